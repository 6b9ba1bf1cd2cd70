//============================================================
// SoftwareWorld.cpp
//============================================================
#include "SoftwareWorld.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "Scene.hpp"

SoftwareWorld::SoftwareWorld(std::unique_ptr<Scene> scene, int32_t logicalWidth, int32_t logicalHeight) :
    m_scene(std::move(scene))
{
    if (!m_scene)
        throw std::invalid_argument("SoftwareWorld: scene must not be null");

    setLogicalSize(logicalWidth, logicalHeight);
}

SoftwareWorld::~SoftwareWorld() = default;

void SoftwareWorld::setPixelRatio(float ratio)
{
    if (!std::isfinite(ratio) || ratio <= 0.0f)
        ratio = 1.0f;

    m_pixelRatio = ratio;
}

void SoftwareWorld::setLogicalSize(int32_t width, int32_t height)
{
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("SoftwareWorld: logical size must be positive");

    m_logicalWidth  = width;
    m_logicalHeight = height;
    m_camera.resize(width, height);
}

void SoftwareWorld::render(const Viewport& camera)
{
    const double w = std::max(1.0, std::round(double(m_logicalWidth) * m_pixelRatio));
    const double h = std::max(1.0, std::round(double(m_logicalHeight) * m_pixelRatio));
    if (w > double(std::numeric_limits<int>::max()) || h > double(std::numeric_limits<int>::max()))
        throw std::length_error("SoftwareWorld: render target too large");

    const int tw = static_cast<int>(w);
    const int th = static_cast<int>(h);
    if (m_target.width() != tw || m_target.height() != th || m_target.channels() != 4)
        m_target.allocate(tw, th, 4);

    m_renderer.render(*m_scene, camera, m_target, m_pixelRatio);
}
