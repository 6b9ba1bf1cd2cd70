#include "OverlayHandler.hpp"

#include <cmath>

#include "CoreUtilities.hpp"

void OverlayHandler::clear() noexcept
{
    m_overlays.clear();
    m_open = false;
}

void OverlayHandler::begin_overlay(int32_t id)
{
    Overlay o;
    o.id = id;
    m_overlays.push_back(std::move(o));
    m_open = true;
}

void OverlayHandler::end_overlay() noexcept
{
    m_open = false;
}

void OverlayHandler::add_line(const glm::vec3& a, const glm::vec3& b, float thicknessPx, const glm::vec4& color)
{
    if (!m_open || m_overlays.empty())
        return;

    Line line;
    line.a         = a;
    line.b         = b;
    line.thickness = thicknessPx;
    line.color     = color;
    m_overlays.back().lines.push_back(line);
}

void OverlayHandler::add_arrow(const glm::vec3& origin,
                               const glm::vec3& dir,
                               float            length,
                               const glm::vec4& color,
                               float            thicknessPx,
                               float            headLength,
                               float            headWidth)
{
    const glm::vec3 d = un::safe_normalize(dir);
    if (un::is_zero(d) || !(length > 0.0f))
        return;

    // Head spokes lie in the plane perpendicular to the shaft.
    const glm::vec3 helper = (std::abs(d.z) < 0.999f) ? glm::vec3(0.0f, 0.0f, 1.0f) : glm::vec3(0.0f, 1.0f, 0.0f);
    const glm::vec3 u      = un::safe_normalize(glm::cross(helper, d));
    const glm::vec3 v      = glm::cross(d, u);

    const glm::vec3 tip  = origin + d * length;
    const glm::vec3 base = tip - d * (length * headLength);
    const float     hw   = length * headWidth;

    add_line(origin, base, thicknessPx, color);
    for (const glm::vec3& spoke : {u, -u, v, -v})
        add_line(base + spoke * hw, tip, thicknessPx, color);
}
