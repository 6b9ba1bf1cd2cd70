//============================================================
// SoftwareWorld.hpp
//============================================================
#pragma once

#include <memory>

#include "Image.hpp"
#include "Renderer.hpp"
#include "Viewport.hpp"
#include "World.hpp"

class Scene;

/**
 * @brief World backed by the CPU Renderer.
 *
 * The render target is (logical size x pixel ratio) pixels and is
 * reallocated lazily on the next render after either changes.
 */
class SoftwareWorld final : public World
{
public:
    /**
     * @param scene         Scene to render; must not be null.
     * @param logicalWidth  Canvas width before the pixel ratio.
     * @param logicalHeight Canvas height before the pixel ratio.
     * @throws std::invalid_argument on a null scene or a non-positive size.
     */
    SoftwareWorld(std::unique_ptr<Scene> scene, int32_t logicalWidth, int32_t logicalHeight);
    ~SoftwareWorld() override;

    SoftwareWorld(const SoftwareWorld&)            = delete;
    SoftwareWorld& operator=(const SoftwareWorld&) = delete;

    Scene&       scene() override { return *m_scene; }
    const Scene& scene() const override { return *m_scene; }

    Viewport&       camera() override { return m_camera; }
    const Viewport& camera() const override { return m_camera; }

    void  setPixelRatio(float ratio) override;
    float pixelRatio() const override { return m_pixelRatio; }

    int32_t logicalWidth() const override { return m_logicalWidth; }
    int32_t logicalHeight() const override { return m_logicalHeight; }

    /// Changes the logical size and resizes the interactive camera to match.
    void setLogicalSize(int32_t width, int32_t height);

    void render(const Viewport& camera) override;

    [[nodiscard]] const Image& renderTarget() const override { return m_target; }

    [[nodiscard]] Renderer& renderer() noexcept { return m_renderer; }

private:
    std::unique_ptr<Scene> m_scene;
    Viewport               m_camera;
    Renderer               m_renderer;
    Image                  m_target;

    int32_t m_logicalWidth  = 0;
    int32_t m_logicalHeight = 0;
    float   m_pixelRatio    = 1.0f;
};
