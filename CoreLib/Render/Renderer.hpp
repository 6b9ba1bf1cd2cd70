//============================================================
// Renderer.hpp
//============================================================
#pragma once

#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include "OverlayHandler.hpp"

class Image;
class Scene;
class Viewport;

/**
 * @brief CPU matcap renderer.
 *
 * One primary ray per pixel through the scene query, restricted to the
 * render sphere (the proxy surfaces have zero opacity). Shading is a
 * metal/rough GGX specular lobe over a Lambert diffuse base, lit by the
 * scene lights plus ambient, written as sRGB. Pixels that miss keep the
 * background color (transparent by default). Visible overlays are drawn
 * last, without depth test.
 *
 * Light conventions (world space):
 *  - Point: inverse-power falloff 1/d^decay, optional smooth range window.
 *  - Spot:  point falloff times a cone term aimed at the light's target.
 *  - Directional: shines from its position toward the origin.
 */
class Renderer
{
public:
    struct Settings
    {
        glm::vec4 background   = glm::vec4(0.0f); // linear RGBA
        bool      drawOverlays = true;
        float     exposure     = 1.0f;
    };

    Renderer() = default;
    explicit Renderer(const Settings& settings) : m_settings(settings) {}

    [[nodiscard]] const Settings& settings() const noexcept { return m_settings; }
    void                          setSettings(const Settings& s) noexcept { m_settings = s; }

    /**
     * @brief Renders `scene` through `camera` into `target`.
     *
     * The camera should already be sized to the target; `pixelRatio`
     * scales overlay line widths.
     */
    void render(const Scene& scene, const Viewport& camera, Image& target, float pixelRatio = 1.0f);

    /// Shaded linear radiance at a render sphere point.
    [[nodiscard]] static glm::vec3 shade(const Scene&     scene,
                                         const glm::vec3& position,
                                         const glm::vec3& normal,
                                         const glm::vec3& viewDir);

private:
    Settings       m_settings;
    OverlayHandler m_overlays;

    void drawOverlays(const Viewport& camera, Image& target, float pixelRatio) const;
};
