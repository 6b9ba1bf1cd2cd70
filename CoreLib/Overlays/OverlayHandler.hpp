#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

/**
 * @brief Collects world-space gizmo lines for the renderer.
 *
 * Gizmos open a group with begin_overlay(), emit lines and close it with
 * end_overlay(). Lines emitted outside a group are dropped. The renderer
 * projects every line through its camera and draws it over the shaded
 * sphere.
 */
class OverlayHandler
{
public:
    struct Line
    {
        glm::vec3 a         = glm::vec3(0.0f);
        glm::vec3 b         = glm::vec3(0.0f);
        float     thickness = 1.0f; // logical pixels, scaled by the pixel ratio
        glm::vec4 color     = glm::vec4(1.0f);
    };

    struct Overlay
    {
        int32_t           id = -1;
        std::vector<Line> lines;
    };

    void clear() noexcept;

    void begin_overlay(int32_t id);
    void end_overlay() noexcept;

    void add_line(const glm::vec3& a, const glm::vec3& b, float thicknessPx, const glm::vec4& color);

    /**
     * @brief Emits a shaft plus a four-line head.
     *
     * `headLength` and `headWidth` are fractions of `length`. Nothing is
     * emitted for a zero direction or a non-positive length.
     */
    void add_arrow(const glm::vec3& origin,
                   const glm::vec3& dir,
                   float            length,
                   const glm::vec4& color,
                   float            thicknessPx = 2.0f,
                   float            headLength  = 0.2f,
                   float            headWidth   = 0.1f);

    [[nodiscard]] const std::vector<Overlay>& overlays() const noexcept { return m_overlays; }
    [[nodiscard]] bool                        empty() const noexcept { return m_overlays.empty(); }

private:
    std::vector<Overlay> m_overlays;
    bool                 m_open = false;
};
