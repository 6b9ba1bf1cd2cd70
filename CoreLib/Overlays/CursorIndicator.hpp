#pragma once

#include <glm/glm.hpp>

#include "ChangeCounter.hpp"
#include "CoreTypes.hpp"

class OverlayHandler;

/**
 * @brief Arrow gizmo that follows the current pick hit.
 *
 * Purely visual feedback: it sits on the render sphere, points along the
 * surface normal and is tinted by the surface the first pick ray struck.
 * It is hidden for every snapshot render.
 */
class CursorIndicator
{
public:
    static constexpr int32_t kOverlayId = 0;

    CursorIndicator();

    void setVisible(bool visible) noexcept;
    [[nodiscard]] bool visible() const noexcept { return m_visible; }

    void setColor(const glm::vec4& color) noexcept;
    [[nodiscard]] const glm::vec4& color() const noexcept { return m_color; }

    /// Moves the arrow tail and aims it; the direction is normalized.
    void place(const glm::vec3& position, const glm::vec3& direction, float length) noexcept;

    [[nodiscard]] const glm::vec3& position() const noexcept { return m_position; }
    [[nodiscard]] const glm::vec3& direction() const noexcept { return m_direction; }
    [[nodiscard]] float            length() const noexcept { return m_length; }

    /// Tint for hits whose first ray struck `surface`.
    [[nodiscard]] static glm::vec4 colorFor(TargetSurface surface) noexcept;

    /// Appends the arrow to `overlays` when visible.
    void buildOverlay(OverlayHandler& overlays) const;

    [[nodiscard]] ChangeCounterPtr changeCounter() const noexcept { return m_changeCounter; }

private:
    bool      m_visible   = false;
    glm::vec4 m_color     = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
    glm::vec3 m_position  = glm::vec3(0.0f);
    glm::vec3 m_direction = glm::vec3(0.0f, 0.0f, 1.0f);
    float     m_length    = 0.1f;

    ChangeCounterPtr m_changeCounter;
};
