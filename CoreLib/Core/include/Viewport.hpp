// ============================================================================
// Viewport.hpp  (RH + ZO, NDC y up)
// ============================================================================

#pragma once

#include <cstdint>
#include <glm/glm.hpp>

#include "ChangeCounter.hpp"
#include "CoreTypes.hpp"
#include "CoreUtilities.hpp"

/**
 * @brief Orbit camera state and matrix utilities.
 *
 * Used both for the interactive (perspective) camera and for the fixed
 * orthographic capture camera that produces matcap snapshots.
 *
 * Conventions:
 *  - Right-handed view/projection, the camera looks down -Z in view space.
 *  - Clip/NDC Z range is [0, 1] (ZO), NDC y points up.
 *  - Screen coordinates from un::screen_position are top-left origin, y down.
 *
 * The camera orbits a target point: it sits at distance `dist` from the target,
 * rotated by yaw (rot.x) and pitch (rot.y) in degrees. With zero rotation it
 * sits on +Z looking at the target.
 */
class Viewport
{
public:
    Viewport();

    /**
     * @brief Resizes the viewport in pixels.
     * @param width  New width in pixels (clamped to >= 0).
     * @param height New height in pixels (clamped to >= 0).
     */
    void resize(int32_t width, int32_t height) noexcept;

    /**
     * @brief Switches to a perspective projection.
     * @param fovDeg    Vertical field of view in degrees.
     * @param nearPlane Near clip distance.
     * @param farPlane  Far clip distance.
     */
    void perspective(float fovDeg, float nearPlane, float farPlane) noexcept;

    /**
     * @brief Switches to an orthographic projection.
     *
     * The frustum spans [-halfHeight * aspect, halfHeight * aspect] horizontally
     * and [-halfHeight, halfHeight] vertically.
     */
    void orthographic(float halfHeight, float nearPlane, float farPlane) noexcept;

    /**
     * @brief Places the camera around a target.
     * @param target Orbit pivot in world space.
     * @param dist   Distance from the pivot.
     * @param rot    Yaw (x) and pitch (y) in degrees.
     */
    void setOrbit(const glm::vec3& target, float dist, const glm::vec2& rot) noexcept;

    /**
     * @brief Rotates by a pixel delta in screen space (degrees per pixel).
     */
    void rotate(float deltaX, float deltaY) noexcept;

    /**
     * @brief Zooms by a pixel delta; the distance never drops below the near plane.
     */
    void zoom(float deltaX, float deltaY) noexcept;

    [[nodiscard]] ViewMode viewMode() const noexcept { return m_viewMode; }

    /**
     * @brief Projects a world-space point to normalized device coordinates.
     * @return NDC x/y in [-1,1] (y up), z depth in [0,1].
     */
    [[nodiscard]] glm::vec3 projectNdc(const glm::vec3& world) const noexcept;

    /**
     * @brief Unprojects an NDC point (z in [0,1]) to world space.
     */
    [[nodiscard]] glm::vec3 unprojectNdc(const glm::vec3& ndc) const noexcept;

    /**
     * @brief Constructs a world-space ray through an NDC point.
     */
    [[nodiscard]] un::ray rayFromNdc(const glm::vec2& ndc) const;

    [[nodiscard]] glm::vec3 cameraPosition() const;

    [[nodiscard]] int32_t width() const noexcept { return m_width; }
    [[nodiscard]] int32_t height() const noexcept { return m_height; }

    /**
     * @brief Returns width/height, or 1 if the viewport has no size.
     */
    [[nodiscard]] float aspect() const noexcept;

    [[nodiscard]] const glm::mat4& projection() const noexcept { return m_matProj; }
    [[nodiscard]] const glm::mat4& view() const noexcept { return m_matView; }

    /**
     * @brief Returns the change counter for dependency tracking.
     */
    [[nodiscard]] ChangeCounterPtr changeCounter() const noexcept { return m_changeCounter; }

    /**
     * @brief Recomputes view/projection and cached derived matrices.
     *
     * Every mutator calls this, so projectNdc/unprojectNdc/rayFromNdc are always current.
     */
    void apply() noexcept;

private:
    ViewMode m_viewMode = ViewMode::PERSPECTIVE;
    int32_t  m_width    = 0;
    int32_t  m_height   = 0;

    glm::vec3 m_target = glm::vec3(0.0f);
    glm::vec2 m_rot    = glm::vec2(0.0f);
    float     m_dist   = 1.2f;

    float m_fovDeg     = 45.0f;
    float m_halfHeight = 0.5f;
    float m_near       = 0.1f;
    float m_far        = 100.0f;

    glm::mat4 m_matProj        = glm::mat4(1.0f);
    glm::mat4 m_matView        = glm::mat4(1.0f);
    glm::mat4 m_matViewProj    = glm::mat4(1.0f);
    glm::mat4 m_matInvViewProj = glm::mat4(1.0f);
    glm::mat4 m_matInvView     = glm::mat4(1.0f);

    ChangeCounterPtr m_changeCounter = {};
};

namespace un
{
    /**
     * @brief Projects a world point into a width x height screen (top-left origin).
     *
     * Independent of the viewport's own pixel size, so overlay UI can be laid out
     * in a fixed reference resolution.
     * @ingroup MathUtils
     */
    glm::vec2 screen_position(const glm::vec3& world, const Viewport& camera, float width, float height) noexcept;

} // namespace un
