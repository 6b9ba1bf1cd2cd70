#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <optional>

#include "CoreTypes.hpp"

class CursorIndicator;
class SceneQuery;
class Viewport;

/**
 * @brief Result of a successful pick.
 *
 * `point` and `surfaceNormal` always lie on the render sphere;
 * `targetSurface` is what the first ray struck.
 */
struct HitRecord
{
    glm::vec3     point         = glm::vec3(0.0f);
    glm::vec3     surfaceNormal = glm::vec3(0.0f, 0.0f, 1.0f);
    TargetSurface targetSurface = TargetSurface::RenderSphere;
};

/**
 * @brief Turns pointer positions into hits on the render sphere.
 *
 * The first ray is cast through the interactive camera against all three
 * surfaces. If it lands on the normal sphere or the back-plane a second
 * ray is cast from that point toward the world origin; the final hit must
 * be on the render sphere.
 *
 * A miss changes nothing: the current hit and the indicator keep their
 * previous state.
 */
class PickingEngine
{
public:
    struct Params
    {
        float   displayRatio = 1.0f;
        int32_t exportSize   = 256; // pointer normalization denominator
    };

    static constexpr float kIndicatorLength = 0.1f;

    PickingEngine() = default;

    /**
     * @brief Pointer pixels to NDC, normalized by the export size.
     */
    [[nodiscard]] static glm::vec2 pointerToNdc(float x, float y, const Params& params) noexcept;

    /**
     * @brief Picks at pointer (x,y).
     *
     * On success the indicator is moved to the hit, aimed along the face
     * normal, recolored for the first surface, and the hit becomes current().
     * @return The new hit, or std::nullopt on a miss.
     */
    std::optional<HitRecord> pick(const Viewport&   camera,
                                  const SceneQuery& query,
                                  CursorIndicator&  indicator,
                                  float             x,
                                  float             y,
                                  const Params&     params);

    /// Last successful hit, if any.
    [[nodiscard]] const std::optional<HitRecord>& current() const noexcept { return m_current; }

    void clear() noexcept { m_current.reset(); }

private:
    std::optional<HitRecord> m_current;
};
