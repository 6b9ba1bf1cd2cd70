#pragma once

#include <glm/glm.hpp>

#include "CoreTypes.hpp"
#include "Viewport.hpp"

/**
 * @defgroup Placement Light placement math
 * @brief Pure functions shared by commit, drag and distance edits.
 */
namespace placement
{
    /// Lift applied along the normal before projecting a light handle.
    constexpr float kHandleLift = 0.1f;

    /**
     * @brief Light position for a surface anchor.
     *
     * P + N * d, with z negated for back placement. x and y are never negated.
     * @ingroup Placement
     */
    inline glm::vec3 lightPosition(const glm::vec3& surfacePoint,
                                   const glm::vec3& surfaceNormal,
                                   float            distance,
                                   PlacementSide    side) noexcept
    {
        glm::vec3 p = surfacePoint + surfaceNormal * distance;
        if (side == PlacementSide::Back)
            p.z = -p.z;
        return p;
    }

    /**
     * @brief Overlay handle position in an exportSize x exportSize screen.
     *
     * Projects the anchor lifted by kHandleLift through the interactive camera.
     * @ingroup Placement
     */
    inline glm::vec2 handleScreenPosition(const glm::vec3& surfacePoint,
                                          const glm::vec3& surfaceNormal,
                                          const Viewport&  camera,
                                          float            exportSize) noexcept
    {
        return un::screen_position(surfacePoint + surfaceNormal * kHandleLift, camera, exportSize, exportSize);
    }

} // namespace placement
