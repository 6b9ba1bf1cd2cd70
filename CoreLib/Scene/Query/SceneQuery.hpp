// Core/Scene/Query/SceneQuery.hpp
#pragma once

#include <glm/vec3.hpp>
#include <limits>

#include "CoreTypes.hpp"

class SurfaceModel;
namespace un
{
    struct ray;
} // namespace un

/**
 * @brief Represents a ray hit on one of the editor surfaces.
 *
 * `faceNormal` is the geometric normal of the struck triangle (outward for
 * the spheres, +Z for the plane); `smoothNormal` is the interpolated vertex
 * normal.
 */
struct SurfaceHit
{
    SurfaceHit() : dist(std::numeric_limits<float>::max()), primId(-1)
    {
    }

    TargetSurface surface = TargetSurface::RenderSphere;
    float         dist;                               ///< Distance from ray origin
    glm::vec3     point        = glm::vec3(0.0f);     ///< World-space hit point
    glm::vec3     faceNormal   = glm::vec3(0.0f);     ///< Unit geometric normal
    glm::vec3     smoothNormal = glm::vec3(0.0f);     ///< Unit interpolated normal
    int           primId;                             ///< Triangle index

    bool valid() const
    {
        return primId > -1;
    }
};

/**
 * @brief Abstract base class for surface hit-testing.
 *
 * Implementations can use plain CPU traversal, Embree, etc. The picking
 * engine and the renderer only talk to this interface, which also lets
 * tests substitute scripted hits.
 */
class SceneQuery
{
public:
    virtual ~SceneQuery() = default;

    /// Rebuild acceleration structures for all surfaces.
    virtual void rebuild(const SurfaceModel& surfaces) = 0;

    /// Nearest hit among the surfaces in `mask`; invalid hit when nothing is struck.
    virtual SurfaceHit intersect(const un::ray& ray, SurfaceMask mask) const = 0;

protected:
    SceneQuery() = default;
};
