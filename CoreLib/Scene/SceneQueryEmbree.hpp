#pragma once

#include <array>
#include <memory>

#include "CoreUtilities.hpp" // for un::ray
#include "SceneQuery.hpp"    // for SurfaceHit base interface
#include "embree4/rtcore.h"  // RTCDevice, RTCScene, etc.

class SurfaceModel;
struct TriangleMesh;

/**
 * @brief Embree-backed SceneQuery.
 *
 * One RTCScene per surface, so a query can be restricted to a subset of
 * surfaces without relying on ray masks (which Embree may be built
 * without). Queries are const and safe to call from several threads once
 * rebuild() has returned.
 */
class SceneQueryEmbree : public SceneQuery
{
public:
    /// @throws std::runtime_error if no Embree device can be created.
    SceneQueryEmbree();
    ~SceneQueryEmbree() override;

    SceneQueryEmbree(const SceneQueryEmbree&)            = delete;
    SceneQueryEmbree& operator=(const SceneQueryEmbree&) = delete;

    void rebuild(const SurfaceModel& surfaces) override;

    SurfaceHit intersect(const un::ray& ray, SurfaceMask mask) const override;

private:
    struct SurfaceAccel;

    RTCDevice                                    m_device = nullptr;
    std::array<std::unique_ptr<SurfaceAccel>, 3> m_accels;            // indexed by TargetSurface
};
