#include "SceneQueryEmbree.hpp"

#include <embree4/rtcore.h>
#include <embree4/rtcore_ray.h>
#include <glm/glm.hpp>
#include <iostream>
#include <limits>
#include <vector>

#include "SurfaceModel.hpp"

// --------------------------------------------------------
// Internal helpers
// --------------------------------------------------------

namespace
{
    RTCRayHit fromRay(const un::ray& ray)
    {
        RTCRayHit rh{};
        rh.ray.org_x = ray.org.x;
        rh.ray.org_y = ray.org.y;
        rh.ray.org_z = ray.org.z;

        rh.ray.dir_x = ray.dir.x;
        rh.ray.dir_y = ray.dir.y;
        rh.ray.dir_z = ray.dir.z;

        rh.ray.tnear = 0.0f;
        rh.ray.tfar  = std::numeric_limits<float>::max();
        rh.ray.mask  = 0xFFFFFFFFu;
        rh.ray.flags = 0;

        rh.hit.geomID = RTC_INVALID_GEOMETRY_ID;
        rh.hit.primID = RTC_INVALID_GEOMETRY_ID;
        return rh;
    }

    void errorCallback(void* /*userPtr*/, RTCError code, const char* str)
    {
        std::cerr << "Embree error " << static_cast<int>(code) << ": " << (str ? str : "") << "\n";
    }

} // namespace

// --------------------------------------------------------
// SurfaceAccel: one committed RTCScene + the triangles it was built from
// --------------------------------------------------------

struct SceneQueryEmbree::SurfaceAccel
{
    RTCScene     scene = nullptr;
    TriangleMesh mesh  = {};

    SurfaceAccel() = default;

    SurfaceAccel(const SurfaceAccel&)            = delete;
    SurfaceAccel& operator=(const SurfaceAccel&) = delete;

    ~SurfaceAccel()
    {
        if (scene)
            rtcReleaseScene(scene);
    }
};

// --------------------------------------------------------
// SceneQueryEmbree implementation
// --------------------------------------------------------

SceneQueryEmbree::SceneQueryEmbree()
{
    m_device = rtcNewDevice(nullptr); // nullptr = default config

    if (!m_device)
        throw un::core_exception("SceneQueryEmbree: rtcNewDevice failed (error " +
                                 std::to_string(static_cast<int>(rtcGetDeviceError(nullptr))) + ")");

    rtcSetDeviceErrorFunction(m_device, errorCallback, nullptr);
}

SceneQueryEmbree::~SceneQueryEmbree()
{
    // Scenes must go before the device.
    for (auto& accel : m_accels)
        accel.reset();

    if (m_device)
        rtcReleaseDevice(m_device);
}

void SceneQueryEmbree::rebuild(const SurfaceModel& surfaces)
{
    for (TargetSurface s : SurfaceModel::kIntersectable)
    {
        auto accel  = std::make_unique<SurfaceAccel>();
        accel->mesh = surfaces.mesh(s);

        const TriangleMesh& mesh = accel->mesh;
        if (mesh.empty())
        {
            m_accels[static_cast<size_t>(s)].reset();
            continue;
        }

        accel->scene = rtcNewScene(m_device);
        rtcSetSceneBuildQuality(accel->scene, RTC_BUILD_QUALITY_HIGH);
        // Watertight: axis-aligned pick rays pass exactly through sphere vertices.
        rtcSetSceneFlags(accel->scene, RTC_SCENE_FLAG_ROBUST);

        RTCGeometry geom = rtcNewGeometry(m_device, RTC_GEOMETRY_TYPE_TRIANGLE);
        rtcSetGeometryBuildQuality(geom, RTC_BUILD_QUALITY_HIGH);

        // Vertex buffer
        struct RTCFloat3
        {
            float x, y, z;
        };

        auto* vbuf = reinterpret_cast<RTCFloat3*>(
            rtcSetNewGeometryBuffer(geom,
                                    RTC_BUFFER_TYPE_VERTEX,
                                    0,
                                    RTC_FORMAT_FLOAT3,
                                    sizeof(RTCFloat3),
                                    mesh.positions.size()));

        for (size_t vi = 0; vi < mesh.positions.size(); ++vi)
        {
            vbuf[vi].x = mesh.positions[vi].x;
            vbuf[vi].y = mesh.positions[vi].y;
            vbuf[vi].z = mesh.positions[vi].z;
        }

        // Index buffer
        struct RTCTri
        {
            unsigned int v0, v1, v2;
        };

        auto* ibuf = reinterpret_cast<RTCTri*>(
            rtcSetNewGeometryBuffer(geom,
                                    RTC_BUFFER_TYPE_INDEX,
                                    0,
                                    RTC_FORMAT_UINT3,
                                    sizeof(RTCTri),
                                    mesh.triangles.size()));

        for (size_t ti = 0; ti < mesh.triangles.size(); ++ti)
        {
            ibuf[ti].v0 = mesh.triangles[ti].x;
            ibuf[ti].v1 = mesh.triangles[ti].y;
            ibuf[ti].v2 = mesh.triangles[ti].z;
        }

        rtcCommitGeometry(geom);
        rtcAttachGeometry(accel->scene, geom);
        rtcReleaseGeometry(geom);

        rtcCommitScene(accel->scene);

        m_accels[static_cast<size_t>(s)] = std::move(accel);
    }
}

SurfaceHit SceneQueryEmbree::intersect(const un::ray& ray, SurfaceMask mask) const
{
    SurfaceHit best;
    if (un::is_zero(ray.dir))
        return best;

    for (TargetSurface s : SurfaceModel::kIntersectable)
    {
        if ((mask & surfaceBit(s)) == 0)
            continue;

        const SurfaceAccel* accel = m_accels[static_cast<size_t>(s)].get();
        if (!accel || !accel->scene)
            continue;

        RTCRayHit rh = fromRay(ray);

        RTCIntersectArguments args;
        rtcInitIntersectArguments(&args);

        rtcIntersect1(accel->scene, &rh, &args);

        if (rh.hit.geomID == RTC_INVALID_GEOMETRY_ID ||
            rh.hit.primID == RTC_INVALID_GEOMETRY_ID)
        {
            continue;
        }

        if (rh.ray.tfar >= best.dist)
            continue;

        const TriangleMesh& mesh = accel->mesh;
        const glm::uvec3&   tri  = mesh.triangles[rh.hit.primID];

        const float u = rh.hit.u;
        const float v = rh.hit.v;
        const float w = 1.0f - u - v;

        best.surface      = s;
        best.dist         = rh.ray.tfar;
        best.primId       = static_cast<int>(rh.hit.primID);
        best.point        = ray.org + ray.dir * rh.ray.tfar;
        best.faceNormal   = mesh.faceNormal(rh.hit.primID);
        best.smoothNormal = un::safe_normalize(w * mesh.normals[tri.x] +
                                                   u * mesh.normals[tri.y] +
                                                   v * mesh.normals[tri.z],
                                               best.faceNormal);
    }

    return best;
}
