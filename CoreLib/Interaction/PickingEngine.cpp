#include "PickingEngine.hpp"

#include <algorithm>

#include "CoreUtilities.hpp"
#include "CursorIndicator.hpp"
#include "SceneQuery.hpp"
#include "Viewport.hpp"

glm::vec2 PickingEngine::pointerToNdc(float x, float y, const Params& params) noexcept
{
    const float size = static_cast<float>(std::max<int32_t>(1, params.exportSize));

    return glm::vec2(((x * params.displayRatio) / size) * 2.0f - 1.0f,
                     -((y * params.displayRatio) / size) * 2.0f + 1.0f);
}

std::optional<HitRecord> PickingEngine::pick(const Viewport&   camera,
                                             const SceneQuery& query,
                                             CursorIndicator&  indicator,
                                             float             x,
                                             float             y,
                                             const Params&     params)
{
    const un::ray first = camera.rayFromNdc(pointerToNdc(x, y, params));

    const SurfaceHit firstHit = query.intersect(first, kAllSurfaces);
    if (!firstHit.valid())
        return std::nullopt;

    SurfaceHit finalHit = firstHit;

    if (firstHit.surface != TargetSurface::RenderSphere)
    {
        // Redirect from the proxy surface toward the sphere center.
        const glm::vec3 toOrigin = -firstHit.point;
        if (un::is_zero(toOrigin))
            return std::nullopt;

        finalHit = query.intersect(un::make_ray(firstHit.point, toOrigin),
                                   surfaceBit(TargetSurface::RenderSphere));

        if (!finalHit.valid() || finalHit.surface != TargetSurface::RenderSphere)
            return std::nullopt;
    }

    HitRecord hit;
    hit.point         = finalHit.point;
    hit.surfaceNormal = finalHit.faceNormal;
    hit.targetSurface = firstHit.surface;

    indicator.setColor(CursorIndicator::colorFor(hit.targetSurface));
    indicator.place(hit.point, hit.surfaceNormal, kIndicatorLength);

    m_current = hit;
    return hit;
}
