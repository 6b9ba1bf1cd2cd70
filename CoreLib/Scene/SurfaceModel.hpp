#pragma once

#include <array>

#include "CoreTypes.hpp"
#include "Primitives.hpp"

/**
 * @brief The three hit-testable surfaces of the matcap editor.
 *
 *  - RenderSphere: the visible, lit sphere. Rendered and picked.
 *  - NormalSphere: larger transparent probe around it. Picked only; a hit
 *    here is redirected toward the origin onto the render sphere.
 *  - Plane: transparent back-plane in z = 0 facing +Z. Picked only; gives
 *    off-sphere pointer positions a deterministic redirect origin.
 *
 * Geometry is built once in the constructor and never changes.
 */
class SurfaceModel
{
public:
    struct Params
    {
        float renderRadius  = 0.3f;
        float probeRadius   = 0.4f;
        int   widthSegments = 256; // height segments are width * 3/4
        float planeSize     = 2.0f;
    };

    /// Nearest-hit candidates for the first pick ray, in scene order.
    static constexpr std::array<TargetSurface, 3> kIntersectable = {
        TargetSurface::Plane,
        TargetSurface::RenderSphere,
        TargetSurface::NormalSphere};

    /**
     * @throws std::invalid_argument if probeRadius <= renderRadius, a radius
     *         is not positive, or widthSegments < 4.
     */
    SurfaceModel();
    explicit SurfaceModel(const Params& params);

    [[nodiscard]] const TriangleMesh& mesh(TargetSurface s) const noexcept;

    [[nodiscard]] float renderRadius() const noexcept { return m_params.renderRadius; }
    [[nodiscard]] float probeRadius() const noexcept { return m_params.probeRadius; }
    [[nodiscard]] int   widthSegments() const noexcept { return m_params.widthSegments; }
    [[nodiscard]] int   heightSegments() const noexcept { return m_params.widthSegments * 3 / 4; }

    /// 1 for the render sphere, 0 for the pick-only proxies.
    [[nodiscard]] static float opacity(TargetSurface s) noexcept;

private:
    Params                      m_params;
    std::array<TriangleMesh, 3> m_meshes; // indexed by TargetSurface
};
