#include "SurfaceModel.hpp"

#include <cmath>
#include <stdexcept>

SurfaceModel::SurfaceModel() : SurfaceModel(Params{})
{
}

SurfaceModel::SurfaceModel(const Params& params) : m_params(params)
{
    if (!(m_params.renderRadius > 0.0f) || !std::isfinite(m_params.renderRadius))
        throw std::invalid_argument("SurfaceModel: render sphere radius must be positive");

    if (!(m_params.probeRadius > m_params.renderRadius) || !std::isfinite(m_params.probeRadius))
        throw std::invalid_argument("SurfaceModel: normal sphere must enclose the render sphere");

    if (m_params.widthSegments < 4)
        throw std::invalid_argument("SurfaceModel: sphere needs at least 4 width segments");

    if (!(m_params.planeSize > 2.0f * m_params.probeRadius))
        throw std::invalid_argument("SurfaceModel: back-plane must extend past the spheres");

    const glm::vec3 origin(0.0f);

    m_meshes[static_cast<size_t>(TargetSurface::RenderSphere)] =
        Primitives::createSphere(origin, m_params.renderRadius, m_params.widthSegments, heightSegments());

    m_meshes[static_cast<size_t>(TargetSurface::NormalSphere)] =
        Primitives::createSphere(origin, m_params.probeRadius, m_params.widthSegments, heightSegments());

    m_meshes[static_cast<size_t>(TargetSurface::Plane)] =
        Primitives::createPlane(m_params.planeSize, m_params.planeSize);
}

const TriangleMesh& SurfaceModel::mesh(TargetSurface s) const noexcept
{
    return m_meshes[static_cast<size_t>(s)];
}

float SurfaceModel::opacity(TargetSurface s) noexcept
{
    return (s == TargetSurface::RenderSphere) ? 1.0f : 0.0f;
}
