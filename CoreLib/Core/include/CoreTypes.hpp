//
//  CoreTypes.hpp
//  Core
//
// Public enums and types that
// are visible to both the editor core and the UI application

#pragma once

#include <cstdint>

/// Surfaces the picking engine can report as the first ray's target.
enum class TargetSurface : uint8_t
{
    RenderSphere = 0,
    NormalSphere = 1,
    Plane        = 2,
};

/// Bit mask over TargetSurface values.
using SurfaceMask = uint32_t;

constexpr SurfaceMask surfaceBit(TargetSurface s) noexcept
{
    return 1u << static_cast<uint32_t>(s);
}

constexpr SurfaceMask kAllSurfaces = surfaceBit(TargetSurface::RenderSphere) |
                                     surfaceBit(TargetSurface::NormalSphere) |
                                     surfaceBit(TargetSurface::Plane);

/// Which side of the sphere a new light is placed on.
enum class PlacementSide
{
    Front,
    Back,
};

enum class ViewMode
{
    PERSPECTIVE,
    ORTHOGRAPHIC,
};

/// Pointer event in canvas pixels (top-left origin).
struct CoreEvent
{
    int   button    = 0;
    float x         = 0.0f;
    float y         = 0.0f;
    float deltaX    = 0.0f;
    float deltaY    = 0.0f;
    bool  shift_key = false;
    bool  ctrl_key  = false;
    bool  alt_key   = false;
};
