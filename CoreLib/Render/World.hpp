//============================================================
// World.hpp
//============================================================
#pragma once

#include <cstdint>

class Image;
class Scene;
class Viewport;

/**
 * @brief Scene + interactive camera + render target.
 *
 * The editor core only needs this narrow surface from whatever renders the
 * scene. The render target is sized logical size x pixel ratio.
 */
class World
{
public:
    virtual ~World() = default;

    virtual Scene&       scene()       = 0;
    virtual const Scene& scene() const = 0;

    /// Camera used for picking and the live view.
    virtual Viewport&       camera()       = 0;
    virtual const Viewport& camera() const = 0;

    virtual void  setPixelRatio(float ratio) = 0;
    virtual float pixelRatio() const         = 0;

    virtual int32_t logicalWidth() const  = 0;
    virtual int32_t logicalHeight() const = 0;

    /// Renders the scene through `camera` into renderTarget().
    virtual void render(const Viewport& camera) = 0;

    [[nodiscard]] virtual const Image& renderTarget() const = 0;

protected:
    World() = default;
};
