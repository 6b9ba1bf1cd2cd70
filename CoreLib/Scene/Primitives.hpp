#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

/**
 * @brief Indexed triangle soup with per-vertex (smooth) normals.
 *
 * Triangles are counter-clockwise when seen from the side the normals
 * point to.
 */
struct TriangleMesh
{
    std::vector<glm::vec3>  positions;
    std::vector<glm::vec3>  normals;
    std::vector<glm::uvec3> triangles;

    [[nodiscard]] bool empty() const noexcept { return triangles.empty(); }

    /// Geometric normal of triangle `tri` from its winding.
    [[nodiscard]] glm::vec3 faceNormal(uint32_t tri) const noexcept;
};

namespace Primitives
{
    /**
     * @brief Creates a UV sphere centered at `center`, poles on +/-Y.
     * @param radius Sphere radius
     * @param widthSegments  Longitude segments (>= 3)
     * @param heightSegments Latitude segments (>= 2)
     *
     * Degenerate pole triangles are not emitted.
     */
    TriangleMesh createSphere(glm::vec3 center, float radius, int widthSegments, int heightSegments);

    /**
     * @brief Creates a width x height plane in z = 0 facing +Z.
     */
    TriangleMesh createPlane(float width, float height);

} // namespace Primitives
