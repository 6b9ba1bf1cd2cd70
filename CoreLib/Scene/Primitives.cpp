#include "Primitives.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

#include "CoreUtilities.hpp"

glm::vec3 TriangleMesh::faceNormal(uint32_t tri) const noexcept
{
    if (tri >= triangles.size())
        return glm::vec3(0.0f);

    const glm::uvec3& t  = triangles[tri];
    const glm::vec3&  p0 = positions[t.x];
    const glm::vec3&  p1 = positions[t.y];
    const glm::vec3&  p2 = positions[t.z];
    return un::safe_normalize(glm::cross(p1 - p0, p2 - p0));
}

namespace Primitives
{
    TriangleMesh createSphere(glm::vec3 center, float radius, int widthSegments, int heightSegments)
    {
        TriangleMesh mesh;

        const int sides = std::max(3, widthSegments);
        const int rings = std::max(2, heightSegments);

        mesh.positions.reserve(static_cast<size_t>((rings + 1) * (sides + 1)));
        mesh.normals.reserve(mesh.positions.capacity());

        // Generate grid, top pole first.
        for (int stack = 0; stack <= rings; ++stack)
        {
            const float phi = glm::half_pi<float>() - stack * glm::pi<float>() / rings;
            for (int slice = 0; slice <= sides; ++slice)
            {
                const float theta = slice * 2.f * glm::pi<float>() / sides;

                const glm::vec3 dir = {
                    -std::cos(phi) * std::sin(theta),
                    std::sin(phi),
                    -std::cos(phi) * std::cos(theta)};

                mesh.positions.push_back(center + dir * radius);
                mesh.normals.push_back(dir);
            }
        }

        const uint32_t row = static_cast<uint32_t>(sides + 1);
        mesh.triangles.reserve(static_cast<size_t>(rings * sides * 2));

        // a---d
        // |   |   a,b,c and a,c,d are CCW from outside.
        // b---c
        for (int stack = 0; stack < rings; ++stack)
        {
            for (int slice = 0; slice < sides; ++slice)
            {
                const uint32_t a = static_cast<uint32_t>(stack) * row + static_cast<uint32_t>(slice);
                const uint32_t b = a + row;
                const uint32_t c = b + 1;
                const uint32_t d = a + 1;

                if (stack != rings - 1)
                    mesh.triangles.emplace_back(a, b, c);
                if (stack != 0)
                    mesh.triangles.emplace_back(a, c, d);
            }
        }

        return mesh;
    }

    TriangleMesh createPlane(float width, float height)
    {
        TriangleMesh mesh;

        const float hw = width * 0.5f;
        const float hh = height * 0.5f;

        mesh.positions = {
            {-hw, -hh, 0.f},
            {hw, -hh, 0.f},
            {hw, hh, 0.f},
            {-hw, hh, 0.f}};
        mesh.normals.assign(4, glm::vec3(0.f, 0.f, 1.f));
        mesh.triangles = {{0u, 1u, 2u}, {0u, 2u, 3u}};

        return mesh;
    }

} // namespace Primitives
