#pragma once

#include <cmath>
#include <cstdint>
#include <glm/ext/scalar_constants.hpp>
#include <glm/glm.hpp>
#include <source_location>
#include <stdexcept>
#include <string>

/**
 * @defgroup MathUtils Math / Geometry Utilities
 * @brief Small helpers shared by picking, placement and the software renderer.
 */
namespace un
{

    /**
     * @brief Simple ray type used for picking and intersections.
     * @ingroup MathUtils
     * @note `dir` is unit length when built with make_ray().
     */
    struct ray
    {
        glm::vec3 org; ///< Origin in world space.
        glm::vec3 dir; ///< Unit direction.
    };

    /**
     * @brief Zero check for vec3 using squared length and epsilon.
     * @ingroup MathUtils
     */
    inline bool is_zero(const glm::vec3& v)
    {
        return glm::dot(v, v) <= (10 * glm::epsilon<float>());
    }

    /**
     * @brief Normalize a vector safely (avoids NaNs for tiny/invalid inputs).
     *
     * Returns (0,0,0) if the vector length is near zero or non-finite.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v, float eps = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return glm::vec3(0.0f);
    }

    /**
     * @brief Normalize a vector safely with a fallback.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v,
                                    const glm::vec3& fallback,
                                    float            eps = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return fallback;
    }

    /**
     * @brief Builds a ray from an origin and an arbitrary direction.
     *
     * A zero direction yields a zero `dir`; intersectors treat it as a miss.
     * @ingroup MathUtils
     */
    inline ray make_ray(const glm::vec3& org, const glm::vec3& dir)
    {
        ray r = {};
        r.org = org;
        r.dir = safe_normalize(dir);
        return r;
    }

    /**
     * @brief Converts a packed 0xRRGGBB value to an opaque RGBA color.
     * @ingroup MathUtils
     */
    constexpr glm::vec4 rgb(uint32_t hex) noexcept
    {
        return glm::vec4(static_cast<float>((hex >> 16) & 0xFFu) / 255.0f,
                         static_cast<float>((hex >> 8) & 0xFFu) / 255.0f,
                         static_cast<float>(hex & 0xFFu) / 255.0f,
                         1.0f);
    }

    /**
     * @brief Replaces non-finite values with a fallback and clamps to [lo, hi].
     * @ingroup MathUtils
     */
    inline float sanitize(float value, float fallback, float lo, float hi) noexcept
    {
        if (!std::isfinite(value))
            return fallback;
        return glm::clamp(value, lo, hi);
    }

    /**
     * @brief Create a runtime_error enriched with source location info.
     *
     * Example output:
     *   SurfaceModel: normal sphere must enclose the render sphere [at SurfaceModel.cpp:42 in SurfaceModel::SurfaceModel(...)]
     */
    inline std::runtime_error core_exception(
        const std::string&   msg,
        std::source_location loc = std::source_location::current())
    {
        std::string file = loc.file_name();
        if (auto pos = file.find_last_of("/\\"); pos != std::string::npos)
            file = file.substr(pos + 1);

        std::string func = loc.function_name();

        if (auto open = func.find('('); open != std::string::npos)
        {
            if (auto close = func.rfind(')'); close != std::string::npos && close > open)
            {
                func.replace(open + 1, close - open - 1, "...");
            }
        }

        return std::runtime_error(
            msg + " [at " + file + ":" + std::to_string(loc.line()) +
            " in " + func + "]");
    }

} // namespace un
