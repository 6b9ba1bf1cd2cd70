//============================================================
// Light.hpp
//============================================================
#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <string>
#include <string_view>

using LightId                     = int32_t; // stable, never reused within a session
constexpr LightId kInvalidLightId = -1;

enum class LightType : uint32_t
{
    Directional = 0,
    Point       = 1,
    Spot        = 2
};

/**
 * @brief Scene light (WORLD SPACE).
 *
 * Authoritative light description owned by LightHandler. Pure data; the
 * placement bookkeeping lives in LightRecord and the renderer reads this
 * struct directly.
 *
 * Notes:
 *  - Directional: shines from position toward its target (or along direction).
 *  - Point: uses position, range (0 = infinite) and decay.
 *  - Spot: uses position + target/direction + range, cone angle and penumbra.
 */
struct Light
{
    LightId     id   = kInvalidLightId;
    std::string name = {};

    LightType type = LightType::Point;

    // ------------------------------------------------------------
    // World-space placement
    // ------------------------------------------------------------
    glm::vec3 position  = glm::vec3(0.0f);
    glm::vec3 direction = glm::vec3(0.0f, 0.0f, -1.0f); // fallback when no target node exists

    // ------------------------------------------------------------
    // Emission
    // ------------------------------------------------------------
    glm::vec3 color     = glm::vec3(1.0f);
    float     intensity = 1.0f;

    // ------------------------------------------------------------
    // Range / attenuation
    // ------------------------------------------------------------
    float range = 0.0f; // 0 = infinite
    float decay = 2.0f; // physically based inverse-square

    // ------------------------------------------------------------
    // Spot parameters
    // ------------------------------------------------------------
    float spotAngleRad = 1.04719755f; // ~pi/3
    float spotPenumbra = 0.0f;        // [0,1], fraction of the cone that fades

    bool enabled = true;
};

/// Display name used by config files and UI ("Point", "Spot", "Directional").
[[nodiscard]] std::string_view lightTypeName(LightType type) noexcept;

/// Case-insensitive parse of lightTypeName(); returns false for unknown names.
[[nodiscard]] bool lightTypeFromName(std::string_view name, LightType& out) noexcept;
