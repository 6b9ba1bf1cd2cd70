//============================================================
// LightRecord.hpp
//============================================================
#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "Light.hpp"

/**
 * @brief Editor bookkeeping for one placed light.
 *
 * Maps 1:1 to a Light owned by the scene's LightHandler. The anchor and
 * normal are kept so the light position can be rebuilt from scratch on
 * every distance edit or drag update:
 *
 *   lightPosition = positionOnSurface + surfaceNormal * distance
 *   (z negated for back placement)
 *
 * screenPosition is the overlay handle location in export-size pixels.
 */
struct LightRecord
{
    LightId   lightId           = kInvalidLightId;
    LightType type              = LightType::Point;
    glm::vec3 positionOnSurface = glm::vec3(0.0f);
    glm::vec3 surfaceNormal     = glm::vec3(0.0f, 0.0f, 1.0f);
    float     distance          = 0.0f;
    glm::vec2 screenPosition    = glm::vec2(0.0f);

    // Mirrors the scene light so UI code does not need scene access.
    glm::vec3 lightPosition = glm::vec3(0.0f);
};
