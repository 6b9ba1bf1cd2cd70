//============================================================
// LightHandler.cpp
//============================================================
#include "LightHandler.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <glm/gtc/constants.hpp>
#include <utility>

#include "CoreUtilities.hpp"

std::string_view lightTypeName(LightType type) noexcept
{
    switch (type)
    {
        case LightType::Directional:
            return "Directional";
        case LightType::Point:
            return "Point";
        case LightType::Spot:
            return "Spot";
    }
    return "Point";
}

bool lightTypeFromName(std::string_view name, LightType& out) noexcept
{
    auto equalsCi = [](std::string_view a, std::string_view b) {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    };

    for (LightType t : {LightType::Directional, LightType::Point, LightType::Spot})
    {
        if (equalsCi(name, lightTypeName(t)))
        {
            out = t;
            return true;
        }
    }
    return false;
}

LightHandler::LightHandler() : m_changeCounter{std::make_shared<ChangeCounter>()}
{
}

void LightHandler::clear() noexcept
{
    m_lights.clear();
    m_changeCounter->change();
}

LightId LightHandler::createLight(const Light& src)
{
    Light l = src;
    sanitize(l);

    const LightId id = m_nextId++;
    l.id             = id;

    m_lights.emplace(id, std::move(l));
    m_changeCounter->change();
    return id;
}

bool LightHandler::destroyLight(LightId id) noexcept
{
    if (m_lights.erase(id) == 0)
        return false;

    m_changeCounter->change();
    return true;
}

Light* LightHandler::light(LightId id) noexcept
{
    auto it = m_lights.find(id);
    return (it != m_lights.end()) ? &it->second : nullptr;
}

const Light* LightHandler::light(LightId id) const noexcept
{
    auto it = m_lights.find(id);
    return (it != m_lights.end()) ? &it->second : nullptr;
}

std::vector<LightId> LightHandler::allLights() const
{
    std::vector<LightId> ids;
    ids.reserve(m_lights.size());
    for (const auto& [id, l] : m_lights)
        ids.push_back(id);
    return ids;
}

bool LightHandler::setPosition(LightId id, const glm::vec3& position) noexcept
{
    Light* l = light(id);
    if (!l)
        return false;

    l->position = position;
    m_changeCounter->change();
    return true;
}

// ------------------------------------------------------------
// sanitize()
// ------------------------------------------------------------

void LightHandler::sanitize(Light& l) noexcept
{
    // ID is assigned by the handler.
    l.id = kInvalidLightId;

    if (!std::isfinite(l.intensity) || l.intensity < 0.0f)
        l.intensity = 0.0f;

    if (!std::isfinite(l.range) || l.range < 0.0f)
        l.range = 0.0f;

    if (!std::isfinite(l.decay) || l.decay < 0.0f)
        l.decay = 2.0f;

    l.direction = un::safe_normalize(l.direction, glm::vec3(0.0f, 0.0f, -1.0f));

    // Spot cone: (0, pi/2], penumbra in [0,1].
    if (!std::isfinite(l.spotAngleRad) || l.spotAngleRad <= 0.0f)
        l.spotAngleRad = 1.04719755f;
    l.spotAngleRad = std::min(l.spotAngleRad, glm::half_pi<float>());
    l.spotPenumbra = un::sanitize(l.spotPenumbra, 0.0f, 0.0f, 1.0f);

    // Color: finite + non-negative (HDR allowed, so no clamp to 1).
    for (int c = 0; c < 3; ++c)
    {
        if (!std::isfinite(l.color[c]) || l.color[c] < 0.0f)
            l.color[c] = 0.0f;
    }

    for (int c = 0; c < 3; ++c)
    {
        if (!std::isfinite(l.position[c]))
            l.position[c] = 0.0f;
    }
}
