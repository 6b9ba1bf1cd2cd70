//============================================================
// LightFactory.cpp
//============================================================
#include "LightFactory.hpp"

#include <string>
#include <utility>

#include "CoreUtilities.hpp"

LightFactory::LightFactory()
{
    registerType(LightType::Point, &LightFactory::createPoint);
    registerType(LightType::Spot, &LightFactory::createSpot);
    registerType(LightType::Directional, &LightFactory::createDirectional);
}

void LightFactory::registerType(LightType type, CreateFunc createFunc)
{
    m_registry[type] = std::move(createFunc);
}

bool LightFactory::hasType(LightType type) const noexcept
{
    return m_registry.find(type) != m_registry.end();
}

LightInstance LightFactory::create(LightType type) const
{
    auto it = m_registry.find(type);
    if (it == m_registry.end() || !it->second)
        throw un::core_exception("LightFactory: no builder for light type " + std::string(lightTypeName(type)));

    LightInstance inst = it->second();
    inst.light.type    = type;
    if (inst.light.name.empty())
        inst.light.name = std::string(lightTypeName(type));
    return inst;
}

// ------------------------------------------------------------
// Stock builders
// ------------------------------------------------------------

// Placement distances are tenths of a unit, so inverse-square lights get a
// low intensity: 0.04 gives unit irradiance at the default 0.2 offset.

LightInstance LightFactory::createPoint()
{
    LightInstance inst;
    inst.light.type      = LightType::Point;
    inst.light.intensity = 0.04f;
    inst.light.range     = 0.0f;
    inst.light.decay     = 2.0f;
    return inst;
}

LightInstance LightFactory::createSpot()
{
    LightInstance inst;
    inst.light.type         = LightType::Spot;
    inst.light.intensity    = 0.04f;
    inst.light.range        = 0.0f;
    inst.light.decay        = 2.0f;
    inst.light.spotAngleRad = 1.04719755f;
    inst.light.spotPenumbra = 0.2f;

    // Aims at the sphere center.
    inst.target = glm::vec3(0.0f);
    return inst;
}

LightInstance LightFactory::createDirectional()
{
    LightInstance inst;
    inst.light.type      = LightType::Directional;
    inst.light.intensity = 1.0f;
    return inst;
}
