//=============================================================================
// Scene.cpp
//=============================================================================
#include "Scene.hpp"

#include <stdexcept>

#include "CoreUtilities.hpp"
#include "OverlayHandler.hpp"
#include "SceneQueryEmbree.hpp"

Scene::Scene() : Scene(std::make_unique<SceneQueryEmbree>())
{
}

Scene::Scene(std::unique_ptr<SceneQuery> query, const SurfaceModel::Params& params) :
    m_surfaces{params},
    m_query{std::move(query)},
    m_changeCounter{std::make_shared<ChangeCounter>()}
{
    if (!m_query)
        throw std::invalid_argument("Scene: a SceneQuery is required");

    // Acceleration structures are built once; the surfaces never change.
    m_query->rebuild(m_surfaces);

    m_lights.changeCounter()->addParent(m_changeCounter);
    m_indicator.changeCounter()->addParent(m_changeCounter);
}

Scene::~Scene() = default;

LightId Scene::addLight(const LightInstance& instance)
{
    const LightId id = m_lights.createLight(instance.light);

    if (instance.target)
        m_spotTargets[id] = *instance.target;

    return id;
}

bool Scene::removeLight(LightId id)
{
    m_spotTargets.erase(id);
    return m_lights.destroyLight(id);
}

bool Scene::setLightPosition(LightId id, const glm::vec3& position) noexcept
{
    return m_lights.setPosition(id, position);
}

const Light* Scene::light(LightId id) const noexcept
{
    return m_lights.light(id);
}

std::optional<glm::vec3> Scene::lightTarget(LightId id) const
{
    auto it = m_spotTargets.find(id);
    if (it == m_spotTargets.end())
        return std::nullopt;
    return it->second;
}

void Scene::setAmbient(const glm::vec3& color, float intensity) noexcept
{
    m_ambientColor     = color;
    m_ambientIntensity = intensity;
    m_changeCounter->change();
}

void Scene::setMaterial(float roughness, float metalness) noexcept
{
    m_roughness = un::sanitize(roughness, 0.4f, 0.0f, 1.0f);
    m_metalness = un::sanitize(metalness, 0.0f, 0.0f, 1.0f);
    m_changeCounter->change();
}

void Scene::buildOverlays(OverlayHandler& overlays) const
{
    m_indicator.buildOverlay(overlays);
}
