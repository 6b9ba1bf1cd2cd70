//=============================================================================
// Scene.hpp
//=============================================================================
#pragma once

#include <memory>
#include <optional>
#include <unordered_map>

#include "ChangeCounter.hpp"
#include "CursorIndicator.hpp"
#include "LightFactory.hpp"
#include "LightHandler.hpp"
#include "SceneQuery.hpp"
#include "SurfaceModel.hpp"

class OverlayHandler;

/**
 * @brief Scene-level container for the matcap editor.
 *
 * Scene owns the three editor surfaces and their hit-test query, the
 * placed lights (plus the aim targets of spot lights), the ambient light,
 * the render sphere material and the cursor indicator.
 *
 * Every mutation bumps changeCounter(), which is also the parent of the
 * light and indicator counters, so hosts can redraw on any change.
 */
class Scene
{
public:
    /** @brief Scene with default surfaces and an Embree query. */
    Scene();

    /**
     * @brief Scene with a caller-provided query.
     * @param query  Hit-test backend; rebuilt against the surfaces here.
     * @param params Surface dimensions.
     * @throws std::invalid_argument if `query` is null or the params are invalid.
     */
    explicit Scene(std::unique_ptr<SceneQuery> query, const SurfaceModel::Params& params = {});

    ~Scene();

    Scene(const Scene&)            = delete;
    Scene& operator=(const Scene&) = delete;

    // ------------------------------------------------------------
    // Surfaces / queries
    // ------------------------------------------------------------

    [[nodiscard]] const SurfaceModel& surfaces() const noexcept { return m_surfaces; }
    [[nodiscard]] const SceneQuery&   sceneQuery() const noexcept { return *m_query; }

    // ------------------------------------------------------------
    // Lights
    // ------------------------------------------------------------

    /**
     * @brief Adds a light and, for spot lights, its target node.
     * @return Stable id of the new light.
     */
    LightId addLight(const LightInstance& instance);

    /**
     * @brief Removes a light and its target node.
     * @return False if the id is unknown.
     */
    bool removeLight(LightId id);

    bool setLightPosition(LightId id, const glm::vec3& position) noexcept;

    [[nodiscard]] const Light*             light(LightId id) const noexcept;
    [[nodiscard]] std::optional<glm::vec3> lightTarget(LightId id) const;

    [[nodiscard]] LightHandler&       lightHandler() noexcept { return m_lights; }
    [[nodiscard]] const LightHandler& lightHandler() const noexcept { return m_lights; }

    // ------------------------------------------------------------
    // Environment / material
    // ------------------------------------------------------------

    void setAmbient(const glm::vec3& color, float intensity) noexcept;

    [[nodiscard]] const glm::vec3& ambientColor() const noexcept { return m_ambientColor; }
    [[nodiscard]] float            ambientIntensity() const noexcept { return m_ambientIntensity; }

    void setMaterial(float roughness, float metalness) noexcept;

    [[nodiscard]] float roughness() const noexcept { return m_roughness; }
    [[nodiscard]] float metalness() const noexcept { return m_metalness; }

    // ------------------------------------------------------------
    // Overlays
    // ------------------------------------------------------------

    [[nodiscard]] CursorIndicator&       indicator() noexcept { return m_indicator; }
    [[nodiscard]] const CursorIndicator& indicator() const noexcept { return m_indicator; }

    /// Emits all visible overlay geometry.
    void buildOverlays(OverlayHandler& overlays) const;

    [[nodiscard]] ChangeCounterPtr changeCounter() const noexcept { return m_changeCounter; }

private:
    SurfaceModel                m_surfaces;
    std::unique_ptr<SceneQuery> m_query;

    LightHandler                            m_lights;
    std::unordered_map<LightId, glm::vec3>  m_spotTargets;

    glm::vec3 m_ambientColor     = glm::vec3(1.0f);
    float     m_ambientIntensity = 0.2f;
    float     m_roughness        = 0.4f;
    float     m_metalness        = 0.0f;

    CursorIndicator m_indicator;

    ChangeCounterPtr m_changeCounter;
};
