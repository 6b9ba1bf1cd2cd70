//=============================================================================
// MatcapEditor.cpp
//=============================================================================
#include "MatcapEditor.hpp"

#include <iostream>

#include "EditorObserver.hpp"
#include "Scene.hpp"
#include "Viewport.hpp"
#include "World.hpp"

namespace
{
    constexpr float kViewNear = 0.01f;
    constexpr float kViewFar  = 100.0f;
} // namespace

MatcapEditor::MatcapEditor(World& world, ImageEncoder& encoder, const EditorConfig& cfg, EditorObserver* observer) :
    m_world{world},
    m_observer{observer},
    m_config{cfg},
    m_configCounter{std::make_shared<ChangeCounter>()},
    m_controller{world.scene(), m_factory},
    m_pipeline{world, encoder, observer}
{
    config::sanitize(m_config);

    applyEnvironment();
    applyView();

    m_world.scene().indicator().setVisible(false);

    if (m_observer)
        m_observer->contentReady();
}

MatcapEditor::~MatcapEditor() = default;

void MatcapEditor::setObserver(EditorObserver* observer) noexcept
{
    m_observer = observer;
    m_pipeline.setObserver(observer);
}

// ------------------------------------------------------------
// Configuration
// ------------------------------------------------------------

void MatcapEditor::applyConfig(const EditorConfig& cfg)
{
    const EditorConfig::View previousView = m_config.view;

    m_config = cfg;
    config::sanitize(m_config);

    applyEnvironment();

    // Keep the user's orbit unless the view settings themselves changed.
    if (m_config.view.fovDeg != previousView.fovDeg || m_config.view.distance != previousView.distance)
        applyView();

    refreshScreenPositions();

    m_configCounter->change();
    requestSnapshot();
}

void MatcapEditor::applyEnvironment()
{
    Scene& scene = m_world.scene();
    scene.setAmbient(m_config.ambient.color, m_config.ambient.intensity);
    scene.setMaterial(m_config.material.roughness, m_config.material.metalness);
}

void MatcapEditor::applyView()
{
    Viewport& camera = m_world.camera();
    camera.perspective(m_config.view.fovDeg, kViewNear, kViewFar);
    camera.setOrbit(glm::vec3(0.0f), m_config.view.distance, glm::vec2(0.0f));
}

PickingEngine::Params MatcapEditor::pickParams() const noexcept
{
    PickingEngine::Params p;
    p.displayRatio = m_config.displayRatio;
    p.exportSize   = m_config.sizes.exportSize;
    return p;
}

// ------------------------------------------------------------
// Pointer input
// ------------------------------------------------------------

void MatcapEditor::pointerEnter()
{
    m_pointerInside = true;
    m_world.scene().indicator().setVisible(true);
}

void MatcapEditor::pointerLeave()
{
    m_pointerInside = false;
    m_world.scene().indicator().setVisible(false);
}

std::optional<HitRecord> MatcapEditor::pointerMove(float x, float y)
{
    if (!m_pointerInside)
        return std::nullopt;

    Scene&                         scene = m_world.scene();
    const std::optional<HitRecord> hit =
        m_picking.pick(m_world.camera(), scene.sceneQuery(), scene.indicator(), x, y, pickParams());

    if (!hit || !m_controller.isDragging())
        return hit;

    if (const LightRecord* rec = m_controller.dragUpdate(*hit, m_config, m_world.camera()))
    {
        if (m_observer)
            m_observer->lightUpdated(*rec);
    }
    return hit;
}

CommitResult MatcapEditor::pointerDown()
{
    if (!m_pointerInside)
        return {};

    const CommitResult result = m_controller.commit(m_picking.current(), m_config, m_world.camera());
    if (!result.created())
        return result;

    if (m_observer)
    {
        if (const LightRecord* rec = m_controller.record(result.lightId))
            m_observer->lightAdded(*rec);
    }

    requestSnapshot();
    return result;
}

void MatcapEditor::pointerUp()
{
    m_config.isUILightVisible = true;
    m_configCounter->change();

    if (!m_configPath.empty() && !config::saveEditorConfig(m_configPath, m_config))
        std::cerr << "MatcapEditor: could not persist config to " << m_configPath << std::endl;

    m_controller.stopDrag();
    requestSnapshot();
}

// ------------------------------------------------------------
// Light lifecycle
// ------------------------------------------------------------

bool MatcapEditor::startLightDrag(LightId id)
{
    return m_controller.startDrag(id);
}

void MatcapEditor::stopLightDrag()
{
    m_controller.stopDrag();
    requestSnapshot();
}

bool MatcapEditor::setLightDistance(LightId id, float distance)
{
    const LightRecord* rec = m_controller.setDistance(id, distance, m_config);
    if (!rec)
        return false;

    if (m_observer)
        m_observer->lightUpdated(*rec);

    requestSnapshot();
    return true;
}

bool MatcapEditor::deleteLight(LightId id)
{
    if (!m_controller.deleteLight(id))
        return false;

    if (m_observer)
        m_observer->lightRemoved(id);

    requestSnapshot();
    return true;
}

// ------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------

uint64_t MatcapEditor::requestSnapshot()
{
    return m_pipeline.snapshot(false, m_config);
}

uint64_t MatcapEditor::requestExport()
{
    return m_pipeline.snapshot(true, m_config);
}

size_t MatcapEditor::poll()
{
    return m_pipeline.poll();
}

// ------------------------------------------------------------
// Interactive camera
// ------------------------------------------------------------

void MatcapEditor::orbit(float deltaX, float deltaY)
{
    m_world.camera().rotate(deltaX, deltaY);
    refreshScreenPositions();
}

void MatcapEditor::zoom(float delta)
{
    m_world.camera().zoom(delta, 0.0f);
    refreshScreenPositions();
}

void MatcapEditor::refreshScreenPositions()
{
    for (const LightRecord* rec : m_controller.records())
    {
        if (const LightRecord* updated = m_controller.refreshScreenPosition(rec->lightId, m_config, m_world.camera()))
        {
            if (m_observer)
                m_observer->lightUpdated(*updated);
        }
    }
}
