//=============================================================================
// MatcapEditor.hpp
//=============================================================================
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "ChangeCounter.hpp"
#include "EditorConfig.hpp"
#include "LightFactory.hpp"
#include "LightPlacementController.hpp"
#include "PickingEngine.hpp"
#include "SnapshotPipeline.hpp"

class EditorObserver;
class ImageEncoder;
class World;

/**
 * @brief Central controller of the matcap editor.
 *
 * MatcapEditor wires pointer input, picking, light placement and the
 * snapshot pipeline together and publishes results to an EditorObserver.
 * It is UI-agnostic; a host forwards canvas events and calls poll() from
 * its event loop.
 *
 * Pointer coordinates are canvas pixels; they are normalized by
 * config().sizes.exportSize and config().displayRatio.
 */
class MatcapEditor
{
public:
    /**
     * @brief Builds the editor on an existing world.
     *
     * Applies ambient/material/view settings from `cfg` and fires
     * contentReady() before returning.
     */
    MatcapEditor(World& world, ImageEncoder& encoder, const EditorConfig& cfg, EditorObserver* observer = nullptr);
    ~MatcapEditor();

    MatcapEditor(const MatcapEditor&)            = delete;
    MatcapEditor& operator=(const MatcapEditor&) = delete;

    void setObserver(EditorObserver* observer) noexcept;

    /// Config file rewritten on pointer release. Empty disables persistence.
    void setConfigPath(const std::filesystem::path& path) { m_configPath = path; }

    [[nodiscard]] const std::filesystem::path& configPath() const noexcept { return m_configPath; }

    // ------------------------------------------------------------
    // Configuration
    // ------------------------------------------------------------

    [[nodiscard]] const EditorConfig& config() const noexcept { return m_config; }

    /**
     * @brief Replaces the configuration, re-applies ambient and material
     *        settings and takes a preview snapshot.
     */
    void applyConfig(const EditorConfig& cfg);

    [[nodiscard]] ChangeCounterPtr configCounter() const noexcept { return m_configCounter; }

    // ------------------------------------------------------------
    // Pointer input
    // ------------------------------------------------------------

    /// Shows the indicator and starts accepting move/down.
    void pointerEnter();

    /// Hides the indicator and ignores move/down. The drag state is kept.
    void pointerLeave();

    [[nodiscard]] bool pointerInside() const noexcept { return m_pointerInside; }

    /**
     * @brief Picks under the pointer; re-anchors the dragged light on success.
     * @return The hit, or std::nullopt on a miss or while outside the canvas.
     */
    std::optional<HitRecord> pointerMove(float x, float y);

    /**
     * @brief Commits a new light at the current hit.
     *
     * On success publishes lightAdded() once and takes one snapshot.
     */
    CommitResult pointerDown();

    /// Shows the light handles, persists the config, ends any drag and snapshots.
    void pointerUp();

    // ------------------------------------------------------------
    // Light lifecycle
    // ------------------------------------------------------------

    bool startLightDrag(LightId id);
    void stopLightDrag();

    /// Sets a light's placement distance. Returns false for unknown ids or invalid distances.
    bool setLightDistance(LightId id, float distance);

    bool deleteLight(LightId id);

    [[nodiscard]] std::vector<const LightRecord*> records() const { return m_controller.records(); }
    [[nodiscard]] const LightRecord*              record(LightId id) const noexcept { return m_controller.record(id); }

    [[nodiscard]] const LightPlacementController& controller() const noexcept { return m_controller; }
    [[nodiscard]] const PickingEngine&            picking() const noexcept { return m_picking; }

    // ------------------------------------------------------------
    // Snapshots
    // ------------------------------------------------------------

    uint64_t requestSnapshot();
    uint64_t requestExport();

    /// Delivers finished snapshots. Call regularly from the event loop.
    size_t poll();

    [[nodiscard]] const SnapshotPipeline& pipeline() const noexcept { return m_pipeline; }

    // ------------------------------------------------------------
    // Interactive camera
    // ------------------------------------------------------------

    /// Orbit/zoom the interactive camera; light handles are re-projected.
    void orbit(float deltaX, float deltaY);
    void zoom(float delta);

    /// Re-projects every light handle through the interactive camera.
    void refreshScreenPositions();

    [[nodiscard]] World&       world() noexcept { return m_world; }
    [[nodiscard]] const World& world() const noexcept { return m_world; }

private:
    World&          m_world;
    EditorObserver* m_observer = nullptr;

    EditorConfig          m_config;
    std::filesystem::path m_configPath;
    ChangeCounterPtr      m_configCounter;

    LightFactory             m_factory;
    PickingEngine            m_picking;
    LightPlacementController m_controller;
    SnapshotPipeline         m_pipeline;

    bool m_pointerInside = false;

    void applyEnvironment();
    void applyView();

    [[nodiscard]] PickingEngine::Params pickParams() const noexcept;
};
