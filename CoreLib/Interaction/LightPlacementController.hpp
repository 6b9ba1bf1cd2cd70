#pragma once

#include <map>
#include <optional>
#include <variant>
#include <vector>

#include "EditorConfig.hpp"
#include "LightRecord.hpp"
#include "PickingEngine.hpp"

class LightFactory;
class Scene;
class Viewport;

/// No light is following the pointer.
struct DragIdle
{
};

/// `lightId` follows every successful pick.
struct DragActive
{
    LightId lightId = kInvalidLightId;
};

using DragState = std::variant<DragIdle, DragActive>;

/**
 * @brief Outcome of a placement commit.
 *
 * InvalidCommit is an explicit no-op: nothing was created because there was
 * no current hit.
 */
struct CommitResult
{
    enum class Status
    {
        Created,
        InvalidCommit,
    };

    Status  status  = Status::InvalidCommit;
    LightId lightId = kInvalidLightId;

    [[nodiscard]] bool created() const noexcept { return status == Status::Created; }
};

/**
 * @brief Creates, drags, re-offsets and deletes placed lights.
 *
 * Keeps one LightRecord per scene light created through it. Every position
 * is rebuilt from the record's anchor, normal and distance using
 * placement::lightPosition(); nothing is accumulated across updates.
 *
 * The controller only mutates the scene. Publishing and snapshots are the
 * caller's job (see MatcapEditor).
 */
class LightPlacementController
{
public:
    LightPlacementController(Scene& scene, const LightFactory& factory);

    /**
     * @brief Creates a light anchored at `hit`.
     *
     * Type, distance and side come from `cfg.create`; the handle position is
     * projected through `camera` at export size.
     */
    CommitResult commit(const std::optional<HitRecord>& hit, const EditorConfig& cfg, const Viewport& camera);

    /**
     * @brief Makes `id` the drag target, replacing any previous one.
     * @return False (and no state change) if the id has no record.
     */
    bool startDrag(LightId id);

    /**
     * @brief Re-anchors the dragged light on a new hit.
     * @return The updated record, or nullptr when idle.
     */
    const LightRecord* dragUpdate(const HitRecord& hit, const EditorConfig& cfg, const Viewport& camera);

    /// Returns to idle. Harmless when already idle.
    void stopDrag() noexcept;

    /**
     * @brief Sets a record's distance and rebuilds its light position.
     *
     * Does not touch the drag state. Negative or non-finite distances are
     * rejected (nullptr).
     */
    const LightRecord* setDistance(LightId id, float distance, const EditorConfig& cfg);

    /**
     * @brief Removes the light, its target and its record.
     *
     * A drag on the deleted light ends.
     * @return False if the id has no record.
     */
    bool deleteLight(LightId id);

    /// Re-projects a record's handle after the camera moved. nullptr for unknown ids.
    const LightRecord* refreshScreenPosition(LightId id, const EditorConfig& cfg, const Viewport& camera);

    [[nodiscard]] const DragState& dragState() const noexcept { return m_drag; }
    [[nodiscard]] bool             isDragging() const noexcept;

    /// Dragged light, or kInvalidLightId when idle.
    [[nodiscard]] LightId draggedLight() const noexcept;

    [[nodiscard]] const LightRecord* record(LightId id) const noexcept;

    /// All records in creation order.
    [[nodiscard]] std::vector<const LightRecord*> records() const;

private:
    Scene&              m_scene;
    const LightFactory& m_factory;

    std::map<LightId, LightRecord> m_records;
    DragState                      m_drag = DragIdle{};

    void applyPosition(LightRecord& rec, PlacementSide side);
};
