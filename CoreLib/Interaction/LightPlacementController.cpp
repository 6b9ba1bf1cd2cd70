#include "LightPlacementController.hpp"

#include <cmath>
#include <iostream>

#include "LightFactory.hpp"
#include "Placement.hpp"
#include "Scene.hpp"
#include "Viewport.hpp"

LightPlacementController::LightPlacementController(Scene& scene, const LightFactory& factory) :
    m_scene{scene},
    m_factory{factory}
{
}

CommitResult LightPlacementController::commit(const std::optional<HitRecord>& hit,
                                              const EditorConfig&             cfg,
                                              const Viewport&                 camera)
{
    CommitResult result;
    if (!hit)
        return result;

    LightInstance inst = m_factory.create(cfg.create.lightType);
    inst.light.position = placement::lightPosition(hit->point, hit->surfaceNormal, cfg.create.distance, cfg.create.side);

    const LightId id = m_scene.addLight(inst);

    LightRecord rec;
    rec.lightId           = id;
    rec.type              = cfg.create.lightType;
    rec.positionOnSurface = hit->point;
    rec.surfaceNormal     = hit->surfaceNormal;
    rec.distance          = cfg.create.distance;
    rec.lightPosition     = inst.light.position;
    rec.screenPosition    = placement::handleScreenPosition(hit->point,
                                                            hit->surfaceNormal,
                                                            camera,
                                                            static_cast<float>(cfg.sizes.exportSize));

    m_records.emplace(id, rec);

    result.status  = CommitResult::Status::Created;
    result.lightId = id;
    return result;
}

bool LightPlacementController::startDrag(LightId id)
{
    if (m_records.find(id) == m_records.end())
        return false;

    m_drag = DragActive{id};
    return true;
}

const LightRecord* LightPlacementController::dragUpdate(const HitRecord&    hit,
                                                        const EditorConfig& cfg,
                                                        const Viewport&     camera)
{
    const LightId id = draggedLight();
    if (id == kInvalidLightId)
        return nullptr;

    auto it = m_records.find(id);
    if (it == m_records.end())
    {
        // Record vanished behind our back; drop the drag.
        std::cerr << "LightPlacementController: dragged light " << id << " has no record\n";
        m_drag = DragIdle{};
        return nullptr;
    }

    LightRecord& rec      = it->second;
    rec.positionOnSurface = hit.point;
    rec.surfaceNormal     = hit.surfaceNormal;
    rec.screenPosition    = placement::handleScreenPosition(hit.point,
                                                            hit.surfaceNormal,
                                                            camera,
                                                            static_cast<float>(cfg.sizes.exportSize));
    applyPosition(rec, cfg.create.side);
    return &rec;
}

void LightPlacementController::stopDrag() noexcept
{
    m_drag = DragIdle{};
}

const LightRecord* LightPlacementController::setDistance(LightId id, float distance, const EditorConfig& cfg)
{
    if (!std::isfinite(distance) || distance < 0.0f)
        return nullptr;

    auto it = m_records.find(id);
    if (it == m_records.end())
        return nullptr;

    LightRecord& rec = it->second;
    rec.distance     = distance;
    applyPosition(rec, cfg.create.side);
    return &rec;
}

bool LightPlacementController::deleteLight(LightId id)
{
    auto it = m_records.find(id);
    if (it == m_records.end())
        return false;

    m_scene.removeLight(id);
    m_records.erase(it);

    if (draggedLight() == id)
        m_drag = DragIdle{};

    return true;
}

const LightRecord* LightPlacementController::refreshScreenPosition(LightId             id,
                                                                   const EditorConfig& cfg,
                                                                   const Viewport&     camera)
{
    auto it = m_records.find(id);
    if (it == m_records.end())
        return nullptr;

    LightRecord& rec   = it->second;
    rec.screenPosition = placement::handleScreenPosition(rec.positionOnSurface,
                                                         rec.surfaceNormal,
                                                         camera,
                                                         static_cast<float>(cfg.sizes.exportSize));
    return &rec;
}

bool LightPlacementController::isDragging() const noexcept
{
    return std::holds_alternative<DragActive>(m_drag);
}

LightId LightPlacementController::draggedLight() const noexcept
{
    if (const auto* active = std::get_if<DragActive>(&m_drag))
        return active->lightId;
    return kInvalidLightId;
}

const LightRecord* LightPlacementController::record(LightId id) const noexcept
{
    auto it = m_records.find(id);
    return (it != m_records.end()) ? &it->second : nullptr;
}

std::vector<const LightRecord*> LightPlacementController::records() const
{
    std::vector<const LightRecord*> out;
    out.reserve(m_records.size());
    for (const auto& [id, rec] : m_records)
        out.push_back(&rec);
    return out;
}

void LightPlacementController::applyPosition(LightRecord& rec, PlacementSide side)
{
    rec.lightPosition = placement::lightPosition(rec.positionOnSurface, rec.surfaceNormal, rec.distance, side);
    m_scene.setLightPosition(rec.lightId, rec.lightPosition);
}
