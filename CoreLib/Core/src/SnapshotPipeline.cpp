#include "SnapshotPipeline.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <memory>

#include "EditorObserver.hpp"
#include "Image.hpp"
#include "Scene.hpp"
#include "World.hpp"

namespace
{
    size_t kindIndex(SnapshotKind kind) noexcept
    {
        return static_cast<size_t>(kind);
    }

    const char* kindName(SnapshotKind kind) noexcept
    {
        return kind == SnapshotKind::Export ? "export" : "preview";
    }

} // namespace

SnapshotPipeline::SnapshotPipeline(World& world, ImageEncoder& encoder, EditorObserver* observer) :
    m_world(world),
    m_encoder(encoder),
    m_observer(observer)
{
}

uint64_t SnapshotPipeline::latestRequest(SnapshotKind kind) const noexcept
{
    return m_latest[kindIndex(kind)];
}

void SnapshotPipeline::configureCapture(const EditorConfig& cfg)
{
    m_capture.orthographic(cfg.capture.halfSize, cfg.capture.nearClip, cfg.capture.farClip);
    m_capture.setOrbit(glm::vec3(0.0f), cfg.capture.distance, glm::vec2(0.0f));
    m_capture.resize(m_world.logicalWidth(), m_world.logicalHeight());
}

uint64_t SnapshotPipeline::snapshot(bool exportRequested, const EditorConfig& cfg, Clock::time_point now)
{
    const SnapshotKind kind = exportRequested ? SnapshotKind::Export : SnapshotKind::Preview;

    CursorIndicator& indicator = m_world.scene().indicator();

    // Restores the indicator on every exit; the density only when the
    // capture never reached the encoder.
    struct CaptureGuard
    {
        CursorIndicator& indicator;
        World&           world;
        const bool       wasVisible;
        bool             submitted = false;
        ~CaptureGuard()
        {
            indicator.setVisible(wasVisible);
            if (!submitted)
                world.setPixelRatio(1.0f);
        }
    } guard{indicator, m_world, indicator.visible()};

    indicator.setVisible(false);
    m_world.setPixelRatio(exportRequested ? cfg.sizes.exportRatio : 1.0f);

    Pending p;
    p.kind     = kind;
    p.deadline = now + std::chrono::milliseconds(cfg.snapshot.encodeTimeoutMs);
    if (exportRequested)
        p.exportPath = cfg.exportPath;

    try
    {
        configureCapture(cfg);
        m_world.render(m_capture);

        p.requestId = m_nextRequestId;
        p.future    = m_encoder.encode(m_world.renderTarget().clone(), p.requestId);
    }
    catch (const std::exception& e)
    {
        std::cerr << "SnapshotPipeline: " << kindName(kind) << " capture failed: " << e.what() << std::endl;
        if (exportRequested && m_observer)
            m_observer->imageExported(p.exportPath, false);
        return 0;
    }

    guard.submitted = true;

    ++m_nextRequestId;
    m_latest[kindIndex(kind)] = p.requestId;

    const uint64_t id = p.requestId;
    m_pending.push_back(std::move(p));
    return id;
}

bool SnapshotPipeline::isStale(const Pending& p) const noexcept
{
    return p.requestId < m_latest[kindIndex(p.kind)];
}

void SnapshotPipeline::finishExport(const Pending& p, bool ok)
{
    m_world.setPixelRatio(1.0f);

    if (m_observer)
        m_observer->imageExported(p.exportPath, ok);
}

size_t SnapshotPipeline::poll(Clock::time_point now)
{
    size_t published = 0;

    // Delivery may re-enter snapshot() through the observer, so the list is
    // detached while it is processed.
    std::vector<Pending> pending;
    pending.swap(m_pending);

    std::vector<Pending> keep;
    keep.reserve(pending.size());

    for (Pending& p : pending)
    {
        if (isStale(p))
        {
            // Superseded; the worker's result is discarded unread. The newer
            // export still owns the pixel ratio.
            if (p.kind == SnapshotKind::Export && m_observer)
                m_observer->imageExported(p.exportPath, false);
            continue;
        }

        if (!p.future.valid())
        {
            std::cerr << "SnapshotPipeline: request " << p.requestId << " has no result" << std::endl;
            if (p.kind == SnapshotKind::Export)
                finishExport(p, false);
            continue;
        }

        if (p.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        {
            if (now >= p.deadline)
            {
                std::cerr << "SnapshotPipeline: " << kindName(p.kind) << " request " << p.requestId
                          << " timed out, abandoning" << std::endl;
                if (p.kind == SnapshotKind::Export)
                    finishExport(p, false);
                continue;
            }

            keep.push_back(std::move(p));
            continue;
        }

        EncodedImage encoded;
        try
        {
            encoded = p.future.get();
        }
        catch (const std::exception& e)
        {
            std::cerr << "SnapshotPipeline: " << kindName(p.kind) << " request " << p.requestId
                      << " failed: " << e.what() << std::endl;
            if (p.kind == SnapshotKind::Export)
                finishExport(p, false);
            continue;
        }

        if (p.kind == SnapshotKind::Export)
        {
            finishExport(p, writeFile(p.exportPath, encoded.bytes));
        }
        else if (m_observer)
        {
            m_observer->previewUpdated(std::make_shared<const EncodedImage>(std::move(encoded)));
        }
        ++published;
    }

    // Requests submitted by observers during delivery go after the survivors.
    for (Pending& p : m_pending)
        keep.push_back(std::move(p));
    m_pending.swap(keep);

    return published;
}

bool SnapshotPipeline::writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& bytes)
{
    if (bytes.empty())
    {
        std::cerr << "SnapshotPipeline: nothing to write to " << path << std::endl;
        return false;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        std::cerr << "SnapshotPipeline: cannot open " << path << " for writing" << std::endl;
        return false;
    }

    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();

    if (!out)
    {
        std::cerr << "SnapshotPipeline: write to " << path << " failed" << std::endl;
        return false;
    }
    return true;
}
