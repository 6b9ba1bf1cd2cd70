//=============================================================================
// SnapshotPipeline.hpp
//=============================================================================
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <vector>

#include "EditorConfig.hpp"
#include "ImageEncoder.hpp"
#include "Viewport.hpp"

class EditorObserver;
class World;

enum class SnapshotKind : uint32_t
{
    Preview = 0,
    Export  = 1
};

/**
 * @brief Renders the scene through the capture camera and publishes PNGs.
 *
 * snapshot() renders synchronously, then hands a copy of the render target
 * to the encoder. Results come back through poll(), which must be called
 * from the thread that owns the editor.
 *
 * Request ids grow monotonically. A newer request of the same kind makes
 * older in-flight ones stale; stale results are dropped, and a superseded
 * export is reported as imageExported(path, false). Previews never cancel
 * exports. Requests still pending after the encode timeout are
 * abandoned with a warning.
 *
 * Pixel ratio: an export renders at cfg.sizes.exportRatio and the ratio is
 * set back to 1 once that export is delivered, fails or is abandoned.
 */
class SnapshotPipeline
{
public:
    using Clock = std::chrono::steady_clock;

    SnapshotPipeline(World& world, ImageEncoder& encoder, EditorObserver* observer = nullptr);

    SnapshotPipeline(const SnapshotPipeline&)            = delete;
    SnapshotPipeline& operator=(const SnapshotPipeline&) = delete;

    void setObserver(EditorObserver* observer) noexcept { m_observer = observer; }

    /**
     * @brief Renders and submits one snapshot.
     *
     * If the render or the submit throws (for example a target too large
     * to allocate), the failure is logged, an export is reported through
     * imageExported(path, false), the indicator and the pixel ratio are
     * restored and nothing is queued.
     * @return Id of the new request, or 0 if nothing was submitted.
     */
    uint64_t snapshot(bool exportRequested, const EditorConfig& cfg, Clock::time_point now = Clock::now());

    /**
     * @brief Delivers finished encodes, drops stale ones and runs the watchdog.
     * @return Number of results published.
     */
    size_t poll(Clock::time_point now = Clock::now());

    [[nodiscard]] size_t pendingCount() const noexcept { return m_pending.size(); }

    /// Newest request id of a kind (0 before the first one).
    [[nodiscard]] uint64_t latestRequest(SnapshotKind kind) const noexcept;

    [[nodiscard]] const Viewport& captureCamera() const noexcept { return m_capture; }

    /// Writes encoded bytes to disk. Returns false (and logs) on failure.
    static bool writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

private:
    struct Pending
    {
        uint64_t                  requestId = 0;
        SnapshotKind              kind      = SnapshotKind::Preview;
        std::future<EncodedImage> future;
        Clock::time_point         deadline;
        std::filesystem::path     exportPath;
    };

    World&          m_world;
    ImageEncoder&   m_encoder;
    EditorObserver* m_observer = nullptr;

    Viewport             m_capture;
    std::vector<Pending> m_pending;

    uint64_t                m_nextRequestId = 1;
    std::array<uint64_t, 2> m_latest        = {0, 0};

    void configureCapture(const EditorConfig& cfg);

    [[nodiscard]] bool isStale(const Pending& p) const noexcept;

    void finishExport(const Pending& p, bool ok);
};
