// Snapshot pipeline: capture density, indicator hiding, delivery through
// poll(), stale-result supersession, capture failure and the encode watchdog.

#include "SnapshotPipeline.hpp"
#include "test_fakes.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace matcap_test;
using namespace std::chrono_literals;

namespace {

    class SnapshotPipelineTest : public ::testing::Test {
    protected:
        void SetUp() override {
            auto script = std::make_shared<ScriptedSceneQuery::Script>();
            auto scene  = std::make_unique<Scene>(std::make_unique<ScriptedSceneQuery>(script), smallSurfaces());
            world       = std::make_unique<FakeWorld>(std::move(scene));
            pipeline    = std::make_unique<SnapshotPipeline>(*world, encoder, &observer);

            exportPath = std::filesystem::temp_directory_path() /
                         ("matcap_snapshot_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                          ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".png");
            std::filesystem::remove(exportPath);

            cfg.sizes.exportRatio        = 4.0f;
            cfg.snapshot.encodeTimeoutMs = 1000;
            cfg.exportPath               = exportPath;
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove(exportPath, ec);
        }

        std::unique_ptr<FakeWorld>        world;
        ManualEncoder                     encoder;
        RecordingObserver                 observer;
        std::unique_ptr<SnapshotPipeline> pipeline;
        EditorConfig                      cfg;
        std::filesystem::path             exportPath;

        const SnapshotPipeline::Clock::time_point t0 = SnapshotPipeline::Clock::now();
    };

    // ---------------------------------------------------------------------------
    // Capture
    // ---------------------------------------------------------------------------

    TEST_F(SnapshotPipelineTest, PreviewRendersAtUnitDensity) {
        pipeline->snapshot(false, cfg, t0);

        ASSERT_EQ(world->renders.size(), 1u);
        EXPECT_FLOAT_EQ(world->renders[0].pixelRatio, 1.0f);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 1.0f);
    }

    TEST_F(SnapshotPipelineTest, ExportRendersAtExportRatioAndResetsAfterEncode) {
        const uint64_t id = pipeline->snapshot(true, cfg, t0);

        ASSERT_EQ(world->renders.size(), 1u);
        EXPECT_FLOAT_EQ(world->renders[0].pixelRatio, 4.0f);
        EXPECT_EQ(encoder.widthOf(id), 16);

        // Still at export density while the encode is in flight.
        pipeline->poll(t0);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 4.0f);

        encoder.complete(id);
        EXPECT_EQ(pipeline->poll(t0 + 1ms), 1u);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 1.0f);
    }

    TEST_F(SnapshotPipelineTest, IndicatorIsHiddenDuringEveryCapture) {
        CursorIndicator& indicator = world->scene().indicator();

        indicator.setVisible(true);
        pipeline->snapshot(false, cfg, t0);
        EXPECT_TRUE(indicator.visible());

        indicator.setVisible(false);
        pipeline->snapshot(true, cfg, t0);
        EXPECT_FALSE(indicator.visible());

        for (const auto& r : world->renders)
            EXPECT_FALSE(r.indicatorVisible);
    }

    TEST_F(SnapshotPipelineTest, CapturesThroughTheOrthographicCamera) {
        pipeline->snapshot(false, cfg, t0);

        ASSERT_EQ(world->renders.size(), 1u);
        EXPECT_EQ(world->renders[0].viewMode, ViewMode::ORTHOGRAPHIC);

        const Viewport& cam = pipeline->captureCamera();
        const glm::vec3 eye = cam.cameraPosition();
        EXPECT_NEAR(eye.x, 0.0f, 1e-5f);
        EXPECT_NEAR(eye.y, 0.0f, 1e-5f);
        EXPECT_NEAR(eye.z, 1.0f, 1e-5f);

        // Half-size 0.3: the render sphere rim touches the frame edges.
        const glm::vec3 rim = cam.projectNdc({0.3f, 0.0f, 0.0f});
        EXPECT_NEAR(rim.x, 1.0f, 1e-4f);
    }

    // ---------------------------------------------------------------------------
    // Delivery
    // ---------------------------------------------------------------------------

    TEST_F(SnapshotPipelineTest, PreviewIsPublishedOnPoll) {
        const uint64_t id = pipeline->snapshot(false, cfg, t0);
        EXPECT_EQ(pipeline->pendingCount(), 1u);

        EXPECT_EQ(pipeline->poll(t0), 0u);
        EXPECT_TRUE(observer.previews.empty());

        encoder.complete(id);
        EXPECT_EQ(pipeline->poll(t0), 1u);

        ASSERT_EQ(observer.previews.size(), 1u);
        EXPECT_EQ(observer.previews[0]->requestId, id);
        EXPECT_EQ(pipeline->pendingCount(), 0u);
        EXPECT_TRUE(observer.exports.empty());
    }

    TEST_F(SnapshotPipelineTest, ExportWritesTheEncodedBytes) {
        const uint64_t id = pipeline->snapshot(true, cfg, t0);
        encoder.complete(id);
        pipeline->poll(t0);

        ASSERT_EQ(observer.exports.size(), 1u);
        EXPECT_TRUE(observer.exports[0].ok);
        EXPECT_EQ(observer.exports[0].path, exportPath);
        EXPECT_TRUE(observer.previews.empty());

        std::ifstream in(exportPath, std::ios::binary);
        ASSERT_TRUE(in.good());
        const std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        ASSERT_EQ(bytes.size(), 5u);
        EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0x89);
    }

    TEST_F(SnapshotPipelineTest, UnwritableExportPathReportsFailure) {
        cfg.exportPath = std::filesystem::temp_directory_path() / "matcap_no_such_dir" / "deeper" / "out.png";

        const uint64_t id = pipeline->snapshot(true, cfg, t0);
        encoder.complete(id);
        pipeline->poll(t0);

        ASSERT_EQ(observer.exports.size(), 1u);
        EXPECT_FALSE(observer.exports[0].ok);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 1.0f);
    }

    TEST_F(SnapshotPipelineTest, EncodeFailureIsReportedForExports) {
        const uint64_t id = pipeline->snapshot(true, cfg, t0);
        encoder.fail(id);
        EXPECT_EQ(pipeline->poll(t0), 0u);

        ASSERT_EQ(observer.exports.size(), 1u);
        EXPECT_FALSE(observer.exports[0].ok);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 1.0f);
        EXPECT_FALSE(std::filesystem::exists(exportPath));
    }

    // ---------------------------------------------------------------------------
    // Supersession
    // ---------------------------------------------------------------------------

    TEST_F(SnapshotPipelineTest, StalePreviewIsDropped) {
        const uint64_t older = pipeline->snapshot(false, cfg, t0);
        const uint64_t newer = pipeline->snapshot(false, cfg, t0);
        EXPECT_GT(newer, older);

        // The older result arrives first but is already superseded.
        encoder.complete(older);
        EXPECT_EQ(pipeline->poll(t0), 0u);
        EXPECT_TRUE(observer.previews.empty());
        EXPECT_EQ(pipeline->pendingCount(), 1u);

        encoder.complete(newer);
        EXPECT_EQ(pipeline->poll(t0), 1u);
        ASSERT_EQ(observer.previews.size(), 1u);
        EXPECT_EQ(observer.previews[0]->requestId, newer);
    }

    TEST_F(SnapshotPipelineTest, PreviewNeverCancelsAnExport) {
        const uint64_t exportId  = pipeline->snapshot(true, cfg, t0);
        const uint64_t previewId = pipeline->snapshot(false, cfg, t0);

        EXPECT_EQ(pipeline->latestRequest(SnapshotKind::Export), exportId);
        EXPECT_EQ(pipeline->latestRequest(SnapshotKind::Preview), previewId);

        encoder.complete(previewId);
        encoder.complete(exportId);
        EXPECT_EQ(pipeline->poll(t0), 2u);

        EXPECT_EQ(observer.previews.size(), 1u);
        ASSERT_EQ(observer.exports.size(), 1u);
        EXPECT_TRUE(observer.exports[0].ok);
    }

    TEST_F(SnapshotPipelineTest, NewerExportSupersedesOlderExport) {
        const uint64_t first  = pipeline->snapshot(true, cfg, t0);
        const uint64_t second = pipeline->snapshot(true, cfg, t0);

        encoder.complete(first);
        encoder.complete(second);
        pipeline->poll(t0);

        // The superseded export is reported as failed, the newer one delivered.
        ASSERT_EQ(observer.exports.size(), 2u);
        EXPECT_FALSE(observer.exports[0].ok);
        EXPECT_TRUE(observer.exports[1].ok);
        EXPECT_EQ(pipeline->pendingCount(), 0u);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 1.0f);
    }

    TEST_F(SnapshotPipelineTest, SupersededExportDoesNotResetTheNewerExportDensity) {
        const uint64_t first = pipeline->snapshot(true, cfg, t0);
        pipeline->snapshot(true, cfg, t0);

        encoder.complete(first);
        EXPECT_EQ(pipeline->poll(t0), 0u);

        ASSERT_EQ(observer.exports.size(), 1u);
        EXPECT_FALSE(observer.exports[0].ok);
        EXPECT_EQ(observer.exports[0].path, exportPath);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 4.0f);
        EXPECT_EQ(pipeline->pendingCount(), 1u);
    }

    // ---------------------------------------------------------------------------
    // Capture failure
    // ---------------------------------------------------------------------------

    TEST_F(SnapshotPipelineTest, FailedExportCaptureRestoresStateAndReportsFailure) {
        CursorIndicator& indicator = world->scene().indicator();
        indicator.setVisible(true);
        world->failRenders = true;

        EXPECT_EQ(pipeline->snapshot(true, cfg, t0), 0u);

        EXPECT_TRUE(indicator.visible());
        EXPECT_FLOAT_EQ(world->pixelRatio(), 1.0f);
        EXPECT_EQ(pipeline->pendingCount(), 0u);
        EXPECT_TRUE(encoder.submitted.empty());
        EXPECT_EQ(pipeline->latestRequest(SnapshotKind::Export), 0u);

        ASSERT_EQ(observer.exports.size(), 1u);
        EXPECT_FALSE(observer.exports[0].ok);
        EXPECT_EQ(observer.exports[0].path, exportPath);
    }

    TEST_F(SnapshotPipelineTest, FailedPreviewCaptureIsDroppedQuietly) {
        world->failRenders = true;

        EXPECT_EQ(pipeline->snapshot(false, cfg, t0), 0u);
        EXPECT_EQ(pipeline->pendingCount(), 0u);
        EXPECT_TRUE(observer.exports.empty());
        EXPECT_TRUE(observer.previews.empty());
    }

    TEST_F(SnapshotPipelineTest, CaptureAfterAFailureStillWorks) {
        world->failRenders = true;
        pipeline->snapshot(true, cfg, t0);

        world->failRenders = false;
        const uint64_t id  = pipeline->snapshot(true, cfg, t0);
        ASSERT_NE(id, 0u);
        encoder.complete(id);
        EXPECT_EQ(pipeline->poll(t0), 1u);

        ASSERT_EQ(observer.exports.size(), 2u);
        EXPECT_TRUE(observer.exports[1].ok);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 1.0f);
    }

    // ---------------------------------------------------------------------------
    // Watchdog
    // ---------------------------------------------------------------------------

    TEST_F(SnapshotPipelineTest, StalledPreviewIsAbandoned) {
        pipeline->snapshot(false, cfg, t0);

        pipeline->poll(t0 + 999ms);
        EXPECT_EQ(pipeline->pendingCount(), 1u);

        pipeline->poll(t0 + 1000ms);
        EXPECT_EQ(pipeline->pendingCount(), 0u);
        EXPECT_TRUE(observer.previews.empty());
    }

    TEST_F(SnapshotPipelineTest, StalledExportIsAbandonedAndDensityReset) {
        pipeline->snapshot(true, cfg, t0);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 4.0f);

        pipeline->poll(t0 + 5s);

        EXPECT_EQ(pipeline->pendingCount(), 0u);
        EXPECT_FLOAT_EQ(world->pixelRatio(), 1.0f);
        ASSERT_EQ(observer.exports.size(), 1u);
        EXPECT_FALSE(observer.exports[0].ok);
    }

    TEST_F(SnapshotPipelineTest, LateResultAfterWatchdogIsIgnored) {
        const uint64_t id = pipeline->snapshot(false, cfg, t0);
        pipeline->poll(t0 + 2s);

        encoder.complete(id);
        EXPECT_EQ(pipeline->poll(t0 + 3s), 0u);
        EXPECT_TRUE(observer.previews.empty());
    }

} // namespace
