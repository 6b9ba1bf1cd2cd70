// EditorConfig text format: round trip, tolerant keys, strict values and
// range sanitizing.

#include "EditorConfig.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>

namespace {

    class EditorConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            path = std::filesystem::temp_directory_path() /
                   (std::string("matcap_config_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".cfg");
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        void write(const std::string& text) const {
            std::ofstream out(path);
            out << text;
        }

        std::filesystem::path path;
    };

    TEST_F(EditorConfigTest, RoundTripPreservesEveryField) {
        EditorConfig cfg;
        cfg.ambient.color            = {0.25f, 0.5f, 0.75f};
        cfg.ambient.intensity        = 0.6f;
        cfg.material.roughness       = 0.15f;
        cfg.material.metalness       = 0.9f;
        cfg.create.distance          = 0.45f;
        cfg.create.lightType         = LightType::Spot;
        cfg.create.side              = PlacementSide::Back;
        cfg.displayRatio             = 2.0f;
        cfg.sizes.exportSize         = 512;
        cfg.sizes.exportRatio        = 2.5f;
        cfg.view.fovDeg              = 30.0f;
        cfg.view.distance            = 1.5f;
        cfg.capture.halfSize         = 0.35f;
        cfg.capture.nearClip         = 0.25f;
        cfg.capture.farClip          = 50.0f;
        cfg.capture.distance         = 2.0f;
        cfg.snapshot.encodeTimeoutMs = 1234;
        cfg.exportPath               = "out dir/my matcap.png";
        cfg.isUILightVisible         = true;

        ASSERT_TRUE(config::saveEditorConfig(path, cfg));

        EditorConfig loaded;
        ASSERT_TRUE(config::loadEditorConfig(path, loaded));

        EXPECT_EQ(loaded.ambient.color, cfg.ambient.color);
        EXPECT_FLOAT_EQ(loaded.ambient.intensity, cfg.ambient.intensity);
        EXPECT_FLOAT_EQ(loaded.material.roughness, cfg.material.roughness);
        EXPECT_FLOAT_EQ(loaded.material.metalness, cfg.material.metalness);
        EXPECT_FLOAT_EQ(loaded.create.distance, cfg.create.distance);
        EXPECT_EQ(loaded.create.lightType, LightType::Spot);
        EXPECT_EQ(loaded.create.side, PlacementSide::Back);
        EXPECT_FLOAT_EQ(loaded.displayRatio, 2.0f);
        EXPECT_EQ(loaded.sizes.exportSize, 512);
        EXPECT_FLOAT_EQ(loaded.sizes.exportRatio, 2.5f);
        EXPECT_FLOAT_EQ(loaded.view.fovDeg, 30.0f);
        EXPECT_FLOAT_EQ(loaded.view.distance, 1.5f);
        EXPECT_FLOAT_EQ(loaded.capture.halfSize, 0.35f);
        EXPECT_FLOAT_EQ(loaded.capture.nearClip, 0.25f);
        EXPECT_FLOAT_EQ(loaded.capture.farClip, 50.0f);
        EXPECT_FLOAT_EQ(loaded.capture.distance, 2.0f);
        EXPECT_EQ(loaded.snapshot.encodeTimeoutMs, 1234);
        EXPECT_EQ(loaded.exportPath, cfg.exportPath);
        EXPECT_TRUE(loaded.isUILightVisible);
    }

    TEST_F(EditorConfigTest, ExportPathWithQuotesAndBackslashesRoundTrips) {
        EditorConfig cfg;
        cfg.exportPath       = "renders/say \"cheese\" \\ v2.png";
        cfg.isUILightVisible = true;

        ASSERT_TRUE(config::saveEditorConfig(path, cfg));

        EditorConfig loaded;
        ASSERT_TRUE(config::loadEditorConfig(path, loaded));
        EXPECT_EQ(loaded.exportPath, cfg.exportPath);
        // Keys after the path are still read.
        EXPECT_TRUE(loaded.isUILightVisible);
    }

    TEST_F(EditorConfigTest, QuotedValuesUnescapeBackslashes) {
        write("matcap_config 1\n"
              "export.path \"a \\\"b\\\" \\\\c.png\"\n");

        EditorConfig cfg;
        ASSERT_TRUE(config::loadEditorConfig(path, cfg));
        EXPECT_EQ(cfg.exportPath, std::filesystem::path("a \"b\" \\c.png"));
    }

    TEST_F(EditorConfigTest, UnknownKeysAreSkipped) {
        write("matcap_config 1\n"
              "# comment\n"
              "// another comment\n"
              "future.option 1 2 3\n"
              "create.distance 0.3\n");

        EditorConfig cfg;
        ASSERT_TRUE(config::loadEditorConfig(path, cfg));
        EXPECT_FLOAT_EQ(cfg.create.distance, 0.3f);
    }

    TEST_F(EditorConfigTest, InvalidValueLeavesConfigUntouched) {
        write("matcap_config 1\n"
              "create.distance 0.3\n"
              "material.roughness shiny\n");

        EditorConfig cfg;
        cfg.create.distance = 0.7f;
        EXPECT_FALSE(config::loadEditorConfig(path, cfg));
        EXPECT_FLOAT_EQ(cfg.create.distance, 0.7f);
    }

    TEST_F(EditorConfigTest, LightTypeNamesAreCaseInsensitive) {
        write("matcap_config 1\n"
              "create.lightType directional\n"
              "create.side back\n");

        EditorConfig cfg;
        ASSERT_TRUE(config::loadEditorConfig(path, cfg));
        EXPECT_EQ(cfg.create.lightType, LightType::Directional);
        EXPECT_EQ(cfg.create.side, PlacementSide::Back);
    }

    TEST_F(EditorConfigTest, MissingHeaderIsRejected) {
        write("create.distance 0.3\n");

        EditorConfig cfg;
        EXPECT_FALSE(config::loadEditorConfig(path, cfg));
        EXPECT_FLOAT_EQ(cfg.create.distance, 0.2f);
    }

    TEST_F(EditorConfigTest, MissingFileIsReportedNotThrown) {
        EditorConfig cfg;
        EXPECT_FALSE(config::loadEditorConfig(path.parent_path() / "matcap_definitely_missing.cfg", cfg));
    }

    TEST_F(EditorConfigTest, LoadedValuesAreSanitized) {
        write("matcap_config 1\n"
              "material.roughness 3\n"
              "create.distance -1\n"
              "sizes.exportSize 4\n"
              "ambient.color 2 -1 0.5\n");

        EditorConfig cfg;
        ASSERT_TRUE(config::loadEditorConfig(path, cfg));
        EXPECT_FLOAT_EQ(cfg.material.roughness, 1.0f);
        EXPECT_FLOAT_EQ(cfg.create.distance, 0.0f);
        EXPECT_EQ(cfg.sizes.exportSize, 16);
        EXPECT_EQ(cfg.ambient.color, glm::vec3(1.0f, 0.0f, 0.5f));
    }

    TEST(EditorConfigSanitize, NonFiniteFallsBackToDefaults) {
        EditorConfig cfg;
        cfg.ambient.intensity = std::numeric_limits<float>::quiet_NaN();
        cfg.sizes.exportRatio = std::numeric_limits<float>::infinity();
        cfg.capture.farClip   = 0.1f; // behind the near plane
        cfg.exportPath.clear();

        config::sanitize(cfg);

        const EditorConfig def;
        EXPECT_FLOAT_EQ(cfg.ambient.intensity, def.ambient.intensity);
        EXPECT_FLOAT_EQ(cfg.sizes.exportRatio, def.sizes.exportRatio);
        EXPECT_GT(cfg.capture.farClip, cfg.capture.nearClip);
        EXPECT_EQ(cfg.exportPath, def.exportPath);
    }

    TEST(EditorConfigSanitize, ExportTargetEdgeIsCapped) {
        EditorConfig cfg;
        cfg.sizes.exportSize  = 8192;
        cfg.sizes.exportRatio = 16.0f;
        config::sanitize(cfg);

        EXPECT_EQ(cfg.sizes.exportSize, 8192);
        EXPECT_FLOAT_EQ(cfg.sizes.exportRatio, 1.0f);

        cfg.sizes.exportSize  = 1024;
        cfg.sizes.exportRatio = 16.0f;
        config::sanitize(cfg);
        EXPECT_FLOAT_EQ(cfg.sizes.exportRatio, 8.0f);
        EXPECT_LE(cfg.sizes.exportSize * cfg.sizes.exportRatio, float(config::kMaxTargetEdge));

        // Products already inside the cap are left alone.
        cfg.sizes.exportSize  = 256;
        cfg.sizes.exportRatio = 4.0f;
        config::sanitize(cfg);
        EXPECT_FLOAT_EQ(cfg.sizes.exportRatio, 4.0f);
    }

} // namespace
