// CPU renderer, PNG encoding and the software world.

#include "Image.hpp"
#include "LightFactory.hpp"
#include "PngEncoder.hpp"
#include "Renderer.hpp"
#include "Scene.hpp"
#include "SceneQueryEmbree.hpp"
#include "SoftwareWorld.hpp"
#include "Viewport.hpp"
#include "test_fakes.hpp"
#include <chrono>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace matcap_test;

namespace {

    constexpr int kSize = 32;

    int luminance(const glm::u8vec4& p) {
        return static_cast<int>(p.r) + p.g + p.b;
    }

    class RendererTest : public ::testing::Test {
    protected:
        void SetUp() override {
            scene = std::make_unique<Scene>(std::make_unique<SceneQueryEmbree>(), smallSurfaces());
            scene->setAmbient(glm::vec3(1.0f), 0.0f);

            camera.resize(kSize, kSize);
            camera.orthographic(0.3f, 0.5f, 200.0f);
            camera.setOrbit(glm::vec3(0.0f), 1.0f, glm::vec2(0.0f));

            ASSERT_TRUE(target.allocate(kSize, kSize, 4));
        }

        LightId addPointLight(const glm::vec3& position) {
            const LightId id = scene->addLight(factory.create(LightType::Point));
            scene->setLightPosition(id, position);
            return id;
        }

        std::unique_ptr<Scene> scene;
        Viewport               camera;
        Image                  target;
        Renderer               renderer;
        LightFactory           factory;
    };

    // ---------------------------------------------------------------------------
    // Shading
    // ---------------------------------------------------------------------------

    TEST_F(RendererTest, MissedPixelsAreTransparent) {
        addPointLight(glm::vec3(0.0f, 0.0f, 0.5f));
        renderer.render(*scene, camera, target);

        EXPECT_EQ(target.pixel(0, 0).a, 0);
        EXPECT_EQ(target.pixel(kSize - 1, kSize - 1).a, 0);
        EXPECT_EQ(target.pixel(kSize / 2, kSize / 2).a, 255);
    }

    TEST_F(RendererTest, FrontLightBrightensThePole) {
        addPointLight(glm::vec3(0.0f, 0.0f, 0.5f));
        renderer.render(*scene, camera, target);

        const glm::u8vec4 pole = target.pixel(kSize / 2, kSize / 2);
        const glm::u8vec4 rim  = target.pixel(kSize - 2, kSize / 2);

        ASSERT_EQ(rim.a, 255);
        EXPECT_GT(luminance(pole), luminance(rim));
        EXPECT_GT(luminance(pole), 600);
    }

    TEST_F(RendererTest, NoLightsLeavesOnlyAmbient) {
        scene->setAmbient(glm::vec3(1.0f), 0.0f);
        renderer.render(*scene, camera, target);

        const glm::u8vec4 pole = target.pixel(kSize / 2, kSize / 2);
        EXPECT_EQ(pole, glm::u8vec4(0, 0, 0, 255));
    }

    TEST_F(RendererTest, BackFacingPointsOnlySeeAmbient) {
        scene->setAmbient(glm::vec3(0.5f), 0.5f);

        LightInstance dir = factory.create(LightType::Directional);
        dir.light.position = glm::vec3(0.0f, 0.0f, 1.0f);
        scene->addLight(dir);

        const glm::vec3 lit  = Renderer::shade(*scene, glm::vec3(0, 0, 0.3f), glm::vec3(0, 0, 1), glm::vec3(0, 0, 1));
        const glm::vec3 dark = Renderer::shade(*scene, glm::vec3(0, 0, -0.3f), glm::vec3(0, 0, -1), glm::vec3(0, 0, -1));

        EXPECT_GT(lit.r, 0.9f);
        EXPECT_NEAR(dark.r, 0.25f, 1e-5f);
        EXPECT_NEAR(dark.g, 0.25f, 1e-5f);
    }

    TEST_F(RendererTest, SpotConeMasksOffAxisPoints) {
        LightInstance spot      = factory.create(LightType::Spot);
        spot.light.position     = glm::vec3(0.0f, 0.0f, 0.5f);
        spot.light.intensity    = 1.0f;
        spot.light.spotAngleRad = 0.1f;
        spot.light.spotPenumbra = 0.0f;
        spot.target             = glm::vec3(0.0f);
        scene->addLight(spot);

        const glm::vec3 onAxis = Renderer::shade(*scene, glm::vec3(0, 0, 0.3f), glm::vec3(0, 0, 1), glm::vec3(0, 0, 1));

        const glm::vec3 p(0.1f, 0.0f, std::sqrt(0.09f - 0.01f));
        const glm::vec3 n = glm::normalize(p);
        const glm::vec3 offAxis = Renderer::shade(*scene, p, n, glm::vec3(0, 0, 1));

        EXPECT_GT(onAxis.r, 0.5f);
        EXPECT_FLOAT_EQ(offAxis.r, 0.0f);
    }

    // ---------------------------------------------------------------------------
    // Overlays
    // ---------------------------------------------------------------------------

    TEST_F(RendererTest, VisibleIndicatorIsDrawnOnTop) {
        CursorIndicator& indicator = scene->indicator();
        indicator.setColor(glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
        indicator.place(glm::vec3(0.0f, 0.0f, 0.3f), glm::vec3(1.0f, 0.0f, 0.0f), 0.1f);

        indicator.setVisible(false);
        renderer.render(*scene, camera, target);
        EXPECT_NE(target.pixel(18, 16), glm::u8vec4(255, 0, 0, 255));

        indicator.setVisible(true);
        renderer.render(*scene, camera, target);
        EXPECT_EQ(target.pixel(18, 16), glm::u8vec4(255, 0, 0, 255));
    }

    TEST_F(RendererTest, OverlaysCanBeDisabled) {
        CursorIndicator& indicator = scene->indicator();
        indicator.setColor(glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
        indicator.place(glm::vec3(0.0f, 0.0f, 0.3f), glm::vec3(1.0f, 0.0f, 0.0f), 0.1f);
        indicator.setVisible(true);

        Renderer::Settings settings = renderer.settings();
        settings.drawOverlays       = false;
        renderer.setSettings(settings);

        renderer.render(*scene, camera, target);
        EXPECT_NE(target.pixel(18, 16), glm::u8vec4(255, 0, 0, 255));
    }

    TEST_F(RendererTest, IndicatorCrossingTheEyeIsClippedAtTheNearPlane) {
        // Zoomed all the way in: the eye sits inside the render sphere.
        camera.perspective(45.0f, 0.01f, 100.0f);
        camera.setOrbit(glm::vec3(0.0f), 0.02f, glm::vec2(0.0f));

        CursorIndicator& indicator = scene->indicator();
        indicator.setColor(glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
        indicator.setVisible(true);

        // Starts behind the eye, then exactly in the eye plane (w == 0).
        for (const float startZ : {0.3f, 0.02f}) {
            SCOPED_TRACE(startZ);
            indicator.place(glm::vec3(0.001f, 0.0f, startZ), glm::vec3(0.0f, 0.0f, -1.0f), startZ + 0.2f);

            renderer.render(*scene, camera, target);

            // Only the part in front of the near plane lands, just right of center.
            EXPECT_EQ(target.pixel(17, 16), glm::u8vec4(255, 0, 0, 255));
            EXPECT_NE(target.pixel(0, 0), glm::u8vec4(255, 0, 0, 255));
            EXPECT_NE(target.pixel(31, 31), glm::u8vec4(255, 0, 0, 255));
        }
    }

    TEST_F(RendererTest, FarOffscreenSegmentsAreClippedToTheTarget) {
        CursorIndicator& indicator = scene->indicator();
        indicator.setColor(glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
        indicator.setVisible(true);
        indicator.place(glm::vec3(0.0f, 0.0f, 0.3f), glm::vec3(1.0f, 0.0f, 0.0f), 1e7f);

        const auto start = std::chrono::steady_clock::now();
        renderer.render(*scene, camera, target);
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

        EXPECT_EQ(target.pixel(18, 16), glm::u8vec4(255, 0, 0, 255));
        EXPECT_EQ(target.pixel(kSize - 1, 16), glm::u8vec4(255, 0, 0, 255));
        EXPECT_NE(target.pixel(2, 16), glm::u8vec4(255, 0, 0, 255));
    }

    // ---------------------------------------------------------------------------
    // Image
    // ---------------------------------------------------------------------------

    TEST(ImageTest, OversizedAllocationLeavesTheImageIntact) {
        Image img(4, 3, 4);
        img.fill(glm::u8vec4(10, 20, 30, 255));

        const int huge = std::numeric_limits<int>::max();
        EXPECT_THROW(img.allocate(huge, huge, 4), std::length_error);

        EXPECT_TRUE(img.valid());
        EXPECT_EQ(img.width(), 4);
        EXPECT_EQ(img.height(), 3);
        EXPECT_EQ(img.channels(), 4);
        EXPECT_EQ(img.pixel(3, 2), glm::u8vec4(10, 20, 30, 255));
    }

    TEST(ImageTest, InvalidSizeClearsTheImage) {
        Image img(4, 4, 4);
        EXPECT_FALSE(img.allocate(0, 4, 4));
        EXPECT_FALSE(img.valid());
        EXPECT_EQ(img.width(), 0);
    }

    // ---------------------------------------------------------------------------
    // PngEncoder
    // ---------------------------------------------------------------------------

    Image makeGradient(int w, int h) {
        Image img(w, h, 4);
        for (int y = 0; y < h; ++y)
            for (int x = 0; x < w; ++x)
                img.setPixel(x, y, glm::u8vec4(x * 40, y * 60, 200, (x + y) % 2 ? 255 : 0));
        return img;
    }

    TEST(PngEncoderTest, EncodedBytesDecodeToTheSamePixels) {
        const Image source = makeGradient(5, 3);

        std::vector<uint8_t> bytes;
        ASSERT_TRUE(PngEncoder::encodePng(source, bytes));
        ASSERT_GE(bytes.size(), 8u);
        EXPECT_EQ(bytes[0], 0x89);
        EXPECT_EQ(bytes[1], 'P');

        Image decoded;
        ASSERT_TRUE(decoded.loadFromEncodedMemory(bytes.data(), static_cast<int>(bytes.size())));
        ASSERT_EQ(decoded.width(), 5);
        ASSERT_EQ(decoded.height(), 3);
        ASSERT_EQ(decoded.channels(), 4);

        for (int y = 0; y < 3; ++y)
            for (int x = 0; x < 5; ++x)
                EXPECT_EQ(decoded.pixel(x, y), source.pixel(x, y)) << x << "," << y;
    }

    TEST(PngEncoderTest, WorkerFulfilsFutures) {
        PngEncoder encoder;

        auto future = encoder.encode(makeGradient(4, 4), 7);
        ASSERT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);

        const EncodedImage result = future.get();
        EXPECT_EQ(result.requestId, 7u);
        EXPECT_EQ(result.width, 4);
        EXPECT_EQ(result.height, 4);
        EXPECT_FALSE(result.empty());
    }

    TEST(PngEncoderTest, InvalidImageFailsTheFuture) {
        PngEncoder encoder;

        auto future = encoder.encode(Image{}, 3);
        ASSERT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
        EXPECT_THROW(future.get(), std::runtime_error);
    }

    // ---------------------------------------------------------------------------
    // SoftwareWorld
    // ---------------------------------------------------------------------------

    TEST(SoftwareWorldTest, TargetScalesWithPixelRatio) {
        SoftwareWorld world(std::make_unique<Scene>(std::make_unique<ScriptedSceneQuery>(nullptr), smallSurfaces()), 8, 6);
        EXPECT_EQ(world.camera().width(), 8);
        EXPECT_EQ(world.camera().height(), 6);

        world.setPixelRatio(2.0f);
        world.render(world.camera());
        EXPECT_EQ(world.renderTarget().width(), 16);
        EXPECT_EQ(world.renderTarget().height(), 12);

        world.setPixelRatio(1.0f);
        world.render(world.camera());
        EXPECT_EQ(world.renderTarget().width(), 8);
        EXPECT_EQ(world.renderTarget().height(), 6);
    }

    TEST(SoftwareWorldTest, InvalidRatioFallsBackToOne) {
        SoftwareWorld world(std::make_unique<Scene>(std::make_unique<ScriptedSceneQuery>(nullptr), smallSurfaces()), 8, 8);

        world.setPixelRatio(0.0f);
        EXPECT_FLOAT_EQ(world.pixelRatio(), 1.0f);
        world.setPixelRatio(std::numeric_limits<float>::quiet_NaN());
        EXPECT_FLOAT_EQ(world.pixelRatio(), 1.0f);
    }

    TEST(SoftwareWorldTest, RejectsNullSceneAndEmptySize) {
        EXPECT_THROW(SoftwareWorld(nullptr, 8, 8), std::invalid_argument);
        EXPECT_THROW(SoftwareWorld(std::make_unique<Scene>(std::make_unique<ScriptedSceneQuery>(nullptr), smallSurfaces()), 0, 8),
                     std::invalid_argument);
    }

} // namespace
