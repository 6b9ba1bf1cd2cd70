// Picking: pointer normalization, the proxy-surface redirect and the
// "miss changes nothing" rule, against both the Embree query and a
// scripted query.

#include "CursorIndicator.hpp"
#include "PickingEngine.hpp"
#include "Scene.hpp"
#include "SceneQueryEmbree.hpp"
#include "SurfaceModel.hpp"
#include "Viewport.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>

using namespace matcap_test;

namespace {

    Viewport makeInteractiveCamera() {
        Viewport camera;
        camera.perspective(45.0f, 0.01f, 100.0f);
        camera.setOrbit(glm::vec3(0.0f), 1.2f, glm::vec2(0.0f));
        camera.resize(256, 256);
        return camera;
    }

    // ---------------------------------------------------------------------------
    // Pointer normalization
    // ---------------------------------------------------------------------------

    TEST(PickingEngine, PointerToNdcUsesExportSizeAndDisplayRatio) {
        PickingEngine::Params params;
        params.exportSize   = 256;
        params.displayRatio = 1.0f;

        glm::vec2 ndc = PickingEngine::pointerToNdc(128.0f, 128.0f, params);
        EXPECT_FLOAT_EQ(ndc.x, 0.0f);
        EXPECT_FLOAT_EQ(ndc.y, 0.0f);

        ndc = PickingEngine::pointerToNdc(0.0f, 0.0f, params);
        EXPECT_FLOAT_EQ(ndc.x, -1.0f);
        EXPECT_FLOAT_EQ(ndc.y, 1.0f);

        // A 2x display reports half the pixels for the same position.
        params.displayRatio = 2.0f;
        ndc = PickingEngine::pointerToNdc(64.0f, 64.0f, params);
        EXPECT_FLOAT_EQ(ndc.x, 0.0f);
        EXPECT_FLOAT_EQ(ndc.y, 0.0f);
    }

    // ---------------------------------------------------------------------------
    // Real surfaces through Embree
    // ---------------------------------------------------------------------------

    class EmbreePickingTest : public ::testing::Test {
    protected:
        void SetUp() override {
            query.rebuild(surfaces);
            camera = makeInteractiveCamera();
        }

        SurfaceModel     surfaces;
        SceneQueryEmbree query;
        Viewport         camera;
        CursorIndicator  indicator;
        PickingEngine    engine;
        PickingEngine::Params params;
    };

    TEST_F(EmbreePickingTest, CenterPointerHitsFrontPole) {
        const auto hit = engine.pick(camera, query, indicator, 128.0f, 128.0f, params);
        ASSERT_TRUE(hit.has_value());

        // From outside, the enclosing probe sphere is always struck first.
        EXPECT_EQ(hit->targetSurface, TargetSurface::NormalSphere);
        EXPECT_NEAR(hit->point.x, 0.0f, 1e-3f);
        EXPECT_NEAR(hit->point.y, 0.0f, 1e-3f);
        EXPECT_NEAR(hit->point.z, 0.3f, 1e-3f);
        EXPECT_GT(hit->surfaceNormal.z, 0.99f);

        EXPECT_EQ(indicator.color(), CursorIndicator::colorFor(TargetSurface::NormalSphere));
        EXPECT_NEAR(indicator.length(), PickingEngine::kIndicatorLength, 1e-6f);
        ASSERT_TRUE(engine.current().has_value());
    }

    TEST_F(EmbreePickingTest, CornerPointerIsRedirectedFromThePlane) {
        const auto hit = engine.pick(camera, query, indicator, 5.0f, 5.0f, params);
        ASSERT_TRUE(hit.has_value());

        EXPECT_EQ(hit->targetSurface, TargetSurface::Plane);
        // The plane hit lies on the upper-left diagonal; the redirect lands on
        // the sphere's silhouette in z = 0.
        EXPECT_NEAR(hit->point.x, -0.212f, 5e-3f);
        EXPECT_NEAR(hit->point.y, 0.212f, 5e-3f);
        EXPECT_NEAR(hit->point.z, 0.0f, 5e-3f);
        EXPECT_NEAR(hit->surfaceNormal.x, -0.707f, 2e-2f);
        EXPECT_NEAR(hit->surfaceNormal.y, 0.707f, 2e-2f);
        EXPECT_NEAR(glm::length(hit->point), 0.3f, 2e-3f);

        EXPECT_EQ(indicator.color(), CursorIndicator::colorFor(TargetSurface::Plane));
    }

    TEST_F(EmbreePickingTest, RingBetweenSpheresIsRedirectedFromTheProbe) {
        // Just outside the render sphere silhouette but inside the probe sphere.
        // At 1.2 units with a 45 degree fov, 0.3 units project to ~75 px.
        const auto hit = engine.pick(camera, query, indicator, 128.0f + 85.0f, 128.0f, params);
        ASSERT_TRUE(hit.has_value());

        EXPECT_EQ(hit->targetSurface, TargetSurface::NormalSphere);
        EXPECT_NEAR(glm::length(hit->point), 0.3f, 2e-3f);
        EXPECT_GT(hit->point.x, 0.0f);
        EXPECT_EQ(indicator.color(), CursorIndicator::colorFor(TargetSurface::NormalSphere));
    }

    TEST(SurfaceColors, MatchTheSurfaceStruckFirst) {
        EXPECT_EQ(CursorIndicator::colorFor(TargetSurface::RenderSphere), un::rgb(0xff0000));
        EXPECT_EQ(CursorIndicator::colorFor(TargetSurface::NormalSphere), un::rgb(0xe5ff00));
        EXPECT_EQ(CursorIndicator::colorFor(TargetSurface::Plane), un::rgb(0x00ffee));
    }

    // ---------------------------------------------------------------------------
    // Scripted query: redirect failures
    // ---------------------------------------------------------------------------

    class ScriptedPickingTest : public ::testing::Test {
    protected:
        void SetUp() override {
            script = std::make_shared<ScriptedSceneQuery::Script>();
            query  = std::make_unique<ScriptedSceneQuery>(script);
            camera = makeInteractiveCamera();
        }

        std::shared_ptr<ScriptedSceneQuery::Script> script;
        std::unique_ptr<ScriptedSceneQuery>         query;
        Viewport                                    camera;
        CursorIndicator                             indicator;
        PickingEngine                               engine;
        PickingEngine::Params                       params;
    };

    TEST_F(ScriptedPickingTest, FailedRedirectLeavesStateUnchanged) {
        // First a normal render sphere hit establishes state.
        *script = [](const un::ray&, SurfaceMask) {
            return makeHit(TargetSurface::RenderSphere, {0.0f, 0.0f, 0.3f}, {0.0f, 0.0f, 1.0f});
        };
        ASSERT_TRUE(engine.pick(camera, *query, indicator, 128.0f, 128.0f, params).has_value());

        const glm::vec4 colorBefore = indicator.color();
        const glm::vec3 posBefore   = indicator.position();

        // Now the first ray hits the probe, but the redirected ray misses.
        *script = [](const un::ray&, SurfaceMask mask) {
            if (mask == kAllSurfaces)
                return makeHit(TargetSurface::NormalSphere, {0.4f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f});
            return SurfaceHit{};
        };

        const auto hit = engine.pick(camera, *query, indicator, 200.0f, 128.0f, params);
        EXPECT_FALSE(hit.has_value());

        ASSERT_TRUE(engine.current().has_value());
        EXPECT_NEAR(engine.current()->point.z, 0.3f, 1e-6f);
        EXPECT_EQ(indicator.color(), colorBefore);
        EXPECT_EQ(indicator.position(), posBefore);
    }

    TEST_F(ScriptedPickingTest, RedirectAimsAtTheOriginAndOnlyTheRenderSphere) {
        const glm::vec3 planePoint(-0.5f, 0.5f, 0.0f);
        *script = [&](const un::ray&, SurfaceMask mask) {
            if (mask == kAllSurfaces)
                return makeHit(TargetSurface::Plane, planePoint, {0.0f, 0.0f, 1.0f});
            return makeHit(TargetSurface::RenderSphere, glm::normalize(planePoint) * 0.3f, glm::normalize(planePoint));
        };

        const auto hit = engine.pick(camera, *query, indicator, 10.0f, 10.0f, params);
        ASSERT_TRUE(hit.has_value());
        ASSERT_EQ(query->calls.size(), 2u);

        const auto& second = query->calls[1];
        EXPECT_EQ(second.mask, surfaceBit(TargetSurface::RenderSphere));
        EXPECT_EQ(second.ray.org, planePoint);

        const glm::vec3 expectedDir = glm::normalize(-planePoint);
        EXPECT_NEAR(glm::dot(second.ray.dir, expectedDir), 1.0f, 1e-5f);

        EXPECT_EQ(hit->targetSurface, TargetSurface::Plane);
    }

    TEST_F(ScriptedPickingTest, MissOnFirstRayIsANoOp) {
        *script = [](const un::ray&, SurfaceMask) { return SurfaceHit{}; };

        EXPECT_FALSE(engine.pick(camera, *query, indicator, 128.0f, 128.0f, params).has_value());
        EXPECT_FALSE(engine.current().has_value());
        EXPECT_EQ(indicator.color(), un::rgb(0xff0000));
    }

    TEST_F(ScriptedPickingTest, DirectHitIsNotRedirected) {
        *script = [](const un::ray&, SurfaceMask) {
            return makeHit(TargetSurface::RenderSphere, {0.0f, 0.3f, 0.0f}, {0.0f, 1.0f, 0.0f});
        };

        const auto hit = engine.pick(camera, *query, indicator, 128.0f, 60.0f, params);
        ASSERT_TRUE(hit.has_value());
        EXPECT_EQ(query->calls.size(), 1u);
        EXPECT_EQ(indicator.direction(), glm::vec3(0.0f, 1.0f, 0.0f));
    }

} // namespace
