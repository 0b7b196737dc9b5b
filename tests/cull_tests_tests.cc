#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "core/camera.h"
#include "core/options.h"
#include "render/cull_tests.h"
#include "render/depth_pyramid.h"

namespace {

using bimview::math::Vector3;
using bimview::render::ProjectedBounds;

constexpr float kViewportSize = 100.0f;

// 90 degree square view from the origin down -z.
bimview::math::Matrix4 SquareViewProjection() {
    bimview::core::Camera camera;
    camera.position = Vector3{0.0f, 0.0f, 0.0f};
    camera.fovDegrees = 90.0f;
    camera.aspectRatio = 1.0f;
    return camera.viewProjectionMatrix();
}

bimview::scene::Aabb Box(const Vector3& min, const Vector3& max) {
    bimview::scene::Aabb box;
    box.min = min;
    box.max = max;
    return box;
}

// Two-unit box centred on the view axis, nearest face at z = -9.
ProjectedBounds ProjectCentredBox() {
    return bimview::render::projectBounds(
        Box({-1.0f, -1.0f, -11.0f}, {1.0f, 1.0f, -9.0f}),
        SquareViewProjection(),
        kViewportSize,
        kViewportSize);
}

std::vector<float> Depth(float value) {
    return std::vector<float>(static_cast<std::size_t>(kViewportSize * kViewportSize), value);
}

} // namespace

TEST(CullTestsTest, ProjectBoundsCoversTheScreenRectangle) {
    const ProjectedBounds projected = ProjectCentredBox();
    ASSERT_TRUE(projected.valid);
    EXPECT_NEAR(projected.minX, 50.0f - 50.0f / 9.0f, 1e-3f);
    EXPECT_NEAR(projected.maxX, 50.0f + 50.0f / 9.0f, 1e-3f);
    EXPECT_NEAR(projected.minY, 50.0f - 50.0f / 9.0f, 1e-3f);
    EXPECT_NEAR(projected.maxY, 50.0f + 50.0f / 9.0f, 1e-3f);
    EXPECT_GT(projected.minDepth, 0.9f);
    EXPECT_LT(projected.minDepth, 1.0f);
}

TEST(CullTestsTest, ProjectBoundsIsInvalidAcrossTheEyePlane) {
    const ProjectedBounds projected = bimview::render::projectBounds(
        Box({-1.0f, -1.0f, -1.0f}, {1.0f, 1.0f, 1.0f}),
        SquareViewProjection(),
        kViewportSize,
        kViewportSize);
    EXPECT_FALSE(projected.valid);

    EXPECT_FALSE(bimview::render::projectBounds(bimview::scene::Aabb{}, SquareViewProjection(), kViewportSize, kViewportSize).valid);
}

TEST(CullTestsTest, ContributionRejectsTinyFootprints) {
    const bimview::render::ContributionAreaTest test(4.0f);
    EXPECT_TRUE(test.isVisible(ProjectCentredBox()));

    const ProjectedBounds far = bimview::render::projectBounds(
        Box({-0.05f, -0.05f, -100.05f}, {0.05f, 0.05f, -99.95f}),
        SquareViewProjection(),
        kViewportSize,
        kViewportSize);
    ASSERT_TRUE(far.valid);
    EXPECT_FALSE(test.isVisible(far));

    EXPECT_FALSE(bimview::render::ContributionAreaTest(500.0f).isVisible(ProjectCentredBox()));
}

TEST(CullTestsTest, InvalidBoundsAreAlwaysVisible) {
    bimview::render::DepthPyramid depth;
    ASSERT_TRUE(depth.build(Depth(0.0f), 100, 100));
    const ProjectedBounds invalid;
    EXPECT_TRUE(bimview::render::ContributionAreaTest(1000.0f).isVisible(invalid));
    EXPECT_TRUE(bimview::render::BoundingBoxDepthTest(depth).isVisible(invalid));
    EXPECT_TRUE(bimview::render::DepthPyramidTest(depth).isVisible(invalid));
}

TEST(CullTestsTest, DepthTestsCullBehindACloserOccluder) {
    bimview::render::DepthPyramid occluded;
    ASSERT_TRUE(occluded.build(Depth(0.5f), 100, 100));
    bimview::render::DepthPyramid open;
    ASSERT_TRUE(open.build(Depth(1.0f), 100, 100));

    const ProjectedBounds projected = ProjectCentredBox();
    EXPECT_FALSE(bimview::render::BoundingBoxDepthTest(occluded).isVisible(projected));
    EXPECT_FALSE(bimview::render::DepthPyramidTest(occluded).isVisible(projected));
    EXPECT_TRUE(bimview::render::BoundingBoxDepthTest(open).isVisible(projected));
    EXPECT_TRUE(bimview::render::DepthPyramidTest(open).isVisible(projected));
}

TEST(CullTestsTest, PyramidSamplesNearTheBoxWhileTheBoxTestUsesTheFrameMaximum) {
    std::vector<float> depth = Depth(0.5f);
    // A gap outside the box's rectangle but inside the coarse texel it samples.
    depth[60 * 100 + 60] = 1.0f;
    bimview::render::DepthPyramid nearGap;
    ASSERT_TRUE(nearGap.build(depth, 100, 100));

    const ProjectedBounds projected = ProjectCentredBox();
    EXPECT_TRUE(bimview::render::BoundingBoxDepthTest(nearGap).isVisible(projected));
    EXPECT_TRUE(bimview::render::DepthPyramidTest(nearGap).isVisible(projected));

    // A gap in the far corner only lifts the single frame-wide reference.
    depth = Depth(0.5f);
    depth[99 * 100 + 99] = 1.0f;
    bimview::render::DepthPyramid farGap;
    ASSERT_TRUE(farGap.build(depth, 100, 100));
    EXPECT_TRUE(bimview::render::BoundingBoxDepthTest(farGap).isVisible(projected));
    EXPECT_FALSE(bimview::render::DepthPyramidTest(farGap).isVisible(projected));
}

TEST(CullTestsTest, BoxDepthTestReadsOnlyTheTopMip) {
    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.build(Depth(0.5f), 100, 100));
    const std::uint32_t top = pyramid.mipCount() - 1;
    ASSERT_EQ(pyramid.width(top), 1u);
    ASSERT_EQ(pyramid.height(top), 1u);

    // Screen-filling box: the verdict still comes from the single reference.
    ProjectedBounds full = ProjectCentredBox();
    full.minX = 0.0f;
    full.minY = 0.0f;
    full.maxX = kViewportSize;
    full.maxY = kViewportSize;
    full.minDepth = 0.5f;
    EXPECT_TRUE(bimview::render::BoundingBoxDepthTest(pyramid).isVisible(full));
    full.minDepth = 0.6f;
    EXPECT_FALSE(bimview::render::BoundingBoxDepthTest(pyramid).isVisible(full));
}

TEST(CullTestsTest, CompositeRequiresEveryTest) {
    bimview::render::DepthPyramid open;
    ASSERT_TRUE(open.build(Depth(1.0f), 100, 100));

    bimview::render::CompositeVisibilityTest composite;
    EXPECT_TRUE(composite.empty());
    EXPECT_TRUE(composite.isVisible(ProjectCentredBox()));

    composite.add(std::make_unique<bimview::render::DepthPyramidTest>(open));
    EXPECT_TRUE(composite.isVisible(ProjectCentredBox()));
    composite.add(std::make_unique<bimview::render::ContributionAreaTest>(500.0f));
    EXPECT_EQ(composite.size(), 2u);
    EXPECT_FALSE(composite.isVisible(ProjectCentredBox()));
}

TEST(CullTestsTest, MakeVisibilityTestsFollowsOptions) {
    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.fill(100, 100, 1.0f));

    bimview::core::RenderOptions options;
    EXPECT_EQ(bimview::render::makeVisibilityTests(options, &pyramid)->size(), 2u);
    EXPECT_EQ(bimview::render::makeVisibilityTests(options, nullptr)->size(), 1u);

    options.enableContributionTesting = false;
    options.enableDepthTesting = false;
    EXPECT_TRUE(bimview::render::makeVisibilityTests(options, &pyramid)->empty());

    options.enableDepthTesting = true;
    options.depthTestStrategy = bimview::core::DepthTestStrategy::BoundingBox;
    const auto tests = bimview::render::makeVisibilityTests(options, &pyramid);
    ASSERT_EQ(tests->size(), 1u);
}
