#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <vector>

#include "core/camera.h"
#include "core/options.h"
#include "render/occlusion.h"
#include "scene/geometry.h"
#include "scene/synthetic_scene.h"

namespace {

using bimview::render::FrameTicket;
using bimview::render::OcclusionCuller;

bimview::scene::GeometryData MakeRow(std::uint32_t count) {
    const std::vector<std::uint32_t> submeshCounts(count, 1u);
    return bimview::scene::makeCubeRow(submeshCounts, 3.0f);
}

// Camera far from the row, looking away from it.
bimview::core::Camera CameraFacingAway() {
    bimview::core::Camera camera;
    camera.position = bimview::math::Vector3{0.0f, 0.0f, 50.0f};
    camera.yawDegrees = 90.0f;
    return camera;
}

FrameTicket BeginWithProxies(OcclusionCuller& culler, const std::vector<std::uint32_t>& tested) {
    const std::optional<FrameTicket> ticket = culler.beginFrame();
    EXPECT_TRUE(ticket.has_value());
    culler.recordProxyDraws(tested);
    return ticket.value_or(FrameTicket{});
}

} // namespace

TEST(FrustumCandidatesTest, BelowThresholdEveryGroupIsACandidate) {
    bimview::scene::GeometryStore geometry;
    ASSERT_TRUE(geometry.load(MakeRow(6)));

    bimview::core::RenderOptions options;
    std::vector<std::uint32_t> candidates;
    bimview::render::collectFrustumCandidates(geometry, CameraFacingAway().frustum(), options, candidates);
    EXPECT_EQ(candidates, (std::vector<std::uint32_t>{0u, 1u, 2u, 3u, 4u, 5u}));
}

TEST(FrustumCandidatesTest, AboveThresholdTheSpatialQueryDecides) {
    bimview::scene::GeometryStore geometry;
    ASSERT_TRUE(geometry.load(MakeRow(6)));

    bimview::core::RenderOptions options;
    options.frustumCullingThreshold = 0;
    std::vector<std::uint32_t> candidates;
    bimview::render::collectFrustumCandidates(geometry, CameraFacingAway().frustum(), options, candidates);
    EXPECT_TRUE(candidates.empty());

    bimview::core::Camera facing = CameraFacingAway();
    facing.yawDegrees = -90.0f;
    facing.position.x = 7.5f;
    bimview::scene::SpatialQueryStats stats;
    bimview::render::collectFrustumCandidates(geometry, facing.frustum(), options, candidates, &stats);
    EXPECT_EQ(candidates.size(), 6u);
    EXPECT_EQ(stats.candidateCount, 6u);
}

TEST(FrustumCandidatesTest, HiddenGroupsAreRemoved) {
    bimview::scene::GeometryStore geometry;
    ASSERT_TRUE(geometry.load(MakeRow(4)));
    ASSERT_TRUE(geometry.setInstanceState(101, bimview::scene::InstanceState::Hidden));

    const bimview::core::RenderOptions options;
    std::vector<std::uint32_t> candidates;
    bimview::render::collectFrustumCandidates(geometry, CameraFacingAway().frustum(), options, candidates);
    EXPECT_EQ(candidates, (std::vector<std::uint32_t>{0u, 2u, 3u}));
}

TEST(FrustumCandidatesTest, GeometryNotReadyGivesNoCandidates) {
    const bimview::scene::GeometryStore geometry{};
    const bimview::core::RenderOptions options;
    std::vector<std::uint32_t> candidates{1u, 2u};
    bimview::render::collectFrustumCandidates(geometry, CameraFacingAway().frustum(), options, candidates);
    EXPECT_TRUE(candidates.empty());
}

TEST(OcclusionCullerTest, WithoutCompletedFramesCandidatesAreVisible) {
    OcclusionCuller culler;
    culler.reset(4, 5);
    const std::vector<std::uint32_t> candidates{0u, 2u, 4u};
    std::vector<std::uint32_t> visible;

    culler.resolve(candidates, bimview::core::RenderOptions{}, visible);
    EXPECT_EQ(visible, candidates);
    EXPECT_EQ(culler.stats().fallbackCount, 3u);
    EXPECT_EQ(culler.stats().occludedCount, 0u);
}

TEST(OcclusionCullerTest, CompletedResultsFilterTheNextFrame) {
    OcclusionCuller culler;
    culler.reset(4, 5);
    const FrameTicket ticket = BeginWithProxies(culler, {0u, 1u, 2u, 3u});
    // Group 4 got no proxy draw; groups 1 and 3 passed zero samples.
    const std::vector<std::uint32_t> samples{12u, 0u, 1u, 0u, 99u};
    ASSERT_TRUE(culler.frameCompleted(ticket, samples));

    const std::vector<std::uint32_t> candidates{0u, 1u, 2u, 3u, 4u};
    std::vector<std::uint32_t> visible;
    culler.resolve(candidates, bimview::core::RenderOptions{}, visible);
    EXPECT_EQ(visible, (std::vector<std::uint32_t>{0u, 2u, 4u}));
    EXPECT_EQ(culler.stats().candidateCount, 5u);
    EXPECT_EQ(culler.stats().visibleCount, 3u);
    EXPECT_EQ(culler.stats().occludedCount, 2u);
    EXPECT_EQ(culler.stats().fallbackCount, 1u);
}

TEST(OcclusionCullerTest, DisabledOcclusionReturnsCandidatesExactly) {
    OcclusionCuller culler;
    culler.reset(3, 4);
    const FrameTicket ticket = BeginWithProxies(culler, {0u, 1u, 2u, 3u});
    ASSERT_TRUE(culler.frameCompleted(ticket, std::vector<std::uint32_t>{0u, 0u, 0u, 0u}));

    bimview::core::RenderOptions options;
    options.occlusionTesting = false;
    const std::vector<std::uint32_t> candidates{1u, 3u};
    std::vector<std::uint32_t> visible{7u};
    culler.resolve(candidates, options, visible);
    EXPECT_EQ(visible, candidates);

    options.occlusionTesting = true;
    options.visualizeOcclusion = true;
    culler.resolve(candidates, options, visible);
    EXPECT_EQ(visible, candidates);
}

TEST(OcclusionCullerTest, ReadsTheNewestCompletedSlot) {
    OcclusionCuller culler;
    culler.reset(4, 2);
    const FrameTicket first = BeginWithProxies(culler, {0u, 1u});
    const FrameTicket second = BeginWithProxies(culler, {0u, 1u});
    ASSERT_TRUE(culler.frameCompleted(first, std::vector<std::uint32_t>{0u, 1u}));

    const std::vector<std::uint32_t> candidates{0u, 1u};
    std::vector<std::uint32_t> visible;
    culler.resolve(candidates, bimview::core::RenderOptions{}, visible);
    EXPECT_EQ(visible, (std::vector<std::uint32_t>{1u}));

    ASSERT_TRUE(culler.frameCompleted(second, std::vector<std::uint32_t>{1u, 0u}));
    culler.resolve(candidates, bimview::core::RenderOptions{}, visible);
    EXPECT_EQ(visible, (std::vector<std::uint32_t>{0u}));
}

TEST(OcclusionCullerTest, ResultsFromBeforeAResetAreDropped) {
    OcclusionCuller culler;
    culler.reset(3, 2);
    const FrameTicket stale = BeginWithProxies(culler, {0u, 1u});
    culler.reset(3, 2);
    EXPECT_FALSE(culler.frameCompleted(stale, std::vector<std::uint32_t>{0u, 0u}));

    const std::vector<std::uint32_t> candidates{0u, 1u};
    std::vector<std::uint32_t> visible;
    culler.resolve(candidates, bimview::core::RenderOptions{}, visible);
    EXPECT_EQ(visible, candidates);
}

TEST(OcclusionCullerTest, ShortDeviceResultsCountAsUntested) {
    OcclusionCuller culler;
    culler.reset(3, 3);
    const FrameTicket ticket = BeginWithProxies(culler, {0u, 1u, 2u});
    ASSERT_TRUE(culler.frameCompleted(ticket, std::vector<std::uint32_t>{0u}));

    const std::vector<std::uint32_t> candidates{0u, 1u, 2u};
    std::vector<std::uint32_t> visible;
    culler.resolve(candidates, bimview::core::RenderOptions{}, visible);
    EXPECT_EQ(visible, (std::vector<std::uint32_t>{1u, 2u}));
    EXPECT_EQ(culler.stats().fallbackCount, 2u);
}
