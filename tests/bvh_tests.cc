#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "scene/bounds.h"
#include "scene/bvh.h"

namespace {

using bimview::math::Vector3;
using bimview::scene::Aabb;
using bimview::scene::Frustum;

Aabb BoxAt(float x, float y, float z, float halfSize = 0.5f) {
    Aabb box;
    box.min = Vector3{x - halfSize, y - halfSize, z - halfSize};
    box.max = Vector3{x + halfSize, y + halfSize, z + halfSize};
    return box;
}

// Axis-aligned region expressed as six inward planes.
Frustum RegionFrustum(const Vector3& min, const Vector3& max) {
    Frustum frustum;
    frustum.planes[0] = {Vector3{1.0f, 0.0f, 0.0f}, -min.x};
    frustum.planes[1] = {Vector3{-1.0f, 0.0f, 0.0f}, max.x};
    frustum.planes[2] = {Vector3{0.0f, 1.0f, 0.0f}, -min.y};
    frustum.planes[3] = {Vector3{0.0f, -1.0f, 0.0f}, max.y};
    frustum.planes[4] = {Vector3{0.0f, 0.0f, 1.0f}, -min.z};
    frustum.planes[5] = {Vector3{0.0f, 0.0f, -1.0f}, max.z};
    return frustum;
}

std::vector<Aabb> MakeGrid(std::uint32_t size, float spacing) {
    std::vector<Aabb> boxes;
    for (std::uint32_t z = 0; z < size; ++z) {
        for (std::uint32_t x = 0; x < size; ++x) {
            boxes.push_back(BoxAt(static_cast<float>(x) * spacing, 0.0f, static_cast<float>(z) * spacing));
        }
    }
    return boxes;
}

} // namespace

TEST(BvhTest, EmptyBuildIsInvalidAndQueriesNothing) {
    bimview::scene::BoundingVolumeHierarchy bvh;
    bvh.build({});
    EXPECT_FALSE(bvh.valid());

    std::vector<std::uint32_t> hits{42u};
    bvh.query(RegionFrustum({-1.0f, -1.0f, -1.0f}, {1.0f, 1.0f, 1.0f}), hits);
    EXPECT_TRUE(hits.empty());
}

TEST(BvhTest, LeavesHoldAtMostMaxLeafItems) {
    const std::vector<Aabb> boxes = MakeGrid(12, 3.0f);
    bimview::scene::BoundingVolumeHierarchy bvh;
    bvh.build(boxes);
    ASSERT_TRUE(bvh.valid());
    EXPECT_EQ(bvh.primitiveCount(), boxes.size());

    std::size_t leafItems = 0;
    for (const auto& node : bvh.nodes()) {
        if (node.leaf) {
            EXPECT_LE(node.itemCount, bimview::scene::BoundingVolumeHierarchy::kMaxLeafItems);
            leafItems += node.itemCount;
        }
    }
    EXPECT_EQ(leafItems, boxes.size());
    EXPECT_FLOAT_EQ(bvh.worldBounds().min.x, -0.5f);
    EXPECT_FLOAT_EQ(bvh.worldBounds().max.z, 33.5f);
}

TEST(BvhTest, SplitFollowsTheSpreadOfItemCentres) {
    // Tall columns along x: the boxes are longest in y but their centres only
    // differ in x. Items are shuffled so index order says nothing about x.
    constexpr std::uint32_t kColumns = 16;
    std::vector<Aabb> boxes;
    for (std::uint32_t i = 0; i < kColumns; ++i) {
        const float x = static_cast<float>((i * 5u) % kColumns);
        Aabb column;
        column.min = Vector3{x, 0.0f, 0.0f};
        column.max = Vector3{x + 0.5f, 100.0f, 0.5f};
        boxes.push_back(column);
    }
    bimview::scene::BoundingVolumeHierarchy bvh;
    bvh.build(boxes);
    ASSERT_TRUE(bvh.valid());

    const auto& nodes = bvh.nodes();
    ASSERT_FALSE(nodes[0].leaf);
    const Aabb& left = nodes[nodes[0].childA].bounds;
    const Aabb& right = nodes[nodes[0].childB].bounds;
    EXPECT_FLOAT_EQ(left.min.x, 0.0f);
    EXPECT_FLOAT_EQ(left.max.x, 7.5f);
    EXPECT_FLOAT_EQ(right.min.x, 8.0f);
    EXPECT_FLOAT_EQ(right.max.x, 15.5f);
}

TEST(BvhTest, QueryMatchesBruteForceAndIsSorted) {
    const std::vector<Aabb> boxes = MakeGrid(16, 2.0f);
    bimview::scene::BoundingVolumeHierarchy bvh;
    bvh.build(boxes);

    const Frustum frustum = RegionFrustum({3.0f, -1.0f, 5.0f}, {11.0f, 1.0f, 9.0f});
    std::vector<std::uint32_t> expected;
    for (std::uint32_t i = 0; i < boxes.size(); ++i) {
        if (frustum.intersects(boxes[i])) {
            expected.push_back(i);
        }
    }

    std::vector<std::uint32_t> hits;
    bimview::scene::SpatialQueryStats stats;
    bvh.query(frustum, hits, &stats);
    EXPECT_EQ(hits, expected);
    EXPECT_EQ(stats.candidateCount, expected.size());
    EXPECT_GT(stats.visitedNodeCount, 0u);
    EXPECT_LT(stats.testedPrimitiveCount, boxes.size());
}

TEST(BvhTest, RepeatedQueryIsIdempotent) {
    const std::vector<Aabb> boxes = MakeGrid(10, 2.5f);
    bimview::scene::BoundingVolumeHierarchy bvh;
    bvh.build(boxes);

    const Frustum frustum = RegionFrustum({0.0f, -1.0f, 0.0f}, {12.0f, 1.0f, 6.0f});
    std::vector<std::uint32_t> first;
    std::vector<std::uint32_t> second;
    bvh.query(frustum, first);
    bvh.query(frustum, second);
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST(BvhTest, RegionOutsideEverythingReturnsNothing) {
    const std::vector<Aabb> boxes = MakeGrid(8, 2.0f);
    bimview::scene::BoundingVolumeHierarchy bvh;
    bvh.build(boxes);

    std::vector<std::uint32_t> hits;
    bimview::scene::SpatialQueryStats stats;
    bvh.query(RegionFrustum({100.0f, 100.0f, 100.0f}, {110.0f, 110.0f, 110.0f}), hits, &stats);
    EXPECT_TRUE(hits.empty());
    EXPECT_EQ(stats.visitedNodeCount, 1u);
    EXPECT_EQ(stats.testedPrimitiveCount, 0u);
}
