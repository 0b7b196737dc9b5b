#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "render/depth_pyramid.h"

namespace {

std::vector<float> ConstantDepth(std::uint32_t width, std::uint32_t height, float depth) {
    return std::vector<float>(static_cast<std::size_t>(width) * height, depth);
}

} // namespace

TEST(DepthPyramidTest, MipCountCoversTheLargestAxis) {
    using bimview::render::DepthPyramid;
    EXPECT_EQ(DepthPyramid::mipCountFor(0, 0), 0u);
    EXPECT_EQ(DepthPyramid::mipCountFor(1, 1), 1u);
    EXPECT_EQ(DepthPyramid::mipCountFor(8, 8), 4u);
    EXPECT_EQ(DepthPyramid::mipCountFor(5, 3), 3u);
    EXPECT_EQ(DepthPyramid::mipCountFor(1280, 720), 11u);
}

TEST(DepthPyramidTest, MipDimensionsHalveDownToOne) {
    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.fill(6, 3, 0.5f));
    ASSERT_EQ(pyramid.mipCount(), 3u);
    EXPECT_EQ(pyramid.width(1), 3u);
    EXPECT_EQ(pyramid.height(1), 1u);
    EXPECT_EQ(pyramid.width(2), 1u);
    EXPECT_EQ(pyramid.height(2), 1u);
    EXPECT_EQ(pyramid.mipOffset(1), 18u);
    EXPECT_EQ(pyramid.mipOffset(2), 21u);
    EXPECT_EQ(pyramid.texels().size(), 22u);
    EXPECT_FLOAT_EQ(pyramid.texel(2, 0, 0), 0.5f);
}

TEST(DepthPyramidTest, ReductionKeepsTheFarthestDepth) {
    std::vector<float> depth = ConstantDepth(4, 4, 0.2f);
    depth[1 * 4 + 2] = 0.8f;

    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.build(depth, 4, 4));
    EXPECT_FLOAT_EQ(pyramid.texel(1, 0, 0), 0.2f);
    EXPECT_FLOAT_EQ(pyramid.texel(1, 1, 0), 0.8f);
    EXPECT_FLOAT_EQ(pyramid.texel(1, 0, 1), 0.2f);
    EXPECT_FLOAT_EQ(pyramid.texel(2, 0, 0), 0.8f);
}

TEST(DepthPyramidTest, OddEdgeTexelsFoldIntoTheLastColumnAndRow) {
    std::vector<float> depth = ConstantDepth(5, 3, 0.1f);
    // Bottom-right corner: dropped by a plain 2x2 halving.
    depth[2 * 5 + 4] = 0.9f;

    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.build(depth, 5, 3));
    ASSERT_EQ(pyramid.mipCount(), 3u);
    ASSERT_EQ(pyramid.width(1), 2u);
    ASSERT_EQ(pyramid.height(1), 1u);
    EXPECT_FLOAT_EQ(pyramid.texel(1, 0, 0), 0.1f);
    EXPECT_FLOAT_EQ(pyramid.texel(1, 1, 0), 0.9f);
    EXPECT_FLOAT_EQ(pyramid.texel(2, 0, 0), 0.9f);
}

TEST(DepthPyramidTest, BuildRejectsMismatchedSource) {
    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.fill(4, 4, 1.0f));
    const std::vector<float> depth = ConstantDepth(3, 3, 0.5f);
    EXPECT_FALSE(pyramid.build(depth, 4, 4));
    EXPECT_TRUE(pyramid.empty());
    EXPECT_TRUE(pyramid.extent().empty());
}

TEST(DepthPyramidTest, MipForFootprintPicksAtMostTwoTexelsPerAxis) {
    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.fill(64, 64, 1.0f));
    EXPECT_EQ(pyramid.mipForFootprint(0.5f, 0.5f), 0u);
    EXPECT_EQ(pyramid.mipForFootprint(2.0f, 1.0f), 1u);
    EXPECT_EQ(pyramid.mipForFootprint(3.0f, 12.0f), 4u);
    EXPECT_EQ(pyramid.mipForFootprint(5000.0f, 1.0f), pyramid.mipCount() - 1);
}

TEST(DepthPyramidTest, FarthestDepthScansTheCoveredTexels) {
    std::vector<float> depth = ConstantDepth(8, 8, 0.3f);
    depth[6 * 8 + 6] = 0.7f;

    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.build(depth, 8, 8));
    EXPECT_FLOAT_EQ(pyramid.farthestDepth(0, 0.0f, 0.0f, 3.0f, 3.0f), 0.3f);
    EXPECT_FLOAT_EQ(pyramid.farthestDepth(0, 5.0f, 5.0f, 7.0f, 7.0f), 0.7f);
    // At mip 2 the rectangle [0, 3] maps to texel 0 only.
    EXPECT_FLOAT_EQ(pyramid.farthestDepth(2, 0.0f, 0.0f, 3.0f, 3.0f), 0.3f);
    EXPECT_FLOAT_EQ(pyramid.farthestDepth(3, 0.0f, 0.0f, 1.0f, 1.0f), 0.7f);

    const bimview::render::DepthPyramid empty{};
    EXPECT_FLOAT_EQ(empty.farthestDepth(0, 0.0f, 0.0f, 1.0f, 1.0f), 1.0f);
}
