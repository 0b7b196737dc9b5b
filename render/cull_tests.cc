#include "render/cull_tests.h"

#include <algorithm>
#include <utility>

namespace bimview::render {

ProjectedBounds projectBounds(
    const scene::Aabb& bounds,
    const math::Matrix4& viewProjection,
    float viewportWidth,
    float viewportHeight
) {
    ProjectedBounds result;
    if (bounds.isEmpty()) {
        return result;
    }

    float ndcMinX = 1.0f;
    float ndcMinY = 1.0f;
    float ndcMaxX = -1.0f;
    float ndcMaxY = -1.0f;
    float minDepth = 1.0f;
    for (std::uint32_t i = 0; i < 8; ++i) {
        const math::Vector4 clip = viewProjection * math::Vector4{bounds.corner(i), 1.0f};
        if (clip.w <= kMinClipW) {
            return result;
        }
        const float invW = 1.0f / clip.w;
        const float x = clip.x * invW;
        const float y = clip.y * invW;
        const float z = clip.z * invW;
        ndcMinX = std::min(ndcMinX, x);
        ndcMinY = std::min(ndcMinY, y);
        ndcMaxX = std::max(ndcMaxX, x);
        ndcMaxY = std::max(ndcMaxY, y);
        minDepth = std::min(minDepth, z);
    }

    ndcMinX = std::clamp(ndcMinX, -1.0f, 1.0f);
    ndcMinY = std::clamp(ndcMinY, -1.0f, 1.0f);
    ndcMaxX = std::clamp(ndcMaxX, -1.0f, 1.0f);
    ndcMaxY = std::clamp(ndcMaxY, -1.0f, 1.0f);

    result.minX = (ndcMinX * 0.5f + 0.5f) * viewportWidth;
    result.maxX = (ndcMaxX * 0.5f + 0.5f) * viewportWidth;
    result.minY = (ndcMinY * 0.5f + 0.5f) * viewportHeight;
    result.maxY = (ndcMaxY * 0.5f + 0.5f) * viewportHeight;
    result.minDepth = std::clamp(minDepth, 0.0f, 1.0f);
    result.valid = result.maxX >= result.minX && result.maxY >= result.minY;
    return result;
}

bool ContributionAreaTest::isVisible(const ProjectedBounds& bounds) const {
    if (!bounds.valid) {
        return true;
    }
    return bounds.area() >= m_minPixels;
}

bool BoundingBoxDepthTest::isVisible(const ProjectedBounds& bounds) const {
    if (!bounds.valid || m_depth.empty()) {
        return true;
    }
    return bounds.minDepth <= m_depth.texel(m_depth.mipCount() - 1, 0, 0);
}

bool DepthPyramidTest::isVisible(const ProjectedBounds& bounds) const {
    if (!bounds.valid || m_pyramid.empty()) {
        return true;
    }
    const std::uint32_t mip = m_pyramid.mipForFootprint(bounds.width(), bounds.height());
    const float farthest = m_pyramid.farthestDepth(mip, bounds.minX, bounds.minY, bounds.maxX, bounds.maxY);
    return bounds.minDepth <= farthest;
}

void CompositeVisibilityTest::add(std::unique_ptr<VisibilityTest> test) {
    if (test != nullptr) {
        m_tests.push_back(std::move(test));
    }
}

bool CompositeVisibilityTest::isVisible(const ProjectedBounds& bounds) const {
    for (const std::unique_ptr<VisibilityTest>& test : m_tests) {
        if (!test->isVisible(bounds)) {
            return false;
        }
    }
    return true;
}

std::unique_ptr<CompositeVisibilityTest> makeVisibilityTests(
    const core::RenderOptions& options,
    const DepthPyramid* depth
) {
    auto tests = std::make_unique<CompositeVisibilityTest>();
    if (options.enableContributionTesting) {
        tests->add(std::make_unique<ContributionAreaTest>(options.minContributionPixels));
    }
    if (options.enableDepthTesting && depth != nullptr && !depth->empty()) {
        if (options.depthTestStrategy == core::DepthTestStrategy::BoundingBox) {
            tests->add(std::make_unique<BoundingBoxDepthTest>(*depth));
        } else {
            tests->add(std::make_unique<DepthPyramidTest>(*depth));
        }
    }
    return tests;
}

} // namespace bimview::render
