#include "render/depth_pyramid.h"

#include "core/log.h"

#include <algorithm>
#include <cmath>

namespace bimview::render {

std::uint32_t DepthPyramid::mipCountFor(std::uint32_t width, std::uint32_t height) {
    const std::uint32_t largest = std::max(width, height);
    if (largest == 0) {
        return 0;
    }
    std::uint32_t count = 1;
    for (std::uint32_t size = largest; size > 1; size >>= 1) {
        ++count;
    }
    return count;
}

bool DepthPyramid::build(std::span<const float> depth, std::uint32_t width, std::uint32_t height) {
    if (width == 0 || height == 0 || depth.size() != static_cast<std::size_t>(width) * height) {
        BIM_LOGW("depth") << "depth pyramid source mismatch: " << width << "x" << height
                          << " with " << depth.size() << " texels";
        clear();
        return false;
    }
    allocate(width, height);
    std::copy(depth.begin(), depth.end(), m_texels.begin());
    reduce();
    return true;
}

bool DepthPyramid::fill(std::uint32_t width, std::uint32_t height, float depth) {
    if (width == 0 || height == 0) {
        clear();
        return false;
    }
    allocate(width, height);
    std::fill(m_texels.begin(), m_texels.end(), depth);
    return true;
}

void DepthPyramid::clear() {
    m_texels.clear();
    m_mipOffsets.clear();
    m_widths.clear();
    m_heights.clear();
}

std::uint32_t DepthPyramid::width(std::uint32_t mip) const {
    return mip < m_widths.size() ? m_widths[mip] : 0;
}

std::uint32_t DepthPyramid::height(std::uint32_t mip) const {
    return mip < m_heights.size() ? m_heights[mip] : 0;
}

float DepthPyramid::texel(std::uint32_t mip, std::uint32_t x, std::uint32_t y) const {
    const std::uint32_t w = m_widths[mip];
    const std::uint32_t h = m_heights[mip];
    x = std::min(x, w - 1);
    y = std::min(y, h - 1);
    return m_texels[m_mipOffsets[mip] + static_cast<std::size_t>(y) * w + x];
}

std::uint32_t DepthPyramid::mipForFootprint(float widthPixels, float heightPixels) const {
    if (empty()) {
        return 0;
    }
    const float largest = std::max(std::max(widthPixels, heightPixels), 1.0f);
    const auto mip = static_cast<std::uint32_t>(std::ceil(std::log2(largest)));
    return std::min(mip, mipCount() - 1);
}

float DepthPyramid::farthestDepth(std::uint32_t mip, float minX, float minY, float maxX, float maxY) const {
    if (empty()) {
        return 1.0f;
    }
    mip = std::min(mip, mipCount() - 1);
    const float maxPixelX = static_cast<float>(m_widths[0] - 1);
    const float maxPixelY = static_cast<float>(m_heights[0] - 1);
    const auto x0 = static_cast<std::uint32_t>(std::clamp(minX, 0.0f, maxPixelX)) >> mip;
    const auto y0 = static_cast<std::uint32_t>(std::clamp(minY, 0.0f, maxPixelY)) >> mip;
    const auto x1 = static_cast<std::uint32_t>(std::clamp(maxX, 0.0f, maxPixelX)) >> mip;
    const auto y1 = static_cast<std::uint32_t>(std::clamp(maxY, 0.0f, maxPixelY)) >> mip;

    float farthest = 0.0f;
    for (std::uint32_t y = y0; y <= y1; ++y) {
        for (std::uint32_t x = x0; x <= x1; ++x) {
            farthest = std::max(farthest, texel(mip, x, y));
        }
    }
    return farthest;
}

void DepthPyramid::allocate(std::uint32_t width, std::uint32_t height) {
    clear();
    const std::uint32_t count = mipCountFor(width, height);
    std::size_t total = 0;
    std::uint32_t w = width;
    std::uint32_t h = height;
    for (std::uint32_t mip = 0; mip < count; ++mip) {
        m_mipOffsets.push_back(total);
        m_widths.push_back(w);
        m_heights.push_back(h);
        total += static_cast<std::size_t>(w) * h;
        w = std::max(1u, w >> 1);
        h = std::max(1u, h >> 1);
    }
    m_texels.assign(total, 1.0f);
}

void DepthPyramid::reduce() {
    for (std::uint32_t mip = 1; mip < mipCount(); ++mip) {
        const std::uint32_t srcW = m_widths[mip - 1];
        const std::uint32_t srcH = m_heights[mip - 1];
        const std::uint32_t dstW = m_widths[mip];
        const std::uint32_t dstH = m_heights[mip];
        float* dst = m_texels.data() + m_mipOffsets[mip];
        for (std::uint32_t y = 0; y < dstH; ++y) {
            // The last row/column also folds in the odd texel left over by the halving.
            const std::uint32_t srcY0 = y * 2;
            const std::uint32_t srcY1 = (y == dstH - 1) ? srcH - 1 : srcY0 + 1;
            for (std::uint32_t x = 0; x < dstW; ++x) {
                const std::uint32_t srcX0 = x * 2;
                const std::uint32_t srcX1 = (x == dstW - 1) ? srcW - 1 : srcX0 + 1;
                float farthest = 0.0f;
                for (std::uint32_t sy = srcY0; sy <= srcY1; ++sy) {
                    for (std::uint32_t sx = srcX0; sx <= srcX1; ++sx) {
                        farthest = std::max(farthest, texel(mip - 1, sx, sy));
                    }
                }
                dst[static_cast<std::size_t>(y) * dstW + x] = farthest;
            }
        }
    }
}

} // namespace bimview::render
