#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bimview::render {

struct DepthPyramidExtent {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t mipCount = 0;

    [[nodiscard]] bool empty() const { return mipCount == 0; }
};

// Max-reduced depth mip chain ([0, 1] depth, larger is farther) stored as one
// linear array, mip 0 first. shaders/depth_pyramid.comp.slang writes the same layout.
class DepthPyramid {
public:
    [[nodiscard]] static std::uint32_t mipCountFor(std::uint32_t width, std::uint32_t height);

    bool build(std::span<const float> depth, std::uint32_t width, std::uint32_t height);
    // Fills every texel of every mip with `depth`.
    bool fill(std::uint32_t width, std::uint32_t height, float depth);
    void clear();

    [[nodiscard]] bool empty() const { return m_texels.empty(); }
    [[nodiscard]] std::uint32_t mipCount() const { return static_cast<std::uint32_t>(m_mipOffsets.size()); }
    [[nodiscard]] DepthPyramidExtent extent() const { return DepthPyramidExtent{width(), height(), mipCount()}; }
    [[nodiscard]] std::uint32_t width(std::uint32_t mip = 0) const;
    [[nodiscard]] std::uint32_t height(std::uint32_t mip = 0) const;
    [[nodiscard]] std::size_t mipOffset(std::uint32_t mip) const { return m_mipOffsets[mip]; }
    [[nodiscard]] float texel(std::uint32_t mip, std::uint32_t x, std::uint32_t y) const;
    [[nodiscard]] const std::vector<float>& texels() const { return m_texels; }

    // Smallest mip at which a footprint of this many mip-0 pixels spans at most two texels per axis.
    [[nodiscard]] std::uint32_t mipForFootprint(float widthPixels, float heightPixels) const;
    // Farthest depth over the mip-0 pixel rectangle, sampled at `mip`.
    [[nodiscard]] float farthestDepth(std::uint32_t mip, float minX, float minY, float maxX, float maxY) const;

private:
    void allocate(std::uint32_t width, std::uint32_t height);
    void reduce();

    std::vector<float> m_texels;
    std::vector<std::size_t> m_mipOffsets;
    std::vector<std::uint32_t> m_widths;
    std::vector<std::uint32_t> m_heights;
};

} // namespace bimview::render
