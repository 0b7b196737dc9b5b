#pragma once

#include <cstddef>
#include <cstdint>

// Structures shared with shaders/common.slang. Storage buffers use std430
// layout, so every struct here is a multiple of 16 bytes except the draw
// command, which matches VkDrawIndexedIndirectCommand.
namespace bimview::render {

enum GpuGroupFlags : std::uint32_t {
    kGpuGroupHidden = 1u << 0,
    kGpuGroupTransparent = 1u << 1,
    // Rejected by the CPU spatial query this frame.
    kGpuGroupNotCandidate = 1u << 2
};

enum GpuCullFlags : std::uint32_t {
    kGpuCullFrustum = 1u << 0,
    kGpuCullContribution = 1u << 1,
    kGpuCullDepthBoundingBox = 1u << 2,
    kGpuCullDepthPyramid = 1u << 3,
    kGpuVisualizeOcclusion = 1u << 4,
    kGpuXRay = 1u << 5
};

struct GpuInstancedMesh {
    float boundsMin[3];
    std::uint32_t meshIndex;
    float boundsMax[3];
    std::uint32_t baseInstance;
    std::uint32_t instanceCount;
    std::uint32_t flags;
    std::uint32_t pad0;
    std::uint32_t pad1;
};
static_assert(sizeof(GpuInstancedMesh) == 48);

struct GpuMesh {
    std::uint32_t submeshBegin;
    std::uint32_t submeshCount;
    std::uint32_t pad0;
    std::uint32_t pad1;
};
static_assert(sizeof(GpuMesh) == 16);

struct GpuSubmesh {
    std::uint32_t indexOffset;
    std::uint32_t indexCount;
    std::int32_t vertexOffset;
    std::uint32_t material;
};
static_assert(sizeof(GpuSubmesh) == 16);

// Per drawn instance, indexed by firstInstance + gl_InstanceIndex.
struct GpuInstance {
    float model[16];
    float color[4];
    std::uint32_t id;
    std::uint32_t state;
    std::uint32_t pad0;
    std::uint32_t pad1;
};
static_assert(sizeof(GpuInstance) == 96);

struct alignas(16) GpuFrameUniforms {
    // Column-major.
    float view[16];
    float projection[16];
    float viewProjection[16];
    // xyz normal, w distance; inward facing, order left/right/bottom/top/near/far.
    float frustumPlanes[6][4];
    // width, height, 1/width, 1/height
    float viewport[4];
    std::uint32_t groupCount;
    std::uint32_t maxSubmeshesPerMesh;
    std::uint32_t cullFlags;
    std::uint32_t pyramidMipCount;
    float minContributionPixels;
    std::uint32_t pyramidWidth;
    std::uint32_t pyramidHeight;
    std::uint32_t commandCapacity;
};
static_assert(sizeof(GpuFrameUniforms) == 336);
static_assert(offsetof(GpuFrameUniforms, frustumPlanes) == 192);
static_assert(offsetof(GpuFrameUniforms, groupCount) == 304);

struct DrawIndexedCommand {
    std::uint32_t indexCount = 0;
    std::uint32_t instanceCount = 0;
    std::uint32_t firstIndex = 0;
    std::int32_t vertexOffset = 0;
    std::uint32_t firstInstance = 0;
};
static_assert(sizeof(DrawIndexedCommand) == 20);

} // namespace bimview::render
