#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "core/camera.h"
#include "core/options.h"
#include "render/depth_pyramid.h"
#include "render/gpu_types.h"
#include "scene/geometry.h"

namespace bimview::render {

// Device-layout copies of the geometry tables read by the command-generation kernel.
struct GpuSceneTables {
    std::vector<GpuInstancedMesh> groups;
    std::vector<GpuMesh> meshes;
    std::vector<GpuSubmesh> submeshes;
    // In draw order: instances[baseInstance + k].
    std::vector<GpuInstance> instances;
    std::uint32_t maxSubmeshesPerMesh = 0;
};

[[nodiscard]] GpuSceneTables buildGpuSceneTables(const scene::GeometryStore& geometry);
// Per-instance table in draw order, including the current hide/select state.
[[nodiscard]] std::vector<GpuInstance> buildGpuInstances(const scene::GeometryStore& geometry);

// Rewrites the per-frame group flags: hidden state and spatial-query membership.
// `candidates` must be sorted.
void refreshGroupFlags(
    const scene::GeometryStore& geometry,
    std::span<const std::uint32_t> candidates,
    std::vector<GpuInstancedMesh>& groups);

struct ViewportSize {
    std::uint32_t width = 1280;
    std::uint32_t height = 720;
};

[[nodiscard]] std::uint32_t cullFlagsFor(const core::RenderOptions& options, bool haveDepth);

[[nodiscard]] GpuFrameUniforms makeFrameUniforms(
    const core::Camera& camera,
    ViewportSize viewport,
    const core::RenderOptions& options,
    std::uint32_t groupCount,
    std::uint32_t maxSubmeshesPerMesh,
    DepthPyramidExtent depth);

[[nodiscard]] scene::Frustum frustumFromUniforms(const GpuFrameUniforms& uniforms);

} // namespace bimview::render
