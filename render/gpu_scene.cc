#include "render/gpu_scene.h"

#include "render/command_generation.h"
#include "scene/bounds.h"

#include <algorithm>

namespace bimview::render {

GpuSceneTables buildGpuSceneTables(const scene::GeometryStore& geometry) {
    GpuSceneTables tables;
    tables.maxSubmeshesPerMesh = geometry.maxSubmeshesPerMesh();

    const std::vector<scene::InstancedMesh>& instanced = geometry.instancedMeshes();
    tables.groups.reserve(instanced.size());
    for (std::uint32_t group = 0; group < instanced.size(); ++group) {
        const scene::InstancedMesh& source = instanced[group];
        GpuInstancedMesh gpu{};
        gpu.boundsMin[0] = source.bounds.min.x;
        gpu.boundsMin[1] = source.bounds.min.y;
        gpu.boundsMin[2] = source.bounds.min.z;
        gpu.boundsMax[0] = source.bounds.max.x;
        gpu.boundsMax[1] = source.bounds.max.y;
        gpu.boundsMax[2] = source.bounds.max.z;
        gpu.meshIndex = source.meshIndex;
        gpu.baseInstance = source.baseInstance;
        gpu.instanceCount = source.instanceCount;
        gpu.flags = source.transparent ? kGpuGroupTransparent : 0u;
        tables.groups.push_back(gpu);
    }

    for (const scene::Mesh& mesh : geometry.meshes()) {
        tables.meshes.push_back(GpuMesh{mesh.submeshBegin, mesh.submeshCount, 0u, 0u});
    }
    for (const scene::Submesh& submesh : geometry.submeshes()) {
        tables.submeshes.push_back(GpuSubmesh{submesh.indexOffset, submesh.indexCount, submesh.vertexOffset, submesh.material});
    }

    tables.instances = buildGpuInstances(geometry);
    return tables;
}

std::vector<GpuInstance> buildGpuInstances(const scene::GeometryStore& geometry) {
    const std::vector<scene::Instance>& instances = geometry.instances();
    const std::vector<scene::Material>& materials = geometry.materials();
    std::vector<GpuInstance> result;
    result.reserve(geometry.instanceOrder().size());
    for (const std::uint32_t instanceIndex : geometry.instanceOrder()) {
        const scene::Instance& instance = instances[instanceIndex];
        GpuInstance gpu{};
        math::storeColumnMajor(instance.transform, gpu.model);
        const scene::Mesh& mesh = geometry.meshes()[static_cast<std::size_t>(instance.meshIndex)];
        if (mesh.submeshCount > 0) {
            const std::uint32_t material = geometry.submeshes()[mesh.submeshBegin].material;
            std::copy(materials[material].color.begin(), materials[material].color.end(), gpu.color);
        }
        gpu.id = instance.id;
        gpu.state = static_cast<std::uint32_t>(instance.state);
        result.push_back(gpu);
    }
    return result;
}

void refreshGroupFlags(
    const scene::GeometryStore& geometry,
    std::span<const std::uint32_t> candidates,
    std::vector<GpuInstancedMesh>& groups
) {
    std::size_t next = 0;
    for (std::uint32_t group = 0; group < groups.size(); ++group) {
        std::uint32_t flags = groups[group].flags & kGpuGroupTransparent;
        if (geometry.isGroupHidden(group)) {
            flags |= kGpuGroupHidden;
        }
        while (next < candidates.size() && candidates[next] < group) {
            ++next;
        }
        if (next >= candidates.size() || candidates[next] != group) {
            flags |= kGpuGroupNotCandidate;
        }
        groups[group].flags = flags;
    }
}

std::uint32_t cullFlagsFor(const core::RenderOptions& options, bool haveDepth) {
    std::uint32_t flags = kGpuCullFrustum;
    if (options.enableContributionTesting) {
        flags |= kGpuCullContribution;
    }
    if (options.enableDepthTesting && haveDepth) {
        flags |= options.depthTestStrategy == core::DepthTestStrategy::BoundingBox
            ? kGpuCullDepthBoundingBox
            : kGpuCullDepthPyramid;
    }
    if (options.visualizeOcclusion) {
        flags |= kGpuVisualizeOcclusion;
    }
    if (options.xRay) {
        flags |= kGpuXRay;
    }
    return flags;
}

GpuFrameUniforms makeFrameUniforms(
    const core::Camera& camera,
    ViewportSize viewport,
    const core::RenderOptions& options,
    std::uint32_t groupCount,
    std::uint32_t maxSubmeshesPerMesh,
    DepthPyramidExtent depth
) {
    GpuFrameUniforms uniforms{};
    const math::Matrix4 view = camera.viewMatrix();
    const math::Matrix4 projection = camera.projectionMatrix();
    const math::Matrix4 viewProjection = projection * view;
    math::storeColumnMajor(view, uniforms.view);
    math::storeColumnMajor(projection, uniforms.projection);
    math::storeColumnMajor(viewProjection, uniforms.viewProjection);

    const scene::Frustum frustum = scene::frustumFromViewProjection(viewProjection);
    for (std::size_t i = 0; i < frustum.planes.size(); ++i) {
        uniforms.frustumPlanes[i][0] = frustum.planes[i].normal.x;
        uniforms.frustumPlanes[i][1] = frustum.planes[i].normal.y;
        uniforms.frustumPlanes[i][2] = frustum.planes[i].normal.z;
        uniforms.frustumPlanes[i][3] = frustum.planes[i].distance;
    }

    const float width = static_cast<float>(std::max(1u, viewport.width));
    const float height = static_cast<float>(std::max(1u, viewport.height));
    uniforms.viewport[0] = width;
    uniforms.viewport[1] = height;
    uniforms.viewport[2] = 1.0f / width;
    uniforms.viewport[3] = 1.0f / height;

    uniforms.groupCount = groupCount;
    uniforms.maxSubmeshesPerMesh = maxSubmeshesPerMesh;
    uniforms.cullFlags = cullFlagsFor(options, !depth.empty());
    uniforms.minContributionPixels = options.minContributionPixels;
    uniforms.pyramidMipCount = depth.mipCount;
    uniforms.pyramidWidth = depth.width;
    uniforms.pyramidHeight = depth.height;
    // Same size as the device command list; groups past it are drawn directly.
    uniforms.commandCapacity = encodableGroupCount(groupCount, maxSubmeshesPerMesh) * maxSubmeshesPerMesh;
    return uniforms;
}

scene::Frustum frustumFromUniforms(const GpuFrameUniforms& uniforms) {
    scene::Frustum frustum;
    for (std::size_t i = 0; i < frustum.planes.size(); ++i) {
        frustum.planes[i].normal = math::Vector3{
            uniforms.frustumPlanes[i][0],
            uniforms.frustumPlanes[i][1],
            uniforms.frustumPlanes[i][2]
        };
        frustum.planes[i].distance = uniforms.frustumPlanes[i][3];
    }
    return frustum;
}

} // namespace bimview::render
