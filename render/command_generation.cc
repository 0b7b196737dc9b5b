#include "render/command_generation.h"

#include "render/cull_tests.h"
#include "render/gpu_scene.h"

#include <algorithm>

namespace bimview::render {

std::uint32_t CommandList::recordedCount() const {
    return static_cast<std::uint32_t>(std::count_if(commands.begin(), commands.end(), [](const DrawIndexedCommand& command) {
        return command.instanceCount != 0;
    }));
}

std::uint32_t encodableGroupCount(std::uint32_t groupCount, std::uint32_t maxSubmeshesPerMesh) {
    if (maxSubmeshesPerMesh == 0) {
        return 0;
    }
    return std::min(groupCount, kMaxCommandCount / maxSubmeshesPerMesh);
}

DispatchSize computeDispatchSize(std::uint32_t groupCount, std::uint32_t maxSubmeshesPerMesh) {
    DispatchSize size;
    size.invocationsX = encodableGroupCount(groupCount, maxSubmeshesPerMesh);
    size.invocationsY = size.invocationsX == 0 ? 0 : maxSubmeshesPerMesh;
    size.groupCountX = (size.invocationsX + kEncodeThreadGroupSizeX - 1) / kEncodeThreadGroupSizeX;
    size.groupCountY = size.invocationsY;
    return size;
}

const char* invocationOutcomeName(InvocationOutcome outcome) {
    switch (outcome) {
    case InvocationOutcome::Recorded:
        return "recorded";
    case InvocationOutcome::OutOfRange:
        return "out-of-range";
    case InvocationOutcome::NoSubmesh:
        return "no-submesh";
    case InvocationOutcome::Hidden:
        return "hidden";
    case InvocationOutcome::NotCandidate:
        return "not-candidate";
    case InvocationOutcome::FrustumCulled:
        return "frustum-culled";
    case InvocationOutcome::ContributionCulled:
        return "contribution-culled";
    case InvocationOutcome::DepthCulled:
        return "depth-culled";
    }
    return "unknown";
}

InvocationOutcome evaluateGroup(const CommandGenerationInput& input, std::uint32_t group) {
    if (group >= input.groups.size() || group >= input.uniforms.groupCount) {
        return InvocationOutcome::OutOfRange;
    }
    const GpuInstancedMesh& entry = input.groups[group];
    if ((entry.flags & kGpuGroupHidden) != 0) {
        return InvocationOutcome::Hidden;
    }
    if ((entry.flags & kGpuGroupNotCandidate) != 0) {
        return InvocationOutcome::NotCandidate;
    }

    scene::Aabb bounds;
    bounds.min = math::Vector3{entry.boundsMin[0], entry.boundsMin[1], entry.boundsMin[2]};
    bounds.max = math::Vector3{entry.boundsMax[0], entry.boundsMax[1], entry.boundsMax[2]};

    const std::uint32_t flags = input.uniforms.cullFlags;
    if ((flags & kGpuCullFrustum) != 0 && !frustumFromUniforms(input.uniforms).intersects(bounds)) {
        return InvocationOutcome::FrustumCulled;
    }

    const bool wantsContribution = (flags & kGpuCullContribution) != 0;
    const bool wantsDepth = (flags & (kGpuCullDepthBoundingBox | kGpuCullDepthPyramid)) != 0 && input.depth != nullptr;
    if (!wantsContribution && !wantsDepth) {
        return InvocationOutcome::Recorded;
    }

    const ProjectedBounds projected = projectBounds(
        bounds,
        math::loadColumnMajor(input.uniforms.viewProjection),
        input.uniforms.viewport[0],
        input.uniforms.viewport[1]);

    if (wantsContribution && !ContributionAreaTest(input.uniforms.minContributionPixels).isVisible(projected)) {
        return InvocationOutcome::ContributionCulled;
    }
    if (wantsDepth) {
        const bool visible = (flags & kGpuCullDepthPyramid) != 0
            ? DepthPyramidTest(*input.depth).isVisible(projected)
            : BoundingBoxDepthTest(*input.depth).isVisible(projected);
        if (!visible) {
            return InvocationOutcome::DepthCulled;
        }
    }
    return InvocationOutcome::Recorded;
}

InvocationOutcome encodeInvocation(
    const CommandGenerationInput& input,
    std::uint32_t group,
    std::uint32_t submeshSlot,
    DrawIndexedCommand& outCommand
) {
    outCommand = DrawIndexedCommand{};
    if (group >= input.groups.size() || submeshSlot >= input.uniforms.maxSubmeshesPerMesh) {
        return InvocationOutcome::OutOfRange;
    }
    const GpuInstancedMesh& entry = input.groups[group];
    if (entry.meshIndex >= input.meshes.size()) {
        return InvocationOutcome::OutOfRange;
    }
    const GpuMesh& mesh = input.meshes[entry.meshIndex];
    if (submeshSlot >= mesh.submeshCount || mesh.submeshBegin + submeshSlot >= input.submeshes.size()) {
        return InvocationOutcome::NoSubmesh;
    }

    const InvocationOutcome verdict = evaluateGroup(input, group);
    if (verdict != InvocationOutcome::Recorded) {
        return verdict;
    }

    const GpuSubmesh& submesh = input.submeshes[mesh.submeshBegin + submeshSlot];
    outCommand.indexCount = submesh.indexCount;
    outCommand.instanceCount = entry.instanceCount;
    outCommand.firstIndex = submesh.indexOffset;
    outCommand.vertexOffset = submesh.vertexOffset;
    outCommand.firstInstance = entry.baseInstance;
    return InvocationOutcome::Recorded;
}

void encodeCommandsReference(const CommandGenerationInput& input, CommandList& out) {
    const std::uint32_t maxSubmeshes = input.uniforms.maxSubmeshesPerMesh;
    const std::uint32_t available = std::min(static_cast<std::uint32_t>(input.groups.size()), input.uniforms.groupCount);
    const DispatchSize dispatch = computeDispatchSize(available, maxSubmeshes);

    out.groupCount = dispatch.invocationsX;
    out.maxSubmeshesPerMesh = maxSubmeshes;
    out.commands.assign(static_cast<std::size_t>(dispatch.invocationsX) * dispatch.invocationsY, DrawIndexedCommand{});
    out.executed.assign(dispatch.invocationsX, 0u);

    for (std::uint32_t y = 0; y < dispatch.invocationsY; ++y) {
        for (std::uint32_t x = 0; x < dispatch.invocationsX; ++x) {
            DrawIndexedCommand command;
            if (encodeInvocation(input, x, y, command) == InvocationOutcome::Recorded) {
                out.commands[commandSlot(x, y, maxSubmeshes)] = command;
                out.executed[x] = 1u;
            }
        }
    }
}

} // namespace bimview::render
