#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "render/depth_pyramid.h"
#include "render/gpu_types.h"

// Draw-command generation: one invocation per (instanced mesh, submesh slot).
// The CPU functions here are the reference for shaders/encode_commands.comp.slang
// and produce the same command list for the same inputs.
namespace bimview::render {

constexpr std::uint32_t kMaxCommandCount = 64u * 1024u;
constexpr std::uint32_t kEncodeThreadGroupSizeX = 64;

struct DispatchSize {
    std::uint32_t groupCountX = 0;
    std::uint32_t groupCountY = 0;
    // Logical grid: x indexes instanced meshes, y indexes submesh slots.
    std::uint32_t invocationsX = 0;
    std::uint32_t invocationsY = 0;

    [[nodiscard]] bool empty() const { return invocationsX == 0 || invocationsY == 0; }
};

[[nodiscard]] constexpr std::uint32_t commandSlot(
    std::uint32_t group,
    std::uint32_t submeshSlot,
    std::uint32_t maxSubmeshesPerMesh
) {
    return group * maxSubmeshesPerMesh + submeshSlot;
}

// Number of leading groups whose full submesh row fits in kMaxCommandCount.
[[nodiscard]] std::uint32_t encodableGroupCount(std::uint32_t groupCount, std::uint32_t maxSubmeshesPerMesh);
[[nodiscard]] DispatchSize computeDispatchSize(std::uint32_t groupCount, std::uint32_t maxSubmeshesPerMesh);

enum class InvocationOutcome : std::uint8_t {
    Recorded = 0,
    OutOfRange,
    NoSubmesh,
    Hidden,
    NotCandidate,
    FrustumCulled,
    ContributionCulled,
    DepthCulled
};

[[nodiscard]] const char* invocationOutcomeName(InvocationOutcome outcome);

struct CommandGenerationInput {
    std::span<const GpuInstancedMesh> groups;
    std::span<const GpuMesh> meshes;
    std::span<const GpuSubmesh> submeshes;
    GpuFrameUniforms uniforms{};
    // Previous frame's depth; required only when a depth cull flag is set.
    const DepthPyramid* depth = nullptr;
};

struct CommandList {
    std::uint32_t groupCount = 0;
    std::uint32_t maxSubmeshesPerMesh = 0;
    // groupCount * maxSubmeshesPerMesh entries; unused slots have instanceCount 0.
    std::vector<DrawIndexedCommand> commands;
    // 1 for every group that recorded at least one draw.
    std::vector<std::uint32_t> executed;

    [[nodiscard]] std::uint32_t recordedCount() const;
};

// Group-level verdict shared by every submesh slot of that group. Returns
// Recorded when the group survives every enabled test.
[[nodiscard]] InvocationOutcome evaluateGroup(const CommandGenerationInput& input, std::uint32_t group);

[[nodiscard]] InvocationOutcome encodeInvocation(
    const CommandGenerationInput& input,
    std::uint32_t group,
    std::uint32_t submeshSlot,
    DrawIndexedCommand& outCommand);

// Runs the whole dispatch grid on the CPU.
void encodeCommandsReference(const CommandGenerationInput& input, CommandList& out);

} // namespace bimview::render
