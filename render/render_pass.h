#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "core/options.h"
#include "render/command_generation.h"
#include "render/frame_stats.h"
#include "render/gpu_scene.h"
#include "render/occlusion.h"
#include "render/render_device.h"
#include "scene/geometry.h"

namespace bimview::render {

struct FrameContext {
    RenderDevice& device;
    const scene::GeometryStore& geometry;
    const core::RenderOptions& options;
    FrameTicket ticket{};
    GpuFrameUniforms uniforms{};
    // Sorted frustum candidates with hidden groups removed.
    std::span<const std::uint32_t> candidates;
    // Final visible set, filled by the pass that decides it.
    std::vector<std::uint32_t>& visible;
    FrameCounters& counters;
};

class RenderPass {
public:
    virtual ~RenderPass() = default;

    [[nodiscard]] virtual const char* name() const = 0;
    virtual void willDraw(FrameContext& context) = 0;
    virtual void draw(FrameContext& context) = 0;
    virtual void didDraw(FrameContext& context) { (void)context; }
};

// Resolves the visible set from completed occlusion results, then issues
// this frame's proxy draws for every candidate.
class VisibilityRenderPass final : public RenderPass {
public:
    explicit VisibilityRenderPass(OcclusionCuller& culler) : m_culler(culler) {}

    [[nodiscard]] const char* name() const override { return "visibility"; }
    void willDraw(FrameContext& context) override;
    void draw(FrameContext& context) override;

private:
    OcclusionCuller& m_culler;
};

// CPU-issued draws of the visible set, one per submesh, bounded by the frame time limit.
class DirectRenderPass final : public RenderPass {
public:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] const char* name() const override { return "direct"; }
    void willDraw(FrameContext& context) override;
    void draw(FrameContext& context) override;

    // Draws `groups` in order until `deadline`; returns the number of groups drawn.
    static std::uint32_t drawGroups(
        RenderDevice& device,
        const scene::GeometryStore& geometry,
        std::span<const std::uint32_t> groups,
        Clock::time_point deadline,
        FrameCounters& counters);
};

// Device-resident command list: either encoded by the compute kernel or, on
// devices without one, by the CPU reference encoder and uploaded.
class IndirectRenderPass final : public RenderPass {
public:
    // nullptr when the device cannot execute indirect draws.
    [[nodiscard]] static std::unique_ptr<IndirectRenderPass> create(RenderDevice& device, const scene::GeometryStore& geometry);

    [[nodiscard]] const char* name() const override { return "indirect"; }
    void willDraw(FrameContext& context) override;
    void draw(FrameContext& context) override;
    void didDraw(FrameContext& context) override;

    // Re-reads the group/mesh tables after a geometry reload.
    void rebuildTables(const scene::GeometryStore& geometry);
    [[nodiscard]] const CommandList& lastCpuCommands() const { return m_cpuCommands; }
    [[nodiscard]] bool usesDeviceGeneration() const { return m_deviceGeneration; }

private:
    IndirectRenderPass(bool deviceGeneration, const scene::GeometryStore& geometry);

    bool m_deviceGeneration = false;
    GpuSceneTables m_tables;
    CommandList m_cpuCommands;
};

} // namespace bimview::render
