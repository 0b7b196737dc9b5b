#include "render/render_pass.h"

#include "core/log.h"

#include <algorithm>

namespace bimview::render {

void VisibilityRenderPass::willDraw(FrameContext& context) {
    m_culler.resolve(context.candidates, context.options, context.visible);
    const OcclusionStats& stats = m_culler.stats();
    context.counters.candidateCount = stats.candidateCount;
    context.counters.visibleCount = stats.visibleCount;
    context.counters.occludedCount = stats.occludedCount;
}

void VisibilityRenderPass::draw(FrameContext& context) {
    if (!context.options.occlusionTesting || !context.device.capabilities().occlusionQueries) {
        m_culler.recordProxyDraws({});
        return;
    }
    const std::vector<scene::InstancedMesh>& groups = context.geometry.instancedMeshes();
    for (const std::uint32_t group : context.candidates) {
        context.device.drawProxy(group, groups[group].bounds);
    }
    m_culler.recordProxyDraws(context.candidates);
    context.counters.proxyDrawCount = static_cast<std::uint32_t>(context.candidates.size());
}

void DirectRenderPass::willDraw(FrameContext& context) {
    context.counters.indirect = false;
}

void DirectRenderPass::draw(FrameContext& context) {
    const auto limit = std::chrono::duration<double>(std::max(0.0, context.options.frameTimeLimitSeconds));
    const Clock::time_point deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(limit);
    const std::uint32_t drawn = drawGroups(context.device, context.geometry, context.visible, deadline, context.counters);
    if (drawn < context.visible.size()) {
        BIM_LOGD("direct") << "frame time limit reached after " << drawn << " of " << context.visible.size() << " groups";
    }
}

std::uint32_t DirectRenderPass::drawGroups(
    RenderDevice& device,
    const scene::GeometryStore& geometry,
    std::span<const std::uint32_t> groups,
    Clock::time_point deadline,
    FrameCounters& counters
) {
    const std::vector<scene::InstancedMesh>& instanced = geometry.instancedMeshes();
    const std::vector<scene::Mesh>& meshes = geometry.meshes();
    const std::vector<scene::Submesh>& submeshes = geometry.submeshes();

    std::uint32_t drawnGroups = 0;
    for (const std::uint32_t group : groups) {
        if (Clock::now() >= deadline) {
            counters.budgetSkippedCount += static_cast<std::uint32_t>(groups.size()) - drawnGroups;
            break;
        }
        const scene::InstancedMesh& entry = instanced[group];
        const scene::Mesh& mesh = meshes[entry.meshIndex];
        for (std::uint32_t s = 0; s < mesh.submeshCount; ++s) {
            const scene::Submesh& submesh = submeshes[mesh.submeshBegin + s];
            DrawIndexedCommand command;
            command.indexCount = submesh.indexCount;
            command.instanceCount = entry.instanceCount;
            command.firstIndex = submesh.indexOffset;
            command.vertexOffset = submesh.vertexOffset;
            command.firstInstance = entry.baseInstance;
            device.drawIndexed(command);
            ++counters.drawCallCount;
        }
        ++drawnGroups;
    }
    return drawnGroups;
}

std::unique_ptr<IndirectRenderPass> IndirectRenderPass::create(RenderDevice& device, const scene::GeometryStore& geometry) {
    const DeviceCapabilities& caps = device.capabilities();
    if (!caps.indirectDraw) {
        BIM_LOGI("indirect") << "indirect draws not supported on " << caps.deviceName << ", using direct path";
        return nullptr;
    }
    if (!caps.deviceCommandGeneration) {
        BIM_LOGI("indirect") << "no device command generation on " << caps.deviceName << ", encoding commands on the CPU";
    }
    return std::unique_ptr<IndirectRenderPass>(new IndirectRenderPass(caps.deviceCommandGeneration, geometry));
}

IndirectRenderPass::IndirectRenderPass(bool deviceGeneration, const scene::GeometryStore& geometry)
    : m_deviceGeneration(deviceGeneration) {
    rebuildTables(geometry);
}

void IndirectRenderPass::rebuildTables(const scene::GeometryStore& geometry) {
    m_tables = buildGpuSceneTables(geometry);
    m_cpuCommands = CommandList{};
    const std::uint32_t groupCount = static_cast<std::uint32_t>(m_tables.groups.size());
    const std::uint32_t encodable = encodableGroupCount(groupCount, m_tables.maxSubmeshesPerMesh);
    if (encodable < groupCount) {
        BIM_LOGW("indirect") << "command list holds " << encodable << " of " << groupCount
                             << " instanced meshes; the rest are drawn directly";
    }
}

void IndirectRenderPass::willDraw(FrameContext& context) {
    context.counters.indirect = true;
    context.counters.candidateCount = static_cast<std::uint32_t>(context.candidates.size());
    refreshGroupFlags(context.geometry, context.candidates, m_tables.groups);
    if (!context.device.updateGroupTable(m_tables.groups)) {
        BIM_LOGW("indirect") << "group table upload failed; flags from the previous frame stay bound";
    }
}

void IndirectRenderPass::draw(FrameContext& context) {
    const auto groupCount = static_cast<std::uint32_t>(m_tables.groups.size());
    const DispatchSize dispatch = computeDispatchSize(groupCount, m_tables.maxSubmeshesPerMesh);
    const std::uint32_t commandCount = dispatch.invocationsX * dispatch.invocationsY;
    context.counters.commandCapacity = commandCount;
    context.visible.clear();

    if (!dispatch.empty()) {
        if (m_deviceGeneration) {
            context.device.dispatchCommandGeneration(dispatch);
            // The device decides the final set; candidates are its upper bound.
            for (const std::uint32_t group : context.candidates) {
                if (group < dispatch.invocationsX) {
                    context.visible.push_back(group);
                }
            }
        } else {
            CommandGenerationInput input;
            input.groups = m_tables.groups;
            input.meshes = m_tables.meshes;
            input.submeshes = m_tables.submeshes;
            input.uniforms = context.uniforms;
            input.depth = context.device.depthPyramid();
            encodeCommandsReference(input, m_cpuCommands);
            if (!context.device.uploadCommands(m_cpuCommands.commands)) {
                BIM_LOGE("indirect") << "command upload failed; drawing this frame directly";
                DirectRenderPass::drawGroups(
                    context.device, context.geometry, context.candidates,
                    DirectRenderPass::Clock::time_point::max(), context.counters);
                context.visible.assign(context.candidates.begin(), context.candidates.end());
                return;
            }
            for (std::uint32_t group = 0; group < m_cpuCommands.executed.size(); ++group) {
                if (m_cpuCommands.executed[group] != 0) {
                    context.visible.push_back(group);
                }
            }
        }
        context.device.executeIndirect(commandCount);
        ++context.counters.drawCallCount;
    }

    // Groups beyond the command list capacity.
    const auto firstOverflow = std::lower_bound(context.candidates.begin(), context.candidates.end(), dispatch.invocationsX);
    const std::span<const std::uint32_t> overflow(firstOverflow, context.candidates.end());
    if (!overflow.empty()) {
        DirectRenderPass::drawGroups(
            context.device, context.geometry, overflow,
            DirectRenderPass::Clock::time_point::max(), context.counters);
        context.visible.insert(context.visible.end(), overflow.begin(), overflow.end());
    }
}

void IndirectRenderPass::didDraw(FrameContext& context) {
    context.counters.visibleCount = static_cast<std::uint32_t>(context.visible.size());
}

} // namespace bimview::render
