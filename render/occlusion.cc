#include "render/occlusion.h"

#include "core/log.h"

#include <algorithm>

namespace bimview::render {

void collectFrustumCandidates(
    const scene::GeometryStore& geometry,
    const scene::Frustum& frustum,
    const core::RenderOptions& options,
    std::vector<std::uint32_t>& out,
    scene::SpatialQueryStats* outStats
) {
    out.clear();
    if (outStats != nullptr) {
        *outStats = scene::SpatialQueryStats{};
    }
    if (!geometry.isReady()) {
        return;
    }

    const auto groupCount = static_cast<std::uint32_t>(geometry.instancedMeshes().size());
    if (groupCount < options.frustumCullingThreshold) {
        out.resize(groupCount);
        for (std::uint32_t group = 0; group < groupCount; ++group) {
            out[group] = group;
        }
    } else {
        geometry.queryGroups(frustum, out, outStats);
    }

    out.erase(
        std::remove_if(out.begin(), out.end(), [&](std::uint32_t group) { return geometry.isGroupHidden(group); }),
        out.end());
    if (outStats != nullptr) {
        outStats->candidateCount = static_cast<std::uint32_t>(out.size());
    }
}

OcclusionCuller::OcclusionCuller(std::uint32_t slotCount)
    : m_ring(slotCount, OcclusionSlot{}) {}

void OcclusionCuller::reset(std::uint32_t slotCount, std::uint32_t groupCount) {
    OcclusionSlot initial;
    initial.results.assign(groupCount, kUntested);
    m_ring.reset(slotCount, initial);
    m_groupCount = groupCount;
    m_stats = OcclusionStats{};
    BIM_LOGD("visibility") << "occlusion results reset: slots=" << m_ring.slotCount() << ", groups=" << groupCount;
}

std::optional<FrameTicket> OcclusionCuller::beginFrame() {
    std::optional<FrameTicket> ticket = m_ring.beginFrame();
    if (ticket.has_value()) {
        m_ring.writeData().tested.clear();
    }
    return ticket;
}

void OcclusionCuller::recordProxyDraws(std::span<const std::uint32_t> groups) {
    std::vector<std::uint32_t>& tested = m_ring.writeData().tested;
    tested.assign(groups.begin(), groups.end());
}

bool OcclusionCuller::frameCompleted(const FrameTicket& ticket, std::span<const std::uint32_t> deviceResults) {
    if (ticket.epoch != m_ring.epoch()) {
        BIM_LOGD("visibility") << "dropping results of frame " << ticket.frameNumber << " from before a reset";
        return false;
    }
    OcclusionSlot& slot = m_ring.slot(ticket.slot);
    slot.results.assign(m_groupCount, kUntested);
    for (const std::uint32_t group : slot.tested) {
        if (group >= slot.results.size() || group >= deviceResults.size()) {
            continue;
        }
        slot.results[group] = deviceResults[group] != 0 ? kVisible : kOccluded;
    }
    return m_ring.complete(ticket);
}

void OcclusionCuller::resolve(
    std::span<const std::uint32_t> candidates,
    const core::RenderOptions& options,
    std::vector<std::uint32_t>& visible
) {
    m_stats = OcclusionStats{};
    m_stats.candidateCount = static_cast<std::uint32_t>(candidates.size());
    visible.clear();

    const OcclusionSlot* slot = m_ring.readData();
    if (!options.occlusionTesting || options.visualizeOcclusion || slot == nullptr) {
        visible.assign(candidates.begin(), candidates.end());
        m_stats.visibleCount = m_stats.candidateCount;
        if (slot == nullptr && options.occlusionTesting && !options.visualizeOcclusion) {
            m_stats.fallbackCount = m_stats.candidateCount;
        }
        return;
    }

    visible.reserve(candidates.size());
    for (const std::uint32_t group : candidates) {
        if (group >= slot->results.size() || slot->results[group] == kUntested) {
            ++m_stats.fallbackCount;
            visible.push_back(group);
        } else if (slot->results[group] == kVisible) {
            visible.push_back(group);
        } else {
            ++m_stats.occludedCount;
        }
    }
    m_stats.visibleCount = static_cast<std::uint32_t>(visible.size());
}

} // namespace bimview::render
