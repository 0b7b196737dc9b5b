#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "core/options.h"
#include "render/frame_ring.h"
#include "scene/bvh.h"
#include "scene/geometry.h"

namespace bimview::render {

// Groups handed to the occlusion stage: the spatial-query result, or every
// group below the culling threshold, minus hidden groups. Sorted.
void collectFrustumCandidates(
    const scene::GeometryStore& geometry,
    const scene::Frustum& frustum,
    const core::RenderOptions& options,
    std::vector<std::uint32_t>& out,
    scene::SpatialQueryStats* outStats = nullptr);

struct OcclusionSlot {
    // Per group: kOccluded, kVisible or kUntested.
    std::vector<std::uint8_t> results;
    // Groups that got a proxy draw in the frame that owns this slot.
    std::vector<std::uint32_t> tested;
};

struct OcclusionStats {
    std::uint32_t candidateCount = 0;
    std::uint32_t visibleCount = 0;
    std::uint32_t occludedCount = 0;
    // Candidates kept because the read slot had no usable result for them.
    std::uint32_t fallbackCount = 0;
};

// Occlusion-query bookkeeping over a ring of result slots. The slot being
// written this frame receives proxy-draw results when the device finishes it;
// the final visible set is read from the newest completed slot.
class OcclusionCuller {
public:
    static constexpr std::uint8_t kOccluded = 0;
    static constexpr std::uint8_t kVisible = 1;
    static constexpr std::uint8_t kUntested = 2;

    explicit OcclusionCuller(std::uint32_t slotCount = 4);

    // Drops all results; call on geometry reload or resize.
    void reset(std::uint32_t slotCount, std::uint32_t groupCount);

    [[nodiscard]] std::optional<FrameTicket> beginFrame();
    // Remembers which groups received proxy draws in the current write slot.
    void recordProxyDraws(std::span<const std::uint32_t> groups);
    // `deviceResults` holds one sample count or boolean per group for the frame's slot.
    bool frameCompleted(const FrameTicket& ticket, std::span<const std::uint32_t> deviceResults);

    // Writes the final visible set for `candidates` (sorted) into `visible`.
    void resolve(
        std::span<const std::uint32_t> candidates,
        const core::RenderOptions& options,
        std::vector<std::uint32_t>& visible);

    [[nodiscard]] const FrameRing<OcclusionSlot>& ring() const { return m_ring; }
    [[nodiscard]] std::uint32_t groupCount() const { return m_groupCount; }
    [[nodiscard]] const OcclusionStats& stats() const { return m_stats; }

private:
    FrameRing<OcclusionSlot> m_ring;
    std::uint32_t m_groupCount = 0;
    OcclusionStats m_stats;
};

} // namespace bimview::render
