#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "scene/geometry.h"

namespace bimview::render {

struct FrameCounters {
    std::uint32_t candidateCount = 0;
    std::uint32_t visibleCount = 0;
    std::uint32_t occludedCount = 0;
    std::uint32_t proxyDrawCount = 0;
    std::uint32_t drawCallCount = 0;
    // Groups the direct path skipped after the frame time limit ran out.
    std::uint32_t budgetSkippedCount = 0;
    std::uint32_t commandCapacity = 0;
    bool indirect = false;
};

struct StatisticsSnapshot {
    scene::GeometryCounts geometry{};
    FrameCounters lastFrame{};
    double averageLatencyMs = 0.0;
    double maxLatencyMs = 0.0;
    std::uint64_t completedFrames = 0;
};

// Rolling frame latency (submit-to-completion) plus per-frame counters.
// Observers read the snapshot, which is refreshed at most once per interval.
class FrameStats {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kLatencyWindow = 100;
    static constexpr std::chrono::milliseconds kPublishInterval{1000};

    void reset(const scene::GeometryCounts& geometry);
    void recordFrame(const FrameCounters& counters);
    void recordLatency(double latencyMs);
    // Copies the current values into the snapshot when the interval has elapsed.
    bool publishIfDue(Clock::time_point now);

    [[nodiscard]] double averageLatencyMs() const;
    [[nodiscard]] double maxLatencyMs() const;
    [[nodiscard]] std::size_t latencySampleCount() const { return m_latencyCount; }
    [[nodiscard]] const FrameCounters& lastFrame() const { return m_lastFrame; }
    [[nodiscard]] const StatisticsSnapshot& snapshot() const { return m_snapshot; }

private:
    scene::GeometryCounts m_geometry{};
    FrameCounters m_lastFrame{};
    std::array<double, kLatencyWindow> m_latencyMs{};
    std::size_t m_latencyWrite = 0;
    std::size_t m_latencyCount = 0;
    std::uint64_t m_completedFrames = 0;
    Clock::time_point m_lastPublish{};
    bool m_published = false;
    StatisticsSnapshot m_snapshot{};
};

} // namespace bimview::render
