#include "render/frame_stats.h"

#include "core/log.h"

#include <algorithm>

namespace bimview::render {

void FrameStats::reset(const scene::GeometryCounts& geometry) {
    m_geometry = geometry;
    m_lastFrame = FrameCounters{};
    m_latencyMs.fill(0.0);
    m_latencyWrite = 0;
    m_latencyCount = 0;
    m_completedFrames = 0;
    m_published = false;
    m_snapshot = StatisticsSnapshot{};
    m_snapshot.geometry = geometry;
}

void FrameStats::recordFrame(const FrameCounters& counters) {
    m_lastFrame = counters;
}

void FrameStats::recordLatency(double latencyMs) {
    m_latencyMs[m_latencyWrite] = latencyMs;
    m_latencyWrite = (m_latencyWrite + 1u) % kLatencyWindow;
    m_latencyCount = std::min(m_latencyCount + 1u, kLatencyWindow);
    ++m_completedFrames;
}

bool FrameStats::publishIfDue(Clock::time_point now) {
    if (m_published && now - m_lastPublish < kPublishInterval) {
        return false;
    }
    m_snapshot.geometry = m_geometry;
    m_snapshot.lastFrame = m_lastFrame;
    m_snapshot.averageLatencyMs = averageLatencyMs();
    m_snapshot.maxLatencyMs = maxLatencyMs();
    m_snapshot.completedFrames = m_completedFrames;
    m_lastPublish = now;
    m_published = true;

    BIM_LOGD("stats") << "instances=" << m_geometry.instanceCount
                      << " meshes=" << m_geometry.meshCount
                      << " submeshes=" << m_geometry.submeshCount
                      << " visible=" << m_lastFrame.visibleCount << "/" << m_lastFrame.candidateCount
                      << " draws=" << m_lastFrame.drawCallCount
                      << " latency avg=" << m_snapshot.averageLatencyMs << "ms max=" << m_snapshot.maxLatencyMs << "ms";
    return true;
}

double FrameStats::averageLatencyMs() const {
    if (m_latencyCount == 0) {
        return 0.0;
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < m_latencyCount; ++i) {
        sum += m_latencyMs[i];
    }
    return sum / static_cast<double>(m_latencyCount);
}

double FrameStats::maxLatencyMs() const {
    double result = 0.0;
    for (std::size_t i = 0; i < m_latencyCount; ++i) {
        result = std::max(result, m_latencyMs[i]);
    }
    return result;
}

} // namespace bimview::render
