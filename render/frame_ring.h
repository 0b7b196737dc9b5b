#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/log.h"

namespace bimview::render {

// Identifies one frame's claim on a ring slot. Tickets from before a reset are stale.
struct FrameTicket {
    std::uint32_t slot = 0;
    std::uint64_t epoch = 0;
    std::uint64_t frameNumber = 0;
};

// Rotating per-frame storage with a write index that advances when a frame
// begins and a read index that advances only when the frame that wrote a slot
// completes. The read slot always holds the newest completed frame, so it
// trails the write slot by the number of frames in flight.
//
// A ring of N slots holds at most N - 1 frames in flight; the remaining slot
// is the one being read.
template <typename T>
class FrameRing {
public:
    explicit FrameRing(std::uint32_t slotCount = 2, const T& initial = T{}) {
        reset(slotCount, initial);
    }

    // Re-sizes every slot and forgets all frames. Frames begun before the
    // reset keep whatever they already bound; their completions are ignored.
    void reset(std::uint32_t slotCount, const T& initial) {
        m_slots.assign(slotCount < 2 ? 2 : slotCount, initial);
        m_writeIndex = 0;
        m_readIndex = 0;
        m_begunFrames = 0;
        m_completedFrames = 0;
        ++m_epoch;
    }

    // Claims the next write slot, or nullopt when every other slot is still in flight.
    [[nodiscard]] std::optional<FrameTicket> beginFrame() {
        if (inFlightCount() >= maxInFlight()) {
            return std::nullopt;
        }
        if (m_begunFrames > 0) {
            m_writeIndex = (m_writeIndex + 1) % slotCount();
        }
        ++m_begunFrames;
        return FrameTicket{m_writeIndex, m_epoch, m_begunFrames};
    }

    // Completions must arrive in submission order.
    bool complete(const FrameTicket& ticket) {
        if (ticket.epoch != m_epoch) {
            BIM_LOGD("frame") << "ignoring completion of frame " << ticket.frameNumber << " from a previous ring epoch";
            return false;
        }
        if (ticket.frameNumber != m_completedFrames + 1 || ticket.frameNumber > m_begunFrames) {
            BIM_LOGW("frame") << "out-of-order completion: frame " << ticket.frameNumber
                              << ", expected " << (m_completedFrames + 1);
            return false;
        }
        if (m_completedFrames > 0) {
            m_readIndex = (m_readIndex + 1) % slotCount();
        }
        ++m_completedFrames;
        return true;
    }

    [[nodiscard]] std::uint32_t slotCount() const { return static_cast<std::uint32_t>(m_slots.size()); }
    [[nodiscard]] std::uint32_t maxInFlight() const { return slotCount() - 1; }
    [[nodiscard]] std::uint32_t writeIndex() const { return m_writeIndex; }
    [[nodiscard]] std::uint32_t readIndex() const { return m_readIndex; }
    [[nodiscard]] std::uint64_t epoch() const { return m_epoch; }
    [[nodiscard]] std::uint32_t inFlightCount() const {
        return static_cast<std::uint32_t>(m_begunFrames - m_completedFrames);
    }
    [[nodiscard]] bool hasCompletedData() const { return m_completedFrames > 0; }

    [[nodiscard]] T& slot(std::uint32_t index) { return m_slots[index]; }
    [[nodiscard]] const T& slot(std::uint32_t index) const { return m_slots[index]; }
    [[nodiscard]] T& writeData() { return m_slots[m_writeIndex]; }
    // nullptr until a frame has completed since the last reset.
    [[nodiscard]] const T* readData() const {
        return hasCompletedData() ? &m_slots[m_readIndex] : nullptr;
    }

private:
    std::vector<T> m_slots;
    std::uint32_t m_writeIndex = 0;
    std::uint32_t m_readIndex = 0;
    std::uint64_t m_begunFrames = 0;
    std::uint64_t m_completedFrames = 0;
    std::uint64_t m_epoch = 0;
};

} // namespace bimview::render
