#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace bimview::render {

// Counting semaphore bounding the number of frames prepared ahead of the device.
class FrameLimiter {
public:
    explicit FrameLimiter(std::uint32_t capacity = 3);

    FrameLimiter(const FrameLimiter&) = delete;
    FrameLimiter& operator=(const FrameLimiter&) = delete;

    void acquire();
    [[nodiscard]] bool tryAcquire();
    [[nodiscard]] bool acquireFor(std::chrono::milliseconds timeout);
    void release();

    // Only valid while nothing is in flight.
    bool setCapacity(std::uint32_t capacity);
    [[nodiscard]] std::uint32_t capacity() const;
    [[nodiscard]] std::uint32_t inFlight() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_released;
    std::uint32_t m_capacity = 0;
    std::uint32_t m_inFlight = 0;
};

} // namespace bimview::render
