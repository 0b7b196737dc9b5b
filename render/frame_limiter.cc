#include "render/frame_limiter.h"

#include "core/log.h"

#include <algorithm>

namespace bimview::render {

FrameLimiter::FrameLimiter(std::uint32_t capacity)
    : m_capacity(std::max(1u, capacity)) {}

void FrameLimiter::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_released.wait(lock, [this]() { return m_inFlight < m_capacity; });
    ++m_inFlight;
}

bool FrameLimiter::tryAcquire() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_inFlight >= m_capacity) {
        return false;
    }
    ++m_inFlight;
    return true;
}

bool FrameLimiter::acquireFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_released.wait_for(lock, timeout, [this]() { return m_inFlight < m_capacity; })) {
        return false;
    }
    ++m_inFlight;
    return true;
}

void FrameLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_inFlight == 0) {
            BIM_LOGW("frame") << "limiter released with no frame in flight";
            return;
        }
        --m_inFlight;
    }
    m_released.notify_one();
}

bool FrameLimiter::setCapacity(std::uint32_t capacity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_inFlight != 0) {
        return false;
    }
    m_capacity = std::max(1u, capacity);
    return true;
}

std::uint32_t FrameLimiter::capacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity;
}

std::uint32_t FrameLimiter::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight;
}

} // namespace bimview::render
