/**
 * @file BackpressureMonitor.cpp
 * @brief Watermark hysteresis over the channel's outbound buffer
 */

#include "chunkwire/BackpressureMonitor.h"

namespace ChunkWire {

BackpressureMonitor::BackpressureMonitor(size_t highWatermark, size_t lowWatermark)
    : m_high(highWatermark)
    , m_low(lowWatermark < highWatermark ? lowWatermark : highWatermark)
    , m_paused(false)
    , m_pauseCount(0)
{
}

bool BackpressureMonitor::shouldPause(size_t bufferedBytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_paused) {
        if (bufferedBytes < m_low) {
            m_paused = false;
        }
    } else if (bufferedBytes > m_high) {
        m_paused = true;
        ++m_pauseCount;
    }
    return m_paused;
}

bool BackpressureMonitor::isPaused() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paused;
}

uint64_t BackpressureMonitor::pauseCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pauseCount;
}

void BackpressureMonitor::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_paused = false;
}

}  // namespace ChunkWire
