/**
 * @file BackpressureMonitor.h
 * @brief Watermark hysteresis over the channel's outbound buffer
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>

namespace ChunkWire {

/**
 * @class BackpressureMonitor
 * @brief Decides whether the sender may put another message on the channel
 *
 * Dispatch pauses once the buffered level goes above the high watermark
 * and resumes only after it falls below the low watermark. One monitor is
 * shared by every transfer writing to the same channel.
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class BackpressureMonitor {
public:
    BackpressureMonitor(size_t highWatermark, size_t lowWatermark);

    /**
     * @brief Feed the current buffered level
     * @return true if dispatch must wait
     */
    bool shouldPause(size_t bufferedBytes);

    bool isPaused() const;

    /// Number of times dispatch went from running to paused
    uint64_t pauseCount() const;

    void reset();

    size_t highWatermark() const { return m_high; }
    size_t lowWatermark() const { return m_low; }

private:
    const size_t m_high;
    const size_t m_low;

    mutable std::mutex m_mutex;
    bool m_paused;
    uint64_t m_pauseCount;
};

}  // namespace ChunkWire
