/**
 * @file CongestionWindow.h
 * @brief AIMD send window with slow start and RTT-derived timeouts
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <deque>

namespace ChunkWire {

/**
 * @brief Tunables for one CongestionWindow
 */
struct CongestionSettings {
    uint32_t initialWindow = INITIAL_WINDOW;
    uint32_t minWindow = MIN_WINDOW;
    uint32_t maxWindow = MAX_WINDOW;
    uint32_t slowStartThreshold = SLOW_START_THRESHOLD;
    uint32_t timeoutBurst = TIMEOUT_BURST;
    size_t rttHistorySize = RTT_HISTORY_SIZE;
    uint32_t initialRttMs = INITIAL_RTT_MS;
    uint32_t baseTimeoutMs = BASE_TIMEOUT_MS;
    uint32_t rttMarginMs = RTT_MARGIN_MS;
};

/**
 * @brief Outcome of one evaluate() tick
 */
enum class WindowChange {
    NONE,
    GREW,
    SHRANK
};

/**
 * @class CongestionWindow
 * @brief Number of chunks a sender may have in flight
 *
 * Counters are fed by onAck()/onTimeout() as events arrive; the window
 * itself only moves in evaluate(), which the sender calls on its
 * congestion tick:
 * - timeoutBurst consecutive timeouts: halve (floor minWindow), set the
 *   slow-start threshold to the new window, leave slow start
 * - a full window of consecutive successes: double in slow start (capped
 *   at the threshold, leaving slow start on reaching it), otherwise +1
 *   (capped at maxWindow)
 *
 * The window never shrinks without timeouts and never leaves
 * [minWindow, maxWindow].
 *
 * Not thread-safe; the owning transfer's mutex guards it.
 */
class CongestionWindow {
public:
    explicit CongestionWindow(const CongestionSettings& settings = CongestionSettings());

    /**
     * @brief Record a successful acknowledgement
     * @param rttMs ackTime - sendTime, negative to skip the RTT sample
     */
    void onAck(int64_t rttMs);

    /**
     * @brief Record a retransmission timeout
     */
    void onTimeout();

    /**
     * @brief Apply accumulated counters to the window size
     */
    WindowChange evaluate();

    uint32_t size() const { return m_window; }
    uint32_t slowStartThreshold() const { return m_ssthresh; }
    bool inSlowStart() const { return m_slowStart; }
    uint32_t consecutiveSuccesses() const { return m_consecutiveSuccesses; }
    uint32_t consecutiveTimeouts() const { return m_consecutiveTimeouts; }

    /**
     * @brief Mean of the recent RTT samples, initialRttMs before the first
     */
    double averageRttMs() const;

    /**
     * @brief max(baseTimeout, 3 x averageRtt + margin)
     */
    int64_t timeoutMs() const;

private:
    CongestionSettings m_settings;
    uint32_t m_window;
    uint32_t m_ssthresh;
    bool m_slowStart;
    uint32_t m_consecutiveSuccesses;
    uint32_t m_consecutiveTimeouts;
    std::deque<int64_t> m_rttSamples;
    int64_t m_rttSum;
};

}  // namespace ChunkWire
