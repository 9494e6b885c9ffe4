/**
 * @file CongestionWindow.cpp
 * @brief AIMD send window with slow start and RTT-derived timeouts
 */

#include "chunkwire/CongestionWindow.h"

#include <algorithm>

namespace ChunkWire {

CongestionWindow::CongestionWindow(const CongestionSettings& settings)
    : m_settings(settings)
    , m_window(0)
    , m_ssthresh(0)
    , m_slowStart(true)
    , m_consecutiveSuccesses(0)
    , m_consecutiveTimeouts(0)
    , m_rttSum(0)
{
    if (m_settings.minWindow == 0) {
        m_settings.minWindow = 1;
    }
    if (m_settings.maxWindow < m_settings.minWindow) {
        m_settings.maxWindow = m_settings.minWindow;
    }
    if (m_settings.rttHistorySize == 0) {
        m_settings.rttHistorySize = 1;
    }

    m_window = std::clamp(m_settings.initialWindow, m_settings.minWindow, m_settings.maxWindow);
    m_ssthresh = std::clamp(m_settings.slowStartThreshold, m_settings.minWindow, m_settings.maxWindow);
    m_slowStart = m_window < m_ssthresh;
}

void CongestionWindow::onAck(int64_t rttMs) {
    m_consecutiveTimeouts = 0;
    ++m_consecutiveSuccesses;

    if (rttMs >= 0) {
        m_rttSamples.push_back(rttMs);
        m_rttSum += rttMs;
        if (m_rttSamples.size() > m_settings.rttHistorySize) {
            m_rttSum -= m_rttSamples.front();
            m_rttSamples.pop_front();
        }
    }
}

void CongestionWindow::onTimeout() {
    m_consecutiveSuccesses = 0;
    ++m_consecutiveTimeouts;
}

WindowChange CongestionWindow::evaluate() {
    if (m_consecutiveTimeouts >= m_settings.timeoutBurst) {
        const uint32_t before = m_window;
        m_window = std::max(m_settings.minWindow, m_window / 2);
        m_ssthresh = m_window;
        m_slowStart = false;
        m_consecutiveTimeouts = 0;
        return m_window < before ? WindowChange::SHRANK : WindowChange::NONE;
    }

    if (m_consecutiveSuccesses >= m_window) {
        m_consecutiveSuccesses = 0;
        const uint32_t before = m_window;

        if (m_slowStart) {
            const uint64_t doubled = static_cast<uint64_t>(m_window) * 2;
            m_window = static_cast<uint32_t>(std::min<uint64_t>(doubled, m_ssthresh));
            if (m_window >= m_ssthresh) {
                m_slowStart = false;
            }
        } else if (m_window < m_settings.maxWindow) {
            ++m_window;
        }
        return m_window > before ? WindowChange::GREW : WindowChange::NONE;
    }

    return WindowChange::NONE;
}

double CongestionWindow::averageRttMs() const {
    if (m_rttSamples.empty()) {
        return static_cast<double>(m_settings.initialRttMs);
    }
    return static_cast<double>(m_rttSum) / static_cast<double>(m_rttSamples.size());
}

int64_t CongestionWindow::timeoutMs() const {
    const auto adaptive = static_cast<int64_t>(3.0 * averageRttMs()) + m_settings.rttMarginMs;
    return std::max<int64_t>(m_settings.baseTimeoutMs, adaptive);
}

}  // namespace ChunkWire
