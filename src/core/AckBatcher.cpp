/**
 * @file AckBatcher.cpp
 * @brief Receiver-side accumulation of chunk acknowledgements
 */

#include "chunkwire/AckBatcher.h"

namespace ChunkWire {

AckBatcher::AckBatcher(Scheduler& scheduler,
                       FlushCallback onFlush,
                       size_t batchSize,
                       int64_t intervalMs)
    : m_scheduler(scheduler)
    , m_onFlush(std::move(onFlush))
    , m_batchSize(batchSize == 0 ? 1 : batchSize)
    , m_intervalMs(intervalMs)
{
}

AckBatcher::~AckBatcher() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& pair : m_pending) {
        if (pair.second.timer != INVALID_TASK_ID) {
            m_scheduler.cancel(pair.second.timer);
        }
    }
    m_pending.clear();
}

void AckBatcher::add(const std::string& transferId, uint32_t chunkIndex) {
    bool flushNow = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Pending& pending = m_pending[transferId];
        pending.indices.push_back(chunkIndex);

        if (pending.indices.size() >= m_batchSize) {
            flushNow = true;
        } else if (pending.timer == INVALID_TASK_ID) {
            pending.timer = m_scheduler.scheduleAfter(m_intervalMs, [this, transferId]() {
                flush(transferId);
            });
        }
    }

    if (flushNow) {
        flush(transferId);
    }
}

bool AckBatcher::takePending(const std::string& transferId, std::vector<uint32_t>& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(transferId);
    if (it == m_pending.end()) {
        return false;
    }
    if (it->second.timer != INVALID_TASK_ID) {
        m_scheduler.cancel(it->second.timer);
    }
    out = std::move(it->second.indices);
    m_pending.erase(it);
    return !out.empty();
}

void AckBatcher::flush(const std::string& transferId) {
    std::vector<uint32_t> indices;
    if (!takePending(transferId, indices)) {
        return;
    }
    if (m_onFlush) {
        m_onFlush(transferId, std::move(indices));
    }
}

void AckBatcher::flushAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ids.reserve(m_pending.size());
        for (const auto& pair : m_pending) {
            ids.push_back(pair.first);
        }
    }
    for (const auto& id : ids) {
        flush(id);
    }
}

void AckBatcher::discard(const std::string& transferId) {
    std::vector<uint32_t> dropped;
    takePending(transferId, dropped);
}

size_t AckBatcher::pendingCount(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(transferId);
    return it == m_pending.end() ? 0 : it->second.indices.size();
}

}  // namespace ChunkWire
