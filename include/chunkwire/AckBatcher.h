/**
 * @file AckBatcher.h
 * @brief Receiver-side accumulation of chunk acknowledgements
 */

#pragma once

#include "Scheduler.h"
#include "config.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ChunkWire {

/**
 * @class AckBatcher
 * @brief Collects acknowledged indices per transfer and flushes them together
 *
 * A transfer's pending indices are flushed when batchSize of them are
 * waiting, when intervalMs has passed since the first one was added, or
 * when the owner calls flush() (completion) or discard() (cancel).
 *
 * The flush callback runs without the batcher's lock held and on the
 * thread that triggered the flush (adder thread or scheduler thread).
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class AckBatcher {
public:
    using FlushCallback = std::function<void(const std::string& transferId,
                                             std::vector<uint32_t> indices)>;

    AckBatcher(Scheduler& scheduler,
               FlushCallback onFlush,
               size_t batchSize = BATCH_ACK_SIZE,
               int64_t intervalMs = BATCH_ACK_INTERVAL_MS);

    /**
     * @brief Cancels any pending flush timers
     */
    ~AckBatcher();

    // Prevent copying
    AckBatcher(const AckBatcher&) = delete;
    AckBatcher& operator=(const AckBatcher&) = delete;

    void add(const std::string& transferId, uint32_t chunkIndex);

    /**
     * @brief Flush one transfer now (no-op when nothing is pending)
     */
    void flush(const std::string& transferId);

    void flushAll();

    /**
     * @brief Drop a transfer's pending indices without sending them
     */
    void discard(const std::string& transferId);

    size_t pendingCount(const std::string& transferId) const;

private:
    struct Pending {
        std::vector<uint32_t> indices;
        TaskId timer = INVALID_TASK_ID;
    };

    bool takePending(const std::string& transferId, std::vector<uint32_t>& out);

    Scheduler& m_scheduler;
    FlushCallback m_onFlush;
    const size_t m_batchSize;
    const int64_t m_intervalMs;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Pending> m_pending;
};

}  // namespace ChunkWire
