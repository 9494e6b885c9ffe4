/**
 * @file SenderEngine.h
 * @brief Windowed chunk transmission with retransmission and AIMD congestion control
 */

#pragma once

#include "BackpressureMonitor.h"
#include "ChunkCodec.h"
#include "ChunkSource.h"
#include "CongestionWindow.h"
#include "DataChannel.h"
#include "DeferredCalls.h"
#include "EngineConfig.h"
#include "Scheduler.h"
#include "TransferRegistry.h"
#include "TransferTypes.h"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace ChunkWire {

/**
 * @struct SendRequest
 * @brief Everything needed to start one outgoing transfer
 */
struct SendRequest {
    std::shared_ptr<ChunkSource> source;
    std::string transferId;   ///< Empty = generate "xfer_..." id
    size_t chunkSize = 0;     ///< 0 = EngineConfig::chunkSize, then auto
    std::string fileName;     ///< Empty = source->name()
    std::string mimeType;
};

/**
 * @struct SenderStatus
 * @brief Snapshot of one outgoing transfer
 */
struct SenderStatus {
    std::string transferId;
    TransferState state = TransferState::PREPARING;
    uint64_t totalBytes = 0;
    uint64_t bytesAcked = 0;
    uint32_t chunkSize = 0;
    uint32_t totalChunks = 0;
    uint32_t chunksAcked = 0;
    uint32_t chunksInFlight = 0;
    uint32_t chunksFailed = 0;
    uint32_t windowSize = 0;
    uint32_t slowStartThreshold = 0;
    bool inSlowStart = false;
    double averageRttMs = 0.0;
    uint64_t retransmissions = 0;
};

/**
 * @class SenderEngine
 * @brief Sends files over a DataChannel and drives them to acknowledgement
 *
 * One engine serves every outgoing transfer on a channel. Per transfer:
 * - INIT is sent first, then chunks while fewer than the congestion
 *   window are unacknowledged and the channel is below its watermarks
 * - each chunk has its own retransmission timer (CongestionWindow::timeoutMs)
 * - a chunk out of retries parks in the failed set; a recovery timer
 *   re-queues failed chunks with a fresh retry budget until
 *   maxRecoveryRounds is exceeded, which fails the transfer
 * - a stall timer resends everything in flight (and INIT while nothing is
 *   acknowledged) after stallTimeoutMs without an ACK
 * - once every chunk is acknowledged the transfer completes and
 *   END_OF_STREAM is sent assembleSignalCount times
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Work on one transfer is serialized by that transfer's mutex
 * - DataChannel::send() is called with the transfer's mutex held, so a
 *   channel must not deliver the peer's reply synchronously into this
 *   engine from inside send()
 *
 * Events are raised after the transfer's mutex is released.
 */
class SenderEngine {
public:
    SenderEngine(DataChannel& channel,
                 Scheduler& scheduler,
                 const EngineConfig& config,
                 TransferEvents events);

    /**
     * @brief Cancels every pending timer of every transfer
     */
    ~SenderEngine();

    // Prevent copying
    SenderEngine(const SenderEngine&) = delete;
    SenderEngine& operator=(const SenderEngine&) = delete;

    //=========================================================================
    // Commands
    //=========================================================================

    /**
     * @brief Start sending a file
     * @param request Source and metadata
     * @param transferIdOut Id of the new transfer
     * @param errorMsg Error message if the transfer could not start
     * @return true if INIT was sent and dispatch has begun
     *
     * Fails without registering anything when the source is missing or
     * unreadable, the id is taken or too long, no chunk fits in one channel
     * message, or the channel refuses INIT.
     */
    bool startTransfer(const SendRequest& request,
                       std::string& transferIdOut,
                       std::string& errorMsg);

    bool pauseTransfer(const std::string& transferId, std::string& errorMsg);
    bool resumeTransfer(const std::string& transferId, std::string& errorMsg);

    /**
     * @brief Cancel locally and notify the peer with CANCEL
     */
    bool cancelTransfer(const std::string& transferId, std::string& errorMsg);

    //=========================================================================
    // Inbound control
    //=========================================================================

    void ackReceived(const std::string& transferId, uint32_t chunkIndex);
    void batchAckReceived(const std::string& transferId, const std::vector<uint32_t>& indices);

    /**
     * @brief Peer sent CANCEL
     * @return true if a live outgoing transfer was cancelled
     */
    bool onPeerCancel(const std::string& transferId, const std::string& reason);

    //=========================================================================
    // Queries
    //=========================================================================

    bool getStatus(const std::string& transferId, SenderStatus& status) const;
    bool hasTransfer(const std::string& transferId) const;
    size_t transferCount() const { return m_transfers.size(); }

    const BackpressureMonitor& backpressure() const { return m_backpressure; }

private:
    struct OutgoingChunk {
        int64_t sentAtMs = 0;
        uint32_t retries = 0;
        TaskId timer = INVALID_TASK_ID;
        bool awaitingRead = false;        ///< Source read failed, retry pending
        std::vector<uint8_t> packet;      ///< Encoded CHUNK kept for resends
    };

    struct OutgoingTransfer {
        std::mutex mutex;

        std::string id;
        std::shared_ptr<ChunkSource> source;
        InitPacket init;
        uint64_t totalSize = 0;
        uint32_t chunkSize = 0;
        uint32_t totalChunks = 0;

        TransferState state = TransferState::PREPARING;
        int64_t startMs = 0;
        int64_t lastAckMs = 0;

        CongestionWindow window;
        std::vector<bool> acked;
        uint32_t ackedCount = 0;
        uint64_t bytesAcked = 0;

        std::map<uint32_t, OutgoingChunk> inFlight;
        std::set<uint32_t> failed;
        std::set<uint32_t> failedByRead;
        std::unordered_map<uint32_t, uint32_t> recoveryRounds;
        std::deque<uint32_t> requeue;
        uint32_t nextFreshIndex = 0;

        TaskId congestionTimer = INVALID_TASK_ID;
        TaskId stallTimer = INVALID_TASK_ID;
        TaskId recoveryTimer = INVALID_TASK_ID;
        TaskId backpressureTimer = INVALID_TASK_ID;
        TaskId deadlineTimer = INVALID_TASK_ID;
        TaskId cleanupTimer = INVALID_TASK_ID;
        std::vector<TaskId> signalTimers;

        int64_t lastProgressMs = 0;
        uint32_t ackedSinceProgress = 0;
        uint64_t retransmissions = 0;
    };

    using TransferPtr = std::shared_ptr<OutgoingTransfer>;

    // Dispatch
    void pumpLocked(const TransferPtr& t, DeferredCalls& calls);
    bool nextIndexLocked(OutgoingTransfer& t, uint32_t& index);
    bool loadChunkLocked(const TransferPtr& t, uint32_t index, OutgoingChunk& chunk);
    void transmitLocked(const TransferPtr& t, uint32_t index, OutgoingChunk& chunk);
    void markFailedLocked(OutgoingTransfer& t, uint32_t index, bool readFailure);

    // Timers
    void scheduleChunkTimerLocked(const TransferPtr& t, uint32_t index, OutgoingChunk& chunk);
    void onChunkTimeout(const std::weak_ptr<OutgoingTransfer>& weak, uint32_t index);
    void onReadRetry(const std::weak_ptr<OutgoingTransfer>& weak, uint32_t index);
    void onCongestionTick(const std::weak_ptr<OutgoingTransfer>& weak);
    void onStallTick(const std::weak_ptr<OutgoingTransfer>& weak);
    void onRecoveryTick(const std::weak_ptr<OutgoingTransfer>& weak);
    void onBackpressurePoll(const std::weak_ptr<OutgoingTransfer>& weak);
    void onDeadline(const std::weak_ptr<OutgoingTransfer>& weak);

    // Acknowledgement
    void applyAckLocked(OutgoingTransfer& t, uint32_t index);
    void afterAcksLocked(const TransferPtr& t, DeferredCalls& calls);

    // Lifecycle
    void completeLocked(const TransferPtr& t, DeferredCalls& calls);
    void failLocked(const TransferPtr& t, FailureReason reason,
                    const std::string& detail, DeferredCalls& calls);
    void cancelLocked(const TransferPtr& t, bool byPeer, const std::string& reason,
                      DeferredCalls& calls);
    void stopTimersLocked(OutgoingTransfer& t);
    void releasePayloadLocked(OutgoingTransfer& t);
    void scheduleCleanup(const TransferPtr& t);

    void reportProgressLocked(OutgoingTransfer& t, DeferredCalls& calls);

    DataChannel& m_channel;
    Scheduler& m_scheduler;
    const EngineConfig m_config;
    const TransferEvents m_events;

    BackpressureMonitor m_backpressure;
    TransferRegistry<OutgoingTransfer> m_transfers;
};

}  // namespace ChunkWire
