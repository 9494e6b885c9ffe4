/**
 * @file SenderEngine.cpp
 * @brief Windowed chunk transmission with retransmission and AIMD congestion control
 */

#include "chunkwire/SenderEngine.h"
#include "chunkwire/ChecksumValidator.h"
#include "chunkwire/Debug.h"
#include "chunkwire/ErrorCodes.h"
#include "chunkwire/TransferUtils.h"
#include "chunkwire/UuidGenerator.h"

#include <limits>

namespace ChunkWire {

//=============================================================================
// Constructor / Destructor
//=============================================================================

SenderEngine::SenderEngine(DataChannel& channel,
                           Scheduler& scheduler,
                           const EngineConfig& config,
                           TransferEvents events)
    : m_channel(channel)
    , m_scheduler(scheduler)
    , m_config(config)
    , m_events(std::move(events))
    , m_backpressure(config.highWatermark, config.lowWatermark)
{
}

SenderEngine::~SenderEngine() {
    for (const auto& t : m_transfers.snapshot()) {
        std::lock_guard<std::mutex> lock(t->mutex);
        stopTimersLocked(*t);
        for (TaskId id : t->signalTimers) {
            m_scheduler.cancel(id);
        }
        t->signalTimers.clear();
        if (t->cleanupTimer != INVALID_TASK_ID) {
            m_scheduler.cancel(t->cleanupTimer);
            t->cleanupTimer = INVALID_TASK_ID;
        }
    }
}

//=============================================================================
// SenderEngine: startTransfer()
//=============================================================================

bool SenderEngine::startTransfer(const SendRequest& request,
                                 std::string& transferIdOut,
                                 std::string& errorMsg)
{
    if (!request.source) {
        errorMsg = std::string(ErrorCodes::INVALID_REQUEST) + ": no source";
        return false;
    }

    const std::string id = request.transferId.empty()
        ? UuidGenerator::generateTransferId()
        : request.transferId;
    if (id.empty()) {
        errorMsg = std::string(ErrorCodes::INVALID_REQUEST) + ": failed to generate transfer id";
        return false;
    }
    if (id.size() > MAX_TRANSFER_ID_LENGTH) {
        errorMsg = std::string(ErrorCodes::INVALID_REQUEST) + ": transfer id too long";
        return false;
    }
    if (m_transfers.contains(id)) {
        errorMsg = std::string(ErrorCodes::INVALID_REQUEST) + ": transfer already exists: " + id;
        return false;
    }

    const uint64_t totalSize = request.source->size();
    const size_t requested = request.chunkSize != 0 ? request.chunkSize : m_config.chunkSize;
    const size_t chunkSize = resolveChunkSize(requested, totalSize, id.size(),
                                              m_channel.maxMessageSize(),
                                              m_config.includeChunkChecksums);
    if (chunkSize == 0) {
        errorMsg = std::string(ErrorCodes::INVALID_REQUEST) +
                   ": channel message size too small for a chunk";
        return false;
    }

    const uint64_t chunkCount = totalSize == 0 ? 0 : (totalSize + chunkSize - 1) / chunkSize;
    if (chunkCount > std::numeric_limits<uint32_t>::max()) {
        errorMsg = std::string(ErrorCodes::INVALID_REQUEST) + ": file has too many chunks";
        return false;
    }

    std::string fileHash;
    if (m_config.computeFileChecksum) {
        std::string readError;
        if (!request.source->computeSha256(fileHash, readError)) {
            errorMsg = std::string(ErrorCodes::SOURCE_READ_FAILED) + ": " + readError;
            return false;
        }
    }

    auto t = std::make_shared<OutgoingTransfer>();
    t->id = id;
    t->source = request.source;
    t->totalSize = totalSize;
    t->chunkSize = static_cast<uint32_t>(chunkSize);
    t->totalChunks = static_cast<uint32_t>(chunkCount);
    t->window = CongestionWindow(m_config.congestionSettings());
    t->acked.assign(t->totalChunks, false);

    t->init.transferId = id;
    t->init.totalSize = totalSize;
    t->init.chunkSize = t->chunkSize;
    t->init.totalChunks = t->totalChunks;
    t->init.checksum = fileHash;
    t->init.fileName = request.fileName.empty() ? request.source->name() : request.fileName;
    t->init.mimeType = request.mimeType;

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);

        if (!m_transfers.insert(id, t)) {
            errorMsg = std::string(ErrorCodes::INVALID_REQUEST) + ": transfer already exists: " + id;
            return false;
        }

        std::string sendError;
        if (!m_channel.sendMessage(ChunkCodec::encodeInit(t->init), sendError)) {
            m_transfers.eraseIf(id, t);
            errorMsg = std::string(ErrorCodes::NETWORK_CHANNEL_SEND_FAILED) + ": " + sendError;
            return false;
        }

        const int64_t now = m_scheduler.nowMs();
        t->startMs = now;
        t->lastAckMs = now;
        t->lastProgressMs = now;
        t->state = TransferState::TRANSFERRING;

        LOG_INFO("Sending " << id << " (" << formatBytes(totalSize) << ", "
                 << t->totalChunks << " chunks of " << chunkSize << " bytes)");

        if (t->totalChunks == 0) {
            completeLocked(t, calls);
        } else {
            const std::weak_ptr<OutgoingTransfer> weak = t;
            t->congestionTimer = m_scheduler.scheduleAfter(m_config.congestionTickMs,
                [this, weak] { onCongestionTick(weak); });
            t->stallTimer = m_scheduler.scheduleAfter(m_config.stallCheckIntervalMs,
                [this, weak] { onStallTick(weak); });
            t->recoveryTimer = m_scheduler.scheduleAfter(m_config.failedChunkRetryIntervalMs,
                [this, weak] { onRecoveryTick(weak); });
            if (m_config.transferTimeoutMs > 0) {
                t->deadlineTimer = m_scheduler.scheduleAfter(m_config.transferTimeoutMs,
                    [this, weak] { onDeadline(weak); });
            }
            pumpLocked(t, calls);
        }
    }

    transferIdOut = id;
    calls.run();
    return true;
}

//=============================================================================
// Pause / Resume / Cancel
//=============================================================================

bool SenderEngine::pauseTransfer(const std::string& transferId, std::string& errorMsg) {
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        errorMsg = "Unknown transfer: " + transferId;
        return false;
    }

    std::lock_guard<std::mutex> lock(t->mutex);
    if (t->state != TransferState::TRANSFERRING) {
        errorMsg = "Transfer is " + transferStateToString(t->state) + ", cannot pause";
        return false;
    }
    t->state = TransferState::PAUSED;
    if (t->backpressureTimer != INVALID_TASK_ID) {
        m_scheduler.cancel(t->backpressureTimer);
        t->backpressureTimer = INVALID_TASK_ID;
    }
    LOG_INFO("Paused " << transferId);
    return true;
}

bool SenderEngine::resumeTransfer(const std::string& transferId, std::string& errorMsg) {
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        errorMsg = "Unknown transfer: " + transferId;
        return false;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (t->state != TransferState::PAUSED) {
            errorMsg = "Transfer is " + transferStateToString(t->state) + ", cannot resume";
            return false;
        }
        t->state = TransferState::TRANSFERRING;
        // Time spent paused does not count towards a stall
        t->lastAckMs = m_scheduler.nowMs();
        LOG_INFO("Resumed " << transferId);
        pumpLocked(t, calls);
    }
    calls.run();
    return true;
}

bool SenderEngine::cancelTransfer(const std::string& transferId, std::string& errorMsg) {
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        errorMsg = "Unknown transfer: " + transferId;
        return false;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (isTerminalState(t->state)) {
            errorMsg = "Transfer already " + transferStateToString(t->state);
            return false;
        }
        cancelLocked(t, false, "Cancelled by sender", calls);
    }
    calls.run();
    return true;
}

bool SenderEngine::onPeerCancel(const std::string& transferId, const std::string& reason) {
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        return false;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (isTerminalState(t->state)) {
            return false;
        }
        cancelLocked(t, true, reason, calls);
    }
    calls.run();
    return true;
}

//=============================================================================
// Dispatch
//=============================================================================

void SenderEngine::pumpLocked(const TransferPtr& t, DeferredCalls& calls) {
    (void)calls;

    while (t->state == TransferState::TRANSFERRING &&
           t->inFlight.size() < t->window.size()) {
        if (m_backpressure.shouldPause(m_channel.bufferedBytes())) {
            if (t->backpressureTimer == INVALID_TASK_ID) {
                const std::weak_ptr<OutgoingTransfer> weak = t;
                t->backpressureTimer = m_scheduler.scheduleAfter(m_config.backpressurePollMs,
                    [this, weak] { onBackpressurePoll(weak); });
            }
            return;
        }

        uint32_t index = 0;
        if (!nextIndexLocked(*t, index)) {
            return;
        }

        OutgoingChunk& chunk = t->inFlight[index];
        if (loadChunkLocked(t, index, chunk)) {
            transmitLocked(t, index, chunk);
        }
    }
}

bool SenderEngine::nextIndexLocked(OutgoingTransfer& t, uint32_t& index) {
    while (!t.requeue.empty()) {
        const uint32_t candidate = t.requeue.front();
        t.requeue.pop_front();
        if (!t.acked[candidate] && t.inFlight.count(candidate) == 0) {
            index = candidate;
            return true;
        }
    }

    while (t.nextFreshIndex < t.totalChunks) {
        const uint32_t candidate = t.nextFreshIndex++;
        if (!t.acked[candidate] && t.inFlight.count(candidate) == 0 &&
            t.failed.count(candidate) == 0) {
            index = candidate;
            return true;
        }
    }
    return false;
}

bool SenderEngine::loadChunkLocked(const TransferPtr& t, uint32_t index, OutgoingChunk& chunk) {
    const uint64_t offset = calculateChunkOffset(index, t->chunkSize);
    const auto length = static_cast<size_t>(calculateChunkLength(t->totalSize, index, t->chunkSize));

    std::vector<uint8_t> payload;
    std::string readError;
    if (!t->source || !t->source->read(offset, length, payload, readError)) {
        LOG_WARNING("Read of chunk " << index << " of " << t->id << " failed: " << readError);
        chunk.awaitingRead = true;
        chunk.sentAtMs = m_scheduler.nowMs();

        if (chunk.retries < m_config.maxChunkRetries) {
            ++chunk.retries;
            const std::weak_ptr<OutgoingTransfer> weak = t;
            if (chunk.timer != INVALID_TASK_ID) {
                m_scheduler.cancel(chunk.timer);
            }
            chunk.timer = m_scheduler.scheduleAfter(m_config.sourceReadRetryDelayMs,
                [this, weak, index] { onReadRetry(weak, index); });
        } else {
            markFailedLocked(*t, index, true);
        }
        return false;
    }

    const std::string checksum = m_config.includeChunkChecksums
        ? ChecksumValidator::chunkChecksum(payload.data(), payload.size())
        : std::string();
    chunk.packet = ChunkCodec::encodeChunk(t->id, index, payload.data(), payload.size(), checksum);
    chunk.awaitingRead = false;
    t->failedByRead.erase(index);
    return true;
}

void SenderEngine::transmitLocked(const TransferPtr& t, uint32_t index, OutgoingChunk& chunk) {
    std::string sendError;
    if (!m_channel.sendMessage(chunk.packet, sendError)) {
        // Left in flight; the retransmission timer will try again
        LOG_WARNING("Channel refused chunk " << index << " of " << t->id << ": " << sendError);
    } else {
        LOG_DEBUG("Sent chunk " << index << " of " << t->id << " (window " << t->window.size() << ")");
    }
    chunk.sentAtMs = m_scheduler.nowMs();
    scheduleChunkTimerLocked(t, index, chunk);
}

void SenderEngine::markFailedLocked(OutgoingTransfer& t, uint32_t index, bool readFailure) {
    auto it = t.inFlight.find(index);
    if (it != t.inFlight.end()) {
        if (it->second.timer != INVALID_TASK_ID) {
            m_scheduler.cancel(it->second.timer);
        }
        t.inFlight.erase(it);
    }
    t.failed.insert(index);
    if (readFailure) {
        t.failedByRead.insert(index);
    } else {
        t.failedByRead.erase(index);
    }
    LOG_WARNING("Chunk " << index << " of " << t.id << " parked as failed; "
                << t.failed.size() << " awaiting recovery");
}

//=============================================================================
// Timers
//=============================================================================

void SenderEngine::scheduleChunkTimerLocked(const TransferPtr& t, uint32_t index, OutgoingChunk& chunk) {
    if (chunk.timer != INVALID_TASK_ID) {
        m_scheduler.cancel(chunk.timer);
    }
    const std::weak_ptr<OutgoingTransfer> weak = t;
    chunk.timer = m_scheduler.scheduleAfter(t->window.timeoutMs(),
        [this, weak, index] { onChunkTimeout(weak, index); });
}

void SenderEngine::onChunkTimeout(const std::weak_ptr<OutgoingTransfer>& weak, uint32_t index) {
    TransferPtr t = weak.lock();
    if (!t) {
        return;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (isTerminalState(t->state)) {
            return;
        }
        auto it = t->inFlight.find(index);
        if (it == t->inFlight.end() || it->second.awaitingRead) {
            return;
        }
        OutgoingChunk& chunk = it->second;
        chunk.timer = INVALID_TASK_ID;

        if (t->state == TransferState::PAUSED) {
            scheduleChunkTimerLocked(t, index, chunk);
            return;
        }

        t->window.onTimeout();

        if (chunk.retries < m_config.maxChunkRetries) {
            ++chunk.retries;
            ++t->retransmissions;
            LOG_DEBUG("Timeout on chunk " << index << " of " << t->id << ", retry "
                      << chunk.retries << "/" << m_config.maxChunkRetries);
            transmitLocked(t, index, chunk);
        } else {
            markFailedLocked(*t, index, false);
            pumpLocked(t, calls);
        }
    }
    calls.run();
}

void SenderEngine::onReadRetry(const std::weak_ptr<OutgoingTransfer>& weak, uint32_t index) {
    TransferPtr t = weak.lock();
    if (!t) {
        return;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (isTerminalState(t->state)) {
            return;
        }
        auto it = t->inFlight.find(index);
        if (it == t->inFlight.end() || !it->second.awaitingRead) {
            return;
        }
        OutgoingChunk& chunk = it->second;
        chunk.timer = INVALID_TASK_ID;

        if (t->state == TransferState::PAUSED) {
            chunk.timer = m_scheduler.scheduleAfter(m_config.sourceReadRetryDelayMs,
                [this, weak, index] { onReadRetry(weak, index); });
            return;
        }

        if (loadChunkLocked(t, index, chunk)) {
            transmitLocked(t, index, chunk);
        } else if (t->inFlight.count(index) == 0) {
            // Out of read retries; the window slot is free again
            pumpLocked(t, calls);
        }
    }
    calls.run();
}

void SenderEngine::onCongestionTick(const std::weak_ptr<OutgoingTransfer>& weak) {
    TransferPtr t = weak.lock();
    if (!t) {
        return;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        t->congestionTimer = INVALID_TASK_ID;
        if (isTerminalState(t->state)) {
            return;
        }

        switch (t->window.evaluate()) {
            case WindowChange::SHRANK:
                LOG_INFO("Congestion on " << t->id << ": window " << t->window.size()
                         << ", ssthresh " << t->window.slowStartThreshold());
                break;
            case WindowChange::GREW:
                LOG_DEBUG("Window on " << t->id << " grew to " << t->window.size()
                          << (t->window.inSlowStart() ? " (slow start)" : ""));
                break;
            case WindowChange::NONE:
                break;
        }

        t->congestionTimer = m_scheduler.scheduleAfter(m_config.congestionTickMs,
            [this, weak] { onCongestionTick(weak); });
        pumpLocked(t, calls);
    }
    calls.run();
}

void SenderEngine::onStallTick(const std::weak_ptr<OutgoingTransfer>& weak) {
    TransferPtr t = weak.lock();
    if (!t) {
        return;
    }

    std::lock_guard<std::mutex> lock(t->mutex);
    t->stallTimer = INVALID_TASK_ID;
    if (isTerminalState(t->state)) {
        return;
    }
    t->stallTimer = m_scheduler.scheduleAfter(m_config.stallCheckIntervalMs,
        [this, weak] { onStallTick(weak); });

    const int64_t now = m_scheduler.nowMs();
    if (t->state != TransferState::TRANSFERRING || t->inFlight.empty() ||
        now - t->lastAckMs < m_config.stallTimeoutMs) {
        return;
    }

    LOG_WARNING("Transfer " << t->id << " stalled for " << (now - t->lastAckMs)
                << " ms, resending " << t->inFlight.size() << " in-flight chunks");

    if (t->ackedCount == 0) {
        std::string sendError;
        if (!m_channel.sendMessage(ChunkCodec::encodeInit(t->init), sendError)) {
            LOG_WARNING("INIT resend for " << t->id << " failed: " << sendError);
        }
    }

    for (auto& pair : t->inFlight) {
        if (!pair.second.awaitingRead) {
            ++t->retransmissions;
            transmitLocked(t, pair.first, pair.second);
        }
    }
    t->lastAckMs = now;
}

void SenderEngine::onRecoveryTick(const std::weak_ptr<OutgoingTransfer>& weak) {
    TransferPtr t = weak.lock();
    if (!t) {
        return;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        t->recoveryTimer = INVALID_TASK_ID;
        if (isTerminalState(t->state)) {
            return;
        }
        t->recoveryTimer = m_scheduler.scheduleAfter(m_config.failedChunkRetryIntervalMs,
            [this, weak] { onRecoveryTick(weak); });

        if (t->state != TransferState::TRANSFERRING || t->failed.empty()) {
            return;
        }

        const std::set<uint32_t> failed = t->failed;
        for (uint32_t index : failed) {
            const uint32_t rounds = ++t->recoveryRounds[index];
            if (rounds > m_config.maxRecoveryRounds) {
                const bool readFailure = t->failedByRead.count(index) > 0;
                failLocked(t,
                           readFailure ? FailureReason::SOURCE_READ_ERROR
                                       : FailureReason::NETWORK_EXHAUSTED,
                           "chunk " + std::to_string(index) + " failed after " +
                               std::to_string(rounds - 1) + " recovery rounds",
                           calls);
                return;
            }
            t->requeue.push_back(index);
        }

        LOG_INFO("Recovering " << t->failed.size() << " failed chunks of " << t->id);
        t->failed.clear();
        pumpLocked(t, calls);
    }
    calls.run();
}

void SenderEngine::onBackpressurePoll(const std::weak_ptr<OutgoingTransfer>& weak) {
    TransferPtr t = weak.lock();
    if (!t) {
        return;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        t->backpressureTimer = INVALID_TASK_ID;
        if (isTerminalState(t->state)) {
            return;
        }
        pumpLocked(t, calls);
    }
    calls.run();
}

void SenderEngine::onDeadline(const std::weak_ptr<OutgoingTransfer>& weak) {
    TransferPtr t = weak.lock();
    if (!t) {
        return;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        t->deadlineTimer = INVALID_TASK_ID;
        if (isTerminalState(t->state)) {
            return;
        }
        failLocked(t, FailureReason::TRANSFER_TIMEOUT,
                   "no completion within " + std::to_string(m_config.transferTimeoutMs) + " ms",
                   calls);
    }
    calls.run();
}

//=============================================================================
// Acknowledgement
//=============================================================================

void SenderEngine::ackReceived(const std::string& transferId, uint32_t chunkIndex) {
    batchAckReceived(transferId, std::vector<uint32_t>{chunkIndex});
}

void SenderEngine::batchAckReceived(const std::string& transferId,
                                    const std::vector<uint32_t>& indices)
{
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        LOG_DEBUG("ACK for unknown transfer " << transferId << " ignored");
        return;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (isTerminalState(t->state) || t->state == TransferState::PREPARING) {
            return;
        }
        for (uint32_t index : indices) {
            applyAckLocked(*t, index);
        }
        afterAcksLocked(t, calls);
    }
    calls.run();
}

void SenderEngine::applyAckLocked(OutgoingTransfer& t, uint32_t index) {
    if (index >= t.totalChunks || t.acked[index]) {
        return;
    }

    const int64_t now = m_scheduler.nowMs();
    int64_t rtt = -1;

    auto it = t.inFlight.find(index);
    if (it != t.inFlight.end()) {
        if (!it->second.awaitingRead) {
            rtt = now - it->second.sentAtMs;
        }
        if (it->second.timer != INVALID_TASK_ID) {
            m_scheduler.cancel(it->second.timer);
        }
        t.inFlight.erase(it);
    }
    t.failed.erase(index);
    t.failedByRead.erase(index);
    t.recoveryRounds.erase(index);

    t.acked[index] = true;
    ++t.ackedCount;
    ++t.ackedSinceProgress;
    t.bytesAcked += calculateChunkLength(t.totalSize, index, t.chunkSize);
    t.window.onAck(rtt);
    t.lastAckMs = now;
}

void SenderEngine::afterAcksLocked(const TransferPtr& t, DeferredCalls& calls) {
    if (t->ackedCount == t->totalChunks) {
        completeLocked(t, calls);
        return;
    }

    const int64_t now = m_scheduler.nowMs();
    if (now - t->lastProgressMs >= m_config.progressIntervalMs ||
        t->ackedSinceProgress >= m_config.progressChunkStride) {
        reportProgressLocked(*t, calls);
    }
    pumpLocked(t, calls);
}

//=============================================================================
// Lifecycle
//=============================================================================

void SenderEngine::completeLocked(const TransferPtr& t, DeferredCalls& calls) {
    reportProgressLocked(*t, calls);

    t->state = TransferState::COMPLETE;
    stopTimersLocked(*t);
    releasePayloadLocked(*t);

    const std::vector<uint8_t> endOfStream = ChunkCodec::encodeEndOfStream(t->id);
    for (uint32_t i = 0; i < m_config.assembleSignalCount; ++i) {
        if (i == 0) {
            std::string sendError;
            if (!m_channel.sendMessage(endOfStream, sendError)) {
                LOG_WARNING("END_OF_STREAM for " << t->id << " failed: " << sendError);
            }
            continue;
        }
        const std::string id = t->id;
        t->signalTimers.push_back(m_scheduler.scheduleAfter(
            static_cast<int64_t>(i) * m_config.assembleSignalSpacingMs,
            [this, id, endOfStream] {
                std::string sendError;
                if (!m_channel.sendMessage(endOfStream, sendError)) {
                    LOG_WARNING("END_OF_STREAM for " << id << " failed: " << sendError);
                }
            }));
    }

    const int64_t now = m_scheduler.nowMs();
    CompleteEvent event;
    event.transferId = t->id;
    event.direction = TransferDirection::SEND;
    event.totalTimeSeconds = static_cast<double>(now - t->startMs) / 1000.0;
    event.averageSpeed = calculateTransferSpeed(t->bytesAcked, t->startMs, now);

    LOG_INFO("Sent " << t->id << ": " << formatBytes(t->bytesAcked) << " in "
             << event.totalTimeSeconds << " s (" << formatSpeed(event.averageSpeed)
             << ", " << t->retransmissions << " retransmissions)");

    if (m_events.onComplete) {
        const auto callback = m_events.onComplete;
        calls.add([callback, event] { callback(event); });
    }
    scheduleCleanup(t);
}

void SenderEngine::failLocked(const TransferPtr& t, FailureReason reason,
                              const std::string& detail, DeferredCalls& calls)
{
    t->state = TransferState::FAILED;
    stopTimersLocked(*t);
    releasePayloadLocked(*t);

    ErrorEvent event;
    event.transferId = t->id;
    event.direction = TransferDirection::SEND;
    event.reason = reason;
    event.code = failureReasonCode(reason);
    event.message = failureReasonToString(reason) + " (" + detail + ")";

    LOG_ERROR("[" << event.code << "] Transfer " << t->id << " failed: " << event.message);

    std::string sendError;
    if (!m_channel.sendMessage(ChunkCodec::encodeCancel(t->id, event.message), sendError)) {
        LOG_WARNING("CANCEL for " << t->id << " failed: " << sendError);
    }

    if (m_events.onError) {
        const auto callback = m_events.onError;
        calls.add([callback, event] { callback(event); });
    }
    scheduleCleanup(t);
}

void SenderEngine::cancelLocked(const TransferPtr& t, bool byPeer, const std::string& reason,
                                DeferredCalls& calls)
{
    t->state = TransferState::CANCELLED;
    stopTimersLocked(*t);
    releasePayloadLocked(*t);

    if (!byPeer) {
        std::string sendError;
        if (!m_channel.sendMessage(ChunkCodec::encodeCancel(t->id, reason), sendError)) {
            LOG_WARNING("CANCEL for " << t->id << " failed: " << sendError);
        }
    }

    LOG_INFO("Transfer " << t->id << " cancelled" << (byPeer ? " by peer: " : ": ") << reason);

    if (m_events.onCancelled) {
        CancelledEvent event;
        event.transferId = t->id;
        event.direction = TransferDirection::SEND;
        event.byPeer = byPeer;
        const auto callback = m_events.onCancelled;
        calls.add([callback, event] { callback(event); });
    }
    scheduleCleanup(t);
}

void SenderEngine::stopTimersLocked(OutgoingTransfer& t) {
    for (TaskId* timer : {&t.congestionTimer, &t.stallTimer, &t.recoveryTimer,
                          &t.backpressureTimer, &t.deadlineTimer}) {
        if (*timer != INVALID_TASK_ID) {
            m_scheduler.cancel(*timer);
            *timer = INVALID_TASK_ID;
        }
    }
    for (auto& pair : t.inFlight) {
        if (pair.second.timer != INVALID_TASK_ID) {
            m_scheduler.cancel(pair.second.timer);
            pair.second.timer = INVALID_TASK_ID;
        }
    }
}

void SenderEngine::releasePayloadLocked(OutgoingTransfer& t) {
    t.inFlight.clear();
    t.requeue.clear();
    t.failed.clear();
    t.failedByRead.clear();
    t.recoveryRounds.clear();
    t.source.reset();
}

void SenderEngine::scheduleCleanup(const TransferPtr& t) {
    const std::weak_ptr<OutgoingTransfer> weak = t;
    const std::string id = t->id;
    t->cleanupTimer = m_scheduler.scheduleAfter(m_config.gracePeriodMs, [this, weak, id] {
        if (TransferPtr p = weak.lock()) {
            m_transfers.eraseIf(id, p);
        }
    });
}

void SenderEngine::reportProgressLocked(OutgoingTransfer& t, DeferredCalls& calls) {
    const int64_t now = m_scheduler.nowMs();
    t.lastProgressMs = now;
    t.ackedSinceProgress = 0;

    if (!m_events.onProgress) {
        return;
    }

    ProgressEvent event;
    event.transferId = t.id;
    event.direction = TransferDirection::SEND;
    event.bytesTransferred = t.bytesAcked;
    event.totalBytes = t.totalSize;
    event.speed = calculateTransferSpeed(t.bytesAcked, t.startMs, now);
    event.etaSeconds = calculateEta(t.totalSize - t.bytesAcked, event.speed);
    event.chunksDone = t.ackedCount;
    event.totalChunks = t.totalChunks;
    event.windowSize = t.window.size();

    const auto callback = m_events.onProgress;
    calls.add([callback, event] { callback(event); });
}

//=============================================================================
// Queries
//=============================================================================

bool SenderEngine::getStatus(const std::string& transferId, SenderStatus& status) const {
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        return false;
    }

    std::lock_guard<std::mutex> lock(t->mutex);
    status.transferId = t->id;
    status.state = t->state;
    status.totalBytes = t->totalSize;
    status.bytesAcked = t->bytesAcked;
    status.chunkSize = t->chunkSize;
    status.totalChunks = t->totalChunks;
    status.chunksAcked = t->ackedCount;
    status.chunksInFlight = static_cast<uint32_t>(t->inFlight.size());
    status.chunksFailed = static_cast<uint32_t>(t->failed.size());
    status.windowSize = t->window.size();
    status.slowStartThreshold = t->window.slowStartThreshold();
    status.inSlowStart = t->window.inSlowStart();
    status.averageRttMs = t->window.averageRttMs();
    status.retransmissions = t->retransmissions;
    return true;
}

bool SenderEngine::hasTransfer(const std::string& transferId) const {
    return m_transfers.contains(transferId);
}

}  // namespace ChunkWire
