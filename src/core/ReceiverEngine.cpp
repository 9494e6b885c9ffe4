/**
 * @file ReceiverEngine.cpp
 * @brief Chunk intake, staging, reassembly and whole-file verification
 */

#include "chunkwire/ReceiverEngine.h"
#include "chunkwire/AtomicFile.h"
#include "chunkwire/Debug.h"
#include "chunkwire/ErrorCodes.h"
#include "chunkwire/FileName.h"
#include "chunkwire/HashUtils.h"
#include "chunkwire/TransferUtils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

namespace ChunkWire {

std::string chunkOutcomeToString(ChunkOutcome outcome) {
    switch (outcome) {
        case ChunkOutcome::STORED:                return "Stored";
        case ChunkOutcome::DUPLICATE:             return "Duplicate";
        case ChunkOutcome::LATE:                  return "Late";
        case ChunkOutcome::DROPPED_MALFORMED:     return "Dropped (malformed)";
        case ChunkOutcome::DROPPED_UNKNOWN:       return "Dropped (unknown transfer)";
        case ChunkOutcome::DROPPED_MISMATCH:      return "Dropped (envelope mismatch)";
        case ChunkOutcome::DROPPED_OUT_OF_RANGE:  return "Dropped (index out of range)";
        case ChunkOutcome::DROPPED_BAD_LENGTH:    return "Dropped (bad length)";
        case ChunkOutcome::DROPPED_CHECKSUM:      return "Dropped (checksum mismatch)";
        case ChunkOutcome::DROPPED_INACTIVE:      return "Dropped (transfer inactive)";
        case ChunkOutcome::DROPPED_STORAGE_ERROR: return "Dropped (storage error)";
        default:                                  return "Unknown";
    }
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

ReceiverEngine::ReceiverEngine(DataChannel& channel,
                               Scheduler& scheduler,
                               const EngineConfig& config,
                               TransferEvents events,
                               std::shared_ptr<ChunkStore> stagingStore,
                               ChecksumValidator validator)
    : m_channel(channel)
    , m_scheduler(scheduler)
    , m_config(config)
    , m_events(std::move(events))
    , m_validator(std::move(validator))
    , m_stagingStore(stagingStore
          ? std::move(stagingStore)
          : std::make_shared<FileChunkStore>(config.resolvedStagingDirectory()))
    , m_ackBatcher(scheduler,
                   [this](const std::string& transferId, std::vector<uint32_t> indices) {
                       std::string sendError;
                       if (!m_channel.sendMessage(
                               ChunkCodec::encodeBatchAck(transferId, std::move(indices)),
                               sendError)) {
                           LOG_WARNING("BATCH_ACK for " << transferId << " failed: " << sendError);
                       }
                   },
                   config.batchAckSize,
                   config.batchAckIntervalMs)
{
}

ReceiverEngine::~ReceiverEngine() {
    for (const auto& t : m_transfers.snapshot()) {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (t->cleanupTimer != INVALID_TASK_ID) {
            m_scheduler.cancel(t->cleanupTimer);
            t->cleanupTimer = INVALID_TASK_ID;
        }
    }
}

//=============================================================================
// ReceiverEngine: initTransfer()
//=============================================================================

bool ReceiverEngine::initTransfer(const InitPacket& init,
                                  const std::string& senderId,
                                  std::string& errorMsg)
{
    if (init.transferId.empty() || init.transferId.size() > MAX_TRANSFER_ID_LENGTH) {
        errorMsg = std::string(ErrorCodes::PROTOCOL_VIOLATION) + ": invalid transfer id";
        return false;
    }
    if (init.totalSize > 0 && init.chunkSize == 0) {
        errorMsg = std::string(ErrorCodes::PROTOCOL_VIOLATION) + ": zero chunk size";
        return false;
    }
    if (init.totalSize > init.chunkSize && init.chunkSize < MIN_CHUNK_SIZE) {
        errorMsg = std::string(ErrorCodes::PROTOCOL_VIOLATION) + ": chunk size " +
                   std::to_string(init.chunkSize) + " below minimum " +
                   std::to_string(MIN_CHUNK_SIZE);
        return false;
    }
    if (calculateChunkCount(init.totalSize, init.chunkSize) >
        std::numeric_limits<uint32_t>::max()) {
        errorMsg = std::string(ErrorCodes::PROTOCOL_VIOLATION) + ": " +
                   std::to_string(init.totalSize) + " bytes in " +
                   std::to_string(init.chunkSize) + "-byte chunks exceeds the chunk index range";
        return false;
    }
    if (init.totalChunks != calculateTotalChunks(init.totalSize, init.chunkSize)) {
        errorMsg = std::string(ErrorCodes::PROTOCOL_VIOLATION) + ": declared " +
                   std::to_string(init.totalChunks) + " chunks for " +
                   std::to_string(init.totalSize) + " bytes in " +
                   std::to_string(init.chunkSize) + "-byte chunks";
        return false;
    }
    if (!init.checksum.empty() && init.checksum.size() != HASH_SIZE * 2) {
        errorMsg = std::string(ErrorCodes::PROTOCOL_VIOLATION) + ": malformed file checksum";
        return false;
    }

    if (TransferPtr existing = m_transfers.find(init.transferId)) {
        std::lock_guard<std::mutex> lock(existing->mutex);
        if (existing->init.totalSize != init.totalSize ||
            existing->init.chunkSize != init.chunkSize) {
            errorMsg = std::string(ErrorCodes::PROTOCOL_VIOLATION) +
                       ": conflicting INIT for " + init.transferId;
            return false;
        }
        LOG_DEBUG("Ignoring repeated INIT for " << init.transferId);
        return true;
    }

    auto t = std::make_shared<IncomingTransfer>();
    t->id = init.transferId;
    t->senderId = senderId;
    t->init = init;
    t->staged = init.totalSize >= m_config.stagingThresholdBytes;
    t->plan = m_validator.createPlan(init.totalSize, init.totalChunks);
    t->received.assign(init.totalChunks, false);

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);

        if (!m_transfers.insert(t->id, t)) {
            // Lost a race with a concurrent INIT for the same id
            return true;
        }

        const int64_t now = m_scheduler.nowMs();
        t->startMs = now;
        t->lastProgressMs = now;
        t->state = TransferState::TRANSFERRING;

        LOG_INFO("Receiving " << t->id << " \"" << init.fileName << "\" ("
                 << formatBytes(init.totalSize) << ", " << init.totalChunks << " chunks, "
                 << (t->staged ? "staged" : "in memory") << ", sampling "
                 << t->plan.sampledCount() << ")");

        if (t->init.totalChunks == 0 && m_config.autoAssemble) {
            std::string assembleError;
            assembleLocked(t, assembleError, calls);
        }
    }
    calls.run();
    return true;
}

//=============================================================================
// Chunk intake
//=============================================================================

ChunkOutcome ReceiverEngine::chunkReceived(const std::string& transferId,
                                           uint32_t chunkIndex,
                                           const uint8_t* bytes,
                                           size_t size,
                                           const std::string& senderId)
{
    Packet packet;
    std::string decodeError;
    if (!ChunkCodec::decode(bytes, size, packet, decodeError) ||
        packet.type != PacketType::CHUNK) {
        LOG_WARNING("[" << ErrorCodes::PROTOCOL_VIOLATION << "] Malformed chunk for "
                    << transferId << ": "
                    << (decodeError.empty() ? "not a CHUNK packet" : decodeError));
        return ChunkOutcome::DROPPED_MALFORMED;
    }

    const ChunkPacket& chunk = std::get<ChunkPacket>(packet.body);
    if (chunk.transferId != transferId || chunk.chunkIndex != chunkIndex) {
        LOG_WARNING("[" << ErrorCodes::PROTOCOL_VIOLATION << "] Chunk envelope "
                    << transferId << "#" << chunkIndex << " carries "
                    << chunk.transferId << "#" << chunk.chunkIndex);
        return ChunkOutcome::DROPPED_MISMATCH;
    }
    return onChunk(chunk, senderId);
}

ChunkOutcome ReceiverEngine::onChunk(const ChunkPacket& chunk, const std::string& senderId) {
    TransferPtr t = m_transfers.find(chunk.transferId);
    if (!t) {
        LOG_DEBUG("Chunk " << chunk.chunkIndex << " for unknown transfer " << chunk.transferId);
        return ChunkOutcome::DROPPED_UNKNOWN;
    }

    DeferredCalls calls;
    ChunkOutcome outcome = ChunkOutcome::STORED;
    {
        std::lock_guard<std::mutex> lock(t->mutex);

        if (!t->senderId.empty() && !senderId.empty() && senderId != t->senderId) {
            LOG_WARNING("[" << ErrorCodes::PROTOCOL_VIOLATION << "] Chunk for " << t->id
                        << " from " << senderId << ", expected " << t->senderId);
            return ChunkOutcome::DROPPED_MISMATCH;
        }
        if (t->state == TransferState::COMPLETE) {
            sendAckLocked(*t, chunk.chunkIndex);
            return ChunkOutcome::LATE;
        }
        if (isTerminalState(t->state)) {
            return ChunkOutcome::DROPPED_INACTIVE;
        }
        if (chunk.chunkIndex >= t->init.totalChunks) {
            LOG_WARNING("[" << ErrorCodes::PROTOCOL_VIOLATION << "] Chunk " << chunk.chunkIndex
                        << " out of range for " << t->id << " (" << t->init.totalChunks << " chunks)");
            return ChunkOutcome::DROPPED_OUT_OF_RANGE;
        }

        const uint64_t expected = calculateChunkLength(t->init.totalSize, chunk.chunkIndex,
                                                       t->init.chunkSize);
        if (chunk.payload.size() != expected) {
            LOG_WARNING("[" << ErrorCodes::PROTOCOL_VIOLATION << "] Chunk " << chunk.chunkIndex
                        << " of " << t->id << " is " << chunk.payload.size()
                        << " bytes, expected " << expected);
            return ChunkOutcome::DROPPED_BAD_LENGTH;
        }

        if (t->received[chunk.chunkIndex]) {
            ++t->duplicates;
            sendAckLocked(*t, chunk.chunkIndex);
            return ChunkOutcome::DUPLICATE;
        }

        if (!chunk.checksum.empty() && t->plan.shouldValidate(chunk.chunkIndex) &&
            !ChecksumValidator::verifyChunk(chunk.payload.data(), chunk.payload.size(),
                                            chunk.checksum)) {
            ++t->checksumFailures;
            LOG_WARNING("Checksum mismatch on chunk " << chunk.chunkIndex << " of " << t->id
                        << ", awaiting retransmission");
            return ChunkOutcome::DROPPED_CHECKSUM;
        }

        std::string storeError;
        if (!storeFor(*t).put(t->id, chunk.chunkIndex, chunk.payload.data(),
                              chunk.payload.size(), storeError)) {
            failLocked(t, FailureReason::STORAGE_ERROR, storeError, calls);
            outcome = ChunkOutcome::DROPPED_STORAGE_ERROR;
        } else {
            t->received[chunk.chunkIndex] = true;
            ++t->receivedCount;
            t->bytesReceived += chunk.payload.size();
            ++t->receivedSinceProgress;
            sendAckLocked(*t, chunk.chunkIndex);

            if (t->receivedCount == t->init.totalChunks) {
                reportProgressLocked(*t, calls);
                if (m_config.autoAssemble) {
                    std::string assembleError;
                    assembleLocked(t, assembleError, calls);
                }
            } else {
                const int64_t now = m_scheduler.nowMs();
                if (now - t->lastProgressMs >= m_config.progressIntervalMs ||
                    t->receivedSinceProgress >= m_config.progressChunkStride) {
                    reportProgressLocked(*t, calls);
                }
            }
        }
    }
    calls.run();
    return outcome;
}

ChunkStore& ReceiverEngine::storeFor(const IncomingTransfer& t) {
    if (t.staged) {
        return *m_stagingStore;
    }
    return m_memoryStore;
}

void ReceiverEngine::sendAckLocked(const IncomingTransfer& t, uint32_t chunkIndex) {
    if (m_config.ackMode == AckMode::BATCHED) {
        m_ackBatcher.add(t.id, chunkIndex);
        return;
    }
    std::string sendError;
    if (!m_channel.sendMessage(ChunkCodec::encodeAck(t.id, chunkIndex), sendError)) {
        LOG_WARNING("ACK " << t.id << "#" << chunkIndex << " failed: " << sendError);
    }
}

//=============================================================================
// Assembly
//=============================================================================

bool ReceiverEngine::assemble(const std::string& transferId,
                              const std::string& mimeType,
                              const std::string& fileName,
                              std::string& errorMsg)
{
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        errorMsg = "Unknown transfer: " + transferId;
        return false;
    }

    DeferredCalls calls;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (t->state == TransferState::COMPLETE) {
            return true;
        }
        if (isTerminalState(t->state)) {
            errorMsg = "Transfer is " + transferStateToString(t->state) + ", cannot assemble";
            return false;
        }
        if (t->receivedCount < t->init.totalChunks) {
            errorMsg = "Missing " + std::to_string(t->init.totalChunks - t->receivedCount) +
                       " of " + std::to_string(t->init.totalChunks) + " chunks";
            return false;
        }
        if (!mimeType.empty()) {
            t->init.mimeType = mimeType;
        }
        if (!fileName.empty()) {
            t->init.fileName = fileName;
        }
        ok = assembleLocked(t, errorMsg, calls);
    }
    calls.run();
    return ok;
}

void ReceiverEngine::onEndOfStream(const std::string& transferId) {
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        return;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (t->state != TransferState::TRANSFERRING) {
            return;
        }
        if (t->receivedCount < t->init.totalChunks) {
            LOG_DEBUG("END_OF_STREAM for " << transferId << " with "
                      << (t->init.totalChunks - t->receivedCount) << " chunks missing");
            return;
        }
        std::string assembleError;
        assembleLocked(t, assembleError, calls);
    }
    calls.run();
}

bool ReceiverEngine::assembleLocked(const TransferPtr& t, std::string& errorMsg,
                                    DeferredCalls& calls)
{
    t->state = TransferState::ASSEMBLING;

    auto artifact = std::make_shared<AssembledArtifact>();
    artifact->transferId = t->id;
    artifact->fileName = t->init.fileName;
    artifact->mimeType = t->init.mimeType;

    FailureReason reason = FailureReason::STORAGE_ERROR;
    const bool ok = t->staged
        ? assembleToFile(*t, *artifact, reason, errorMsg)
        : assembleInMemory(*t, *artifact, reason, errorMsg);
    if (!ok) {
        failLocked(t, reason, errorMsg, calls);
        return false;
    }

    t->state = TransferState::COMPLETE;
    discardDataLocked(*t);
    m_ackBatcher.flush(t->id);

    const int64_t now = m_scheduler.nowMs();
    CompleteEvent event;
    event.transferId = t->id;
    event.direction = TransferDirection::RECEIVE;
    event.totalTimeSeconds = static_cast<double>(now - t->startMs) / 1000.0;
    event.averageSpeed = calculateTransferSpeed(artifact->size, t->startMs, now);
    event.artifact = artifact;

    LOG_INFO("Received " << t->id << ": " << formatBytes(artifact->size) << " in "
             << event.totalTimeSeconds << " s (" << formatSpeed(event.averageSpeed) << ")"
             << (artifact->isOnDisk() ? " -> " + artifact->filePath.string() : std::string()));

    if (m_events.onComplete) {
        const auto callback = m_events.onComplete;
        calls.add([callback, event] { callback(event); });
    }
    scheduleCleanup(t);
    return true;
}

bool ReceiverEngine::assembleInMemory(IncomingTransfer& t, AssembledArtifact& artifact,
                                      FailureReason& reason, std::string& errorMsg)
{
    std::vector<uint8_t> data;
    data.reserve(static_cast<size_t>(t.init.totalSize));

    std::vector<uint8_t> chunk;
    for (uint32_t i = 0; i < t.init.totalChunks; ++i) {
        std::string storeError;
        if (!m_memoryStore.get(t.id, i, chunk, storeError)) {
            reason = FailureReason::STORAGE_ERROR;
            errorMsg = storeError;
            return false;
        }
        data.insert(data.end(), chunk.begin(), chunk.end());
    }

    if (data.size() != t.init.totalSize) {
        reason = FailureReason::SIZE_MISMATCH;
        errorMsg = "expected " + std::to_string(t.init.totalSize) + " bytes, assembled " +
                   std::to_string(data.size());
        return false;
    }

    const std::string actual = HashUtils::sha256Hex(data.data(), data.size());
    if (!ChecksumValidator::verifyArtifact(actual, t.init.checksum)) {
        reason = FailureReason::INTEGRITY_CHECK_FAILED;
        errorMsg = "expected " + t.init.checksum + ", got " + actual;
        return false;
    }

    artifact.size = data.size();
    artifact.sha256Hex = actual;
    artifact.data = std::move(data);
    return true;
}

bool ReceiverEngine::assembleToFile(IncomingTransfer& t, AssembledArtifact& artifact,
                                    FailureReason& reason, std::string& errorMsg)
{
    reason = FailureReason::STORAGE_ERROR;

    const std::filesystem::path outputDir = m_config.resolvedOutputDirectory();
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        errorMsg = "Cannot create " + outputDir.string() + ": " + ec.message();
        return false;
    }

    const std::string name = safeFileNameOr(t.init.fileName, t.id + ".bin");
    const AtomicFilePaths paths = computeAtomicFilePaths(uniqueFilePath(outputDir, name));

    std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        errorMsg = "Cannot open " + paths.tempPath.string() + " for writing";
        return false;
    }

    const auto abandon = [&paths, &out] {
        out.close();
        std::error_code removeEc;
        std::filesystem::remove(paths.tempPath, removeEc);
    };

    HashUtils::IncrementalHash hasher;
    std::vector<uint8_t> aggregate;
    aggregate.reserve(static_cast<size_t>(
        std::min<uint64_t>(m_config.aggregateFlushBytes, t.init.totalSize)));
    uint64_t written = 0;

    const auto flushAggregate = [&]() -> bool {
        if (aggregate.empty()) {
            return true;
        }
        out.write(reinterpret_cast<const char*>(aggregate.data()),
                  static_cast<std::streamsize>(aggregate.size()));
        written += aggregate.size();
        aggregate.clear();
        return static_cast<bool>(out);
    };

    std::vector<uint8_t> chunk;
    for (uint32_t i = 0; i < t.init.totalChunks; ++i) {
        std::string storeError;
        if (!m_stagingStore->get(t.id, i, chunk, storeError)) {
            abandon();
            errorMsg = storeError;
            return false;
        }
        if (!hasher.update(chunk.data(), chunk.size())) {
            abandon();
            errorMsg = "SHA-256 update failed";
            return false;
        }
        aggregate.insert(aggregate.end(), chunk.begin(), chunk.end());
        if (aggregate.size() >= m_config.aggregateFlushBytes && !flushAggregate()) {
            abandon();
            errorMsg = "Write to " + paths.tempPath.string() + " failed";
            return false;
        }
    }
    if (!flushAggregate()) {
        abandon();
        errorMsg = "Write to " + paths.tempPath.string() + " failed";
        return false;
    }
    out.close();
    if (!out) {
        abandon();
        errorMsg = "Closing " + paths.tempPath.string() + " failed";
        return false;
    }

    if (written != t.init.totalSize) {
        abandon();
        reason = FailureReason::SIZE_MISMATCH;
        errorMsg = "expected " + std::to_string(t.init.totalSize) + " bytes, assembled " +
                   std::to_string(written);
        return false;
    }

    const std::string actual = hasher.finalizeHex();
    if (actual.empty()) {
        abandon();
        errorMsg = "SHA-256 finalize failed";
        return false;
    }
    if (!ChecksumValidator::verifyArtifact(actual, t.init.checksum)) {
        abandon();
        reason = FailureReason::INTEGRITY_CHECK_FAILED;
        errorMsg = "expected " + t.init.checksum + ", got " + actual;
        return false;
    }

    std::string renameError;
    if (!atomicRenameToFinal(paths.tempPath, paths.finalPath, renameError)) {
        abandon();
        errorMsg = renameError;
        return false;
    }

    artifact.size = written;
    artifact.sha256Hex = actual;
    artifact.filePath = paths.finalPath;
    artifact.fileName = paths.finalPath.filename().string();
    return true;
}

//=============================================================================
// Cancel
//=============================================================================

bool ReceiverEngine::cancelTransfer(const std::string& transferId, std::string& errorMsg) {
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        errorMsg = "Unknown transfer: " + transferId;
        return false;
    }

    DeferredCalls calls;
    {
        std::lock_guard<std::mutex> lock(t->mutex);
        if (isTerminalState(t->state)) {
            errorMsg = "Transfer is already " + transferStateToString(t->state);
            return false;
        }
        cancelLocked(t, false, "Cancelled by receiver", calls);
    }
    calls.run();
    return true;
}

bool ReceiverEngine::onPeerCancel(const std::string& transferId, const std::string& reason) {
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
// Lifecycle
//=============================================================================

void ReceiverEngine::failLocked(const TransferPtr& t, FailureReason reason,
                                const std::string& detail, DeferredCalls& calls)
{
    t->state = TransferState::FAILED;
    discardDataLocked(*t);
    m_ackBatcher.discard(t->id);

    ErrorEvent event;
    event.transferId = t->id;
    event.direction = TransferDirection::RECEIVE;
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

void ReceiverEngine::cancelLocked(const TransferPtr& t, bool byPeer, const std::string& reason,
                                  DeferredCalls& calls)
{
    t->state = TransferState::CANCELLED;
    discardDataLocked(*t);
    m_ackBatcher.discard(t->id);

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
        event.direction = TransferDirection::RECEIVE;
        event.byPeer = byPeer;
        const auto callback = m_events.onCancelled;
        calls.add([callback, event] { callback(event); });
    }
    scheduleCleanup(t);
}

void ReceiverEngine::discardDataLocked(IncomingTransfer& t) {
    storeFor(t).eraseTransfer(t.id);
    t.received.clear();
    t.received.shrink_to_fit();
}

void ReceiverEngine::scheduleCleanup(const TransferPtr& t) {
    const std::weak_ptr<IncomingTransfer> weak = t;
    const std::string id = t->id;
    t->cleanupTimer = m_scheduler.scheduleAfter(m_config.gracePeriodMs, [this, weak, id] {
        if (TransferPtr p = weak.lock()) {
            m_transfers.eraseIf(id, p);
        }
    });
}

void ReceiverEngine::reportProgressLocked(IncomingTransfer& t, DeferredCalls& calls) {
    const int64_t now = m_scheduler.nowMs();
    t.lastProgressMs = now;
    t.receivedSinceProgress = 0;

    if (!m_events.onProgress) {
        return;
    }

    ProgressEvent event;
    event.transferId = t.id;
    event.direction = TransferDirection::RECEIVE;
    event.bytesTransferred = t.bytesReceived;
    event.totalBytes = t.init.totalSize;
    event.speed = calculateTransferSpeed(t.bytesReceived, t.startMs, now);
    event.etaSeconds = calculateEta(t.init.totalSize - t.bytesReceived, event.speed);
    event.chunksDone = t.receivedCount;
    event.totalChunks = t.init.totalChunks;

    const auto callback = m_events.onProgress;
    calls.add([callback, event] { callback(event); });
}

//=============================================================================
// Queries
//=============================================================================

bool ReceiverEngine::getStatus(const std::string& transferId, ReceiverStatus& status) const {
    TransferPtr t = m_transfers.find(transferId);
    if (!t) {
        return false;
    }

    std::lock_guard<std::mutex> lock(t->mutex);
    status.transferId = t->id;
    status.state = t->state;
    status.totalBytes = t->init.totalSize;
    status.bytesReceived = t->bytesReceived;
    status.totalChunks = t->init.totalChunks;
    status.chunksReceived = t->receivedCount;
    status.chunksSampled = t->plan.sampledCount();
    status.duplicates = t->duplicates;
    status.checksumFailures = t->checksumFailures;
    status.staged = t->staged;
    return true;
}

bool ReceiverEngine::hasTransfer(const std::string& transferId) const {
    return m_transfers.contains(transferId);
}

}  // namespace ChunkWire
