/**
 * @file ReceiverEngine.h
 * @brief Chunk intake, staging, reassembly and whole-file verification
 */

#pragma once

#include "AckBatcher.h"
#include "ChecksumValidator.h"
#include "ChunkCodec.h"
#include "ChunkStore.h"
#include "DataChannel.h"
#include "DeferredCalls.h"
#include "EngineConfig.h"
#include "Scheduler.h"
#include "TransferRegistry.h"
#include "TransferTypes.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ChunkWire {

/**
 * @brief What happened to one inbound chunk
 */
enum class ChunkOutcome : uint8_t {
    STORED,                 ///< New chunk stored and acknowledged
    DUPLICATE,              ///< Already stored; acknowledged again, data ignored
    LATE,                   ///< Transfer already assembled; acknowledged, ignored
    DROPPED_MALFORMED,      ///< Not a decodable CHUNK packet
    DROPPED_UNKNOWN,        ///< No transfer with this id (no INIT yet)
    DROPPED_MISMATCH,       ///< Envelope id/index/sender disagrees with the packet
    DROPPED_OUT_OF_RANGE,   ///< Index >= total chunk count
    DROPPED_BAD_LENGTH,     ///< Payload length differs from the expected chunk length
    DROPPED_CHECKSUM,       ///< Sampled checksum did not match
    DROPPED_INACTIVE,       ///< Transfer cancelled or failed
    DROPPED_STORAGE_ERROR   ///< Staging store refused the chunk; transfer failed
};

std::string chunkOutcomeToString(ChunkOutcome outcome);

/**
 * @struct ReceiverStatus
 * @brief Snapshot of one incoming transfer
 */
struct ReceiverStatus {
    std::string transferId;
    TransferState state = TransferState::PREPARING;
    uint64_t totalBytes = 0;
    uint64_t bytesReceived = 0;
    uint32_t totalChunks = 0;
    uint32_t chunksReceived = 0;
    uint32_t chunksSampled = 0;
    uint64_t duplicates = 0;
    uint64_t checksumFailures = 0;
    bool staged = false;
};

/**
 * @class ReceiverEngine
 * @brief Receives chunks for every incoming transfer on a channel
 *
 * A transfer exists once INIT (or initTransfer()) declared its size and
 * chunk count. Chunks are validated, stored, and acknowledged
 * (immediately or through an AckBatcher). When every chunk is present the
 * transfer is assembled in index order, its length and SHA-256 are checked
 * against the declaration, and the artifact is handed to onComplete.
 *
 * Transfers of at least stagingThresholdBytes keep chunks in the staging
 * ChunkStore and assemble straight into a file under outputDirectory;
 * smaller transfers stay in memory and produce an in-memory artifact.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Work on one transfer is serialized by that transfer's mutex
 */
class ReceiverEngine {
public:
    /**
     * @brief Constructor
     * @param channel Channel ACKs and CANCELs are written to
     * @param scheduler Timer source (ACK batching, grace-period cleanup)
     * @param config Engine tunables
     * @param events Caller-facing callbacks
     * @param stagingStore Store for large transfers; nullptr selects a
     *        FileChunkStore under EngineConfig::resolvedStagingDirectory()
     * @param validator Checksum sampler
     */
    ReceiverEngine(DataChannel& channel,
                   Scheduler& scheduler,
                   const EngineConfig& config,
                   TransferEvents events,
                   std::shared_ptr<ChunkStore> stagingStore = nullptr,
                   ChecksumValidator validator = ChecksumValidator());

    ~ReceiverEngine();

    // Prevent copying
    ReceiverEngine(const ReceiverEngine&) = delete;
    ReceiverEngine& operator=(const ReceiverEngine&) = delete;

    //=========================================================================
    // Commands
    //=========================================================================

    /**
     * @brief Declare an incoming transfer
     * @param init Declared size, chunking, checksum and naming
     * @param senderId Peer the chunks must come from (empty = any)
     * @param errorMsg Error message if the declaration is invalid
     * @return true if the transfer exists afterwards (a repeated INIT for a
     *         known transfer is ignored and returns true)
     */
    bool initTransfer(const InitPacket& init, const std::string& senderId, std::string& errorMsg);

    /**
     * @brief Handle one raw CHUNK message
     * @param transferId Transfer the caller expects the chunk to belong to
     * @param chunkIndex Index the caller expects
     * @param bytes Encoded CHUNK packet
     * @param size Packet length
     * @param senderId Peer the message came from
     */
    ChunkOutcome chunkReceived(const std::string& transferId,
                               uint32_t chunkIndex,
                               const uint8_t* bytes,
                               size_t size,
                               const std::string& senderId);

    /**
     * @brief Handle an already decoded CHUNK packet
     */
    ChunkOutcome onChunk(const ChunkPacket& chunk, const std::string& senderId);

    /**
     * @brief Assemble a transfer whose chunks are all present
     * @param transferId Transfer to assemble
     * @param mimeType Overrides the declared MIME type when not empty
     * @param fileName Overrides the declared file name when not empty
     * @param errorMsg Why assembly did not happen
     * @return true if the transfer is complete afterwards
     *
     * Missing chunks make this return false without changing state; a
     * length or hash mismatch fails the transfer.
     */
    bool assemble(const std::string& transferId,
                  const std::string& mimeType,
                  const std::string& fileName,
                  std::string& errorMsg);

    /**
     * @brief Sender signalled END_OF_STREAM
     */
    void onEndOfStream(const std::string& transferId);

    /**
     * @brief Cancel locally, discard staged data and notify the peer
     */
    bool cancelTransfer(const std::string& transferId, std::string& errorMsg);

    /**
     * @brief Peer sent CANCEL
     * @return true if a live incoming transfer was cancelled
     */
    bool onPeerCancel(const std::string& transferId, const std::string& reason);

    //=========================================================================
    // Queries
    //=========================================================================

    bool getStatus(const std::string& transferId, ReceiverStatus& status) const;
    bool hasTransfer(const std::string& transferId) const;
    size_t transferCount() const { return m_transfers.size(); }

private:
    struct IncomingTransfer {
        std::mutex mutex;

        std::string id;
        std::string senderId;
        InitPacket init;
        TransferState state = TransferState::PREPARING;
        bool staged = false;
        SamplingPlan plan;

        std::vector<bool> received;
        uint32_t receivedCount = 0;
        uint64_t bytesReceived = 0;
        uint64_t duplicates = 0;
        uint64_t checksumFailures = 0;

        int64_t startMs = 0;
        int64_t lastProgressMs = 0;
        uint32_t receivedSinceProgress = 0;
        TaskId cleanupTimer = INVALID_TASK_ID;
    };

    using TransferPtr = std::shared_ptr<IncomingTransfer>;

    ChunkStore& storeFor(const IncomingTransfer& t);
    void sendAckLocked(const IncomingTransfer& t, uint32_t chunkIndex);

    bool assembleLocked(const TransferPtr& t, std::string& errorMsg, DeferredCalls& calls);
    bool assembleInMemory(IncomingTransfer& t, AssembledArtifact& artifact,
                          FailureReason& reason, std::string& errorMsg);
    bool assembleToFile(IncomingTransfer& t, AssembledArtifact& artifact,
                        FailureReason& reason, std::string& errorMsg);

    void failLocked(const TransferPtr& t, FailureReason reason,
                    const std::string& detail, DeferredCalls& calls);
    void cancelLocked(const TransferPtr& t, bool byPeer, const std::string& reason,
                      DeferredCalls& calls);
    void discardDataLocked(IncomingTransfer& t);
    void scheduleCleanup(const TransferPtr& t);

    void reportProgressLocked(IncomingTransfer& t, DeferredCalls& calls);

    DataChannel& m_channel;
    Scheduler& m_scheduler;
    const EngineConfig m_config;
    const TransferEvents m_events;
    const ChecksumValidator m_validator;

    MemoryChunkStore m_memoryStore;
    std::shared_ptr<ChunkStore> m_stagingStore;
    AckBatcher m_ackBatcher;
    TransferRegistry<IncomingTransfer> m_transfers;
};

}  // namespace ChunkWire
