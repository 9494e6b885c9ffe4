/**
 * @file TransferTypes.h
 * @brief Transfer lifecycle states, failure reasons, events and chunk math
 */

#pragma once

#include "ErrorCodes.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <filesystem>
#include <vector>

namespace ChunkWire {

//=============================================================================
// Lifecycle
//=============================================================================

/**
 * @brief Lifecycle of one transfer, shared by both sides
 *
 * Preparing -> Transferring <-> Paused -> Assembling -> Complete, with
 * Cancelled and Failed reachable from any non-terminal state. The sender
 * never enters Assembling.
 */
enum class TransferState : uint8_t {
    PREPARING,     ///< Created; sender has not dispatched, receiver awaits data
    TRANSFERRING,  ///< Chunks moving
    PAUSED,        ///< Sender paused by the caller
    ASSEMBLING,    ///< Receiver concatenating and verifying
    COMPLETE,      ///< Terminal: delivered (sender) or verified (receiver)
    CANCELLED,     ///< Terminal: cancelled locally or by the peer
    FAILED         ///< Terminal: unrecoverable error
};

/**
 * @brief Convert TransferState to string
 */
inline std::string transferStateToString(TransferState state) {
    switch (state) {
        case TransferState::PREPARING:    return "Preparing";
        case TransferState::TRANSFERRING: return "Transferring";
        case TransferState::PAUSED:       return "Paused";
        case TransferState::ASSEMBLING:   return "Assembling";
        case TransferState::COMPLETE:     return "Complete";
        case TransferState::CANCELLED:    return "Cancelled";
        case TransferState::FAILED:       return "Failed";
        default:                          return "Unknown";
    }
}

inline bool isTerminalState(TransferState state) {
    return state == TransferState::COMPLETE ||
           state == TransferState::CANCELLED ||
           state == TransferState::FAILED;
}

/**
 * @brief Which side of the transfer an event belongs to
 */
enum class TransferDirection : uint8_t {
    SEND,
    RECEIVE
};

//=============================================================================
// Failures
//=============================================================================

/**
 * @brief Why a transfer reached FAILED
 */
enum class FailureReason : uint8_t {
    NETWORK_EXHAUSTED,       ///< Retry and recovery budget used up
    TRANSFER_TIMEOUT,        ///< Overall transfer deadline passed
    CHANNEL_SEND_FAILED,     ///< Channel refused a control message we depend on
    INTEGRITY_CHECK_FAILED,  ///< Whole-artifact hash mismatch
    SIZE_MISMATCH,           ///< Assembled length differs from declared size
    SOURCE_READ_ERROR,       ///< Sender cannot read its source
    STORAGE_ERROR            ///< Receiver staging store failed
};

inline const char* failureReasonCode(FailureReason reason) {
    switch (reason) {
        case FailureReason::NETWORK_EXHAUSTED:      return ErrorCodes::NETWORK_RETRIES_EXHAUSTED;
        case FailureReason::TRANSFER_TIMEOUT:       return ErrorCodes::NETWORK_TRANSFER_TIMEOUT;
        case FailureReason::CHANNEL_SEND_FAILED:    return ErrorCodes::NETWORK_CHANNEL_SEND_FAILED;
        case FailureReason::INTEGRITY_CHECK_FAILED: return ErrorCodes::INTEGRITY_CHECK_FAILED;
        case FailureReason::SIZE_MISMATCH:          return ErrorCodes::INTEGRITY_SIZE_MISMATCH;
        case FailureReason::SOURCE_READ_ERROR:      return ErrorCodes::SOURCE_READ_FAILED;
        case FailureReason::STORAGE_ERROR:          return ErrorCodes::STORAGE_FAILED;
        default:                                    return ErrorCodes::INVALID_REQUEST;
    }
}

/**
 * @brief User-facing summary; distinguishes "retry" from "re-source"
 */
inline std::string failureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::NETWORK_EXHAUSTED:      return "Network error: retries exhausted";
        case FailureReason::TRANSFER_TIMEOUT:       return "Network error: transfer timed out";
        case FailureReason::CHANNEL_SEND_FAILED:    return "Network error: channel send failed";
        case FailureReason::INTEGRITY_CHECK_FAILED: return "Integrity check failed: file corrupted";
        case FailureReason::SIZE_MISMATCH:          return "Integrity check failed: size mismatch";
        case FailureReason::SOURCE_READ_ERROR:      return "Source file could not be read";
        case FailureReason::STORAGE_ERROR:          return "Local staging storage failed";
        default:                                    return "Unknown error";
    }
}

//=============================================================================
// Events
//=============================================================================

/**
 * @brief Result of a successful receive
 *
 * Small transfers are assembled in memory (data); staged transfers are
 * assembled straight into a file (filePath) and data stays empty.
 */
struct AssembledArtifact {
    std::string transferId;
    std::string fileName;
    std::string mimeType;
    uint64_t size = 0;
    std::string sha256Hex;
    std::vector<uint8_t> data;
    std::filesystem::path filePath;

    bool isOnDisk() const { return !filePath.empty(); }
};

struct ProgressEvent {
    std::string transferId;
    TransferDirection direction = TransferDirection::SEND;
    uint64_t bytesTransferred = 0;  ///< Acked (send) or stored (receive)
    uint64_t totalBytes = 0;
    double speed = 0.0;             ///< Bytes per second since start
    double etaSeconds = 0.0;        ///< Negative when unknown
    uint32_t chunksDone = 0;
    uint32_t totalChunks = 0;
    uint32_t windowSize = 0;        ///< Sender only
};

struct CompleteEvent {
    std::string transferId;
    TransferDirection direction = TransferDirection::SEND;
    double averageSpeed = 0.0;      ///< Bytes per second
    double totalTimeSeconds = 0.0;
    std::shared_ptr<const AssembledArtifact> artifact;  ///< Receiver only
};

struct ErrorEvent {
    std::string transferId;
    TransferDirection direction = TransferDirection::SEND;
    FailureReason reason = FailureReason::NETWORK_EXHAUSTED;
    std::string code;
    std::string message;
};

struct CancelledEvent {
    std::string transferId;
    TransferDirection direction = TransferDirection::SEND;
    bool byPeer = false;
};

/**
 * @brief Caller-facing event surface
 *
 * Any callback may be left empty. Callbacks run on whichever thread drove
 * the event and must not re-enter the same engine for the same transfer.
 */
struct TransferEvents {
    std::function<void(const ProgressEvent&)> onProgress;
    std::function<void(const CompleteEvent&)> onComplete;
    std::function<void(const ErrorEvent&)> onError;
    std::function<void(const CancelledEvent&)> onCancelled;
};

//=============================================================================
// Chunk Math
//=============================================================================

/**
 * @brief ceil(fileSize / chunkSize) without overflow; 0 for a zero chunk size
 */
inline uint64_t calculateChunkCount(uint64_t fileSize, uint64_t chunkSize) {
    if (chunkSize == 0) {
        return 0;
    }
    return fileSize / chunkSize + (fileSize % chunkSize != 0 ? 1 : 0);
}

/**
 * @brief calculateChunkCount narrowed to a chunk index range
 *
 * Callers must check calculateChunkCount() fits in uint32_t first.
 */
inline uint32_t calculateTotalChunks(uint64_t fileSize, uint64_t chunkSize) {
    return static_cast<uint32_t>(calculateChunkCount(fileSize, chunkSize));
}

inline uint64_t calculateChunkOffset(uint32_t chunkIndex, uint64_t chunkSize) {
    return static_cast<uint64_t>(chunkIndex) * chunkSize;
}

/**
 * @brief Byte length of chunk chunkIndex; only the last chunk may be short
 */
inline uint64_t calculateChunkLength(uint64_t fileSize, uint32_t chunkIndex, uint64_t chunkSize) {
    const uint64_t offset = calculateChunkOffset(chunkIndex, chunkSize);
    if (offset >= fileSize) {
        return 0;
    }
    const uint64_t remaining = fileSize - offset;
    return remaining < chunkSize ? remaining : chunkSize;
}

}  // namespace ChunkWire
