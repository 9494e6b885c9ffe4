/**
 * @file config.h
 * @brief Compile-time configuration defaults for ChunkWire
 *
 * This file contains the default values used throughout the ChunkWire
 * transfer engine: chunk sizing, congestion window parameters, timer
 * intervals, backpressure watermarks, checksum sampling thresholds and
 * receiver staging limits.
 *
 * Every value here is only a default. The runtime EngineConfig (see
 * EngineConfig.h) copies these constants on construction and may override
 * them from a JSON file.
 *
 * @note The wire format constants (packet types, header sizes) are not
 *       tunable. Changing them breaks compatibility with existing peers.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace ChunkWire
 * @brief ChunkWire namespace containing all public APIs
 */
namespace ChunkWire {

//=========================================================================
// Chunk Sizing
//=========================================================================

/** @defgroup ChunkSizing Chunk Sizing Configuration
 * @brief Chunk sizes selected from the total file size
 * @{
 */

/**
 * @brief Chunk size for files smaller than SMALL_FILE_LIMIT (32 KB).
 */
constexpr size_t CHUNK_SIZE_SMALL = 32 * 1024;

/**
 * @brief Chunk size for files smaller than MEDIUM_FILE_LIMIT (64 KB).
 */
constexpr size_t CHUNK_SIZE_MEDIUM = 64 * 1024;

/**
 * @brief Chunk size for everything else (128 KB).
 */
constexpr size_t CHUNK_SIZE_LARGE = 128 * 1024;

constexpr uint64_t SMALL_FILE_LIMIT = 10ULL * 1024ULL * 1024ULL;    // 10 MB
constexpr uint64_t MEDIUM_FILE_LIMIT = 100ULL * 1024ULL * 1024ULL;  // 100 MB

/**
 * @brief Smallest chunk size accepted by startTransfer().
 *
 * Requests below this are raised to it. Tiny chunks waste most of each
 * message on the header.
 */
constexpr size_t MIN_CHUNK_SIZE = 1024;

/** @} */ // end of ChunkSizing

//=========================================================================
// Congestion Window
//=========================================================================

/** @defgroup CongestionWindow Congestion Window Configuration
 * @brief AIMD window parameters (counts of chunks in flight)
 * @{
 */

/**
 * @brief Window size at the start of every transfer.
 *
 * Starts small so the first round does not flood a slow channel.
 */
constexpr uint32_t INITIAL_WINDOW = 4;

/**
 * @brief Floor applied when the window is halved.
 */
constexpr uint32_t MIN_WINDOW = 2;

/**
 * @brief Ceiling for additive growth.
 */
constexpr uint32_t MAX_WINDOW = 128;

/**
 * @brief Initial slow-start threshold.
 *
 * The window doubles per fully acknowledged round until it reaches this
 * value, then grows by one per round.
 */
constexpr uint32_t SLOW_START_THRESHOLD = 64;

/**
 * @brief Consecutive timeouts within one monitoring tick that trigger a
 * multiplicative decrease.
 */
constexpr uint32_t TIMEOUT_BURST = 3;

/**
 * @brief Number of RTT samples kept for the moving average.
 */
constexpr size_t RTT_HISTORY_SIZE = 10;

/**
 * @brief Assumed RTT before the first sample arrives (ms).
 */
constexpr uint32_t INITIAL_RTT_MS = 1000;

/** @} */ // end of CongestionWindow

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timer intervals and timeouts (in milliseconds)
 * @{
 */

/**
 * @brief Lower bound of the per-chunk ACK timeout.
 *
 * The adaptive timeout is max(BASE_TIMEOUT_MS, 3 * averageRTT + RTT_MARGIN_MS).
 */
constexpr uint32_t BASE_TIMEOUT_MS = 5000;

/**
 * @brief Safety margin added to 3 * averageRTT.
 */
constexpr uint32_t RTT_MARGIN_MS = 2000;

/**
 * @brief Per-chunk retransmission ceiling before the chunk joins the
 * failed-chunk set.
 */
constexpr uint32_t MAX_CHUNK_RETRIES = 10;

/**
 * @brief Monitoring tick of the congestion controller.
 */
constexpr uint32_t CONGESTION_TICK_MS = 200;

/**
 * @brief Cadence of the background failed-chunk recovery loop.
 */
constexpr uint32_t FAILED_CHUNK_RETRY_INTERVAL_MS = 5000;

/**
 * @brief Number of background recovery rounds a single chunk may consume
 * before the transfer is declared failed.
 *
 * 12 rounds at FAILED_CHUNK_RETRY_INTERVAL_MS is roughly one minute.
 */
constexpr uint32_t MAX_RECOVERY_ROUNDS = 12;

/**
 * @brief Delay before re-reading a chunk whose source read failed.
 */
constexpr uint32_t SOURCE_READ_RETRY_DELAY_MS = 1000;

/**
 * @brief Stall detector tick.
 */
constexpr uint32_t STALL_CHECK_INTERVAL_MS = 1000;

/**
 * @brief Window silence after which every in-flight chunk is resent.
 */
constexpr uint32_t STALL_TIMEOUT_MS = 5000;

/**
 * @brief Polling interval while dispatch is held by backpressure.
 */
constexpr uint32_t BACKPRESSURE_POLL_MS = 50;

/**
 * @brief Minimum interval between two progress reports.
 */
constexpr uint32_t PROGRESS_REPORT_INTERVAL_MS = 200;

/**
 * @brief A progress report is also forced every this many chunks.
 */
constexpr uint32_t PROGRESS_REPORT_CHUNK_STRIDE = 50;

/**
 * @brief END_OF_STREAM copies sent after the last ACK.
 *
 * The final control message is not acknowledged, so it is repeated to
 * tolerate loss of any single copy.
 */
constexpr int ASSEMBLE_SIGNAL_COUNT = 3;

/**
 * @brief Spacing between END_OF_STREAM copies.
 */
constexpr uint32_t ASSEMBLE_SIGNAL_SPACING_MS = 500;

/**
 * @brief Time terminal transfers stay in the registry to absorb late
 * duplicates before final teardown.
 */
constexpr uint32_t TERMINAL_GRACE_PERIOD_MS = 60000;

/** @} */ // end of Timing

//=========================================================================
// Acknowledgements
//=========================================================================

/** @defgroup Acks Acknowledgement Configuration
 * @{
 */

/**
 * @brief Pending ACK count that flushes a batch immediately.
 */
constexpr size_t BATCH_ACK_SIZE = 50;

/**
 * @brief Maximum time an ACK waits in a batch (ms).
 */
constexpr uint32_t BATCH_ACK_INTERVAL_MS = 100;

/**
 * @brief Batches needing more ranges than this are sent as a bitmap.
 */
constexpr size_t BATCH_ACK_MAX_RANGES = 10;

/** @} */ // end of Acks

//=========================================================================
// Backpressure
//=========================================================================

/** @defgroup Backpressure Backpressure Watermarks
 * @brief Outbound buffered-byte thresholds (bytes)
 *
 * Dispatch stops above the high watermark and resumes below the low
 * watermark. Values for the three NetworkTier presets.
 * @{
 */

constexpr size_t CONSTRAINED_HIGH_WATERMARK = 512 * 1024;        // 512 KB
constexpr size_t CONSTRAINED_LOW_WATERMARK = 128 * 1024;         // 128 KB
constexpr size_t STANDARD_HIGH_WATERMARK = 1024 * 1024;          // 1 MB
constexpr size_t STANDARD_LOW_WATERMARK = 256 * 1024;            // 256 KB
constexpr size_t HIGH_THROUGHPUT_HIGH_WATERMARK = 4 * 1024 * 1024;  // 4 MB
constexpr size_t HIGH_THROUGHPUT_LOW_WATERMARK = 512 * 1024;     // 512 KB

/** @} */ // end of Backpressure

//=========================================================================
// Checksum Sampling
//=========================================================================

/** @defgroup Sampling Checksum Sampling Configuration
 * @{
 */

/**
 * @brief Files below this size validate every chunk.
 */
constexpr uint64_t FULL_VALIDATION_LIMIT = 100ULL * 1024ULL * 1024ULL;  // 100 MB

/**
 * @brief Files below this size (and at least FULL_VALIDATION_LIMIT)
 * validate a 10% sample.
 */
constexpr uint64_t DECIMATED_VALIDATION_LIMIT = 1024ULL * 1024ULL * 1024ULL;  // 1 GB

constexpr double SAMPLE_RATE_FULL = 1.0;
constexpr double SAMPLE_RATE_DECIMATED = 0.10;
constexpr double SAMPLE_RATE_SPARSE = 0.01;

/** @} */ // end of Sampling

//=========================================================================
// Receiver Staging
//=========================================================================

/** @defgroup Staging Receiver Staging Configuration
 * @{
 */

/**
 * @brief Transfers of at least this many bytes are staged in the
 * persistent ChunkStore instead of memory.
 */
constexpr uint64_t STAGING_THRESHOLD_BYTES = 256ULL * 1024ULL * 1024ULL;  // 256 MB

/**
 * @brief In-memory aggregate size that is flushed into the assembled
 * output during incremental assembly.
 */
constexpr size_t AGGREGATE_FLUSH_BYTES = 50 * 1024 * 1024;  // 50 MB

/**
 * @brief Read buffer used when hashing a source file.
 */
constexpr size_t HASH_READ_BUFFER_SIZE = 1024 * 1024;  // 1 MB

/** @} */ // end of Staging

//=========================================================================
// Protocol
//=========================================================================

/** @defgroup Protocol Wire Protocol Constants
 * @{
 */

/**
 * @brief SHA-256 hash size in bytes.
 */
constexpr size_t HASH_SIZE = 32;

/**
 * @brief Fixed part of a CHUNK header, excluding transferId and checksum.
 *
 * type(1) + idLen(2) + chunkIndex(4) + payloadLength(4) + checksumLen(2)
 */
constexpr size_t CHUNK_HEADER_FIXED_SIZE = 13;

/**
 * @brief Longest transferId representable on the wire.
 */
constexpr size_t MAX_TRANSFER_ID_LENGTH = 0xFFFF;

/**
 * @brief Maximum single-message size assumed when a channel does not
 * advertise one.
 */
constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 256 * 1024;

/**
 * @brief Prefix used for generated transfer ids.
 */
constexpr const char* TRANSFER_ID_PREFIX = "xfer_";

/** @} */ // end of Protocol

}  // namespace ChunkWire
