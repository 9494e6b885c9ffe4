/**
 * @file EngineConfig.h
 * @brief Runtime tunables for the sender and receiver engines
 */

#pragma once

#include "CongestionWindow.h"
#include "config.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace ChunkWire {

/**
 * @brief Backpressure watermark presets
 */
enum class NetworkTier : uint8_t {
    CONSTRAINED,      ///< 512 KB / 128 KB
    STANDARD,         ///< 1 MB / 256 KB
    HIGH_THROUGHPUT   ///< 4 MB / 512 KB
};

std::string networkTierToString(NetworkTier tier);

/**
 * @brief Parse "constrained" / "standard" / "high_throughput"
 * @return false if name is not a known tier
 */
bool networkTierFromString(const std::string& name, NetworkTier& tier);

/**
 * @brief How the receiver acknowledges stored chunks
 */
enum class AckMode : uint8_t {
    IMMEDIATE,  ///< One ACK packet per chunk
    BATCHED     ///< BATCH_ACK every batchAckSize chunks or batchAckIntervalMs
};

/**
 * @struct EngineConfig
 * @brief Every constant the engines use, defaulted from config.h
 *
 * Loaded from and saved to JSON. Unknown keys are ignored; a key with the
 * wrong type or an out-of-range value keeps its default.
 *
 * Example file:
 * @code
 * {
 *   "network_tier": "standard",
 *   "ack_mode": "batched",
 *   "max_window": 64,
 *   "staging_directory": "/var/tmp/chunkwire"
 * }
 * @endcode
 */
struct EngineConfig {
    // Chunking
    size_t chunkSize = 0;                     ///< 0 = pick from file size
    bool includeChunkChecksums = true;
    bool computeFileChecksum = true;

    // Congestion window
    uint32_t initialWindow = INITIAL_WINDOW;
    uint32_t minWindow = MIN_WINDOW;
    uint32_t maxWindow = MAX_WINDOW;
    uint32_t slowStartThreshold = SLOW_START_THRESHOLD;
    uint32_t timeoutBurst = TIMEOUT_BURST;
    size_t rttHistorySize = RTT_HISTORY_SIZE;
    uint32_t initialRttMs = INITIAL_RTT_MS;

    // Retransmission
    uint32_t baseTimeoutMs = BASE_TIMEOUT_MS;
    uint32_t rttMarginMs = RTT_MARGIN_MS;
    uint32_t maxChunkRetries = MAX_CHUNK_RETRIES;
    uint32_t congestionTickMs = CONGESTION_TICK_MS;
    uint32_t failedChunkRetryIntervalMs = FAILED_CHUNK_RETRY_INTERVAL_MS;
    uint32_t maxRecoveryRounds = MAX_RECOVERY_ROUNDS;
    uint32_t sourceReadRetryDelayMs = SOURCE_READ_RETRY_DELAY_MS;
    uint32_t stallCheckIntervalMs = STALL_CHECK_INTERVAL_MS;
    uint32_t stallTimeoutMs = STALL_TIMEOUT_MS;
    uint32_t transferTimeoutMs = 0;           ///< 0 = no overall deadline

    // Backpressure
    NetworkTier networkTier = NetworkTier::CONSTRAINED;
    size_t highWatermark = CONSTRAINED_HIGH_WATERMARK;
    size_t lowWatermark = CONSTRAINED_LOW_WATERMARK;
    uint32_t backpressurePollMs = BACKPRESSURE_POLL_MS;

    // Acknowledgements
    AckMode ackMode = AckMode::BATCHED;
    size_t batchAckSize = BATCH_ACK_SIZE;
    uint32_t batchAckIntervalMs = BATCH_ACK_INTERVAL_MS;

    // Progress and completion
    uint32_t progressIntervalMs = PROGRESS_REPORT_INTERVAL_MS;
    uint32_t progressChunkStride = PROGRESS_REPORT_CHUNK_STRIDE;
    uint32_t assembleSignalCount = ASSEMBLE_SIGNAL_COUNT;
    uint32_t assembleSignalSpacingMs = ASSEMBLE_SIGNAL_SPACING_MS;
    uint32_t gracePeriodMs = TERMINAL_GRACE_PERIOD_MS;
    bool autoAssemble = true;

    // Receiver storage
    uint64_t stagingThresholdBytes = STAGING_THRESHOLD_BYTES;
    size_t aggregateFlushBytes = AGGREGATE_FLUSH_BYTES;
    std::string stagingDirectory;             ///< Empty = <temp>/chunkwire-staging
    std::string outputDirectory;              ///< Empty = <temp>/chunkwire-received

    /**
     * @brief Set both watermarks from a preset
     */
    void applyNetworkTier(NetworkTier tier);

    CongestionSettings congestionSettings() const;

    std::filesystem::path resolvedStagingDirectory() const;
    std::filesystem::path resolvedOutputDirectory() const;

    /**
     * @brief Check cross-field constraints
     * @param errorMsg First violated constraint
     */
    bool validate(std::string& errorMsg) const;

    nlohmann::json toJson() const;

    /**
     * @brief Build a config from JSON, keeping defaults for bad fields
     *
     * "network_tier" is applied first, so explicit watermarks override it.
     */
    static EngineConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Load and validate a JSON config file
     */
    static bool loadFromFile(const std::filesystem::path& path,
                             EngineConfig& config,
                             std::string& errorMsg);

    /**
     * @brief Validate, then write atomically as pretty-printed JSON
     */
    bool saveToFile(const std::filesystem::path& path, std::string& errorMsg) const;
};

}  // namespace ChunkWire
