/**
 * @file EngineConfig.cpp
 * @brief Runtime tunables for the sender and receiver engines
 */

#include "chunkwire/EngineConfig.h"
#include "chunkwire/AtomicFile.h"
#include "chunkwire/Debug.h"

#include <fstream>
#include <limits>

namespace ChunkWire {

namespace {

/**
 * @brief Copy an unsigned JSON field into out if present, typed and in range
 */
template <typename T>
void readUnsigned(const nlohmann::json& j, const char* key, T& out,
                  uint64_t minValue = 0,
                  uint64_t maxValue = std::numeric_limits<T>::max())
{
    if (!j.contains(key)) {
        return;
    }
    const auto& value = j[key];
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<int64_t>() >= 0)) {
        LOG_WARNING("Config field '" << key << "' is not an unsigned integer, keeping default");
        return;
    }
    const auto v = value.get<uint64_t>();
    if (v < minValue || v > maxValue) {
        LOG_WARNING("Config field '" << key << "' out of range (" << v << "), keeping default");
        return;
    }
    out = static_cast<T>(v);
}

void readBool(const nlohmann::json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean()) {
        out = j[key].get<bool>();
    }
}

void readString(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
    }
}

}  // namespace

//=============================================================================
// NetworkTier
//=============================================================================

std::string networkTierToString(NetworkTier tier) {
    switch (tier) {
        case NetworkTier::CONSTRAINED:     return "constrained";
        case NetworkTier::STANDARD:        return "standard";
        case NetworkTier::HIGH_THROUGHPUT: return "high_throughput";
        default:                           return "unknown";
    }
}

bool networkTierFromString(const std::string& name, NetworkTier& tier) {
    if (name == "constrained") {
        tier = NetworkTier::CONSTRAINED;
    } else if (name == "standard") {
        tier = NetworkTier::STANDARD;
    } else if (name == "high_throughput") {
        tier = NetworkTier::HIGH_THROUGHPUT;
    } else {
        return false;
    }
    return true;
}

//=============================================================================
// EngineConfig
//=============================================================================

void EngineConfig::applyNetworkTier(NetworkTier tier) {
    networkTier = tier;
    switch (tier) {
        case NetworkTier::CONSTRAINED:
            highWatermark = CONSTRAINED_HIGH_WATERMARK;
            lowWatermark = CONSTRAINED_LOW_WATERMARK;
            break;
        case NetworkTier::STANDARD:
            highWatermark = STANDARD_HIGH_WATERMARK;
            lowWatermark = STANDARD_LOW_WATERMARK;
            break;
        case NetworkTier::HIGH_THROUGHPUT:
            highWatermark = HIGH_THROUGHPUT_HIGH_WATERMARK;
            lowWatermark = HIGH_THROUGHPUT_LOW_WATERMARK;
            break;
    }
}

CongestionSettings EngineConfig::congestionSettings() const {
    CongestionSettings s;
    s.initialWindow = initialWindow;
    s.minWindow = minWindow;
    s.maxWindow = maxWindow;
    s.slowStartThreshold = slowStartThreshold;
    s.timeoutBurst = timeoutBurst;
    s.rttHistorySize = rttHistorySize;
    s.initialRttMs = initialRttMs;
    s.baseTimeoutMs = baseTimeoutMs;
    s.rttMarginMs = rttMarginMs;
    return s;
}

std::filesystem::path EngineConfig::resolvedStagingDirectory() const {
    if (!stagingDirectory.empty()) {
        return stagingDirectory;
    }
    std::error_code ec;
    const auto tmp = std::filesystem::temp_directory_path(ec);
    return (ec ? std::filesystem::path(".") : tmp) / "chunkwire-staging";
}

std::filesystem::path EngineConfig::resolvedOutputDirectory() const {
    if (!outputDirectory.empty()) {
        return outputDirectory;
    }
    std::error_code ec;
    const auto tmp = std::filesystem::temp_directory_path(ec);
    return (ec ? std::filesystem::path(".") : tmp) / "chunkwire-received";
}

bool EngineConfig::validate(std::string& errorMsg) const {
    if (chunkSize != 0 && chunkSize < MIN_CHUNK_SIZE) {
        errorMsg = "chunk_size below minimum of " + std::to_string(MIN_CHUNK_SIZE);
        return false;
    }
    if (minWindow == 0 || minWindow > maxWindow) {
        errorMsg = "min_window must be in [1, max_window]";
        return false;
    }
    if (initialWindow < minWindow || initialWindow > maxWindow) {
        errorMsg = "initial_window must be in [min_window, max_window]";
        return false;
    }
    if (slowStartThreshold < minWindow || slowStartThreshold > maxWindow) {
        errorMsg = "slow_start_threshold must be in [min_window, max_window]";
        return false;
    }
    if (timeoutBurst == 0 || rttHistorySize == 0) {
        errorMsg = "timeout_burst and rtt_history_size must be positive";
        return false;
    }
    if (lowWatermark > highWatermark) {
        errorMsg = "low_watermark must not exceed high_watermark";
        return false;
    }
    if (congestionTickMs == 0 || stallCheckIntervalMs == 0 || backpressurePollMs == 0 ||
        failedChunkRetryIntervalMs == 0) {
        errorMsg = "timer intervals must be positive";
        return false;
    }
    if (batchAckSize == 0) {
        errorMsg = "batch_ack_size must be positive";
        return false;
    }
    if (aggregateFlushBytes == 0) {
        errorMsg = "aggregate_flush_bytes must be positive";
        return false;
    }
    return true;
}

nlohmann::json EngineConfig::toJson() const {
    nlohmann::json out = nlohmann::json::object();

    out["chunk_size"] = chunkSize;
    out["include_chunk_checksums"] = includeChunkChecksums;
    out["compute_file_checksum"] = computeFileChecksum;

    out["initial_window"] = initialWindow;
    out["min_window"] = minWindow;
    out["max_window"] = maxWindow;
    out["slow_start_threshold"] = slowStartThreshold;
    out["timeout_burst"] = timeoutBurst;
    out["rtt_history_size"] = rttHistorySize;
    out["initial_rtt_ms"] = initialRttMs;

    out["base_timeout_ms"] = baseTimeoutMs;
    out["rtt_margin_ms"] = rttMarginMs;
    out["max_chunk_retries"] = maxChunkRetries;
    out["congestion_tick_ms"] = congestionTickMs;
    out["failed_chunk_retry_interval_ms"] = failedChunkRetryIntervalMs;
    out["max_recovery_rounds"] = maxRecoveryRounds;
    out["source_read_retry_delay_ms"] = sourceReadRetryDelayMs;
    out["stall_check_interval_ms"] = stallCheckIntervalMs;
    out["stall_timeout_ms"] = stallTimeoutMs;
    out["transfer_timeout_ms"] = transferTimeoutMs;

    out["network_tier"] = networkTierToString(networkTier);
    out["high_watermark"] = highWatermark;
    out["low_watermark"] = lowWatermark;
    out["backpressure_poll_ms"] = backpressurePollMs;

    out["ack_mode"] = ackMode == AckMode::IMMEDIATE ? "immediate" : "batched";
    out["batch_ack_size"] = batchAckSize;
    out["batch_ack_interval_ms"] = batchAckIntervalMs;

    out["progress_interval_ms"] = progressIntervalMs;
    out["progress_chunk_stride"] = progressChunkStride;
    out["assemble_signal_count"] = assembleSignalCount;
    out["assemble_signal_spacing_ms"] = assembleSignalSpacingMs;
    out["grace_period_ms"] = gracePeriodMs;
    out["auto_assemble"] = autoAssemble;

    out["staging_threshold_bytes"] = stagingThresholdBytes;
    out["aggregate_flush_bytes"] = aggregateFlushBytes;
    out["staging_directory"] = stagingDirectory;
    out["output_directory"] = outputDirectory;

    return out;
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
    EngineConfig config;
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("network_tier") && j["network_tier"].is_string()) {
        NetworkTier tier;
        if (networkTierFromString(j["network_tier"].get<std::string>(), tier)) {
            config.applyNetworkTier(tier);
        } else {
            LOG_WARNING("Unknown network_tier, keeping default");
        }
    }

    readUnsigned(j, "chunk_size", config.chunkSize);
    readBool(j, "include_chunk_checksums", config.includeChunkChecksums);
    readBool(j, "compute_file_checksum", config.computeFileChecksum);

    readUnsigned(j, "initial_window", config.initialWindow, 1);
    readUnsigned(j, "min_window", config.minWindow, 1);
    readUnsigned(j, "max_window", config.maxWindow, 1);
    readUnsigned(j, "slow_start_threshold", config.slowStartThreshold, 1);
    readUnsigned(j, "timeout_burst", config.timeoutBurst, 1);
    readUnsigned(j, "rtt_history_size", config.rttHistorySize, 1, 10000);
    readUnsigned(j, "initial_rtt_ms", config.initialRttMs);

    readUnsigned(j, "base_timeout_ms", config.baseTimeoutMs, 1);
    readUnsigned(j, "rtt_margin_ms", config.rttMarginMs);
    readUnsigned(j, "max_chunk_retries", config.maxChunkRetries);
    readUnsigned(j, "congestion_tick_ms", config.congestionTickMs, 1);
    readUnsigned(j, "failed_chunk_retry_interval_ms", config.failedChunkRetryIntervalMs, 1);
    readUnsigned(j, "max_recovery_rounds", config.maxRecoveryRounds);
    readUnsigned(j, "source_read_retry_delay_ms", config.sourceReadRetryDelayMs);
    readUnsigned(j, "stall_check_interval_ms", config.stallCheckIntervalMs, 1);
    readUnsigned(j, "stall_timeout_ms", config.stallTimeoutMs, 1);
    readUnsigned(j, "transfer_timeout_ms", config.transferTimeoutMs);

    readUnsigned(j, "high_watermark", config.highWatermark);
    readUnsigned(j, "low_watermark", config.lowWatermark);
    readUnsigned(j, "backpressure_poll_ms", config.backpressurePollMs, 1);

    if (j.contains("ack_mode") && j["ack_mode"].is_string()) {
        const std::string mode = j["ack_mode"].get<std::string>();
        if (mode == "immediate") {
            config.ackMode = AckMode::IMMEDIATE;
        } else if (mode == "batched") {
            config.ackMode = AckMode::BATCHED;
        } else {
            LOG_WARNING("Unknown ack_mode '" << mode << "', keeping default");
        }
    }
    readUnsigned(j, "batch_ack_size", config.batchAckSize, 1);
    readUnsigned(j, "batch_ack_interval_ms", config.batchAckIntervalMs);

    readUnsigned(j, "progress_interval_ms", config.progressIntervalMs);
    readUnsigned(j, "progress_chunk_stride", config.progressChunkStride, 1);
    readUnsigned(j, "assemble_signal_count", config.assembleSignalCount, 1, 100);
    readUnsigned(j, "assemble_signal_spacing_ms", config.assembleSignalSpacingMs);
    readUnsigned(j, "grace_period_ms", config.gracePeriodMs);
    readBool(j, "auto_assemble", config.autoAssemble);

    readUnsigned(j, "staging_threshold_bytes", config.stagingThresholdBytes);
    readUnsigned(j, "aggregate_flush_bytes", config.aggregateFlushBytes, 1);
    readString(j, "staging_directory", config.stagingDirectory);
    readString(j, "output_directory", config.outputDirectory);

    return config;
}

bool EngineConfig::loadFromFile(const std::filesystem::path& path,
                                EngineConfig& config,
                                std::string& errorMsg)
{
    std::ifstream in(path);
    if (!in) {
        errorMsg = "Cannot open config file: " + path.string();
        return false;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        errorMsg = std::string("Config parse error: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        errorMsg = "Config root must be a JSON object";
        return false;
    }

    EngineConfig loaded = fromJson(j);
    if (!loaded.validate(errorMsg)) {
        return false;
    }
    config = loaded;
    return true;
}

bool EngineConfig::saveToFile(const std::filesystem::path& path, std::string& errorMsg) const {
    // loadFromFile refuses anything validate() rejects, so never write it
    if (!validate(errorMsg)) {
        return false;
    }
    const std::string text = toJson().dump(2) + "\n";
    return atomicWriteFile(path, reinterpret_cast<const uint8_t*>(text.data()), text.size(), errorMsg);
}

}  // namespace ChunkWire
