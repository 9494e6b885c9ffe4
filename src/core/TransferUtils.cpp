/**
 * @file TransferUtils.cpp
 * @brief Chunk size selection, throughput math and formatting
 */

#include "chunkwire/TransferUtils.h"
#include "chunkwire/config.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace ChunkWire {

size_t calculateOptimalChunkSize(uint64_t fileSize)
{
    if (fileSize < SMALL_FILE_LIMIT) {
        return CHUNK_SIZE_SMALL;
    }
    if (fileSize < MEDIUM_FILE_LIMIT) {
        return CHUNK_SIZE_MEDIUM;
    }
    return CHUNK_SIZE_LARGE;
}

size_t resolveChunkSize(size_t requested,
                        uint64_t fileSize,
                        size_t transferIdLength,
                        size_t maxMessageSize,
                        bool includeChecksum)
{
    size_t chunkSize = requested == 0 ? calculateOptimalChunkSize(fileSize) : requested;
    if (chunkSize < MIN_CHUNK_SIZE) {
        chunkSize = MIN_CHUNK_SIZE;
    }

    const size_t overhead = CHUNK_HEADER_FIXED_SIZE + transferIdLength +
                            (includeChecksum ? HASH_SIZE * 2 : 0);
    if (maxMessageSize <= overhead || maxMessageSize - overhead < MIN_CHUNK_SIZE) {
        return 0;
    }

    const size_t maxPayload = maxMessageSize - overhead;
    return chunkSize > maxPayload ? maxPayload : chunkSize;
}

double calculateTransferSpeed(uint64_t bytes, int64_t startMs, int64_t nowMs)
{
    const double elapsedSeconds = static_cast<double>(nowMs - startMs) / 1000.0;
    if (elapsedSeconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes) / elapsedSeconds;
}

double calculateEta(uint64_t bytesRemaining, double bytesPerSecond)
{
    if (bytesRemaining == 0) {
        return 0.0;
    }
    if (bytesPerSecond <= 0.0) {
        return -1.0;
    }
    return static_cast<double>(bytesRemaining) / bytesPerSecond;
}

std::string formatBytes(uint64_t bytes)
{
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    if (bytes >= GB) {
        oss << std::fixed << std::setprecision(2) << (bytes / GB) << " GB";
    } else if (bytes >= MB) {
        oss << std::fixed << std::setprecision(2) << (bytes / MB) << " MB";
    } else if (bytes >= KB) {
        oss << std::fixed << std::setprecision(2) << (bytes / KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

std::string formatSpeed(double bytesPerSecond)
{
    if (bytesPerSecond < 0.0) {
        bytesPerSecond = 0.0;
    }
    return formatBytes(static_cast<uint64_t>(bytesPerSecond)) + "/s";
}

std::string formatEta(double seconds)
{
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return "--";
    }

    const auto total = static_cast<uint64_t>(seconds);
    const uint64_t hours = total / 3600;
    const uint64_t minutes = (total % 3600) / 60;
    const uint64_t secs = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << minutes << "m";
    } else if (minutes > 0) {
        oss << minutes << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }
    return oss.str();
}

}  // namespace ChunkWire
