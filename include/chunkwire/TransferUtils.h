/**
 * @file TransferUtils.h
 * @brief Chunk size selection, throughput math and human-readable formatting
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ChunkWire {

/**
 * @brief Pick a chunk size from the file size
 *
 * 32 KB below 10 MB, 64 KB below 100 MB, 128 KB above.
 */
size_t calculateOptimalChunkSize(uint64_t fileSize);

/**
 * @brief Clamp a requested chunk size so a whole CHUNK packet fits in one
 * channel message
 * @param requested Requested payload size (0 selects calculateOptimalChunkSize)
 * @param fileSize Total file size
 * @param transferIdLength Length of the transfer id carried in each header
 * @param maxMessageSize Channel's maximum single-message size
 * @param includeChecksum Whether each chunk carries a SHA-256 hex checksum
 * @return Payload size to use, 0 if not even MIN_CHUNK_SIZE fits
 */
size_t resolveChunkSize(size_t requested,
                        uint64_t fileSize,
                        size_t transferIdLength,
                        size_t maxMessageSize,
                        bool includeChecksum);

/**
 * @brief Average bytes per second between startMs and nowMs (0 if no time passed)
 */
double calculateTransferSpeed(uint64_t bytes, int64_t startMs, int64_t nowMs);

/**
 * @brief Seconds remaining at the given speed, negative when unknown
 */
double calculateEta(uint64_t bytesRemaining, double bytesPerSecond);

/**
 * @brief "1.50 MB" style formatting
 */
std::string formatBytes(uint64_t bytes);

/**
 * @brief "1.50 MB/s" style formatting
 */
std::string formatSpeed(double bytesPerSecond);

/**
 * @brief "1h 2m", "3m 4s", "5s", or "--" when unknown
 */
std::string formatEta(double seconds);

}  // namespace ChunkWire
