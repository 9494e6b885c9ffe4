/**
 * @file ChecksumValidator.h
 * @brief Per-chunk checksum sampling and whole-artifact verification
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ChunkWire {

/**
 * @class SamplingPlan
 * @brief Which chunk indices of one transfer get their checksum verified
 *
 * Decided once when the transfer is initialized so every chunk index has
 * a fixed answer no matter how often it is retransmitted.
 */
class SamplingPlan {
public:
    SamplingPlan() = default;

    bool shouldValidate(uint32_t chunkIndex) const;

    uint32_t totalChunks() const { return m_totalChunks; }
    uint32_t sampledCount() const { return m_sampledCount; }
    double rate() const { return m_rate; }

private:
    friend class ChecksumValidator;

    uint32_t m_totalChunks = 0;
    uint32_t m_sampledCount = 0;
    double m_rate = 1.0;
    bool m_validateAll = true;
    std::vector<bool> m_selected;
};

/**
 * @class ChecksumValidator
 * @brief Adaptive sampling: all chunks below 100 MB, 10% below 1 GB, 1% above
 *
 * The first, middle (totalChunks / 2) and last chunk are always in the
 * plan. The random source is injectable so tests can pin the draw.
 *
 * Thread Safety:
 * - createPlan() is thread-safe when the injected random source is
 * - Static helpers are thread-safe
 */
class ChecksumValidator {
public:
    /// Uniform doubles in [0, 1)
    using RandomSource = std::function<double()>;

    /**
     * @brief Create a validator
     * @param random Random source; empty selects a seeded std::mt19937_64
     */
    explicit ChecksumValidator(RandomSource random = RandomSource());

    /**
     * @brief Sampling rate for a file of totalSize bytes
     */
    static double samplingRate(uint64_t totalSize);

    SamplingPlan createPlan(uint64_t totalSize, uint32_t totalChunks) const;

    /**
     * @brief SHA-256 hex checksum of one chunk payload
     */
    static std::string chunkChecksum(const uint8_t* data, size_t size);

    /**
     * @brief Compare a payload against an expected hex checksum
     * @return false if expectedHex is malformed or does not match
     */
    static bool verifyChunk(const uint8_t* data, size_t size, const std::string& expectedHex);

    /**
     * @brief Final gate: compare the assembled artifact's hash with the
     * sender-declared one (no declaration passes)
     */
    static bool verifyArtifact(const std::string& actualHex, const std::string& expectedHex);

private:
    RandomSource m_random;
};

}  // namespace ChunkWire
