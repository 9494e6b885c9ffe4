/**
 * @file ChecksumValidator.cpp
 * @brief Per-chunk checksum sampling and whole-artifact verification
 */

#include "chunkwire/ChecksumValidator.h"
#include "chunkwire/HashUtils.h"
#include "chunkwire/config.h"

#include <memory>
#include <mutex>
#include <random>

namespace ChunkWire {

bool SamplingPlan::shouldValidate(uint32_t chunkIndex) const {
    if (chunkIndex >= m_totalChunks) {
        return false;
    }
    if (m_validateAll) {
        return true;
    }
    return m_selected[chunkIndex];
}

ChecksumValidator::ChecksumValidator(RandomSource random)
    : m_random(std::move(random))
{
    if (!m_random) {
        auto state = std::make_shared<std::pair<std::mutex, std::mt19937_64>>();
        state->second.seed(std::random_device{}());
        m_random = [state]() {
            std::lock_guard<std::mutex> lock(state->first);
            return std::uniform_real_distribution<double>(0.0, 1.0)(state->second);
        };
    }
}

double ChecksumValidator::samplingRate(uint64_t totalSize) {
    if (totalSize < FULL_VALIDATION_LIMIT) {
        return SAMPLE_RATE_FULL;
    }
    if (totalSize < DECIMATED_VALIDATION_LIMIT) {
        return SAMPLE_RATE_DECIMATED;
    }
    return SAMPLE_RATE_SPARSE;
}

SamplingPlan ChecksumValidator::createPlan(uint64_t totalSize, uint32_t totalChunks) const {
    SamplingPlan plan;
    plan.m_totalChunks = totalChunks;
    plan.m_rate = samplingRate(totalSize);

    if (plan.m_rate >= 1.0 || totalChunks <= 3) {
        plan.m_validateAll = true;
        plan.m_sampledCount = totalChunks;
        return plan;
    }

    plan.m_validateAll = false;
    plan.m_selected.assign(totalChunks, false);

    // Always verified
    plan.m_selected[0] = true;
    plan.m_selected[totalChunks / 2] = true;
    plan.m_selected[totalChunks - 1] = true;

    for (uint32_t i = 0; i < totalChunks; ++i) {
        if (!plan.m_selected[i] && m_random() < plan.m_rate) {
            plan.m_selected[i] = true;
        }
    }

    for (uint32_t i = 0; i < totalChunks; ++i) {
        if (plan.m_selected[i]) {
            ++plan.m_sampledCount;
        }
    }
    return plan;
}

std::string ChecksumValidator::chunkChecksum(const uint8_t* data, size_t size) {
    return HashUtils::sha256Hex(data, size);
}

bool ChecksumValidator::verifyChunk(const uint8_t* data, size_t size, const std::string& expectedHex) {
    unsigned char expected[HASH_SIZE];
    if (!HashUtils::stringToHash(expectedHex, expected)) {
        return false;
    }
    const std::vector<unsigned char> actual = HashUtils::computeBufferHash(data, size);
    if (actual.size() != HASH_SIZE) {
        return false;
    }
    return HashUtils::compareHashes(actual.data(), expected);
}

bool ChecksumValidator::verifyArtifact(const std::string& actualHex, const std::string& expectedHex) {
    if (expectedHex.empty()) {
        return true;
    }
    return HashUtils::compareHex(actualHex, expectedHex);
}

}  // namespace ChunkWire
