#include <gtest/gtest.h>
#include "chunkwire/TransferTypes.h"
#include "chunkwire/TransferUtils.h"
#include "chunkwire/UuidGenerator.h"
#include "chunkwire/config.h"

#include <cstdint>
#include <set>
#include <string>

using namespace ChunkWire;

//=============================================================================
// Chunk Math
//=============================================================================

TEST(ChunkMathTest, TotalChunksRoundsUp) {
    EXPECT_EQ(calculateTotalChunks(0, 1024), 0u);
    EXPECT_EQ(calculateTotalChunks(1, 1024), 1u);
    EXPECT_EQ(calculateTotalChunks(1023, 1024), 1u);
    EXPECT_EQ(calculateTotalChunks(1024, 1024), 1u);
    EXPECT_EQ(calculateTotalChunks(1025, 1024), 2u);
    EXPECT_EQ(calculateTotalChunks(10240, 1024), 10u);
    EXPECT_EQ(calculateTotalChunks(100, 0), 0u);
}

TEST(ChunkMathTest, ChunkCountDoesNotWrapOrOverflow) {
    EXPECT_EQ(calculateChunkCount((uint64_t{1} << 32) + 5, 1), (uint64_t{1} << 32) + 5);
    EXPECT_EQ(calculateChunkCount(UINT64_MAX, 1), UINT64_MAX);
    EXPECT_EQ(calculateChunkCount(UINT64_MAX, 2), (UINT64_MAX / 2) + 1);
    EXPECT_EQ(calculateChunkCount(100, 0), 0u);
}

TEST(ChunkMathTest, OnlyLastChunkIsShort) {
    EXPECT_EQ(calculateChunkLength(2500, 0, 1024), 1024u);
    EXPECT_EQ(calculateChunkLength(2500, 1, 1024), 1024u);
    EXPECT_EQ(calculateChunkLength(2500, 2, 1024), 452u);
    EXPECT_EQ(calculateChunkLength(2500, 3, 1024), 0u);
    EXPECT_EQ(calculateChunkOffset(2, 1024), 2048u);
}

TEST(ChunkMathTest, OffsetsDoNotOverflowPast4GB) {
    const uint64_t chunk = 128 * 1024;
    const uint64_t size = 6ULL * 1024 * 1024 * 1024;
    const uint32_t total = calculateTotalChunks(size, chunk);

    EXPECT_EQ(total, 49152u);
    EXPECT_EQ(calculateChunkOffset(total - 1, chunk), size - chunk);
    EXPECT_EQ(calculateChunkLength(size, total - 1, chunk), chunk);
}

//=============================================================================
// Chunk Size Selection
//=============================================================================

TEST(ChunkSizeTest, OptimalSizeFollowsFileSize) {
    EXPECT_EQ(calculateOptimalChunkSize(0), CHUNK_SIZE_SMALL);
    EXPECT_EQ(calculateOptimalChunkSize(SMALL_FILE_LIMIT), CHUNK_SIZE_MEDIUM);
    EXPECT_EQ(calculateOptimalChunkSize(MEDIUM_FILE_LIMIT), CHUNK_SIZE_LARGE);
}

TEST(ChunkSizeTest, ResolvedSizeFitsOneMessage) {
    const size_t idLength = 41;
    const size_t overhead = CHUNK_HEADER_FIXED_SIZE + idLength + HASH_SIZE * 2;

    EXPECT_EQ(resolveChunkSize(0, 5 * 1024 * 1024, idLength, DEFAULT_MAX_MESSAGE_SIZE, true),
              CHUNK_SIZE_SMALL);
    EXPECT_EQ(resolveChunkSize(1024 * 1024, 0, idLength, DEFAULT_MAX_MESSAGE_SIZE, true),
              DEFAULT_MAX_MESSAGE_SIZE - overhead);
    EXPECT_EQ(resolveChunkSize(1024 * 1024, 0, idLength, DEFAULT_MAX_MESSAGE_SIZE, false),
              DEFAULT_MAX_MESSAGE_SIZE - overhead + HASH_SIZE * 2);
}

TEST(ChunkSizeTest, TinyRequestsAreRaisedToMinimum) {
    EXPECT_EQ(resolveChunkSize(100, 0, 10, DEFAULT_MAX_MESSAGE_SIZE, true), MIN_CHUNK_SIZE);
}

TEST(ChunkSizeTest, ReturnsZeroWhenMinimumCannotFit) {
    EXPECT_EQ(resolveChunkSize(0, 0, 10, 1000, false), 0u);
    EXPECT_EQ(resolveChunkSize(0, 0, 10, 10, false), 0u);
}

//=============================================================================
// Speed and ETA
//=============================================================================

TEST(ThroughputTest, SpeedAndEta) {
    EXPECT_DOUBLE_EQ(calculateTransferSpeed(1000, 0, 2000), 500.0);
    EXPECT_DOUBLE_EQ(calculateTransferSpeed(1000, 5, 5), 0.0);

    EXPECT_DOUBLE_EQ(calculateEta(0, 0.0), 0.0);
    EXPECT_LT(calculateEta(100, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(calculateEta(100, 50.0), 2.0);
}

TEST(FormatTest, Bytes) {
    EXPECT_EQ(formatBytes(512), "512 bytes");
    EXPECT_EQ(formatBytes(1536), "1.50 KB");
    EXPECT_EQ(formatBytes(3 * 1024 * 1024 / 2), "1.50 MB");
    EXPECT_EQ(formatBytes(2ULL * 1024 * 1024 * 1024), "2.00 GB");
}

TEST(FormatTest, SpeedClampsNegative) {
    EXPECT_EQ(formatSpeed(2048.0), "2.00 KB/s");
    EXPECT_EQ(formatSpeed(-5.0), "0 bytes/s");
}

TEST(FormatTest, Eta) {
    EXPECT_EQ(formatEta(3725.0), "1h 2m");
    EXPECT_EQ(formatEta(125.0), "2m 5s");
    EXPECT_EQ(formatEta(5.0), "5s");
    EXPECT_EQ(formatEta(0.0), "--");
    EXPECT_EQ(formatEta(-1.0), "--");
}

//=============================================================================
// Identifiers and Reasons
//=============================================================================

TEST(UuidGeneratorTest, GeneratesVersion4Layout) {
    const std::string uuid = UuidGenerator::generate();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
}

TEST(UuidGeneratorTest, PrefixedIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        const std::string id = UuidGenerator::generateTransferId();
        ASSERT_EQ(id.rfind(TRANSFER_ID_PREFIX, 0), 0u);
        EXPECT_EQ(id.size(), std::string(TRANSFER_ID_PREFIX).size() + 36u);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(TransferTypesTest, TerminalStates) {
    EXPECT_TRUE(isTerminalState(TransferState::COMPLETE));
    EXPECT_TRUE(isTerminalState(TransferState::CANCELLED));
    EXPECT_TRUE(isTerminalState(TransferState::FAILED));
    EXPECT_FALSE(isTerminalState(TransferState::PAUSED));
    EXPECT_FALSE(isTerminalState(TransferState::ASSEMBLING));
}

TEST(TransferTypesTest, FailureMessagesSeparateNetworkFromIntegrity) {
    EXPECT_EQ(failureReasonToString(FailureReason::NETWORK_EXHAUSTED).rfind("Network error", 0), 0u);
    EXPECT_EQ(failureReasonToString(FailureReason::TRANSFER_TIMEOUT).rfind("Network error", 0), 0u);
    EXPECT_EQ(failureReasonToString(FailureReason::INTEGRITY_CHECK_FAILED).rfind("Integrity", 0), 0u);
    EXPECT_EQ(failureReasonToString(FailureReason::SIZE_MISMATCH).rfind("Integrity", 0), 0u);
    EXPECT_STRNE(failureReasonCode(FailureReason::SIZE_MISMATCH),
                 failureReasonCode(FailureReason::INTEGRITY_CHECK_FAILED));
}
