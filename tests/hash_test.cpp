/**
 * @file hash_test.cpp
 * @brief Unit tests for SHA-256 hashing functionality
 *
 * Tests HashUtils buffer, file and incremental hashing, hex conversion and
 * constant-time comparison.
 *
 * (c) 2026 ChunkWire Project
 * Licensed under MIT License
 */

#include "chunkwire/HashUtils.h"
#include "chunkwire/config.h"
#include <gtest/gtest.h>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace ChunkWire;

namespace {

const char* const kEmptySha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const char* const kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const char* const kHelloSha256 = "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f";

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

//=============================================================================
// Test Fixtures
//=============================================================================

/**
 * @brief Test fixture for HashUtils tests
 */
class HashUtilsTest : public ::testing::Test {
protected:
    std::filesystem::path tempDir;

    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "chunkwire_hash_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tempDir, ec);
    }

    std::filesystem::path writeFile(const std::string& name, const std::vector<uint8_t>& data) {
        const auto path = tempDir / name;
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        return path;
    }
};

//=============================================================================
// Buffer Hashing
//=============================================================================

/**
 * @test sha256Hex matches published test vectors
 */
TEST_F(HashUtilsTest, Sha256HexMatchesKnownVectors) {
    const auto abc = bytesOf("abc");
    const auto hello = bytesOf("Hello, World!");

    EXPECT_EQ(HashUtils::sha256Hex(nullptr, 0), kEmptySha256);
    EXPECT_EQ(HashUtils::sha256Hex(abc.data(), abc.size()), kAbcSha256);
    EXPECT_EQ(HashUtils::sha256Hex(hello.data(), hello.size()), kHelloSha256);
}

/**
 * @test computeBufferHash returns 32 raw bytes that round-trip through hex
 */
TEST_F(HashUtilsTest, ComputeBufferHashReturns32Bytes) {
    const auto abc = bytesOf("abc");
    const std::vector<unsigned char> hash = HashUtils::computeBufferHash(abc.data(), abc.size());

    ASSERT_EQ(hash.size(), HASH_SIZE);
    EXPECT_EQ(hash[0], 0xba);
    EXPECT_EQ(hash[31], 0xad);
    EXPECT_EQ(HashUtils::hashToString(hash.data()), kAbcSha256);
}

//=============================================================================
// Hex Conversion
//=============================================================================

/**
 * @test hashToString produces lowercase hex, two characters per byte
 */
TEST_F(HashUtilsTest, HashToStringProducesLowercaseHex) {
    unsigned char hash[HASH_SIZE];
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        hash[i] = static_cast<unsigned char>(0xF0 + (i % 16));
    }

    const std::string hex = HashUtils::hashToString(hash);

    EXPECT_EQ(hex.size(), HASH_SIZE * 2);
    EXPECT_EQ(hex.substr(0, 6), "f0f1f2");
    EXPECT_EQ(hex.substr(30, 2), "ff");
}

/**
 * @test stringToHash accepts both cases
 */
TEST_F(HashUtilsTest, StringToHashAcceptsMixedCase) {
    const std::string hex = "FF" + std::string(60, '0') + "aB";

    unsigned char hash[HASH_SIZE];
    ASSERT_TRUE(HashUtils::stringToHash(hex, hash));
    EXPECT_EQ(hash[0], 0xFF);
    EXPECT_EQ(hash[31], 0xAB);
}

/**
 * @test stringToHash rejects wrong length and non-hex characters
 */
TEST_F(HashUtilsTest, StringToHashRejectsMalformedInput) {
    unsigned char hash[HASH_SIZE];

    EXPECT_FALSE(HashUtils::stringToHash("abcd", hash));
    EXPECT_FALSE(HashUtils::stringToHash(std::string(65, '0'), hash));
    EXPECT_FALSE(HashUtils::stringToHash("xy" + std::string(62, '0'), hash));
    EXPECT_FALSE(HashUtils::stringToHash(kAbcSha256, nullptr));
}

//=============================================================================
// Comparison
//=============================================================================

/**
 * @test compareHashes detects a difference in the last byte
 */
TEST_F(HashUtilsTest, CompareHashesDetectsLastByteDifference) {
    unsigned char a[HASH_SIZE];
    unsigned char b[HASH_SIZE];
    std::memset(a, 0x42, HASH_SIZE);
    std::memset(b, 0x42, HASH_SIZE);

    EXPECT_TRUE(HashUtils::compareHashes(a, b));
    b[HASH_SIZE - 1] = 0x43;
    EXPECT_FALSE(HashUtils::compareHashes(a, b));
    EXPECT_FALSE(HashUtils::compareHashes(a, nullptr));
}

/**
 * @test compareHex ignores case and fails on invalid hex
 */
TEST_F(HashUtilsTest, CompareHexIgnoresCase) {
    std::string upper = kAbcSha256;
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    EXPECT_TRUE(HashUtils::compareHex(kAbcSha256, upper));
    EXPECT_FALSE(HashUtils::compareHex(kAbcSha256, kEmptySha256));
    EXPECT_FALSE(HashUtils::compareHex("not hex", "not hex"));
}

//=============================================================================
// Incremental and File Hashing
//=============================================================================

/**
 * @test Feeding data in pieces gives the same digest as hashing it at once
 */
TEST_F(HashUtilsTest, IncrementalHashMatchesOneShot) {
    std::vector<uint8_t> data(100000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>((i * 31) ^ (i >> 8));
    }

    HashUtils::IncrementalHash hasher;
    size_t offset = 0;
    for (size_t piece : {1u, 7u, 4096u, 60000u}) {
        ASSERT_TRUE(hasher.update(data.data() + offset, piece));
        offset += piece;
    }
    ASSERT_TRUE(hasher.update(data.data() + offset, data.size() - offset));

    EXPECT_EQ(hasher.finalizeHex(), HashUtils::sha256Hex(data.data(), data.size()));
}

/**
 * @test An IncrementalHash cannot be updated or finalized twice
 */
TEST_F(HashUtilsTest, IncrementalHashRejectsUseAfterFinalize) {
    const auto abc = bytesOf("abc");
    HashUtils::IncrementalHash hasher;
    ASSERT_TRUE(hasher.update(abc.data(), abc.size()));
    EXPECT_EQ(hasher.finalizeHex(), kAbcSha256);

    EXPECT_FALSE(hasher.update(abc.data(), abc.size()));
    EXPECT_TRUE(hasher.finalizeHex().empty());

    ASSERT_TRUE(hasher.reset());
    EXPECT_EQ(hasher.finalizeHex(), kEmptySha256);
}

/**
 * @test Moving an IncrementalHash carries its state along
 */
TEST_F(HashUtilsTest, IncrementalHashIsMovable) {
    const auto abc = bytesOf("abc");
    HashUtils::IncrementalHash first;
    ASSERT_TRUE(first.update(abc.data(), 1));

    HashUtils::IncrementalHash second(std::move(first));
    ASSERT_TRUE(second.update(abc.data() + 1, 2));
    EXPECT_EQ(second.finalizeHex(), kAbcSha256);
}

/**
 * @test computeFileHash reads the whole file, including one larger than its buffer
 */
TEST_F(HashUtilsTest, ComputeFileHashMatchesBufferHash) {
    std::vector<uint8_t> data(HASH_READ_BUFFER_SIZE + 12345, 0x5A);
    data[0] = 1;
    data.back() = 2;
    const auto path = writeFile("large.bin", data);

    unsigned char hash[HASH_SIZE];
    std::string errorMsg;
    ASSERT_TRUE(HashUtils::computeFileHash(path, hash, errorMsg)) << errorMsg;
    EXPECT_EQ(HashUtils::hashToString(hash), HashUtils::sha256Hex(data.data(), data.size()));
}

/**
 * @test computeFileHash reports a missing file
 */
TEST_F(HashUtilsTest, ComputeFileHashFailsForMissingFile) {
    unsigned char hash[HASH_SIZE];
    std::string errorMsg;
    EXPECT_FALSE(HashUtils::computeFileHash(tempDir / "missing.bin", hash, errorMsg));
    EXPECT_FALSE(errorMsg.empty());
}
