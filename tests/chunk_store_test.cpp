/**
 * @file chunk_store_test.cpp
 * @brief Behavior shared by the memory and file chunk stores
 *
 * (c) 2026 ChunkWire Project
 * Licensed under MIT License
 */

#include "chunkwire/ChunkStore.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace ChunkWire;

namespace {

std::filesystem::path storeRoot() {
    return std::filesystem::temp_directory_path() / "chunkwire_chunk_store_test";
}

struct StoreFactory {
    const char* name;
    std::function<std::unique_ptr<ChunkStore>()> make;
};

std::ostream& operator<<(std::ostream& os, const StoreFactory& f) {
    return os << f.name;
}

}  // namespace

//=============================================================================
// Test Fixtures
//=============================================================================

class ChunkStoreTest : public ::testing::TestWithParam<StoreFactory> {
protected:
    std::unique_ptr<ChunkStore> store;
    std::string errorMsg;

    void SetUp() override {
        std::error_code ec;
        std::filesystem::remove_all(storeRoot(), ec);
        store = GetParam().make();
    }

    void TearDown() override {
        store.reset();
        std::error_code ec;
        std::filesystem::remove_all(storeRoot(), ec);
    }

    bool putBytes(const std::string& id, uint32_t index, const std::vector<uint8_t>& bytes) {
        return store->put(id, index, bytes.data(), bytes.size(), errorMsg);
    }
};

//=============================================================================
// Shared Behavior
//=============================================================================

TEST_P(ChunkStoreTest, PutThenGetReturnsSameBytes) {
    const std::vector<uint8_t> bytes = {9, 8, 7, 6};
    ASSERT_TRUE(putBytes("xfer_a", 3, bytes)) << errorMsg;

    std::vector<uint8_t> out;
    ASSERT_TRUE(store->get("xfer_a", 3, out, errorMsg)) << errorMsg;
    EXPECT_EQ(out, bytes);
    EXPECT_EQ(store->chunkCount("xfer_a"), 1u);
}

TEST_P(ChunkStoreTest, PutReplacesExistingValue) {
    ASSERT_TRUE(putBytes("xfer_a", 0, {1, 1, 1}));
    ASSERT_TRUE(putBytes("xfer_a", 0, {2}));

    std::vector<uint8_t> out;
    ASSERT_TRUE(store->get("xfer_a", 0, out, errorMsg));
    EXPECT_EQ(out, (std::vector<uint8_t>{2}));
    EXPECT_EQ(store->chunkCount("xfer_a"), 1u);
}

TEST_P(ChunkStoreTest, EmptyChunkIsStorable) {
    ASSERT_TRUE(store->put("xfer_a", 0, nullptr, 0, errorMsg)) << errorMsg;

    std::vector<uint8_t> out = {42};
    ASSERT_TRUE(store->get("xfer_a", 0, out, errorMsg)) << errorMsg;
    EXPECT_TRUE(out.empty());
}

TEST_P(ChunkStoreTest, GetMissingChunkFails) {
    std::vector<uint8_t> out;
    EXPECT_FALSE(store->get("xfer_none", 0, out, errorMsg));
    EXPECT_FALSE(errorMsg.empty());

    ASSERT_TRUE(putBytes("xfer_a", 0, {1}));
    EXPECT_FALSE(store->get("xfer_a", 1, out, errorMsg));
}

TEST_P(ChunkStoreTest, EraseRemovesOneChunk) {
    ASSERT_TRUE(putBytes("xfer_a", 0, {1}));
    ASSERT_TRUE(putBytes("xfer_a", 1, {2}));

    ASSERT_TRUE(store->erase("xfer_a", 0, errorMsg)) << errorMsg;
    EXPECT_EQ(store->chunkCount("xfer_a"), 1u);
    EXPECT_FALSE(store->erase("xfer_a", 0, errorMsg));
}

TEST_P(ChunkStoreTest, EraseTransferDropsOnlyThatTransfer) {
    ASSERT_TRUE(putBytes("xfer_a", 0, {1}));
    ASSERT_TRUE(putBytes("xfer_a", 1, {2}));
    ASSERT_TRUE(putBytes("xfer_b", 0, {3}));

    store->eraseTransfer("xfer_a");
    store->eraseTransfer("xfer_never_seen");

    EXPECT_EQ(store->chunkCount("xfer_a"), 0u);
    EXPECT_EQ(store->chunkCount("xfer_b"), 1u);
}

TEST_P(ChunkStoreTest, TransferIdsWithPathCharactersStaySeparate) {
    ASSERT_TRUE(putBytes("../escape", 0, {1}));
    ASSERT_TRUE(putBytes("a/b", 0, {2}));

    std::vector<uint8_t> out;
    ASSERT_TRUE(store->get("../escape", 0, out, errorMsg)) << errorMsg;
    EXPECT_EQ(out, (std::vector<uint8_t>{1}));
    ASSERT_TRUE(store->get("a/b", 0, out, errorMsg)) << errorMsg;
    EXPECT_EQ(out, (std::vector<uint8_t>{2}));
}

INSTANTIATE_TEST_SUITE_P(
    Stores, ChunkStoreTest,
    ::testing::Values(
        StoreFactory{"Memory", [] { return std::unique_ptr<ChunkStore>(new MemoryChunkStore()); }},
        StoreFactory{"File", [] {
            return std::unique_ptr<ChunkStore>(new FileChunkStore(storeRoot()));
        }}),
    [](const ::testing::TestParamInfo<StoreFactory>& info) {
        return std::string(info.param.name);
    });

//=============================================================================
// FileChunkStore Layout
//=============================================================================

TEST(FileChunkStoreTest, ChunksLiveUnderHashedTransferDirectory) {
    const auto root = storeRoot() / "layout";
    FileChunkStore store(root);

    const auto dir = store.transferDir("../../etc");
    EXPECT_EQ(dir.parent_path(), root);
    EXPECT_EQ(dir.filename().string().size(), 32u);
    EXPECT_EQ(store.chunkPath("../../etc", 5), dir / "5.chunk");

    std::string errorMsg;
    const uint8_t byte = 1;
    ASSERT_TRUE(store.put("../../etc", 5, &byte, 1, errorMsg)) << errorMsg;
    EXPECT_TRUE(std::filesystem::exists(dir / "5.chunk"));
    EXPECT_FALSE(std::filesystem::exists(dir / "5.chunk.part"));

    std::error_code ec;
    std::filesystem::remove_all(storeRoot(), ec);
}
