/**
 * @file integration_test.cpp
 * @brief End-to-end transfers between two TransferEndpoints
 *
 * Two endpoints ("alice" and "bob") are joined by a pair of LoopbackLinks
 * and driven on one ManualScheduler, so every run is deterministic.
 *
 * (c) 2026 ChunkWire Project
 * Licensed under MIT License
 */

#include "LoopbackChannel.h"
#include "chunkwire/ChunkStore.h"
#include "chunkwire/ErrorCodes.h"
#include "chunkwire/HashUtils.h"
#include "chunkwire/TransferEndpoint.h"
#include "chunkwire/config.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace ChunkWire;
using namespace ChunkWire::Testing;

namespace {

constexpr size_t kChunk = MIN_CHUNK_SIZE;

/// Passes every chunk it returns through a tamper function
class TamperingStore : public ChunkStore {
public:
    using Tamper = std::function<void(uint32_t, std::vector<uint8_t>&)>;

    explicit TamperingStore(Tamper tamper) : m_tamper(std::move(tamper)) {}

    bool put(const std::string& id, uint32_t index, const uint8_t* data, size_t size,
             std::string& errorMsg) override {
        return m_inner.put(id, index, data, size, errorMsg);
    }
    bool get(const std::string& id, uint32_t index, std::vector<uint8_t>& out,
             std::string& errorMsg) const override {
        if (!m_inner.get(id, index, out, errorMsg)) {
            return false;
        }
        if (!out.empty()) {
            m_tamper(index, out);
        }
        return true;
    }
    bool erase(const std::string& id, uint32_t index, std::string& errorMsg) override {
        return m_inner.erase(id, index, errorMsg);
    }
    void eraseTransfer(const std::string& id) override { m_inner.eraseTransfer(id); }
    size_t chunkCount(const std::string& id) const override { return m_inner.chunkCount(id); }

private:
    MemoryChunkStore m_inner;
    Tamper m_tamper;
};

/// Counts decodable packets of one type crossing a link
LoopbackLink::Fault countPackets(PacketType type, size_t& counter) {
    return [type, &counter](std::vector<uint8_t>& message) {
        Packet packet;
        std::string errorMsg;
        if (ChunkCodec::decode(message.data(), message.size(), packet, errorMsg) &&
            packet.type == type) {
            ++counter;
        }
        return 1;
    };
}

std::vector<uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

//=============================================================================
// Test Fixtures
//=============================================================================

/**
 * @brief Test fixture joining two endpoints over in-process links
 */
class IntegrationTest : public ::testing::Test {
protected:
    ManualScheduler scheduler;
    LoopbackLink aliceToBob;
    LoopbackLink bobToAlice;
    EventRecorder aliceEvents;
    EventRecorder bobEvents;
    EngineConfig config;
    std::shared_ptr<ChunkStore> bobStaging;
    std::unique_ptr<TransferEndpoint> alice;
    std::unique_ptr<TransferEndpoint> bob;
    std::filesystem::path tempDir;

    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "chunkwire_integration_test";
        std::error_code ec;
        std::filesystem::remove_all(tempDir, ec);
        std::filesystem::create_directories(tempDir);

        config.chunkSize = kChunk;
        config.ackMode = AckMode::IMMEDIATE;
        config.gracePeriodMs = 1000;
        config.stagingDirectory = (tempDir / "staging").string();
        config.outputDirectory = (tempDir / "received").string();
    }

    void TearDown() override {
        alice.reset();
        bob.reset();
        std::error_code ec;
        std::filesystem::remove_all(tempDir, ec);
    }

    void connect() {
        alice.reset(new TransferEndpoint(aliceToBob, scheduler, config, aliceEvents.events(), "bob"));
        bob.reset(new TransferEndpoint(bobToAlice, scheduler, config, bobEvents.events(), "alice",
                                       bobStaging));
        aliceToBob.connect(bob.get());
        bobToAlice.connect(alice.get());
    }

    std::string send(TransferEndpoint& from, const std::vector<uint8_t>& data,
                     const std::string& name = "payload.bin") {
        SendRequest request;
        request.source = std::make_shared<MemoryChunkSource>(data, name);
        std::string id;
        std::string errorMsg;
        EXPECT_TRUE(from.sendFile(request, id, errorMsg)) << errorMsg;
        return id;
    }

    bool pump(const std::function<bool()>& done, int64_t maxMs = 600000) {
        return pumpUntil(scheduler, aliceToBob, bobToAlice, done, maxMs);
    }

    /// One hop each way without advancing time; each hop moves about one window
    void deliverRounds(int rounds) {
        for (int i = 0; i < rounds; ++i) {
            aliceToBob.deliver();
            bobToAlice.deliver();
        }
    }

    /// Artifact bob received for transferId, or nullptr
    std::shared_ptr<const AssembledArtifact> received(const std::string& transferId) {
        for (const auto& ev : bobEvents.complete(TransferDirection::RECEIVE)) {
            if (ev.transferId == transferId) {
                return ev.artifact;
            }
        }
        return nullptr;
    }
};

//=============================================================================
// Round Trips
//=============================================================================

/**
 * @test Sizes around chunk boundaries arrive byte-identical on both sides
 */
TEST_F(IntegrationTest, RoundTripsAcrossChunkBoundaries) {
    connect();

    const size_t sizes[] = {0, 1, kChunk - 1, kChunk, kChunk + 1, 10 * kChunk};
    size_t expectedSends = 0;
    for (size_t size : sizes) {
        SCOPED_TRACE("size " + std::to_string(size));
        const auto data = patternBytes(size, static_cast<uint32_t>(size) + 3);
        const std::string id = send(*alice, data);
        ++expectedSends;

        ASSERT_TRUE(pump([&] {
            return received(id) != nullptr &&
                   aliceEvents.complete(TransferDirection::SEND).size() == expectedSends;
        }));

        const auto artifact = received(id);
        EXPECT_EQ(artifact->data, data);
        EXPECT_EQ(artifact->size, size);
        EXPECT_EQ(artifact->fileName, "payload.bin");
        EXPECT_EQ(artifact->sha256Hex, HashUtils::sha256Hex(data.data(), data.size()));
    }

    EXPECT_TRUE(aliceEvents.errors(TransferDirection::SEND).empty());
    EXPECT_TRUE(bobEvents.errors(TransferDirection::RECEIVE).empty());
    EXPECT_EQ(alice->protocolViolations(), 0u);
    EXPECT_EQ(bob->protocolViolations(), 0u);
}

/**
 * @test A file smaller than one chunk takes a single CHUNK and a single ACK
 */
TEST_F(IntegrationTest, SmallFileTakesOneChunkAndOneAck) {
    connect();
    size_t chunksSent = 0;
    size_t acksSent = 0;
    aliceToBob.fault = countPackets(PacketType::CHUNK, chunksSent);
    bobToAlice.fault = countPackets(PacketType::ACK, acksSent);

    const auto data = patternBytes(100, 21);
    const std::string id = send(*alice, data, "small.txt");
    ASSERT_TRUE(pump([&] {
        return received(id) != nullptr && aliceEvents.completed(TransferDirection::SEND);
    }));

    EXPECT_EQ(chunksSent, 1u);
    EXPECT_EQ(acksSent, 1u);
    EXPECT_EQ(received(id)->data, data);
    EXPECT_EQ(received(id)->fileName, "small.txt");

    SenderStatus status;
    ASSERT_TRUE(alice->sender().getStatus(id, status));
    EXPECT_EQ(status.totalChunks, 1u);
    EXPECT_EQ(status.retransmissions, 0u);
}

/**
 * @test Both endpoints can send to each other at the same time
 */
TEST_F(IntegrationTest, BidirectionalTransfersShareOneLink) {
    connect();
    const auto forAlice = patternBytes(7 * kChunk + 100, 11);
    const auto forBob = patternBytes(12 * kChunk + 1, 12);

    const std::string toBob = send(*alice, forBob, "to-bob.bin");
    const std::string toAlice = send(*bob, forAlice, "to-alice.bin");

    ASSERT_TRUE(pump([&] {
        return bobEvents.completed(TransferDirection::RECEIVE) &&
               aliceEvents.completed(TransferDirection::RECEIVE) &&
               aliceEvents.completed(TransferDirection::SEND) &&
               bobEvents.completed(TransferDirection::SEND);
    }));

    EXPECT_EQ(bobEvents.complete(TransferDirection::RECEIVE)[0].transferId, toBob);
    EXPECT_EQ(bobEvents.complete(TransferDirection::RECEIVE)[0].artifact->data, forBob);
    EXPECT_EQ(aliceEvents.complete(TransferDirection::RECEIVE)[0].transferId, toAlice);
    EXPECT_EQ(aliceEvents.complete(TransferDirection::RECEIVE)[0].artifact->data, forAlice);
}

/**
 * @test Several transfers in flight at once all complete
 */
TEST_F(IntegrationTest, ConcurrentTransfersAllComplete) {
    connect();
    std::vector<std::vector<uint8_t>> payloads;
    std::vector<std::string> ids;
    for (uint32_t i = 0; i < 5; ++i) {
        payloads.push_back(patternBytes((i + 1) * 3 * kChunk + i, 20 + i));
        ids.push_back(send(*alice, payloads.back()));
    }

    ASSERT_TRUE(pump([&] {
        return bobEvents.complete(TransferDirection::RECEIVE).size() == ids.size() &&
               aliceEvents.complete(TransferDirection::SEND).size() == ids.size();
    }));

    for (size_t i = 0; i < ids.size(); ++i) {
        const auto artifact = received(ids[i]);
        ASSERT_TRUE(artifact);
        EXPECT_EQ(artifact->data, payloads[i]);
    }
}

/**
 * @test Large transfers are staged and assembled into the output directory
 */
TEST_F(IntegrationTest, StagedTransferLandsOnDisk) {
    config.stagingThresholdBytes = 4 * kChunk;
    connect();
    const auto data = patternBytes(20 * kChunk + 5, 31);

    const std::string id = send(*alice, data, "photo.jpg");
    ASSERT_TRUE(pump([&] {
        return received(id) != nullptr && aliceEvents.completed(TransferDirection::SEND);
    }));

    const auto artifact = received(id);
    ASSERT_TRUE(artifact->isOnDisk());
    EXPECT_EQ(artifact->filePath, tempDir / "received" / "photo.jpg");
    EXPECT_EQ(readFile(artifact->filePath), data);

    ReceiverStatus status;
    ASSERT_TRUE(bob->receiver().getStatus(id, status));
    EXPECT_TRUE(status.staged);
    FileChunkStore staging(config.resolvedStagingDirectory());
    EXPECT_EQ(staging.chunkCount(id), 0u);
}

/**
 * @test Batched acknowledgements complete a transfer with far fewer messages
 */
TEST_F(IntegrationTest, BatchedAcksCompleteTransfer) {
    config.ackMode = AckMode::BATCHED;
    config.batchAckSize = 8;
    config.batchAckIntervalMs = 100;
    connect();
    const auto data = patternBytes(100 * kChunk, 41);

    const std::string id = send(*alice, data);
    ASSERT_TRUE(pump([&] {
        return received(id) != nullptr && aliceEvents.completed(TransferDirection::SEND);
    }));

    EXPECT_EQ(received(id)->data, data);
    EXPECT_LT(bobToAlice.sentCount(), 50u);
}

/**
 * @test Low watermarks cap how many chunks sit in the link at once
 */
TEST_F(IntegrationTest, BackpressureLimitsQueuedChunks) {
    config.highWatermark = 4 * kChunk;
    config.lowWatermark = kChunk;
    connect();

    size_t maxChunksQueued = 0;
    aliceToBob.reorder = [&maxChunksQueued](std::deque<std::vector<uint8_t>>& queue) {
        size_t chunks = 0;
        for (const auto& message : queue) {
            Packet packet;
            std::string errorMsg;
            if (ChunkCodec::decode(message.data(), message.size(), packet, errorMsg) &&
                packet.type == PacketType::CHUNK) {
                ++chunks;
            }
        }
        maxChunksQueued = std::max(maxChunksQueued, chunks);
    };

    const auto data = patternBytes(200 * kChunk, 51);
    const std::string id = send(*alice, data);
    ASSERT_TRUE(pump([&] {
        return received(id) != nullptr && aliceEvents.completed(TransferDirection::SEND);
    }));

    EXPECT_EQ(received(id)->data, data);
    EXPECT_GT(maxChunksQueued, 0u);
    EXPECT_LE(maxChunksQueued, 6u);
}

//=============================================================================
// Cancellation
//=============================================================================

/**
 * @test A sender cancel mid-flight reaches the receiver and both sides forget it
 */
TEST_F(IntegrationTest, SenderCancelMidFlight) {
    connect();
    const std::string id = send(*alice, patternBytes(200 * kChunk, 61));

    deliverRounds(3);
    ReceiverStatus progress;
    ASSERT_TRUE(bob->receiver().getStatus(id, progress));
    ASSERT_GE(progress.chunksReceived, 8u);

    std::string errorMsg;
    ASSERT_TRUE(alice->sender().cancelTransfer(id, errorMsg)) << errorMsg;
    ASSERT_TRUE(pump([&] { return bobEvents.finished(TransferDirection::RECEIVE); }));

    const auto bobCancelled = bobEvents.cancelled(TransferDirection::RECEIVE);
    ASSERT_EQ(bobCancelled.size(), 1u);
    EXPECT_TRUE(bobCancelled[0].byPeer);
    const auto aliceCancelled = aliceEvents.cancelled(TransferDirection::SEND);
    ASSERT_EQ(aliceCancelled.size(), 1u);
    EXPECT_FALSE(aliceCancelled[0].byPeer);
    EXPECT_TRUE(bobEvents.complete(TransferDirection::RECEIVE).empty());

    pump([] { return false; }, 2000);
    EXPECT_FALSE(alice->sender().hasTransfer(id));
    EXPECT_FALSE(bob->receiver().hasTransfer(id));
}

/**
 * @test A receiver cancel stops the sender
 */
TEST_F(IntegrationTest, ReceiverCancelStopsSender) {
    connect();
    const std::string id = send(*alice, patternBytes(200 * kChunk, 62));

    deliverRounds(3);
    ReceiverStatus progress;
    ASSERT_TRUE(bob->receiver().getStatus(id, progress));
    ASSERT_GE(progress.chunksReceived, 8u);

    std::string errorMsg;
    ASSERT_TRUE(bob->receiver().cancelTransfer(id, errorMsg)) << errorMsg;
    ASSERT_TRUE(pump([&] { return aliceEvents.finished(TransferDirection::SEND); }));

    const auto cancelled = aliceEvents.cancelled(TransferDirection::SEND);
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_TRUE(cancelled[0].byPeer);

    SenderStatus status;
    ASSERT_TRUE(alice->sender().getStatus(id, status));
    EXPECT_EQ(status.state, TransferState::CANCELLED);
    EXPECT_LT(status.chunksAcked, status.totalChunks);
}

//=============================================================================
// Verification Failures
//=============================================================================

/**
 * @test A wrong whole-file checksum fails the receiver and cancels the sender
 */
TEST_F(IntegrationTest, IntegrityFailureCancelsSender) {
    config.ackMode = AckMode::BATCHED;
    connect();

    const auto decoy = patternBytes(64, 99);
    aliceToBob.fault = [&decoy](std::vector<uint8_t>& message) {
        Packet packet;
        std::string errorMsg;
        if (ChunkCodec::decode(message.data(), message.size(), packet, errorMsg) &&
            packet.type == PacketType::INIT) {
            InitPacket init = std::get<InitPacket>(packet.body);
            init.checksum = HashUtils::sha256Hex(decoy.data(), decoy.size());
            message = ChunkCodec::encodeInit(init);
        }
        return 1;
    };

    const std::string id = send(*alice, patternBytes(10 * kChunk, 71));
    ASSERT_TRUE(pump([&] { return aliceEvents.finished(TransferDirection::SEND); }));

    const auto errors = bobEvents.errors(TransferDirection::RECEIVE);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].transferId, id);
    EXPECT_EQ(errors[0].reason, FailureReason::INTEGRITY_CHECK_FAILED);
    EXPECT_EQ(errors[0].code, ErrorCodes::INTEGRITY_CHECK_FAILED);

    const auto cancelled = aliceEvents.cancelled(TransferDirection::SEND);
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_TRUE(cancelled[0].byPeer);
    EXPECT_TRUE(aliceEvents.complete(TransferDirection::SEND).empty());
}

/**
 * @test A staged chunk that rots before assembly fails the whole-file hash
 */
TEST_F(IntegrationTest, CorruptedStagedChunkCancelsSender) {
    config.ackMode = AckMode::BATCHED;
    config.stagingThresholdBytes = 0;
    bobStaging = std::make_shared<TamperingStore>([](uint32_t index, std::vector<uint8_t>& bytes) {
        if (index == 1) {
            bytes[0] ^= 0x01;
        }
    });
    connect();

    const std::string id = send(*alice, patternBytes(10 * kChunk, 73), "rotten.bin");
    ASSERT_TRUE(pump([&] { return aliceEvents.finished(TransferDirection::SEND); }));

    const auto errors = bobEvents.errors(TransferDirection::RECEIVE);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].transferId, id);
    EXPECT_EQ(errors[0].reason, FailureReason::INTEGRITY_CHECK_FAILED);
    EXPECT_EQ(errors[0].code, ErrorCodes::INTEGRITY_CHECK_FAILED);
    EXPECT_TRUE(bobEvents.complete(TransferDirection::RECEIVE).empty());
    EXPECT_FALSE(std::filesystem::exists(tempDir / "received" / "rotten.bin"));

    const auto cancelled = aliceEvents.cancelled(TransferDirection::SEND);
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_TRUE(cancelled[0].byPeer);
}

/**
 * @test An assembled size that disagrees with INIT fails with SIZE_MISMATCH
 */
TEST_F(IntegrationTest, SizeMismatchCancelsSender) {
    config.ackMode = AckMode::BATCHED;
    config.stagingThresholdBytes = 0;
    bobStaging = std::make_shared<TamperingStore>(
        [](uint32_t, std::vector<uint8_t>& bytes) { bytes.pop_back(); });
    connect();

    const std::string id = send(*alice, patternBytes(10 * kChunk, 72), "short.bin");
    ASSERT_TRUE(pump([&] { return aliceEvents.finished(TransferDirection::SEND); }));

    const auto errors = bobEvents.errors(TransferDirection::RECEIVE);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].reason, FailureReason::SIZE_MISMATCH);
    EXPECT_EQ(errors[0].code, ErrorCodes::INTEGRITY_SIZE_MISMATCH);
    EXPECT_FALSE(std::filesystem::exists(tempDir / "received" / "short.bin"));

    const auto cancelled = aliceEvents.cancelled(TransferDirection::SEND);
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_EQ(cancelled[0].transferId, id);
    EXPECT_TRUE(cancelled[0].byPeer);
}

//=============================================================================
// Inbound Dispatch
//=============================================================================

/**
 * @test Undecodable messages are counted and dropped
 */
TEST_F(IntegrationTest, GarbageMessagesAreCounted) {
    connect();
    const uint8_t garbage[] = {0xEE, 0x00, 0x01};
    bob->onMessage(garbage, sizeof(garbage));
    bob->onMessage(garbage, 0);

    EXPECT_EQ(bob->protocolViolations(), 2u);
    EXPECT_EQ(bobToAlice.pending(), 0u);
}

/**
 * @test An INIT the receiver refuses is answered with CANCEL
 */
TEST_F(IntegrationTest, RejectedInitIsAnsweredWithCancel) {
    connect();
    InitPacket init;
    init.transferId = "xfer_bogus";
    init.totalSize = 10 * kChunk;
    init.chunkSize = static_cast<uint32_t>(kChunk);
    init.totalChunks = 3;
    const auto bytes = ChunkCodec::encodeInit(init);

    bob->onMessage(bytes.data(), bytes.size());

    EXPECT_EQ(bob->protocolViolations(), 1u);
    EXPECT_FALSE(bob->receiver().hasTransfer("xfer_bogus"));
    ASSERT_EQ(bobToAlice.pending(), 1u);
    bobToAlice.deliver();
    EXPECT_TRUE(aliceEvents.cancelled(TransferDirection::SEND).empty());
}

/**
 * @test CHUNKs that contradict the declared transfer count as violations
 */
TEST_F(IntegrationTest, ContradictoryChunksAreViolations) {
    connect();
    InitPacket init;
    init.transferId = "xfer_manual";
    init.totalSize = 2 * kChunk;
    init.chunkSize = static_cast<uint32_t>(kChunk);
    init.totalChunks = 2;
    const auto initBytes = ChunkCodec::encodeInit(init);
    bob->onMessage(initBytes.data(), initBytes.size());

    const std::vector<uint8_t> shortPayload(kChunk / 2, 0x5A);
    const auto badLength = ChunkCodec::encodeChunk("xfer_manual", 0, shortPayload.data(),
                                                   shortPayload.size(), "");
    bob->onMessage(badLength.data(), badLength.size());

    const std::vector<uint8_t> payload(kChunk, 0x5A);
    const auto outOfRange = ChunkCodec::encodeChunk("xfer_manual", 7, payload.data(),
                                                    payload.size(), "");
    bob->onMessage(outOfRange.data(), outOfRange.size());

    EXPECT_EQ(bob->protocolViolations(), 2u);
    EXPECT_EQ(bobToAlice.pending(), 0u);
}
