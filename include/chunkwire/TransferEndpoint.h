/**
 * @file TransferEndpoint.h
 * @brief One side of a channel: a sender, a receiver, and inbound dispatch
 */

#pragma once

#include "ChunkStore.h"
#include "DataChannel.h"
#include "EngineConfig.h"
#include "ReceiverEngine.h"
#include "Scheduler.h"
#include "SenderEngine.h"
#include "TransferTypes.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace ChunkWire {

/**
 * @class TransferEndpoint
 * @brief Binds a SenderEngine and a ReceiverEngine to one DataChannel
 *
 * The host hands every inbound message to onMessage(). It is decoded once
 * and routed by packet type:
 * - INIT, CHUNK, END_OF_STREAM go to the receiver
 * - ACK, BATCH_ACK go to the sender
 * - CANCEL goes to whichever engine owns the transfer
 *
 * Undecodable messages are logged, counted and dropped. An INIT the
 * receiver rejects is answered with CANCEL so the sender stops early.
 */
class TransferEndpoint {
public:
    /**
     * @param channel Outbound channel to the peer
     * @param scheduler Timer source shared by both engines
     * @param config Engine tunables
     * @param events Callbacks for both directions (see ProgressEvent::direction)
     * @param peerId Identity of the peer; chunks are bound to it
     * @param stagingStore Receiver staging store (nullptr = FileChunkStore)
     */
    TransferEndpoint(DataChannel& channel,
                     Scheduler& scheduler,
                     const EngineConfig& config,
                     const TransferEvents& events,
                     std::string peerId = std::string(),
                     std::shared_ptr<ChunkStore> stagingStore = nullptr);

    // Prevent copying
    TransferEndpoint(const TransferEndpoint&) = delete;
    TransferEndpoint& operator=(const TransferEndpoint&) = delete;

    /**
     * @brief Handle one inbound message from the peer
     */
    void onMessage(const uint8_t* data, size_t size);

    /**
     * @brief Convenience wrapper around SenderEngine::startTransfer()
     */
    bool sendFile(const SendRequest& request, std::string& transferIdOut, std::string& errorMsg);

    SenderEngine& sender() { return m_sender; }
    ReceiverEngine& receiver() { return m_receiver; }
    const SenderEngine& sender() const { return m_sender; }
    const ReceiverEngine& receiver() const { return m_receiver; }

    const std::string& peerId() const { return m_peerId; }

    /// Messages dropped as undecodable or rejected
    uint64_t protocolViolations() const { return m_protocolViolations.load(); }

private:
    void rejectInit(const std::string& transferId, const std::string& reason);

    DataChannel& m_channel;
    const std::string m_peerId;
    SenderEngine m_sender;
    ReceiverEngine m_receiver;
    std::atomic<uint64_t> m_protocolViolations{0};
};

}  // namespace ChunkWire
