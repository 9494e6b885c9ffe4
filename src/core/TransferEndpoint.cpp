/**
 * @file TransferEndpoint.cpp
 * @brief One side of a channel: a sender, a receiver, and inbound dispatch
 */

#include "chunkwire/TransferEndpoint.h"
#include "chunkwire/ChunkCodec.h"
#include "chunkwire/Debug.h"
#include "chunkwire/ErrorCodes.h"

namespace ChunkWire {

TransferEndpoint::TransferEndpoint(DataChannel& channel,
                                   Scheduler& scheduler,
                                   const EngineConfig& config,
                                   const TransferEvents& events,
                                   std::string peerId,
                                   std::shared_ptr<ChunkStore> stagingStore)
    : m_channel(channel)
    , m_peerId(std::move(peerId))
    , m_sender(channel, scheduler, config, events)
    , m_receiver(channel, scheduler, config, events, std::move(stagingStore))
{
}

bool TransferEndpoint::sendFile(const SendRequest& request,
                                std::string& transferIdOut,
                                std::string& errorMsg)
{
    return m_sender.startTransfer(request, transferIdOut, errorMsg);
}

//=============================================================================
// Inbound dispatch
//=============================================================================

void TransferEndpoint::onMessage(const uint8_t* data, size_t size) {
    Packet packet;
    std::string errorMsg;
    if (!ChunkCodec::decode(data, size, packet, errorMsg)) {
        ++m_protocolViolations;
        LOG_WARNING("[" << ErrorCodes::PROTOCOL_VIOLATION << "] Dropping message from "
                    << (m_peerId.empty() ? "peer" : m_peerId) << ": " << errorMsg);
        return;
    }

    switch (packet.type) {
    case PacketType::INIT: {
        const InitPacket& init = std::get<InitPacket>(packet.body);
        if (!m_receiver.initTransfer(init, m_peerId, errorMsg)) {
            ++m_protocolViolations;
            rejectInit(init.transferId, errorMsg);
        }
        break;
    }
    case PacketType::CHUNK: {
        const ChunkPacket& chunk = std::get<ChunkPacket>(packet.body);
        const ChunkOutcome outcome = m_receiver.onChunk(chunk, m_peerId);
        if (outcome == ChunkOutcome::DROPPED_MISMATCH ||
            outcome == ChunkOutcome::DROPPED_OUT_OF_RANGE ||
            outcome == ChunkOutcome::DROPPED_BAD_LENGTH) {
            ++m_protocolViolations;
        }
        break;
    }
    case PacketType::END_OF_STREAM:
        m_receiver.onEndOfStream(packet.transferId());
        break;
    case PacketType::ACK: {
        const AckPacket& ack = std::get<AckPacket>(packet.body);
        m_sender.ackReceived(ack.transferId, ack.chunkIndex);
        break;
    }
    case PacketType::BATCH_ACK: {
        const BatchAckPacket& batch = std::get<BatchAckPacket>(packet.body);
        m_sender.batchAckReceived(batch.transferId, batch.indices);
        break;
    }
    case PacketType::CANCEL: {
        const CancelPacket& cancel = std::get<CancelPacket>(packet.body);
        if (!m_sender.onPeerCancel(cancel.transferId, cancel.reason) &&
            !m_receiver.onPeerCancel(cancel.transferId, cancel.reason)) {
            LOG_DEBUG("CANCEL for inactive transfer " << cancel.transferId);
        }
        break;
    }
    default:
        ++m_protocolViolations;
        LOG_WARNING("[" << ErrorCodes::PROTOCOL_VIOLATION << "] Unhandled packet type "
                    << packetTypeToString(packet.type));
        break;
    }
}

void TransferEndpoint::rejectInit(const std::string& transferId, const std::string& reason) {
    LOG_WARNING("Rejecting INIT for " << transferId << ": " << reason);
    if (transferId.empty()) {
        return;
    }
    std::string sendError;
    if (!m_channel.sendMessage(ChunkCodec::encodeCancel(transferId, reason), sendError)) {
        LOG_WARNING("CANCEL for " << transferId << " failed: " << sendError);
    }
}

}  // namespace ChunkWire
