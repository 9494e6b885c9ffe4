/**
 * @file DataChannel.h
 * @brief Minimal channel abstraction the transfer engines write to
 */

#pragma once

#include "config.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ChunkWire {

/**
 * @brief Message-oriented, ordered, unacknowledged outbound channel.
 *
 * The engines only ever need three things from the transport: hand it one
 * whole message, ask how much it still has queued, and know the largest
 * message it accepts. Inbound messages are delivered by the host to
 * TransferEndpoint::onMessage(), so there is no receive method here.
 *
 * send() returning true means the message was queued, not delivered.
 */
class DataChannel {
public:
    virtual ~DataChannel() = default;

    virtual bool send(const uint8_t* data, size_t size, std::string& errorMsg) = 0;

    /// Bytes accepted by send() and not yet put on the wire
    virtual size_t bufferedBytes() const = 0;

    virtual size_t maxMessageSize() const { return DEFAULT_MAX_MESSAGE_SIZE; }

    bool sendMessage(const std::vector<uint8_t>& message, std::string& errorMsg) {
        return send(message.data(), message.size(), errorMsg);
    }
};

}  // namespace ChunkWire
