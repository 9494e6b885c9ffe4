/**
 * @file LoopbackChannel.h
 * @brief In-process channels and event capture shared by the engine tests
 *
 * RecordingChannel keeps every outbound message for inspection.
 * LoopbackLink queues messages for a peer TransferEndpoint and delivers
 * them only when the test pumps it, so engine sends never re-enter the
 * peer while a transfer lock is held.
 *
 * (c) 2026 ChunkWire Project
 * Licensed under MIT License
 */

#pragma once

#include "chunkwire/ChunkCodec.h"
#include "chunkwire/DataChannel.h"
#include "chunkwire/Scheduler.h"
#include "chunkwire/TransferEndpoint.h"
#include "chunkwire/TransferTypes.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace ChunkWire {
namespace Testing {

//=============================================================================
// RecordingChannel
//=============================================================================

class RecordingChannel : public DataChannel {
public:
    bool send(const uint8_t* data, size_t size, std::string& errorMsg) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (refuse.load()) {
            errorMsg = "channel closed";
            return false;
        }
        m_messages.emplace_back(data, data + size);
        return true;
    }

    size_t bufferedBytes() const override { return buffered.load(); }
    size_t maxMessageSize() const override { return maxMessage; }

    std::vector<std::vector<uint8_t>> messages() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_messages;
    }

    std::vector<Packet> packets(PacketType type) const {
        std::vector<Packet> out;
        for (const auto& message : messages()) {
            Packet packet;
            std::string errorMsg;
            if (ChunkCodec::decode(message.data(), message.size(), packet, errorMsg) &&
                packet.type == type) {
                out.push_back(std::move(packet));
            }
        }
        return out;
    }

    size_t count(PacketType type) const { return packets(type).size(); }

    /// CHUNK indices in the order they were sent
    std::vector<uint32_t> chunkIndices() const {
        std::vector<uint32_t> out;
        for (const auto& packet : packets(PacketType::CHUNK)) {
            out.push_back(std::get<ChunkPacket>(packet.body).chunkIndex);
        }
        return out;
    }

    /// Every index acknowledged by ACK or BATCH_ACK, in send order
    std::vector<uint32_t> ackedIndices() const {
        std::vector<uint32_t> out;
        for (const auto& message : messages()) {
            Packet packet;
            std::string errorMsg;
            if (!ChunkCodec::decode(message.data(), message.size(), packet, errorMsg)) {
                continue;
            }
            if (packet.type == PacketType::ACK) {
                out.push_back(std::get<AckPacket>(packet.body).chunkIndex);
            } else if (packet.type == PacketType::BATCH_ACK) {
                const auto& indices = std::get<BatchAckPacket>(packet.body).indices;
                out.insert(out.end(), indices.begin(), indices.end());
            }
        }
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_messages.clear();
    }

    std::atomic<bool> refuse{false};
    std::atomic<size_t> buffered{0};
    size_t maxMessage = DEFAULT_MAX_MESSAGE_SIZE;

private:
    mutable std::mutex m_mutex;
    std::vector<std::vector<uint8_t>> m_messages;
};

//=============================================================================
// LoopbackLink
//=============================================================================

/**
 * @brief One direction of an in-process connection
 *
 * The fault hook sees each message just before delivery and returns how
 * many copies to deliver (0 drops it). It may modify the message.
 */
class LoopbackLink : public DataChannel {
public:
    using Fault = std::function<int(std::vector<uint8_t>& message)>;
    using Reorder = std::function<void(std::deque<std::vector<uint8_t>>& queue)>;

    void connect(TransferEndpoint* peer) { m_peer = peer; }

    bool send(const uint8_t* data, size_t size, std::string& errorMsg) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (closed) {
            errorMsg = "link closed";
            return false;
        }
        m_queue.emplace_back(data, data + size);
        m_queuedBytes += size;
        ++m_sent;
        return true;
    }

    size_t bufferedBytes() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queuedBytes;
    }

    /**
     * @brief Deliver everything queued right now
     * @return Number of messages handed to the peer
     */
    size_t deliver() {
        std::deque<std::vector<uint8_t>> batch;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            batch.swap(m_queue);
            m_queuedBytes = 0;
        }
        if (reorder) {
            reorder(batch);
        }

        size_t handed = 0;
        for (auto& message : batch) {
            const int copies = fault ? fault(message) : 1;
            if (copies <= 0) {
                ++m_dropped;
                continue;
            }
            for (int i = 0; i < copies; ++i) {
                if (m_peer) {
                    m_peer->onMessage(message.data(), message.size());
                }
                ++handed;
            }
        }
        return handed;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    uint64_t sentCount() const { return m_sent.load(); }
    uint64_t droppedCount() const { return m_dropped.load(); }

    Fault fault;
    Reorder reorder;
    bool closed = false;

private:
    TransferEndpoint* m_peer = nullptr;

    mutable std::mutex m_mutex;
    std::deque<std::vector<uint8_t>> m_queue;
    size_t m_queuedBytes = 0;
    std::atomic<uint64_t> m_sent{0};
    std::atomic<uint64_t> m_dropped{0};
};

/**
 * @brief Alternate delivery on both links and simulated time until done()
 * @return true if done() became true within maxMs of simulated time
 */
inline bool pumpUntil(ManualScheduler& scheduler,
                      LoopbackLink& forward,
                      LoopbackLink& backward,
                      const std::function<bool()>& done,
                      int64_t maxMs = 600000,
                      int64_t stepMs = 10)
{
    const int64_t deadline = scheduler.nowMs() + maxMs;
    while (true) {
        while (forward.pending() > 0 || backward.pending() > 0) {
            forward.deliver();
            backward.deliver();
        }
        if (done()) {
            return true;
        }
        if (scheduler.nowMs() >= deadline) {
            return false;
        }
        scheduler.advance(stepMs);
    }
}

//=============================================================================
// EventRecorder
//=============================================================================

class EventRecorder {
public:
    TransferEvents events() {
        TransferEvents e;
        e.onProgress = [this](const ProgressEvent& ev) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_progress.push_back(ev);
        };
        e.onComplete = [this](const CompleteEvent& ev) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_complete.push_back(ev);
        };
        e.onError = [this](const ErrorEvent& ev) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_errors.push_back(ev);
        };
        e.onCancelled = [this](const CancelledEvent& ev) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled.push_back(ev);
        };
        return e;
    }

    std::vector<ProgressEvent> progress(TransferDirection direction) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return filter(m_progress, direction);
    }

    std::vector<CompleteEvent> complete(TransferDirection direction) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return filter(m_complete, direction);
    }

    std::vector<ErrorEvent> errors(TransferDirection direction) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return filter(m_errors, direction);
    }

    std::vector<CancelledEvent> cancelled(TransferDirection direction) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return filter(m_cancelled, direction);
    }

    bool completed(TransferDirection direction) const { return !complete(direction).empty(); }

    /// Any terminal event at all in this direction
    bool finished(TransferDirection direction) const {
        return !complete(direction).empty() || !errors(direction).empty() ||
               !cancelled(direction).empty();
    }

private:
    template <typename Event>
    static std::vector<Event> filter(const std::vector<Event>& all, TransferDirection direction) {
        std::vector<Event> out;
        for (const auto& ev : all) {
            if (ev.direction == direction) {
                out.push_back(ev);
            }
        }
        return out;
    }

    mutable std::mutex m_mutex;
    std::vector<ProgressEvent> m_progress;
    std::vector<CompleteEvent> m_complete;
    std::vector<ErrorEvent> m_errors;
    std::vector<CancelledEvent> m_cancelled;
};

/// Deterministic test payload
inline std::vector<uint8_t> patternBytes(size_t size, uint32_t seed = 1) {
    std::vector<uint8_t> data(size);
    uint32_t x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        x = x * 1103515245u + 12345u;
        data[i] = static_cast<uint8_t>(x >> 16);
    }
    return data;
}

}  // namespace Testing
}  // namespace ChunkWire
