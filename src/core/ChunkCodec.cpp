/**
 * @file ChunkCodec.cpp
 * @brief Binary framing for chunk and control packets
 */

#include "chunkwire/ChunkCodec.h"

#include <algorithm>

namespace ChunkWire {

namespace {

//=============================================================================
// Big-endian helpers
//=============================================================================

class ByteWriter {
public:
    explicit ByteWriter(size_t reserve = 0) { m_buffer.reserve(reserve); }

    void u8(uint8_t v) { m_buffer.push_back(v); }

    void u16(uint16_t v) {
        m_buffer.push_back(static_cast<uint8_t>(v >> 8));
        m_buffer.push_back(static_cast<uint8_t>(v));
    }

    void u32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            m_buffer.push_back(static_cast<uint8_t>(v >> shift));
        }
    }

    void u64(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            m_buffer.push_back(static_cast<uint8_t>(v >> shift));
        }
    }

    void bytes(const uint8_t* data, size_t size) {
        if (data && size > 0) {
            m_buffer.insert(m_buffer.end(), data, data + size);
        }
    }

    /// [2 len][bytes]; strings longer than 0xFFFF are truncated
    void shortString(const std::string& s) {
        const size_t len = std::min<size_t>(s.size(), 0xFFFF);
        u16(static_cast<uint16_t>(len));
        bytes(reinterpret_cast<const uint8_t*>(s.data()), len);
    }

    std::vector<uint8_t> take() { return std::move(m_buffer); }

private:
    std::vector<uint8_t> m_buffer;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : m_data(data), m_size(size), m_offset(0) {}

    bool u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = m_data[m_offset++];
        return true;
    }

    bool u16(uint16_t& v) {
        if (remaining() < 2) return false;
        v = static_cast<uint16_t>((m_data[m_offset] << 8) | m_data[m_offset + 1]);
        m_offset += 2;
        return true;
    }

    bool u32(uint32_t& v) {
        if (remaining() < 4) return false;
        v = 0;
        for (int i = 0; i < 4; ++i) {
            v = (v << 8) | m_data[m_offset++];
        }
        return true;
    }

    bool u64(uint64_t& v) {
        if (remaining() < 8) return false;
        v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | m_data[m_offset++];
        }
        return true;
    }

    bool bytes(size_t len, const uint8_t*& out) {
        if (remaining() < len) return false;
        out = m_data + m_offset;
        m_offset += len;
        return true;
    }

    bool shortString(std::string& out) {
        uint16_t len = 0;
        const uint8_t* p = nullptr;
        if (!u16(len) || !bytes(len, p)) return false;
        out.assign(reinterpret_cast<const char*>(p), len);
        return true;
    }

    size_t remaining() const { return m_size - m_offset; }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_offset;
};

void writePrefix(ByteWriter& w, PacketType type, const std::string& transferId) {
    w.u8(static_cast<uint8_t>(type));
    w.shortString(transferId);
}

bool isKnownType(uint8_t raw) {
    return raw >= static_cast<uint8_t>(PacketType::CHUNK) &&
           raw <= static_cast<uint8_t>(PacketType::INIT);
}

size_t rangesEncodedSize(size_t rangeCount) {
    return 2 + rangeCount * 8;
}

size_t bitmapEncodedSize(uint32_t first, uint32_t last) {
    const uint64_t span = static_cast<uint64_t>(last) - first + 1;
    return 8 + static_cast<size_t>((span + 7) / 8);
}

}  // namespace

std::string packetTypeToString(PacketType type) {
    switch (type) {
        case PacketType::CHUNK:         return "CHUNK";
        case PacketType::END_OF_STREAM: return "END_OF_STREAM";
        case PacketType::ACK:           return "ACK";
        case PacketType::BATCH_ACK:     return "BATCH_ACK";
        case PacketType::CANCEL:        return "CANCEL";
        case PacketType::INIT:          return "INIT";
        default:                        return "UNKNOWN";
    }
}

const std::string& Packet::transferId() const {
    return std::visit([](const auto& payload) -> const std::string& {
        return payload.transferId;
    }, body);
}

//=============================================================================
// Encoding
//=============================================================================

std::vector<uint8_t> ChunkCodec::encodeChunk(const std::string& transferId,
                                             uint32_t chunkIndex,
                                             const uint8_t* payload,
                                             size_t payloadSize,
                                             const std::string& checksum)
{
    ByteWriter w(chunkHeaderSize(transferId.size(), checksum.size()) + payloadSize);
    writePrefix(w, PacketType::CHUNK, transferId);
    w.u32(chunkIndex);
    w.u32(static_cast<uint32_t>(payloadSize));
    w.shortString(checksum);
    w.bytes(payload, payloadSize);
    return w.take();
}

std::vector<uint8_t> ChunkCodec::encodeEndOfStream(const std::string& transferId)
{
    ByteWriter w(3 + transferId.size());
    writePrefix(w, PacketType::END_OF_STREAM, transferId);
    return w.take();
}

std::vector<uint8_t> ChunkCodec::encodeAck(const std::string& transferId,
                                           uint32_t chunkIndex)
{
    ByteWriter w(7 + transferId.size());
    writePrefix(w, PacketType::ACK, transferId);
    w.u32(chunkIndex);
    return w.take();
}

std::vector<AckRange> ChunkCodec::compressToRanges(const std::vector<uint32_t>& sortedIndices)
{
    std::vector<AckRange> ranges;
    if (sortedIndices.empty()) {
        return ranges;
    }

    AckRange current{sortedIndices.front(), sortedIndices.front()};
    for (size_t i = 1; i < sortedIndices.size(); ++i) {
        const uint32_t index = sortedIndices[i];
        if (index == current.end + 1) {
            current.end = index;
        } else {
            ranges.push_back(current);
            current = AckRange{index, index};
        }
    }
    ranges.push_back(current);
    return ranges;
}

std::vector<uint8_t> ChunkCodec::encodeBatchAck(const std::string& transferId,
                                                std::vector<uint32_t> indices)
{
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    const std::vector<AckRange> ranges = compressToRanges(indices);

    bool useBitmap = false;
    if (ranges.size() > 0xFFFF) {
        // Range count is a u16 on the wire
        useBitmap = true;
    } else if (!indices.empty() && ranges.size() > BATCH_ACK_MAX_RANGES) {
        useBitmap = bitmapEncodedSize(indices.front(), indices.back()) <
                    rangesEncodedSize(ranges.size());
    }

    ByteWriter w(3 + transferId.size() + 5 + 64);
    writePrefix(w, PacketType::BATCH_ACK, transferId);

    if (useBitmap) {
        const uint32_t base = indices.front();
        const size_t byteLen = bitmapEncodedSize(base, indices.back()) - 8;
        std::vector<uint8_t> bitmap(byteLen, 0);
        for (uint32_t index : indices) {
            const uint32_t bit = index - base;
            bitmap[bit / 8] = static_cast<uint8_t>(bitmap[bit / 8] | (1u << (bit % 8)));
        }

        w.u8(static_cast<uint8_t>(BatchAckEncoding::BITMAP));
        w.u32(static_cast<uint32_t>(indices.size()));
        w.u32(base);
        w.u32(static_cast<uint32_t>(bitmap.size()));
        w.bytes(bitmap.data(), bitmap.size());
    } else {
        w.u8(static_cast<uint8_t>(BatchAckEncoding::RANGES));
        w.u32(static_cast<uint32_t>(indices.size()));
        w.u16(static_cast<uint16_t>(ranges.size()));
        for (const AckRange& range : ranges) {
            w.u32(range.start);
            w.u32(range.end);
        }
    }
    return w.take();
}

std::vector<uint8_t> ChunkCodec::encodeCancel(const std::string& transferId,
                                              const std::string& reason)
{
    ByteWriter w(5 + transferId.size() + reason.size());
    writePrefix(w, PacketType::CANCEL, transferId);
    w.shortString(reason);
    return w.take();
}

std::vector<uint8_t> ChunkCodec::encodeInit(const InitPacket& init)
{
    ByteWriter w(3 + init.transferId.size() + 22 +
                 init.checksum.size() + init.fileName.size() + init.mimeType.size());
    writePrefix(w, PacketType::INIT, init.transferId);
    w.u64(init.totalSize);
    w.u32(init.chunkSize);
    w.u32(init.totalChunks);
    w.shortString(init.checksum);
    w.shortString(init.fileName);
    w.shortString(init.mimeType);
    return w.take();
}

std::vector<uint8_t> ChunkCodec::encode(const Packet& packet)
{
    switch (packet.type) {
        case PacketType::CHUNK: {
            const auto& p = std::get<ChunkPacket>(packet.body);
            return encodeChunk(p.transferId, p.chunkIndex, p.payload.data(),
                               p.payload.size(), p.checksum);
        }
        case PacketType::END_OF_STREAM:
            return encodeEndOfStream(std::get<EndOfStreamPacket>(packet.body).transferId);
        case PacketType::ACK: {
            const auto& p = std::get<AckPacket>(packet.body);
            return encodeAck(p.transferId, p.chunkIndex);
        }
        case PacketType::BATCH_ACK: {
            const auto& p = std::get<BatchAckPacket>(packet.body);
            return encodeBatchAck(p.transferId, p.indices);
        }
        case PacketType::CANCEL: {
            const auto& p = std::get<CancelPacket>(packet.body);
            return encodeCancel(p.transferId, p.reason);
        }
        case PacketType::INIT:
            return encodeInit(std::get<InitPacket>(packet.body));
    }
    return {};
}

//=============================================================================
// Decoding
//=============================================================================

bool ChunkCodec::decode(const uint8_t* data, size_t size,
                        Packet& out, std::string& errorMsg)
{
    if (!data || size == 0) {
        errorMsg = "Empty packet";
        return false;
    }

    ByteReader r(data, size);
    uint8_t rawType = 0;
    std::string transferId;
    r.u8(rawType);

    if (!isKnownType(rawType)) {
        errorMsg = "Unknown packet type: " + std::to_string(rawType);
        return false;
    }
    if (!r.shortString(transferId)) {
        errorMsg = "Transfer id length exceeds packet size";
        return false;
    }

    const auto type = static_cast<PacketType>(rawType);
    Packet packet;
    packet.type = type;

    switch (type) {
        case PacketType::CHUNK: {
            ChunkPacket chunk;
            chunk.transferId = std::move(transferId);
            uint32_t payloadLength = 0;
            const uint8_t* payload = nullptr;
            if (!r.u32(chunk.chunkIndex) || !r.u32(payloadLength)) {
                errorMsg = "Truncated chunk header";
                return false;
            }
            if (!r.shortString(chunk.checksum)) {
                errorMsg = "Checksum length exceeds packet size";
                return false;
            }
            if (!r.bytes(payloadLength, payload)) {
                errorMsg = "Payload length " + std::to_string(payloadLength) +
                           " exceeds packet size";
                return false;
            }
            chunk.payload.assign(payload, payload + payloadLength);
            packet.body = std::move(chunk);
            break;
        }

        case PacketType::END_OF_STREAM:
            packet.body = EndOfStreamPacket{std::move(transferId)};
            break;

        case PacketType::ACK: {
            AckPacket ack;
            ack.transferId = std::move(transferId);
            if (!r.u32(ack.chunkIndex)) {
                errorMsg = "Truncated ACK";
                return false;
            }
            packet.body = std::move(ack);
            break;
        }

        case PacketType::BATCH_ACK: {
            BatchAckPacket batch;
            batch.transferId = std::move(transferId);
            uint8_t encoding = 0;
            uint32_t totalAcks = 0;
            if (!r.u8(encoding) || !r.u32(totalAcks)) {
                errorMsg = "Truncated BATCH_ACK header";
                return false;
            }
            if (totalAcks > MAX_BATCH_ACK_INDICES) {
                errorMsg = "BATCH_ACK declares too many indices";
                return false;
            }

            if (encoding == static_cast<uint8_t>(BatchAckEncoding::RANGES)) {
                uint16_t count = 0;
                if (!r.u16(count)) {
                    errorMsg = "Truncated BATCH_ACK range count";
                    return false;
                }
                uint64_t expanded = 0;
                for (uint16_t i = 0; i < count; ++i) {
                    AckRange range;
                    if (!r.u32(range.start) || !r.u32(range.end)) {
                        errorMsg = "Truncated BATCH_ACK range";
                        return false;
                    }
                    if (range.start > range.end) {
                        errorMsg = "BATCH_ACK range start after end";
                        return false;
                    }
                    expanded += static_cast<uint64_t>(range.end) - range.start + 1;
                    if (expanded > totalAcks) {
                        errorMsg = "BATCH_ACK ranges exceed declared count";
                        return false;
                    }
                    for (uint64_t index = range.start; index <= range.end; ++index) {
                        batch.indices.push_back(static_cast<uint32_t>(index));
                    }
                }
            } else if (encoding == static_cast<uint8_t>(BatchAckEncoding::BITMAP)) {
                uint32_t base = 0;
                uint32_t byteLen = 0;
                const uint8_t* bitmap = nullptr;
                if (!r.u32(base) || !r.u32(byteLen) || !r.bytes(byteLen, bitmap)) {
                    errorMsg = "BATCH_ACK bitmap exceeds packet size";
                    return false;
                }
                for (uint64_t bit = 0; bit < static_cast<uint64_t>(byteLen) * 8; ++bit) {
                    if (bitmap[bit / 8] & (1u << (bit % 8))) {
                        const uint64_t index = base + bit;
                        if (index > 0xFFFFFFFFull || batch.indices.size() >= totalAcks) {
                            errorMsg = "BATCH_ACK bitmap exceeds declared count";
                            return false;
                        }
                        batch.indices.push_back(static_cast<uint32_t>(index));
                    }
                }
            } else {
                errorMsg = "Unknown BATCH_ACK encoding: " + std::to_string(encoding);
                return false;
            }

            if (batch.indices.size() != totalAcks) {
                errorMsg = "BATCH_ACK count mismatch";
                return false;
            }
            std::sort(batch.indices.begin(), batch.indices.end());
            batch.indices.erase(std::unique(batch.indices.begin(), batch.indices.end()),
                                batch.indices.end());
            packet.body = std::move(batch);
            break;
        }

        case PacketType::CANCEL: {
            CancelPacket cancel;
            cancel.transferId = std::move(transferId);
            if (!r.shortString(cancel.reason)) {
                errorMsg = "Cancel reason exceeds packet size";
                return false;
            }
            packet.body = std::move(cancel);
            break;
        }

        case PacketType::INIT: {
            InitPacket init;
            init.transferId = std::move(transferId);
            if (!r.u64(init.totalSize) || !r.u32(init.chunkSize) || !r.u32(init.totalChunks)) {
                errorMsg = "Truncated INIT header";
                return false;
            }
            if (!r.shortString(init.checksum) ||
                !r.shortString(init.fileName) ||
                !r.shortString(init.mimeType)) {
                errorMsg = "INIT string field exceeds packet size";
                return false;
            }
            packet.body = std::move(init);
            break;
        }
    }

    if (r.remaining() != 0) {
        errorMsg = "Trailing bytes after " + packetTypeToString(type) + " packet";
        return false;
    }

    out = std::move(packet);
    return true;
}

}  // namespace ChunkWire
