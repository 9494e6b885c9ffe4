/**
 * @file ChunkCodec.h
 * @brief Binary framing for chunk and control packets
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ChunkWire {

/**
 * @brief Packet types of the ChunkWire wire protocol
 *
 * Every packet starts with [1 byte type][2 bytes idLen][idLen bytes
 * transferId]. All integers are big-endian.
 */
enum class PacketType : uint8_t {
    CHUNK = 0x01,          ///< File data
    END_OF_STREAM = 0x02,  ///< All chunks acknowledged; receiver may assemble
    ACK = 0x03,            ///< One chunk stored
    BATCH_ACK = 0x04,      ///< Several chunks stored
    CANCEL = 0x05,         ///< Peer cancelled the transfer
    INIT = 0x06            ///< Transfer metadata, sent before any chunk
};

/**
 * @brief Get human-readable name of a packet type
 */
std::string packetTypeToString(PacketType type);

//=============================================================================
// Packet Payloads
//=============================================================================

/**
 * @brief CHUNK packet
 *
 * Layout after the common prefix:
 * [4 chunkIndex][4 payloadLength][2 checksumLen][checksum][payload]
 */
struct ChunkPacket {
    std::string transferId;
    uint32_t chunkIndex = 0;
    std::string checksum;            ///< SHA-256 hex of payload, may be empty
    std::vector<uint8_t> payload;
};

/**
 * @brief END_OF_STREAM packet (no body)
 */
struct EndOfStreamPacket {
    std::string transferId;
};

/**
 * @brief ACK packet: [4 chunkIndex]
 */
struct AckPacket {
    std::string transferId;
    uint32_t chunkIndex = 0;
};

/**
 * @brief Encoding used for a BATCH_ACK body
 */
enum class BatchAckEncoding : uint8_t {
    RANGES = 0,  ///< [2 count] then count x ([4 start][4 end]), inclusive
    BITMAP = 1   ///< [4 base][4 byteLen][bytes]; bit i of byte i/8 acks base + i
};

/**
 * @brief BATCH_ACK packet: [1 encoding][4 totalAcks][encoded indices]
 *
 * indices are sorted and unique after decode.
 */
struct BatchAckPacket {
    std::string transferId;
    std::vector<uint32_t> indices;
};

/**
 * @brief CANCEL packet: [2 reasonLen][reason]
 */
struct CancelPacket {
    std::string transferId;
    std::string reason;
};

/**
 * @brief INIT packet
 *
 * [8 totalSize][4 chunkSize][4 totalChunks][2 checksumLen][checksum]
 * [2 nameLen][name][2 mimeLen][mime]
 */
struct InitPacket {
    std::string transferId;
    uint64_t totalSize = 0;
    uint32_t chunkSize = 0;
    uint32_t totalChunks = 0;
    std::string checksum;   ///< Whole-file SHA-256 hex, may be empty
    std::string fileName;
    std::string mimeType;
};

/**
 * @brief Inclusive run of acknowledged chunk indices
 */
struct AckRange {
    uint32_t start = 0;
    uint32_t end = 0;
};

/**
 * @brief A decoded packet: a type tag plus exactly one typed payload
 *
 * Consumers switch on type and read the matching alternative with
 * std::get<...>(body).
 */
struct Packet {
    PacketType type = PacketType::CHUNK;
    std::variant<ChunkPacket, EndOfStreamPacket, AckPacket,
                 BatchAckPacket, CancelPacket, InitPacket> body;

    const std::string& transferId() const;
};

//=============================================================================
// ChunkCodec
//=============================================================================

/**
 * @class ChunkCodec
 * @brief Encodes and decodes ChunkWire packets
 *
 * Decoding never throws: a malformed buffer makes decode() return false
 * with a description in errorMsg. Malformed input is a protocol violation
 * and callers drop it; it is never retried.
 *
 * Rejected on decode:
 * - unknown packet type
 * - any declared length running past the end of the buffer
 * - bytes left over after a complete packet
 * - BATCH_ACK ranges with start > end or a count that disagrees with totalAcks
 */
class ChunkCodec {
public:
    /**
     * @brief Upper bound on indices accepted from one BATCH_ACK
     */
    static constexpr uint32_t MAX_BATCH_ACK_INDICES = 1u << 20;

    static std::vector<uint8_t> encodeChunk(const std::string& transferId,
                                            uint32_t chunkIndex,
                                            const uint8_t* payload,
                                            size_t payloadSize,
                                            const std::string& checksum);

    static std::vector<uint8_t> encodeEndOfStream(const std::string& transferId);

    static std::vector<uint8_t> encodeAck(const std::string& transferId,
                                          uint32_t chunkIndex);

    /**
     * @brief Encode a batch of acknowledgements
     *
     * Indices are sorted and deduplicated first. Ranges are used when the
     * batch compresses to at most BATCH_ACK_MAX_RANGES runs or when ranges
     * are shorter than the bitmap; otherwise the bitmap is used.
     */
    static std::vector<uint8_t> encodeBatchAck(const std::string& transferId,
                                               std::vector<uint32_t> indices);

    static std::vector<uint8_t> encodeCancel(const std::string& transferId,
                                             const std::string& reason);

    static std::vector<uint8_t> encodeInit(const InitPacket& init);

    /**
     * @brief Encode any decoded packet back to bytes
     */
    static std::vector<uint8_t> encode(const Packet& packet);

    /**
     * @brief Decode one message
     * @param data Message bytes
     * @param size Message length
     * @param out Decoded packet (unchanged on failure)
     * @param errorMsg Reason for rejection
     * @return true if the message is a well-formed packet
     */
    static bool decode(const uint8_t* data, size_t size,
                       Packet& out, std::string& errorMsg);

    /**
     * @brief Collapse sorted, unique indices into inclusive runs
     */
    static std::vector<AckRange> compressToRanges(const std::vector<uint32_t>& sortedIndices);

    /**
     * @brief Size of a CHUNK header for the given id and checksum lengths
     */
    static size_t chunkHeaderSize(size_t transferIdLength, size_t checksumLength) {
        return CHUNK_HEADER_FIXED_SIZE + transferIdLength + checksumLength;
    }

private:
    ChunkCodec() = delete;
};

}  // namespace ChunkWire
