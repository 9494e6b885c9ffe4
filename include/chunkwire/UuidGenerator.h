/**
 * @file UuidGenerator.h
 * @brief Random transfer identifiers
 */

#pragma once

#include "config.h"

#include <array>
#include <cstdint>
#include <string>

#include <openssl/rand.h>

namespace ChunkWire {

/**
 * @class UuidGenerator
 * @brief RFC 4122 version 4 UUIDs from OpenSSL's CSPRNG
 *
 * Both methods return an empty string if RAND_bytes fails; callers treat
 * that as a start failure rather than fall back to a weaker source.
 */
class UuidGenerator {
public:
    UuidGenerator() = delete;

    /**
     * @brief xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, lowercase hex
     */
    static std::string generate() {
        std::array<uint8_t, 16> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            return {};
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant 10xx

        static const char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(kHex[bytes[i] >> 4]);
            out.push_back(kHex[bytes[i] & 0x0F]);
        }
        return out;
    }

    /**
     * @brief TRANSFER_ID_PREFIX followed by a fresh UUID
     */
    static std::string generateTransferId() {
        const std::string uuid = generate();
        if (uuid.empty()) {
            return {};
        }
        return std::string(TRANSFER_ID_PREFIX) + uuid;
    }
};

}  // namespace ChunkWire
