/**
 * @file HashUtils.h
 * @brief SHA-256 hash computation utilities
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ChunkWire {

/**
 * @class HashUtils
 * @brief SHA-256 hashing for chunk and whole-artifact integrity checks
 *
 * Chunk checksums and whole-file checksums travel on the wire as
 * lower-case hex strings (64 characters), so most callers use the *Hex
 * helpers. The binary helpers are kept for callers that store digests.
 *
 * Thread Safety:
 * - All static methods are thread-safe (no shared state)
 * - IncrementalHash instances must not be shared between threads
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 hash of a file
     * @param filePath Path to the file to hash
     * @param hash Output buffer (must be at least HASH_SIZE bytes)
     * @param errorMsg Output error message if computation fails
     * @return true if successful, false otherwise
     *
     * Streams the file through HASH_READ_BUFFER_SIZE reads, so memory use
     * does not depend on the file size.
     */
    static bool computeFileHash(const std::filesystem::path& filePath,
                                unsigned char* hash,
                                std::string& errorMsg);

    /**
     * @brief Compute SHA-256 hash of a memory buffer
     * @param data Pointer to the data to hash (may be null when size is 0)
     * @param size Size of the data in bytes
     * @return Vector containing the 32-byte hash
     */
    static std::vector<unsigned char> computeBufferHash(const uint8_t* data,
                                                        size_t size);

    /**
     * @brief Compute SHA-256 of a buffer as a 64-character lower-case hex string
     */
    static std::string sha256Hex(const uint8_t* data, size_t size);

    /**
     * @brief Convert binary hash to hexadecimal string
     * @param hash Binary hash (must be HASH_SIZE bytes)
     * @return Lower-case hexadecimal string (64 characters)
     */
    static std::string hashToString(const unsigned char* hash);

    /**
     * @brief Convert hexadecimal string to binary hash
     * @param hexString Hexadecimal string (64 characters, either case)
     * @param hash Output buffer (must be at least HASH_SIZE bytes)
     * @return true if successful, false if invalid hex string
     */
    static bool stringToHash(const std::string& hexString,
                             unsigned char* hash);

    /**
     * @brief Compare two binary hashes in constant time
     */
    static bool compareHashes(const unsigned char* hash1,
                              const unsigned char* hash2);

    /**
     * @brief Compare two hex digests, ignoring case
     * @return false if either string is not a valid SHA-256 hex digest
     */
    static bool compareHex(const std::string& hex1, const std::string& hex2);

    /**
     * @brief Incremental SHA-256 for data that arrives in pieces
     *
     * Used by incremental assembly, where the artifact is never resident
     * in memory as a whole.
     */
    class IncrementalHash {
    public:
        /**
         * @brief Constructor - initializes OpenSSL EVP digest context
         */
        IncrementalHash();

        /**
         * @brief Destructor - cleans up OpenSSL EVP context
         */
        ~IncrementalHash();

        // Prevent copying (context cannot be copied)
        IncrementalHash(const IncrementalHash&) = delete;
        IncrementalHash& operator=(const IncrementalHash&) = delete;

        // Allow moving (transfers ownership of EVP_MD_CTX)
        IncrementalHash(IncrementalHash&& other) noexcept;
        IncrementalHash& operator=(IncrementalHash&& other) noexcept;

        /**
         * @brief Add data to the hash computation
         * @return true if successful
         */
        bool update(const uint8_t* data, size_t size);

        /**
         * @brief Finalize and get the hash result
         * @param hash Output buffer (must be at least HASH_SIZE bytes)
         * @return true if successful
         *
         * After calling finalize(), update() fails until reset().
         */
        bool finalize(unsigned char* hash);

        /**
         * @brief Finalize and return the digest as hex (empty on failure)
         */
        std::string finalizeHex();

        /**
         * @brief Reset the hash context to start a new hash
         * @return true if successful
         */
        bool reset();

    private:
        void* m_ctx;  ///< Opaque pointer to EVP_MD_CTX
        bool m_finalized;
    };
};

}  // namespace ChunkWire
