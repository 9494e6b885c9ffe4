/**
 * @file HashUtils.cpp
 * @brief SHA-256 hash computation utilities using OpenSSL EVP API
 *
 * Uses the EVP API instead of the deprecated SHA256_* functions
 * for compatibility with OpenSSL 3.0+.
 */

#include "chunkwire/HashUtils.h"

#include <openssl/evp.h>
#include <cctype>
#include <fstream>

namespace ChunkWire {

namespace {

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

//=============================================================================
// Static Methods
//=============================================================================

bool HashUtils::computeFileHash(const std::filesystem::path& filePath,
                                unsigned char* hash,
                                std::string& errorMsg)
{
    if (!hash) {
        errorMsg = "Hash buffer is null";
        return false;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        errorMsg = "Failed to open file: " + filePath.string();
        return false;
    }

    IncrementalHash hasher;
    std::vector<uint8_t> buffer(HASH_READ_BUFFER_SIZE);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytesRead = file.gcount();

        if (bytesRead > 0 &&
            !hasher.update(buffer.data(), static_cast<size_t>(bytesRead))) {
            errorMsg = "Failed to update SHA256 hash";
            return false;
        }
    }

    if (file.bad()) {
        errorMsg = "Error reading file: " + filePath.string();
        return false;
    }

    if (!hasher.finalize(hash)) {
        errorMsg = "Failed to finalize SHA256 hash";
        return false;
    }
    return true;
}

std::vector<unsigned char> HashUtils::computeBufferHash(const uint8_t* data,
                                                        size_t size)
{
    std::vector<unsigned char> hash(HASH_SIZE);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return hash;  // Zeroed hash on error never matches a real digest
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1) {
        if (data && size > 0) {
            EVP_DigestUpdate(ctx, data, size);
        }
        unsigned int hashLen = 0;
        EVP_DigestFinal_ex(ctx, hash.data(), &hashLen);
    }

    EVP_MD_CTX_free(ctx);
    return hash;
}

std::string HashUtils::sha256Hex(const uint8_t* data, size_t size)
{
    const std::vector<unsigned char> hash = computeBufferHash(data, size);
    return hashToString(hash.data());
}

std::string HashUtils::hashToString(const unsigned char* hash)
{
    if (!hash) {
        return "";
    }

    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        out.push_back(kHex[(hash[i] >> 4) & 0x0F]);
        out.push_back(kHex[hash[i] & 0x0F]);
    }
    return out;
}

bool HashUtils::stringToHash(const std::string& hexString,
                             unsigned char* hash)
{
    if (!hash || hexString.length() != HASH_SIZE * 2) {
        return false;
    }

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        const int hi = hexNibble(hexString[i * 2]);
        const int lo = hexNibble(hexString[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        hash[i] = static_cast<unsigned char>((hi << 4) | lo);
    }

    return true;
}

/**
 * Uses constant-time comparison so digest checks do not leak how many
 * leading bytes matched.
 */
bool HashUtils::compareHashes(const unsigned char* hash1,
                              const unsigned char* hash2)
{
    if (!hash1 || !hash2) {
        return false;
    }

    int result = 0;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        result |= hash1[i] ^ hash2[i];
    }
    return result == 0;
}

bool HashUtils::compareHex(const std::string& hex1, const std::string& hex2)
{
    unsigned char a[HASH_SIZE];
    unsigned char b[HASH_SIZE];
    if (!stringToHash(hex1, a) || !stringToHash(hex2, b)) {
        return false;
    }
    return compareHashes(a, b);
}

//=============================================================================
// IncrementalHash Class (using EVP API)
//=============================================================================

HashUtils::IncrementalHash::IncrementalHash()
    : m_ctx(nullptr), m_finalized(false)
{
    m_ctx = EVP_MD_CTX_new();
    reset();
}

HashUtils::IncrementalHash::~IncrementalHash()
{
    if (m_ctx) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        m_ctx = nullptr;
    }
}

HashUtils::IncrementalHash::IncrementalHash(IncrementalHash&& other) noexcept
    : m_ctx(other.m_ctx)
    , m_finalized(other.m_finalized)
{
    other.m_ctx = nullptr;
    other.m_finalized = false;
}

HashUtils::IncrementalHash& HashUtils::IncrementalHash::operator=(IncrementalHash&& other) noexcept {
    if (this != &other) {
        if (m_ctx) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        }

        m_ctx = other.m_ctx;
        m_finalized = other.m_finalized;

        other.m_ctx = nullptr;
        other.m_finalized = false;
    }
    return *this;
}

bool HashUtils::IncrementalHash::update(const uint8_t* data, size_t size)
{
    if (m_finalized || !m_ctx) {
        return false;
    }

    if (!data || size == 0) {
        return true;  // Nothing to update
    }

    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    return EVP_DigestUpdate(ctx, data, size) == 1;
}

bool HashUtils::IncrementalHash::finalize(unsigned char* hash)
{
    if (m_finalized || !hash || !m_ctx) {
        return false;
    }

    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    unsigned int hashLen = 0;
    const bool success = (EVP_DigestFinal_ex(ctx, hash, &hashLen) == 1);
    m_finalized = true;
    return success;
}

std::string HashUtils::IncrementalHash::finalizeHex()
{
    unsigned char hash[HASH_SIZE];
    if (!finalize(hash)) {
        return {};
    }
    return hashToString(hash);
}

bool HashUtils::IncrementalHash::reset()
{
    if (!m_ctx) {
        return false;
    }
    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    const bool success = (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1);
    m_finalized = false;
    return success;
}

}  // namespace ChunkWire
