/**
 * @file ChunkStore.h
 * @brief Staging storage for received chunks, keyed by (transferId, chunkIndex)
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ChunkWire {

/**
 * @class ChunkStore
 * @brief Key-value byte store for chunks awaiting assembly
 *
 * put() on an existing key replaces the value. All methods report failure
 * as false plus errorMsg and must be thread-safe.
 */
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    virtual bool put(const std::string& transferId, uint32_t chunkIndex,
                     const uint8_t* data, size_t size, std::string& errorMsg) = 0;

    virtual bool get(const std::string& transferId, uint32_t chunkIndex,
                     std::vector<uint8_t>& out, std::string& errorMsg) const = 0;

    virtual bool erase(const std::string& transferId, uint32_t chunkIndex,
                       std::string& errorMsg) = 0;

    /**
     * @brief Drop every chunk of a transfer (missing transfer is not an error)
     */
    virtual void eraseTransfer(const std::string& transferId) = 0;

    virtual size_t chunkCount(const std::string& transferId) const = 0;
};

/**
 * @class MemoryChunkStore
 * @brief Chunks held in process memory
 */
class MemoryChunkStore final : public ChunkStore {
public:
    bool put(const std::string& transferId, uint32_t chunkIndex,
             const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool get(const std::string& transferId, uint32_t chunkIndex,
             std::vector<uint8_t>& out, std::string& errorMsg) const override;
    bool erase(const std::string& transferId, uint32_t chunkIndex,
               std::string& errorMsg) override;
    void eraseTransfer(const std::string& transferId) override;
    size_t chunkCount(const std::string& transferId) const override;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::map<uint32_t, std::vector<uint8_t>>> m_chunks;
};

/**
 * @class FileChunkStore
 * @brief One file per chunk under rootDir/<transfer key>/<index>.chunk
 *
 * The transfer key is a digest of the transfer id, so arbitrary ids map to
 * safe directory names. Every chunk is written to a temp file and renamed
 * into place; a crash never leaves a truncated chunk under its final name.
 */
class FileChunkStore final : public ChunkStore {
public:
    explicit FileChunkStore(std::filesystem::path rootDir);

    bool put(const std::string& transferId, uint32_t chunkIndex,
             const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool get(const std::string& transferId, uint32_t chunkIndex,
             std::vector<uint8_t>& out, std::string& errorMsg) const override;
    bool erase(const std::string& transferId, uint32_t chunkIndex,
               std::string& errorMsg) override;
    void eraseTransfer(const std::string& transferId) override;
    size_t chunkCount(const std::string& transferId) const override;

    const std::filesystem::path& rootDir() const { return m_rootDir; }

    std::filesystem::path transferDir(const std::string& transferId) const;
    std::filesystem::path chunkPath(const std::string& transferId, uint32_t chunkIndex) const;

private:
    const std::filesystem::path m_rootDir;
    mutable std::mutex m_mutex;
};

}  // namespace ChunkWire
