/**
 * @file ChunkStore.cpp
 * @brief Staging storage for received chunks
 */

#include "chunkwire/ChunkStore.h"
#include "chunkwire/AtomicFile.h"
#include "chunkwire/HashUtils.h"

#include <fstream>

namespace ChunkWire {

//=============================================================================
// MemoryChunkStore
//=============================================================================

bool MemoryChunkStore::put(const std::string& transferId, uint32_t chunkIndex,
                           const uint8_t* data, size_t size, std::string& errorMsg)
{
    if (!data && size > 0) {
        errorMsg = "Null chunk data";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_chunks[transferId][chunkIndex].assign(data, data + size);
    return true;
}

bool MemoryChunkStore::get(const std::string& transferId, uint32_t chunkIndex,
                           std::vector<uint8_t>& out, std::string& errorMsg) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto transfer = m_chunks.find(transferId);
    if (transfer == m_chunks.end()) {
        errorMsg = "Unknown transfer: " + transferId;
        return false;
    }
    auto chunk = transfer->second.find(chunkIndex);
    if (chunk == transfer->second.end()) {
        errorMsg = "Chunk " + std::to_string(chunkIndex) + " not stored";
        return false;
    }
    out = chunk->second;
    return true;
}

bool MemoryChunkStore::erase(const std::string& transferId, uint32_t chunkIndex,
                             std::string& errorMsg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto transfer = m_chunks.find(transferId);
    if (transfer == m_chunks.end() || transfer->second.erase(chunkIndex) == 0) {
        errorMsg = "Chunk " + std::to_string(chunkIndex) + " not stored";
        return false;
    }
    if (transfer->second.empty()) {
        m_chunks.erase(transfer);
    }
    return true;
}

void MemoryChunkStore::eraseTransfer(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_chunks.erase(transferId);
}

size_t MemoryChunkStore::chunkCount(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto transfer = m_chunks.find(transferId);
    return transfer == m_chunks.end() ? 0 : transfer->second.size();
}

//=============================================================================
// FileChunkStore
//=============================================================================

FileChunkStore::FileChunkStore(std::filesystem::path rootDir)
    : m_rootDir(std::move(rootDir))
{
}

std::filesystem::path FileChunkStore::transferDir(const std::string& transferId) const {
    const std::string key = HashUtils::sha256Hex(
        reinterpret_cast<const uint8_t*>(transferId.data()), transferId.size());
    return m_rootDir / key.substr(0, 32);
}

std::filesystem::path FileChunkStore::chunkPath(const std::string& transferId,
                                                uint32_t chunkIndex) const {
    return transferDir(transferId) / (std::to_string(chunkIndex) + ".chunk");
}

bool FileChunkStore::put(const std::string& transferId, uint32_t chunkIndex,
                         const uint8_t* data, size_t size, std::string& errorMsg)
{
    std::error_code ec;
    const std::filesystem::path dir = transferDir(transferId);

    std::lock_guard<std::mutex> lock(m_mutex);
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        errorMsg = "Cannot create staging directory: " + ec.message();
        return false;
    }
    return atomicWriteFile(chunkPath(transferId, chunkIndex), data, size, errorMsg);
}

bool FileChunkStore::get(const std::string& transferId, uint32_t chunkIndex,
                         std::vector<uint8_t>& out, std::string& errorMsg) const
{
    const std::filesystem::path path = chunkPath(transferId, chunkIndex);

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    const uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        errorMsg = "Chunk " + std::to_string(chunkIndex) + " not stored";
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        errorMsg = "Failed to open chunk file: " + path.string();
        return false;
    }
    out.resize(static_cast<size_t>(size));
    if (size > 0) {
        in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
        if (static_cast<uint64_t>(in.gcount()) != size) {
            errorMsg = "Short read from chunk file: " + path.string();
            return false;
        }
    }
    return true;
}

bool FileChunkStore::erase(const std::string& transferId, uint32_t chunkIndex,
                           std::string& errorMsg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    if (!std::filesystem::remove(chunkPath(transferId, chunkIndex), ec)) {
        errorMsg = ec ? ec.message() : "Chunk " + std::to_string(chunkIndex) + " not stored";
        return false;
    }
    return true;
}

void FileChunkStore::eraseTransfer(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    std::filesystem::remove_all(transferDir(transferId), ec);
}

size_t FileChunkStore::chunkCount(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    const std::filesystem::path dir = transferDir(transferId);
    if (!std::filesystem::is_directory(dir, ec)) {
        return 0;
    }

    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().extension() == ".chunk") {
            ++count;
        }
    }
    return count;
}

}  // namespace ChunkWire
