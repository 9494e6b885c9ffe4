/**
 * @file ChunkSource.cpp
 * @brief Random-access byte sources the sender reads chunks from
 */

#include "chunkwire/ChunkSource.h"
#include "chunkwire/HashUtils.h"
#include "chunkwire/config.h"

#include <algorithm>

namespace ChunkWire {

//=============================================================================
// ChunkSource
//=============================================================================

bool ChunkSource::computeSha256(std::string& hexOut, std::string& errorMsg) {
    HashUtils::IncrementalHash hasher;
    std::vector<uint8_t> buffer;

    const uint64_t total = size();
    uint64_t offset = 0;
    while (offset < total) {
        const size_t length = static_cast<size_t>(
            std::min<uint64_t>(HASH_READ_BUFFER_SIZE, total - offset));
        if (!read(offset, length, buffer, errorMsg)) {
            return false;
        }
        if (!hasher.update(buffer.data(), buffer.size())) {
            errorMsg = "Hash update failed";
            return false;
        }
        offset += length;
    }

    hexOut = hasher.finalizeHex();
    if (hexOut.empty()) {
        errorMsg = "Hash finalization failed";
        return false;
    }
    return true;
}

//=============================================================================
// MemoryChunkSource
//=============================================================================

MemoryChunkSource::MemoryChunkSource(std::vector<uint8_t> data, std::string name)
    : m_data(std::move(data))
    , m_name(std::move(name))
{
}

bool MemoryChunkSource::read(uint64_t offset, size_t length,
                             std::vector<uint8_t>& out, std::string& errorMsg)
{
    if (offset > m_data.size() || length > m_data.size() - offset) {
        errorMsg = "Read past end of buffer";
        return false;
    }
    const auto begin = m_data.begin() + static_cast<std::ptrdiff_t>(offset);
    out.assign(begin, begin + static_cast<std::ptrdiff_t>(length));
    return true;
}

//=============================================================================
// FileChunkSource
//=============================================================================

FileChunkSource::FileChunkSource(std::filesystem::path path, uint64_t size)
    : m_path(std::move(path))
    , m_size(size)
{
}

std::shared_ptr<FileChunkSource> FileChunkSource::open(const std::filesystem::path& path,
                                                       std::string& errorMsg)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        errorMsg = "Not a regular file: " + path.string();
        return nullptr;
    }

    const uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        errorMsg = "Cannot stat file: " + ec.message();
        return nullptr;
    }

    std::shared_ptr<FileChunkSource> source(new FileChunkSource(path, size));
    source->m_stream.open(path, std::ios::binary);
    if (!source->m_stream.is_open()) {
        errorMsg = "Failed to open file: " + path.string();
        return nullptr;
    }
    return source;
}

bool FileChunkSource::read(uint64_t offset, size_t length,
                           std::vector<uint8_t>& out, std::string& errorMsg)
{
    if (offset > m_size || length > m_size - offset) {
        errorMsg = "Read past end of file";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.clear();
    m_stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!m_stream) {
        errorMsg = "Seek failed in " + m_path.string();
        return false;
    }

    out.resize(length);
    if (length > 0) {
        m_stream.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(length));
        if (static_cast<size_t>(m_stream.gcount()) != length) {
            errorMsg = "Short read from " + m_path.string();
            return false;
        }
    }
    return true;
}

}  // namespace ChunkWire
