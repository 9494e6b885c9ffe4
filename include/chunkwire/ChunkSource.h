/**
 * @file ChunkSource.h
 * @brief Random-access byte sources the sender reads chunks from
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ChunkWire {

/**
 * @class ChunkSource
 * @brief Fixed-size byte source read at arbitrary offsets
 *
 * A read may fail transiently; the sender retries it later. Implementations
 * must be safe to read from several threads.
 */
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual uint64_t size() const = 0;

    /**
     * @brief Read exactly length bytes at offset into out
     * @return false (with errorMsg) on any short or failed read
     */
    virtual bool read(uint64_t offset, size_t length,
                      std::vector<uint8_t>& out, std::string& errorMsg) = 0;

    /// Suggested file name for the receiver (may be empty)
    virtual std::string name() const { return {}; }

    /**
     * @brief Stream the whole source through SHA-256
     * @param hexOut Lower-case hex digest
     * @param errorMsg Error message if a read fails
     * @return true on success
     */
    bool computeSha256(std::string& hexOut, std::string& errorMsg);
};

/**
 * @class MemoryChunkSource
 * @brief Source over an in-memory buffer
 */
class MemoryChunkSource final : public ChunkSource {
public:
    explicit MemoryChunkSource(std::vector<uint8_t> data, std::string name = std::string());

    uint64_t size() const override { return m_data.size(); }
    bool read(uint64_t offset, size_t length,
              std::vector<uint8_t>& out, std::string& errorMsg) override;
    std::string name() const override { return m_name; }

private:
    const std::vector<uint8_t> m_data;
    const std::string m_name;
};

/**
 * @class FileChunkSource
 * @brief Source over a regular file, read with one shared ifstream
 *
 * Usage:
 * @code
 * std::string error;
 * auto source = FileChunkSource::open("video.mp4", error);
 * if (!source) {
 *     LOG_ERROR("Cannot open source: " << error);
 * }
 * @endcode
 */
class FileChunkSource final : public ChunkSource {
public:
    /**
     * @brief Open a file for reading
     * @return nullptr (with errorMsg) if the path is not a readable regular file
     */
    static std::shared_ptr<FileChunkSource> open(const std::filesystem::path& path,
                                                 std::string& errorMsg);

    uint64_t size() const override { return m_size; }
    bool read(uint64_t offset, size_t length,
              std::vector<uint8_t>& out, std::string& errorMsg) override;
    std::string name() const override { return m_path.filename().string(); }

    const std::filesystem::path& path() const { return m_path; }

private:
    FileChunkSource(std::filesystem::path path, uint64_t size);

    const std::filesystem::path m_path;
    const uint64_t m_size;

    std::mutex m_mutex;
    std::ifstream m_stream;
};

}  // namespace ChunkWire
