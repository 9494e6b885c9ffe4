/**
 * @file AtomicFile.h
 * @brief Small helpers for atomic file writes (write temp, then rename).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ChunkWire {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute a temp path next to finalPath for atomic writes.
 *
 * The temp path is derived deterministically from finalPath so callers can
 * clean up partial files on error.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Atomically move tempPath to finalPath using rename semantics.
 *
 * Requirements:
 * - tempPath must exist as a file.
 * - Unless allowReplace is set, finalPath must not already exist.
 */
bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg,
                         bool allowReplace = false);

/**
 * @brief Write a whole buffer to finalPath through its temp path.
 *
 * Readers of finalPath see either the previous content or the complete new
 * content. The temp file is removed on failure.
 */
bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const uint8_t* data,
                     size_t size,
                     std::string& errorMsg);

/**
 * @brief Pick a path in directory for fileName that does not exist yet.
 *
 * "name.ext", then "name (1).ext", "name (2).ext", ...
 */
std::filesystem::path uniqueFilePath(const std::filesystem::path& directory,
                                     const std::string& fileName);

}  // namespace ChunkWire
