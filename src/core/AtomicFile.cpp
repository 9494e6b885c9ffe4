/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "chunkwire/AtomicFile.h"

#include <fstream>

namespace ChunkWire {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg,
                         bool allowReplace)
{
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::exists(tempPath, ec) || ec) {
        errorMsg = "Temp file does not exist";
        return false;
    }

    if (!allowReplace && std::filesystem::exists(finalPath, ec)) {
        errorMsg = "Final file already exists";
        return false;
    }

    // POSIX rename() replaces an existing target atomically
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        return false;
    }

    return true;
}

bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const uint8_t* data,
                     size_t size,
                     std::string& errorMsg)
{
    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);
    std::error_code ec;

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Failed to open temp file: " + paths.tempPath.string();
            return false;
        }
        if (size > 0) {
            out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        }
        out.flush();
        if (!out) {
            errorMsg = "Failed to write temp file: " + paths.tempPath.string();
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            return false;
        }
    }

    if (!atomicRenameToFinal(paths.tempPath, paths.finalPath, errorMsg, true)) {
        std::filesystem::remove(paths.tempPath, ec);
        return false;
    }
    return true;
}

std::filesystem::path uniqueFilePath(const std::filesystem::path& directory,
                                     const std::string& fileName)
{
    const std::filesystem::path name(fileName);
    const std::string stem = name.stem().string();
    const std::string ext = name.extension().string();

    std::error_code ec;
    std::filesystem::path candidate = directory / name;
    for (int n = 1; std::filesystem::exists(candidate, ec) ||
                    std::filesystem::exists(computeAtomicFilePaths(candidate).tempPath, ec); ++n) {
        candidate = directory / (stem + " (" + std::to_string(n) + ")" + ext);
    }
    return candidate;
}

}  // namespace ChunkWire
