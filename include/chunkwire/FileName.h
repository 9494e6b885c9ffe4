/**
 * @file FileName.h
 * @brief Turning peer-declared file names into safe local names
 */

#pragma once

#include <string>

namespace ChunkWire {

/**
 * @brief Sanitize a peer-provided file name in place
 * @param name Declared name; rewritten to a single safe path component
 * @return false if nothing usable remains (empty, control characters,
 *         only dots, reserved device name, too long)
 *
 * Any directory part is dropped, separators and shell-hostile characters
 * become '_', ".." runs are broken up, and trailing dots and spaces are
 * trimmed.
 */
bool sanitizeFileName(std::string& name);

/**
 * @brief True if @p name is already safe and sanitizeFileName() would leave it unchanged
 */
bool isSafeFileName(const std::string& name);

/**
 * @brief Sanitized @p declared, or @p fallback when it cannot be made safe
 */
std::string safeFileNameOr(const std::string& declared, const std::string& fallback);

}  // namespace ChunkWire
