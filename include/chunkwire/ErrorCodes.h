/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 *
 * The NET family means "try again", the INT family means "re-source the
 * file": the user action differs, so the families must never be mixed.
 */

#pragma once

namespace ChunkWire {
namespace ErrorCodes {

// Network / delivery (retrying the transfer may help)
inline constexpr const char* NETWORK_RETRIES_EXHAUSTED = "CW-NET-1000";
inline constexpr const char* NETWORK_TRANSFER_TIMEOUT = "CW-NET-1001";
inline constexpr const char* NETWORK_CHANNEL_SEND_FAILED = "CW-NET-1002";

// Integrity (the artifact or its source is bad)
inline constexpr const char* INTEGRITY_CHECK_FAILED = "CW-INT-2000";
inline constexpr const char* INTEGRITY_SIZE_MISMATCH = "CW-INT-2001";

// Local I/O
inline constexpr const char* SOURCE_READ_FAILED = "CW-IO-3000";
inline constexpr const char* STORAGE_FAILED = "CW-IO-3001";

// Protocol / usage
inline constexpr const char* PROTOCOL_VIOLATION = "CW-PROTO-4000";
inline constexpr const char* INVALID_REQUEST = "CW-PROTO-4001";

}  // namespace ErrorCodes
}  // namespace ChunkWire
