/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe file journal for transfer diagnostics
 *
 * (c) 2026 ChunkWire Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace ChunkWire {

/**
 * @brief Thread-safe append-only log file
 *
 * The LOG_* macros in Debug.h mirror every line into this journal once a
 * path has been set, so a transfer that misbehaves in the field leaves a
 * trace behind even when stderr is not captured.
 *
 * Writers include:
 * - caller threads delivering inbound channel messages
 * - the ThreadScheduler worker running retransmission and stall timers
 * - caller threads issuing commands (start/pause/cancel)
 *
 * Note: initialize() should be called before any engine is created.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the journal path
     * @param logPath Path of the file to append to (created on first write)
     *
     * An empty path disables the journal.
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Check whether a journal path has been set
     */
    static bool isEnabled();

    /**
     * @brief Append one timestamped line
     * @param message Message to log
     *
     * Thread-safe: locks the journal mutex before writing.
     * Silently does nothing until initialize() has been called.
     */
    static void log(const std::string& message);

    /**
     * @brief Append one timestamped line
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

private:
    /// Serializes file access across all threads
    static std::mutex s_mutex;

    /// Journal path (empty when disabled)
    static std::filesystem::path s_logPath;
};

} // namespace ChunkWire
