/**
 * @file Debug.h
 * @brief Debug logging utilities with timestamps
 *
 * (c) 2026 ChunkWire Project
 * Licensed under MIT License
 */

#pragma once

#include "ThreadSafeLog.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

namespace ChunkWire {

// Note: Global mutex for thread-safe logging
// Engines log from caller threads and scheduler threads at the same time.
inline std::mutex g_logMutex;

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time_t);
#else
    localtime_r(&time_t, &tm);
#endif

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

}  // namespace ChunkWire

/**
 * @brief Thread-safe logging macro with timestamp
 *
 * Writes to std::cerr and mirrors the line into ThreadSafeLog when a
 * journal path has been configured.
 */
#define CHUNKWIRE_LOG_LINE(level, msg) \
    do { \
        std::ostringstream chunkwire_log_oss_; \
        chunkwire_log_oss_ << "[" << level << "] " << msg; \
        { \
            std::lock_guard<std::mutex> chunkwire_log_lock_(ChunkWire::g_logMutex); \
            std::cerr << ChunkWire::getTimestamp() << " " << chunkwire_log_oss_.str() << std::endl; \
        } \
        ChunkWire::ThreadSafeLog::log(chunkwire_log_oss_.str()); \
    } while(0)

#define LOG_INFO(msg) CHUNKWIRE_LOG_LINE("INFO", msg)
#define LOG_WARNING(msg) CHUNKWIRE_LOG_LINE("WARNING", msg)
#define LOG_ERROR(msg) CHUNKWIRE_LOG_LINE("ERROR", msg)

// Per-chunk tracing is far too chatty for normal runs
#ifdef CHUNKWIRE_VERBOSE_LOGGING
#define LOG_DEBUG(msg) CHUNKWIRE_LOG_LINE("DEBUG", msg)
#else
#define LOG_DEBUG(msg) do { } while(0)
#endif
