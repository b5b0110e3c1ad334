#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SLUICE_CORE_LOGGING_H
#define SLUICE_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    CHANNEL    = 1u << 0,
    PRODUCER   = 1u << 1,
    HANDLER    = 1u << 2,
    PIPELINE   = 1u << 3,
    CONFIG     = 1u << 4,
    IO         = 1u << 5,
    CRYPTO     = 1u << 6,
    THREAD     = 1u << 7,
    ALL        = 0xFFFFFFFF,
};

// Bitwise operators for LogCategory so it can be used as a bitmask.
inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator~(LogCategory a) noexcept {
    return static_cast<LogCategory>(~static_cast<uint32_t>(a));
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the short string name for a single log category bit.
/// If multiple bits are set, returns the name of the lowest set bit.
/// Returns "NONE" when the value is zero.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses a level name ("trace" ... "off", case-insensitive; "err" and
/// "error" both map to ERR).  Returns std::nullopt for unknown names.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Parses a single category name ("channel", "producer", ..., "all",
/// "none"; case-insensitive).  Returns std::nullopt for unknown names.
[[nodiscard]] std::optional<LogCategory> parse_log_category(
    std::string_view name);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Returns the process-wide singleton instance.
    static Logger& instance();

    // -- configuration (all thread-safe) ------------------------------------

    /// Sets the minimum severity level. Messages below this are discarded.
    void set_level(LogLevel level);

    /// Enables logging for the given category (bitwise OR).
    void enable_category(LogCategory cat);

    /// Disables logging for the given category.
    void disable_category(LogCategory cat);

    /// Replaces the enabled category bitmask.
    void set_categories(LogCategory cats);

    /// Returns the current effective log level.
    [[nodiscard]] LogLevel level() const noexcept;

    /// Returns the current enabled category bitmask.
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Fast lockless check: returns true if a message at the given
    /// level and category would actually be written.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    /// Enables or disables writing to stderr / console.
    void set_print_to_console(bool enable);

    /// Enables or disables writing to the log file.
    void set_print_to_file(bool enable);

    /// Opens (or replaces) the output log file. The file is opened in
    /// append mode. An empty path closes the current file.
    void set_log_file(const std::filesystem::path& path);

    /// Flushes all buffered output to console and file sinks.
    void flush();

    // -- logging entry point ------------------------------------------------

    /// Writes one log line tagged with the calling thread's name. The
    /// caller is responsible for performing the will_log() check
    /// beforehand to avoid unnecessary formatting work.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    // Non-copyable, non-movable.
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// Formats a timestamp string:  "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Formats and writes one complete log line to all active sinks.
    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);

    // -- atomic state for lockless will_log() checks -----------------------
    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    // -- guarded state for I/O ---------------------------------------------
    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::filesystem::path log_file_path_;

    // -- internal write buffer (reduces small write syscalls) ---------------
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Each macro performs a lockless will_log() check before doing any string
// formatting, so disabled paths have near-zero overhead.
//
// Usage:
//   LOG_DEBUG(core::LogCategory::PRODUCER, "stage started: " + name);
//   LOG_WARN(core::LogCategory::CHANNEL, "put on closed error channel");
//
// The message argument can be any expression convertible to std::string.
// ---------------------------------------------------------------------------

#define SLUICE_LOG(level, cat, msg)                                       \
    do {                                                                  \
        if (core::Logger::instance().will_log((level), (cat))) {          \
            core::Logger::instance().write(                               \
                (level), (cat), std::string(msg));                        \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) SLUICE_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) SLUICE_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  SLUICE_LOG(core::LogLevel::INFO,  cat, msg)
#define LOG_WARN(cat, msg)  SLUICE_LOG(core::LogLevel::WARN,  cat, msg)
#define LOG_ERROR(cat, msg) SLUICE_LOG(core::LogLevel::ERR,   cat, msg)
#define LOG_FATAL(cat, msg) SLUICE_LOG(core::LogLevel::FATAL, cat, msg)

#endif // SLUICE_CORE_LOGGING_H
