#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBOARD_CORE_LOGGING_H
#define CHAINBOARD_CORE_LOGGING_H

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
    ERR     = 4,
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    SOURCE     = 1u << 0,   // board file polling
    PUBLISH    = 1u << 1,   // publish loop decisions
    GAS        = 1u << 2,   // gas price escalation
    FEES       = 1u << 3,   // fee ledger
    RPC        = 1u << 4,   // JSON-RPC calls
    HTTP       = 1u << 5,   // transport
    TX         = 1u << 6,   // transaction building and receipts
    CONFIG     = 1u << 7,
    LOCK       = 1u << 8,
    ALL        = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the name of the lowest set bit of a category mask.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses "trace", "debug", "info", "warn", "error", "fatal" or "off"
/// (case-insensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Parses a single category name such as "gas" or "fees", or "all".
[[nodiscard]] std::optional<LogCategory> parse_log_category(
    std::string_view name);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Returns the process-wide singleton instance.
    static Logger& instance();

    void set_level(LogLevel level);
    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Fast lockless check: returns true if a message at the given
    /// level and category would actually be written.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Opens (or replaces) the output log file in append mode. An empty
    /// path closes the current file. Returns false if the file could not
    /// be opened.
    bool set_log_file(const std::filesystem::path& path);

    /// Flushes all buffered output to console and file sinks.
    void flush();

    /// Writes one log line. Callers check will_log() first.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123" (UTC)
    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Each macro performs a lockless will_log() check before building the
// message, so disabled paths cost one atomic load.
//
// Usage:
//   LOG_INFO(core::LogCategory::PUBLISH, "published board " + id);
// ---------------------------------------------------------------------------

#define CHAINBOARD_LOG(level, cat, msg)                                   \
    do {                                                                  \
        if (core::Logger::instance().will_log((level), (cat))) {          \
            core::Logger::instance().write((level), (cat),                \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) CHAINBOARD_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) CHAINBOARD_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  CHAINBOARD_LOG(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  CHAINBOARD_LOG(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) CHAINBOARD_LOG(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) CHAINBOARD_LOG(core::LogLevel::FATAL, cat, msg)

#endif // CHAINBOARD_CORE_LOGGING_H
