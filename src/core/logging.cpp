// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"
#include "core/thread.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace core {

namespace {

struct CategoryName {
    LogCategory      cat;
    std::string_view name;
};

constexpr CategoryName CATEGORY_NAMES[] = {
    {LogCategory::SOURCE,  "SOURCE"},
    {LogCategory::PUBLISH, "PUBLISH"},
    {LogCategory::GAS,     "GAS"},
    {LogCategory::FEES,    "FEES"},
    {LogCategory::RPC,     "RPC"},
    {LogCategory::HTTP,    "HTTP"},
    {LogCategory::TX,      "TX"},
    {LogCategory::CONFIG,  "CONFIG"},
    {LogCategory::LOCK,    "LOCK"},
};

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Name conversions
// ---------------------------------------------------------------------------
std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

std::string_view log_category_string(LogCategory cat) noexcept {
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";
    if (bits == static_cast<uint32_t>(LogCategory::ALL)) return "ALL";

    uint32_t lowest = bits & (~bits + 1u);
    for (const auto& entry : CATEGORY_NAMES) {
        if (static_cast<uint32_t>(entry.cat) == lowest) return entry.name;
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower = to_lower(name);
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERR;
    if (lower == "fatal") return LogLevel::FATAL;
    if (lower == "off" || lower == "none") return LogLevel::OFF;
    return std::nullopt;
}

std::optional<LogCategory> parse_log_category(std::string_view name) {
    std::string lower = to_lower(name);
    if (lower == "all" || lower == "1") return LogCategory::ALL;
    for (const auto& entry : CATEGORY_NAMES) {
        if (to_lower(entry.name) == lower) return entry.cat;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger& Logger::instance() {
    static Logger the_logger;
    return the_logger;
}

Logger::Logger() {
    buffer_.reserve(BUFFER_FLUSH_THRESHOLD * 2);
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_release);
}

void Logger::enable_category(LogCategory cat) {
    enabled_categories_.fetch_or(static_cast<uint32_t>(cat),
                                 std::memory_order_release);
}

void Logger::disable_category(LogCategory cat) {
    enabled_categories_.fetch_and(~static_cast<uint32_t>(cat),
                                  std::memory_order_release);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_acquire));
}

LogCategory Logger::enabled_categories() const noexcept {
    return static_cast<LogCategory>(
        enabled_categories_.load(std::memory_order_acquire));
}

bool Logger::will_log(LogLevel lvl, LogCategory cat) const noexcept {
    if (static_cast<int>(lvl) < level_.load(std::memory_order_acquire)) {
        return false;
    }
    // WARN and above pass regardless of the category mask.
    uint32_t cat_bits = static_cast<uint32_t>(cat);
    if (cat_bits != 0 && static_cast<int>(lvl) < static_cast<int>(LogLevel::WARN)) {
        uint32_t mask = enabled_categories_.load(std::memory_order_acquire);
        if ((mask & cat_bits) == 0) {
            return false;
        }
    }
    return print_to_console_.load(std::memory_order_acquire) ||
           print_to_file_.load(std::memory_order_acquire);
}

void Logger::set_print_to_console(bool enable) {
    print_to_console_.store(enable, std::memory_order_release);
}

void Logger::set_print_to_file(bool enable) {
    print_to_file_.store(enable, std::memory_order_release);
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        if (!buffer_.empty()) {
            file_stream_.write(buffer_.data(),
                               static_cast<std::streamsize>(buffer_.size()));
        }
        file_stream_.close();
    }
    buffer_.clear();

    if (path.empty()) return true;

    file_stream_.open(path, std::ios::out | std::ios::app);
    if (!file_stream_.is_open()) {
        print_to_file_.store(false, std::memory_order_release);
        return false;
    }
    return true;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        if (!buffer_.empty()) {
            file_stream_.write(buffer_.data(),
                               static_cast<std::streamsize>(buffer_.size()));
        }
        file_stream_.flush();
    }
    buffer_.clear();
    std::cerr.flush();
}

void Logger::write(LogLevel lvl, LogCategory cat,
                   std::string_view message) {
    // [2026-02-03 12:00:00.123] [INFO] [PUBLISH] (board2) message
    std::string line;
    line.reserve(80 + message.size());

    line += '[';
    line += format_timestamp();
    line += "] [";
    line += log_level_string(lvl);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    const std::string& thread_name = current_thread_name();
    if (!thread_name.empty()) {
        line += '(';
        line += thread_name;
        line += ") ";
    }
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    write_line_locked(line);

    // Auto-flush on WARN and above so important messages are not lost.
    if (static_cast<int>(lvl) >= static_cast<int>(LogLevel::WARN)) {
        if (file_stream_.is_open()) {
            if (!buffer_.empty()) {
                file_stream_.write(buffer_.data(),
                                   static_cast<std::streamsize>(buffer_.size()));
                buffer_.clear();
            }
            file_stream_.flush();
        }
        std::cerr.flush();
    }
}

void Logger::write_line_locked(std::string_view line) {
    if (print_to_console_.load(std::memory_order_relaxed)) {
        std::cerr.write(line.data(), static_cast<std::streamsize>(line.size()));
    }

    if (print_to_file_.load(std::memory_order_relaxed) &&
        file_stream_.is_open()) {
        buffer_ += line;
        if (buffer_.size() >= BUFFER_FLUSH_THRESHOLD) {
            file_stream_.write(buffer_.data(),
                               static_cast<std::streamsize>(buffer_.size()));
            buffer_.clear();
        }
    }
}

std::string Logger::format_timestamp() {
    using Clock = std::chrono::system_clock;

    auto now = Clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count();
    int millis = static_cast<int>(epoch_ms % 1000);

    std::time_t time_val = Clock::to_time_t(now);
    std::tm tm_buf{};
    gmtime_r(&time_val, &tm_buf);

    char buf[32];
    int n = std::snprintf(
        buf, sizeof(buf),
        "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);

    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace core
