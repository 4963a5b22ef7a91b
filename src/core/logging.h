#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TALLY_CORE_LOGGING_H
#define TALLY_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
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
    CONSENSUS  = 1u << 0,   // block acceptance, fork choice, halts
    DIFF       = 1u << 1,   // individual diff commits (very chatty)
    CHAIN      = 1u << 2,   // best path and reorganizations
    VALIDATION = 1u << 3,   // rejections and DoS detection
    NOTIFY     = 1u << 4,   // subscriber delivery
    STORAGE    = 1u << 5,   // persisted block records
    LOCK       = 1u << 6,
    BENCH      = 1u << 7,
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

inline constexpr LogCategory& operator|=(LogCategory& a,
                                          LogCategory b) noexcept {
    a = a | b;
    return a;
}

/// Short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Short string name for the lowest set bit of @p cat, "NONE" for zero.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parse "trace".."off" (case-insensitive). Unknown names yield INFO.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);

    /// Replace the enabled category mask wholesale.
    void set_categories(LogCategory mask);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Fast lockless check: true if a message at @p level in @p cat
    /// would actually reach a sink.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Open (or replace) the output log file in append mode. An empty
    /// path closes the current file.
    void set_log_file(const std::filesystem::path& path);

    void flush();

    /// Write one formatted line. Callers perform will_log() first.
    void write(LogLevel level, LogCategory cat, std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);
    void drain_buffer_locked();

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
// The will_log() check happens before the message expression is evaluated,
// so disabled paths never build their strings.
//
//   LOG_INFO(core::LogCategory::CHAIN, "new tip " + id.to_hex());
// ---------------------------------------------------------------------------

#define TALLY_LOG_AT(lvl, cat, msg)                                       \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) TALLY_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) TALLY_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  TALLY_LOG_AT(core::LogLevel::INFO,  cat, msg)
#define LOG_WARN(cat, msg)  TALLY_LOG_AT(core::LogLevel::WARN,  cat, msg)
#define LOG_ERROR(cat, msg) TALLY_LOG_AT(core::LogLevel::ERR,   cat, msg)
#define LOG_FATAL(cat, msg) TALLY_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // TALLY_CORE_LOGGING_H
