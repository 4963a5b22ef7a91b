// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace core {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

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
    switch (static_cast<LogCategory>(lowest)) {
        case LogCategory::CONSENSUS:  return "CONSENSUS";
        case LogCategory::DIFF:       return "DIFF";
        case LogCategory::CHAIN:      return "CHAIN";
        case LogCategory::VALIDATION: return "VALIDATION";
        case LogCategory::NOTIFY:     return "NOTIFY";
        case LogCategory::STORAGE:    return "STORAGE";
        case LogCategory::LOCK:       return "LOCK";
        case LogCategory::BENCH:      return "BENCH";
        default:                      break;
    }
    return "UNKNOWN";
}

LogLevel parse_log_level(std::string_view name) noexcept {
    if (iequals(name, "trace")) return LogLevel::TRACE;
    if (iequals(name, "debug")) return LogLevel::DEBUG;
    if (iequals(name, "info"))  return LogLevel::INFO;
    if (iequals(name, "warn") || iequals(name, "warning")) {
        return LogLevel::WARN;
    }
    if (iequals(name, "error")) return LogLevel::ERR;
    if (iequals(name, "fatal")) return LogLevel::FATAL;
    if (iequals(name, "off"))   return LogLevel::OFF;
    return LogLevel::INFO;
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

void Logger::set_categories(LogCategory mask) {
    enabled_categories_.store(static_cast<uint32_t>(mask),
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
    // NONE always passes the category filter.
    uint32_t cat_bits = static_cast<uint32_t>(cat);
    if (cat_bits != 0 &&
        (enabled_categories_.load(std::memory_order_acquire) & cat_bits) == 0) {
        return false;
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

void Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        drain_buffer_locked();
        file_stream_.close();
    }
    buffer_.clear();

    if (path.empty()) return;

    file_stream_.open(path, std::ios::out | std::ios::app);
    if (!file_stream_.is_open()) {
        print_to_file_.store(false, std::memory_order_release);
        std::cerr << "Logger: failed to open log file: " << path << "\n";
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    drain_buffer_locked();
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cerr.flush();
}

void Logger::write(LogLevel lvl, LogCategory cat, std::string_view message) {
    //   [2026-02-03 12:00:00.123] [INFO] [CHAIN] message here
    std::string line;
    line.reserve(64 + message.size());
    line += '[';
    line += format_timestamp();
    line += "] [";
    line += log_level_string(lvl);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    write_line_locked(line);

    // WARN and above go straight to disk.
    if (static_cast<int>(lvl) >= static_cast<int>(LogLevel::WARN)) {
        drain_buffer_locked();
        if (file_stream_.is_open()) {
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
            drain_buffer_locked();
        }
    }
}

void Logger::drain_buffer_locked() {
    if (buffer_.empty()) return;
    if (file_stream_.is_open()) {
        file_stream_.write(buffer_.data(),
                           static_cast<std::streamsize>(buffer_.size()));
    }
    buffer_.clear();
}

std::string Logger::format_timestamp() {
    using Clock = std::chrono::system_clock;

    auto now = Clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count();
    int millis = static_cast<int>(epoch_ms % 1000);

    std::time_t time_val = Clock::to_time_t(now);
    std::tm tm_buf{};
#if defined(_WIN32) || defined(_WIN64)
    gmtime_s(&tm_buf, &time_val);
#else
    gmtime_r(&time_val, &tm_buf);
#endif

    char buf[32];
    int n = std::snprintf(
        buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);
    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace core
