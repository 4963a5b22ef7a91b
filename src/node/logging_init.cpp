// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/logging_init.h"
#include "node/config.h"

#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>

namespace node {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim_ws(std::string_view sv) {
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

core::LogCategory parse_single_category(std::string_view name) {
    if (iequals(name, "consensus"))  return core::LogCategory::CONSENSUS;
    if (iequals(name, "diff"))       return core::LogCategory::DIFF;
    if (iequals(name, "chain"))      return core::LogCategory::CHAIN;
    if (iequals(name, "validation")) return core::LogCategory::VALIDATION;
    if (iequals(name, "notify"))     return core::LogCategory::NOTIFY;
    if (iequals(name, "storage"))    return core::LogCategory::STORAGE;
    if (iequals(name, "lock"))       return core::LogCategory::LOCK;
    if (iequals(name, "bench"))      return core::LogCategory::BENCH;
    if (iequals(name, "all"))        return core::LogCategory::ALL;
    return core::LogCategory::NONE;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

core::Result<void> init_logging(const NodeConfig& config) {
    auto& logger = core::Logger::instance();

    logger.set_level(config.log_level);
    logger.set_categories(static_cast<core::LogCategory>(config.log_categories));
    logger.set_print_to_console(config.print_to_console);

    const std::filesystem::path log_path = config.log_file_path();
    if (log_path.has_parent_path() &&
        !core::fs::ensure_directory(log_path.parent_path())) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Cannot create data directory " +
            log_path.parent_path().string());
    }

    rotate_log_file(log_path, MAX_LOG_FILE_SIZE);

    logger.set_log_file(log_path);
    logger.set_print_to_file(true);

    LOG_INFO(core::LogCategory::NONE, get_startup_banner(config));

    return core::make_ok();
}

// ---------------------------------------------------------------------------
// rotate_log_file
// ---------------------------------------------------------------------------

bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size) {
    auto size_opt = core::fs::file_size(log_path);
    if (!size_opt.has_value() || *size_opt < max_size) {
        return false;
    }

    std::filesystem::path rotated_path =
        log_path.parent_path() / (log_path.filename().string() + ".1");

    std::error_code ec;
    std::filesystem::remove(rotated_path, ec);
    if (ec) {
        LOG_WARN(core::LogCategory::NONE,
                 "Failed to remove old rotated log: " +
                 rotated_path.string() + " (" + ec.message() + ")");
    }

    std::filesystem::rename(log_path, rotated_path, ec);
    if (ec) {
        LOG_WARN(core::LogCategory::NONE,
                 "Failed to rotate log file: " + log_path.string() +
                 " (" + ec.message() + ")");
        return false;
    }

    LOG_INFO(core::LogCategory::NONE,
             "Rotated log file: " + log_path.string() +
             " -> " + rotated_path.string() +
             " (was " + std::to_string(*size_opt / (1024 * 1024)) + " MB)");
    return true;
}

// ---------------------------------------------------------------------------
// get_startup_banner
// ---------------------------------------------------------------------------

std::string get_startup_banner(const NodeConfig& config) {
    std::ostringstream ss;

    ss << "\n"
       << "============================================================\n"
       << "  " << get_client_name() << "\n"
       << "  Build: " << __DATE__ << " " << __TIME__ << "\n"
       << "  Compiler: "
#if defined(__clang__)
       << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
       << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
       << "Unknown"
#endif
       << " | C++ " << __cplusplus << "\n"
       << "  Network: " << config.network << "\n"
       << "  Data directory: " << config.datadir.string() << "\n"
       << "  Log level: " << core::log_level_string(config.log_level) << "\n";

    if (!config.import_file.empty()) {
        ss << "  Import: " << config.import_file.string() << "\n";
    }

    ss << "  Started: " << core::format_iso8601(core::get_time()) << "\n"
       << "============================================================\n";

    return ss.str();
}

// ---------------------------------------------------------------------------
// parse_log_categories
// ---------------------------------------------------------------------------

uint32_t parse_log_categories(std::string_view category_str) {
    uint32_t result = 0;

    size_t start = 0;
    while (start < category_str.size()) {
        size_t comma = category_str.find(',', start);
        if (comma == std::string_view::npos) {
            comma = category_str.size();
        }

        std::string_view token =
            trim_ws(category_str.substr(start, comma - start));
        if (!token.empty()) {
            result |= static_cast<uint32_t>(parse_single_category(token));
        }

        start = comma + 1;
    }

    if (result == 0) {
        result = static_cast<uint32_t>(core::LogCategory::ALL);
    }
    return result;
}

} // namespace node
