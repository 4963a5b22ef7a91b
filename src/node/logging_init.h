#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging system initialization for tallyd.
//
// Configures the global Logger singleton based on NodeConfig settings:
//   - Sets the log level threshold.
//   - Restricts output to the configured categories.
//   - Opens datadir/debug.log, rotating it first if it has grown too large.
//   - Prints a startup banner.
// ---------------------------------------------------------------------------

#ifndef TALLY_NODE_LOGGING_INIT_H
#define TALLY_NODE_LOGGING_INIT_H

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace node {

struct NodeConfig;

/// Initialize the logging subsystem based on the node configuration.
///
/// @returns core::make_ok() on success, or STORAGE_ERROR if the data
///          directory cannot be created.
[[nodiscard]] core::Result<void> init_logging(const NodeConfig& config);

// ---------------------------------------------------------------------------
// Log file rotation
// ---------------------------------------------------------------------------

/// Maximum log file size before rotation, in bytes.
inline constexpr uint64_t MAX_LOG_FILE_SIZE = 50 * 1024 * 1024;  // 50 MB

/// Rotate the log file at @p log_path if it is at least @p max_size bytes:
/// debug.log.1 is deleted, debug.log becomes debug.log.1, and the logger
/// starts a fresh debug.log when it next opens the path.
///
/// @returns true if rotation was performed.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

// ---------------------------------------------------------------------------
// Startup banner
// ---------------------------------------------------------------------------

[[nodiscard]] std::string get_startup_banner(const NodeConfig& config);

// ---------------------------------------------------------------------------
// Category helpers
// ---------------------------------------------------------------------------

/// Parse a comma-separated list of category names into a bitmask.
///
/// Recognised names (case-insensitive):
///   consensus, diff, chain, validation, notify, storage, lock, bench,
///   all
///
/// Unknown names are ignored. An empty or entirely unknown list yields ALL.
[[nodiscard]] uint32_t parse_log_categories(std::string_view category_str);

} // namespace node

#endif // TALLY_NODE_LOGGING_INIT_H
