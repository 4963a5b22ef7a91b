#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// NodeConfig -- typed settings for the tallyd process.
//
// Built from a core::Config that has already seen the command line and, if
// present, <datadir>/tally.conf (or the file named by -conf). Command-line
// values win over file values.
// ---------------------------------------------------------------------------

#ifndef TALLY_NODE_CONFIG_H
#define TALLY_NODE_CONFIG_H

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "consensus/params.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace node {

// ---------------------------------------------------------------------------
// Version constants
// ---------------------------------------------------------------------------

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
inline constexpr const char* VERSION_SUFFIX = "alpha";

/// e.g. "0.1.0-alpha".
std::string get_version_string();

/// e.g. "Tally v0.1.0-alpha".
std::string get_client_name();

// ---------------------------------------------------------------------------
// NodeConfig
// ---------------------------------------------------------------------------

struct NodeConfig {
    // -- Data directory ------------------------------------------------------
    std::filesystem::path datadir;  // network subdirectory already applied

    // -- Chain ---------------------------------------------------------------
    std::string network = "main";

    /// Overrides ConsensusParams::max_reorg_depth when set.
    std::optional<consensus::BlockHeight> max_reorg_depth;

    /// File of length-prefixed encoded blocks to feed through accept_block
    /// after replay. Empty for none.
    std::filesystem::path import_file;

    // -- Logging -------------------------------------------------------------
    core::LogLevel log_level = core::LogLevel::INFO;
    uint32_t log_categories = static_cast<uint32_t>(core::LogCategory::ALL);
    bool print_to_console = true;
    std::string log_file = "debug.log";

    // -- Derived helpers -----------------------------------------------------

    [[nodiscard]] std::filesystem::path log_file_path() const;

    /// Chain constants for `network` with the overrides above applied.
    [[nodiscard]] consensus::ConsensusParams consensus_params() const;
};

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

/// Parse argv, then the configuration file it points at, into a
/// core::Config. A missing default tally.conf is not an error; a missing
/// file named explicitly with -conf is.
[[nodiscard]] core::Result<core::Config> load_config(int argc,
                                                     const char* const argv[]);

/// Resolve and validate the typed settings. Unknown networks and
/// non-positive reorg limits are PARSE_BAD_FORMAT.
[[nodiscard]] core::Result<NodeConfig> make_node_config(
    const core::Config& raw);

/// Print a usage/help message to stdout.
void print_usage();

/// Print version information to stdout.
void print_version();

} // namespace node

#endif // TALLY_NODE_CONFIG_H
