// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/config.h"

#include "core/fs.h"
#include "node/logging_init.h"

#include <iostream>
#include <sstream>
#include <string>

namespace node {

// ---------------------------------------------------------------------------
// Version helpers
// ---------------------------------------------------------------------------

std::string get_version_string() {
    std::ostringstream ss;
    ss << VERSION_MAJOR << '.' << VERSION_MINOR << '.' << VERSION_PATCH;
    if (VERSION_SUFFIX[0] != '\0') {
        ss << '-' << VERSION_SUFFIX;
    }
    return ss.str();
}

std::string get_client_name() {
    return "Tally v" + get_version_string();
}

// ---------------------------------------------------------------------------
// NodeConfig -- derived helpers
// ---------------------------------------------------------------------------

std::filesystem::path NodeConfig::log_file_path() const {
    return datadir / log_file;
}

consensus::ConsensusParams NodeConfig::consensus_params() const {
    const consensus::ConsensusParams* base =
        consensus::ConsensusParams::for_network(network);
    consensus::ConsensusParams params =
        base != nullptr ? *base : consensus::ConsensusParams::main_params();
    if (max_reorg_depth.has_value()) {
        params.max_reorg_depth = *max_reorg_depth;
    }
    return params;
}

// ---------------------------------------------------------------------------
// load_config
// ---------------------------------------------------------------------------

core::Result<core::Config> load_config(int argc, const char* const argv[]) {
    core::Config raw;
    raw.parse_args(argc, argv);

    // -conf overrides the default location of <datadir>/tally.conf.
    std::filesystem::path conf_path;
    bool explicit_conf = false;
    if (auto cf = raw.get_path(core::CONF_CONF)) {
        conf_path = *cf;
        explicit_conf = true;
    } else {
        conf_path = raw.data_dir() / core::DEFAULT_CONF_FILENAME;
    }

    if (core::fs::file_exists(conf_path)) {
        TALLY_TRY_VOID(raw.parse_file(conf_path));
    } else if (explicit_conf) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            "Configuration file not found: " + conf_path.string());
    }

    return raw;
}

// ---------------------------------------------------------------------------
// make_node_config
// ---------------------------------------------------------------------------

core::Result<NodeConfig> make_node_config(const core::Config& raw) {
    NodeConfig config;

    config.network = raw.network();
    if (consensus::ConsensusParams::for_network(config.network) == nullptr) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
            "Unknown network '" + config.network +
            "' (expected main or regtest)");
    }

    config.datadir = raw.data_dir();

    TALLY_TRY_ASSIGN(depth, raw.get_uint(core::CONF_MAXREORGDEPTH));
    if (depth.has_value()) {
        if (*depth == 0) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                "-maxreorgdepth must be a positive integer");
        }
        config.max_reorg_depth = static_cast<consensus::BlockHeight>(*depth);
    }

    if (auto imp = raw.get_path(core::CONF_IMPORT)) {
        config.import_file = *imp;
    }

    config.log_level =
        core::parse_log_level(raw.get_or(core::CONF_LOGLEVEL, "info"));

    // -debug may be repeated and each value may itself be a list.
    auto debug_values = raw.get_list(core::CONF_DEBUG);
    if (!debug_values.empty()) {
        uint32_t mask = 0;
        for (const auto& v : debug_values) {
            mask |= parse_log_categories(v);
        }
        config.log_categories = mask;
        if (!raw.has(core::CONF_LOGLEVEL)) {
            config.log_level = core::LogLevel::DEBUG;
        }
    }

    config.print_to_console =
        raw.get_bool(core::CONF_PRINTTOCONSOLE, config.print_to_console);
    config.log_file = raw.get_or(core::CONF_LOGFILE, config.log_file);

    return config;
}

// ---------------------------------------------------------------------------
// print_usage / print_version
// ---------------------------------------------------------------------------

void print_usage() {
    std::cout
        << get_client_name() << "\n"
        << "\n"
        << "Usage:\n"
        << "  tallyd [options]\n"
        << "\n"
        << "Replays the stored chain, checks every recorded diff against a\n"
        << "fresh regeneration, optionally imports more blocks, and reports\n"
        << "the resulting ledger.\n"
        << "\n"
        << "Options:\n"
        << "  -h, -help, -?             Show this help message and exit\n"
        << "  -version                  Show version information and exit\n"
        << "  -conf=<file>              Configuration file (default: <datadir>/tally.conf)\n"
        << "  -datadir=<dir>            Data directory path (default: platform-specific)\n"
        << "\n"
        << "Chain:\n"
        << "  -network=<main|regtest>   Chain parameters to use (default: main)\n"
        << "  -regtest                  Shorthand for -network=regtest\n"
        << "  -maxreorgdepth=<n>        Deepest reorganization accepted\n"
        << "  -import=<file>            Accept length-prefixed blocks from <file>\n"
        << "\n"
        << "Logging:\n"
        << "  -loglevel=<level>         trace, debug, info, warn, error, fatal, off\n"
        << "  -debug=<cat>[,<cat>...]   consensus, diff, chain, validation, notify,\n"
        << "                            storage, lock, bench, all\n"
        << "  -printtoconsole=<0|1>     Log to stderr (default: 1)\n"
        << "  -logfile=<name>           Log file inside the data directory (default: debug.log)\n";
}

void print_version() {
    std::cout << get_client_name() << "\n"
              << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

} // namespace node
