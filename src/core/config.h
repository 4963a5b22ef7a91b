#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_DATADIR        = "datadir";
inline constexpr const char* CONF_NETWORK        = "network";
inline constexpr const char* CONF_REGTEST        = "regtest";
inline constexpr const char* CONF_CONF           = "conf";
inline constexpr const char* CONF_LOGLEVEL       = "loglevel";
inline constexpr const char* CONF_DEBUG          = "debug";
inline constexpr const char* CONF_PRINTTOCONSOLE = "printtoconsole";
inline constexpr const char* CONF_MAXREORGDEPTH  = "maxreorgdepth";
inline constexpr const char* CONF_IMPORT         = "import";
inline constexpr const char* CONF_LOGFILE        = "logfile";

inline constexpr const char* DEFAULT_CONF_FILENAME = "tally.conf";

// ---------------------------------------------------------------------------
// Config  --  layered key/value settings
//
// Priority order: command-line args  >  config file  >  set()
// Repeated keys (-debug=chain -debug=diff) accumulate and are visible
// through get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value
    ///   -key         --key         (boolean flag, value = "1")
    /// Positional arguments are logged and ignored.
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style file of `key=value` lines. '#' starts a comment
    /// line; bare words are boolean flags. PARSE_ERROR if the file cannot
    /// be opened, PARSE_BAD_FORMAT (with the line number) for a line with
    /// an empty key. Nothing from a rejected file is kept.
    core::Result<void> parse_file(const std::filesystem::path& path);

    /// Set a key to a single value (replaces any previous values).
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Value as an unsigned decimal. nullopt when the key is absent;
    /// PARSE_BAD_FORMAT when it is present but not a plain number.
    [[nodiscard]] core::Result<std::optional<uint64_t>> get_uint(
        std::string_view key) const;

    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Every value for @p key, CLI values first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    /// Path-valued key. An empty value counts as absent.
    [[nodiscard]] std::optional<std::filesystem::path> get_path(
        std::string_view key) const;

    /// Resolved data directory: "datadir" if set, otherwise the platform
    /// default. The regtest network gets its own subdirectory.
    [[nodiscard]] std::filesystem::path data_dir() const;

    /// "main" or "regtest".
    [[nodiscard]] std::string network() const;

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
