// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/fs.h"
#include "core/logging.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <string>
#include <utility>

namespace core {

// ---------------------------------------------------------------------------
// Helpers (anonymous namespace)
// ---------------------------------------------------------------------------
namespace {

/// Trim leading and trailing whitespace.
std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

/// "-key" and "--key" name the same option.
std::string_view option_name(std::string_view arg) {
    if (arg.starts_with("--")) return arg.substr(2);
    return arg.substr(1);
}

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

/// Parse a string as a boolean. Anything that is neither a recognised true
/// nor a recognised false spelling yields @p default_val.
bool parse_bool(std::string_view sv, bool default_val) {
    if (sv.empty()) return default_val;
    for (std::string_view t : {"1", "true", "yes", "on"}) {
        if (iequals(sv, t)) return true;
    }
    for (std::string_view f : {"0", "false", "no", "off"}) {
        if (iequals(sv, f)) return false;
    }
    return default_val;
}

/// Split "key=value" (or a bare "key", which means "key=1").
std::pair<std::string_view, std::string> split_setting(std::string_view sv) {
    auto eq_pos = sv.find('=');
    if (eq_pos == std::string_view::npos) {
        return {trim(sv), "1"};
    }
    return {trim(sv.substr(0, eq_pos)),
            std::string{trim(sv.substr(eq_pos + 1))}};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Config -- internal helpers
// ---------------------------------------------------------------------------

void Config::insert(ValueMap& target, std::string_view key,
                    std::string value) {
    target[std::string{key}].push_back(std::move(value));
}

const std::vector<std::string>* Config::lookup(std::string_view key) const {
    std::string k{key};

    // Command line first.
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return &it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return &it->second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

void Config::parse_args(int argc, const char* const argv[]) {
    // argv[0] is the program name.
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-")) {
            LOG_WARN(LogCategory::NONE,
                     "Config: ignoring positional argument '" +
                     std::string{arg} + "'");
            continue;
        }

        auto [key, value] = split_setting(option_name(arg));
        if (key.empty()) {
            LOG_WARN(LogCategory::NONE,
                     "Config: ignoring nameless option '" +
                     std::string{arg} + "'");
            continue;
        }
        insert(cli_values_, key, std::move(value));
    }
}

core::Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            "Cannot read configuration file " + path.string());
    }

    // Staged so that a bad line leaves the config untouched.
    ValueMap staged;
    std::string line;
    int line_num = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        std::string_view sv = trim(std::string_view{line});
        if (sv.empty() || sv.front() == '#') continue;

        auto [key, value] = split_setting(sv);
        if (key.empty()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                path.string() + ":" + std::to_string(line_num) +
                ": setting without a key");
        }
        insert(staged, key, std::move(value));
    }

    for (auto& [key, values] : staged) {
        auto& slot = file_values_[key];
        slot.insert(slot.end(),
                    std::make_move_iterator(values.begin()),
                    std::make_move_iterator(values.end()));
    }

    LOG_INFO(LogCategory::NONE,
             "Config: loaded " + std::to_string(staged.size()) +
             " key(s) from '" + path.string() + "'");
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Config -- setters / getters
// ---------------------------------------------------------------------------

void Config::set(std::string_view key, std::string value) {
    // Lands with the file values, so the command line still wins.
    file_values_[std::string{key}] = {std::move(value)};
}

std::optional<std::string> Config::get(std::string_view key) const {
    const auto* vals = lookup(key);
    if (!vals || vals->empty()) return std::nullopt;
    return vals->front();
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    auto val = get(key);
    return val.has_value() ? *val : std::string{default_val};
}

core::Result<std::optional<uint64_t>> Config::get_uint(
    std::string_view key) const {
    auto val = get(key);
    if (!val.has_value()) {
        return std::optional<uint64_t>{};
    }

    uint64_t result = 0;
    const auto& s = *val;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
            "-" + std::string{key} + "='" + s +
            "' is not an unsigned integer");
    }
    return std::optional<uint64_t>{result};
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;
    return parse_bool(*val, default_val);
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    // Both sources, command line first.
    std::string k{key};
    std::vector<std::string> result;
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

// ---------------------------------------------------------------------------
// Config -- convenience accessors
// ---------------------------------------------------------------------------

std::optional<std::filesystem::path> Config::get_path(
    std::string_view key) const {
    auto val = get(key);
    if (!val.has_value() || val->empty()) return std::nullopt;
    return std::filesystem::path{*val};
}

std::filesystem::path Config::data_dir() const {
    std::filesystem::path base =
        get_path(CONF_DATADIR).value_or(fs::get_default_data_dir());

    // Regtest chains never share a directory with main.
    if (network() == "regtest") {
        base /= "regtest";
    }
    return base;
}

std::string Config::network() const {
    // An explicit -network wins over the -regtest shorthand.
    auto net = get(CONF_NETWORK);
    if (net.has_value() && !net->empty()) {
        return *net;
    }
    if (get_bool(CONF_REGTEST, false)) return "regtest";
    return "main";
}

} // namespace core
