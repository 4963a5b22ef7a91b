// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/diff.h"

#include "core/stream.h"

#include <exception>
#include <type_traits>

namespace consensus {

std::string_view direction_name(DiffDirection d) noexcept {
    return d == DiffDirection::APPLY ? "apply" : "revert";
}

DiffKind diff_kind(const Diff& d) noexcept {
    return static_cast<DiffKind>(d.index());
}

DiffDirection diff_direction(const Diff& d) noexcept {
    return std::visit([](const auto& alt) { return alt.direction; }, d);
}

std::string describe(const Diff& d) {
    return std::visit([](const auto& alt) -> std::string {
        using T = std::decay_t<decltype(alt)>;
        std::string sign = alt.direction == DiffDirection::APPLY ? "+" : "-";
        if constexpr (std::is_same_v<T, SiacoinOutputDiff>) {
            return "siacoin" + sign + " " + alt.id.short_hex() + " " +
                   alt.output.value.to_string();
        } else if constexpr (std::is_same_v<T, SiafundOutputDiff>) {
            return "siafund" + sign + " " + alt.id.short_hex() + " " +
                   std::to_string(alt.output.value.value());
        } else if constexpr (std::is_same_v<T, FileContractDiff>) {
            return "contract" + sign + " " + alt.id.short_hex() + " window [" +
                   std::to_string(alt.contract.window_start) + "," +
                   std::to_string(alt.contract.window_end) + ")";
        } else {
            return "delayed" + sign + " " + alt.id.short_hex() + " @" +
                   std::to_string(alt.maturity_height);
        }
    }, d);
}

std::vector<uint8_t> encode_diffs(const DiffList& diffs) {
    core::DataStream s;
    core::ser_write_compact_size(s, diffs.size());
    for (const auto& d : diffs) {
        serialize_diff(s, d);
    }
    return s.release();
}

core::Result<DiffList> decode_diffs(std::span<const uint8_t> data) {
    core::SpanReader reader(data);
    DiffList diffs;
    try {
        uint64_t count = core::ser_read_compact_size(reader);
        if (count > core::MAX_VECTOR_SIZE) {
            return core::make_error(core::ErrorCode::PARSE_OVERFLOW,
                                    "diff list: too many entries");
        }
        diffs.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            diffs.push_back(deserialize_diff(reader));
        }
    } catch (const std::exception& e) {
        return core::make_error(core::ErrorCode::PARSE_UNDERFLOW,
                                std::string("diff list: ") + e.what());
    }
    if (!reader.eof()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "diff list: trailing bytes");
    }
    return diffs;
}

} // namespace consensus
