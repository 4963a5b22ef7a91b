#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TALLY_CONSENSUS_DIFF_H
#define TALLY_CONSENSUS_DIFF_H

#include "core/error.h"
#include "core/serialize.h"
#include "primitives/ids.h"
#include "primitives/outputs.h"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace consensus {

using primitives::BlockHeight;

// ---------------------------------------------------------------------------
// DiffDirection
// ---------------------------------------------------------------------------
// A diff records the direction it was generated in. Committing it in the
// same direction ADDs the object; committing it in the opposite direction
// REMOVEs it. Reverting a block therefore means committing each of its
// diffs, last first, with DiffDirection::REVERT.
// ---------------------------------------------------------------------------
enum class DiffDirection : uint8_t {
    APPLY  = 0,
    REVERT = 1,
};

[[nodiscard]] constexpr DiffDirection opposite(DiffDirection d) noexcept {
    return d == DiffDirection::APPLY ? DiffDirection::REVERT
                                     : DiffDirection::APPLY;
}

[[nodiscard]] std::string_view direction_name(DiffDirection d) noexcept;

namespace detail {

template <typename Stream>
void write_direction(Stream& s, DiffDirection d) {
    core::ser_write_u8(s, static_cast<uint8_t>(d));
}

template <typename Stream>
DiffDirection read_direction(Stream& s) {
    uint8_t v = core::ser_read_u8(s);
    if (v > 1) {
        throw std::runtime_error("diff: invalid direction byte");
    }
    return static_cast<DiffDirection>(v);
}

} // namespace detail

// ---------------------------------------------------------------------------
// The four diff kinds
// ---------------------------------------------------------------------------

struct SiacoinOutputDiff {
    DiffDirection direction = DiffDirection::APPLY;
    primitives::SiacoinOutputID id;
    primitives::SiacoinOutput output;

    bool operator==(const SiacoinOutputDiff&) const = default;

    template <typename Stream>
    void serialize(Stream& s) const {
        detail::write_direction(s, direction);
        id.serialize(s);
        output.serialize(s);
    }

    template <typename Stream>
    static SiacoinOutputDiff deserialize(Stream& s) {
        SiacoinOutputDiff d;
        d.direction = detail::read_direction(s);
        d.id = primitives::SiacoinOutputID::deserialize(s);
        d.output = primitives::SiacoinOutput::deserialize(s);
        return d;
    }
};

struct SiafundOutputDiff {
    DiffDirection direction = DiffDirection::APPLY;
    primitives::SiafundOutputID id;
    primitives::SiafundOutput output;

    bool operator==(const SiafundOutputDiff&) const = default;

    template <typename Stream>
    void serialize(Stream& s) const {
        detail::write_direction(s, direction);
        id.serialize(s);
        output.serialize(s);
    }

    template <typename Stream>
    static SiafundOutputDiff deserialize(Stream& s) {
        SiafundOutputDiff d;
        d.direction = detail::read_direction(s);
        d.id = primitives::SiafundOutputID::deserialize(s);
        d.output = primitives::SiafundOutput::deserialize(s);
        return d;
    }
};

struct FileContractDiff {
    DiffDirection direction = DiffDirection::APPLY;
    primitives::FileContractID id;
    primitives::FileContract contract;

    bool operator==(const FileContractDiff&) const = default;

    template <typename Stream>
    void serialize(Stream& s) const {
        detail::write_direction(s, direction);
        id.serialize(s);
        contract.serialize(s);
    }

    template <typename Stream>
    static FileContractDiff deserialize(Stream& s) {
        FileContractDiff d;
        d.direction = detail::read_direction(s);
        d.id = primitives::FileContractID::deserialize(s);
        d.contract = primitives::FileContract::deserialize(s);
        return d;
    }
};

/// An output parked in the maturity queue until maturity_height.
struct DelayedSiacoinOutputDiff {
    DiffDirection direction = DiffDirection::APPLY;
    primitives::SiacoinOutputID id;
    primitives::SiacoinOutput output;
    BlockHeight maturity_height = 0;

    bool operator==(const DelayedSiacoinOutputDiff&) const = default;

    template <typename Stream>
    void serialize(Stream& s) const {
        detail::write_direction(s, direction);
        id.serialize(s);
        output.serialize(s);
        core::ser_write_u64(s, maturity_height);
    }

    template <typename Stream>
    static DelayedSiacoinOutputDiff deserialize(Stream& s) {
        DelayedSiacoinOutputDiff d;
        d.direction = detail::read_direction(s);
        d.id = primitives::SiacoinOutputID::deserialize(s);
        d.output = primitives::SiacoinOutput::deserialize(s);
        d.maturity_height = core::ser_read_u64(s);
        return d;
    }
};

// ---------------------------------------------------------------------------
// Diff -- any of the above, in block order
// ---------------------------------------------------------------------------

using Diff = std::variant<SiacoinOutputDiff,
                          SiafundOutputDiff,
                          FileContractDiff,
                          DelayedSiacoinOutputDiff>;

using DiffList = std::vector<Diff>;

/// Wire tag for each alternative; equal to the variant index.
enum class DiffKind : uint8_t {
    SIACOIN_OUTPUT          = 0,
    SIAFUND_OUTPUT          = 1,
    FILE_CONTRACT           = 2,
    DELAYED_SIACOIN_OUTPUT  = 3,
};

[[nodiscard]] DiffKind diff_kind(const Diff& d) noexcept;
[[nodiscard]] DiffDirection diff_direction(const Diff& d) noexcept;

/// One-line description for logs, e.g. "siacoin+ 3f2a..".
[[nodiscard]] std::string describe(const Diff& d);

template <typename Stream>
void serialize_diff(Stream& s, const Diff& d) {
    core::ser_write_u8(s, static_cast<uint8_t>(d.index()));
    std::visit([&s](const auto& alt) { alt.serialize(s); }, d);
}

template <typename Stream>
Diff deserialize_diff(Stream& s) {
    switch (static_cast<DiffKind>(core::ser_read_u8(s))) {
        case DiffKind::SIACOIN_OUTPUT:
            return SiacoinOutputDiff::deserialize(s);
        case DiffKind::SIAFUND_OUTPUT:
            return SiafundOutputDiff::deserialize(s);
        case DiffKind::FILE_CONTRACT:
            return FileContractDiff::deserialize(s);
        case DiffKind::DELAYED_SIACOIN_OUTPUT:
            return DelayedSiacoinOutputDiff::deserialize(s);
    }
    throw std::runtime_error("diff: unknown kind tag");
}

/// CompactSize count followed by (kind tag, diff) pairs.
[[nodiscard]] std::vector<uint8_t> encode_diffs(const DiffList& diffs);

/// Decode untrusted bytes; the whole buffer must be consumed.
[[nodiscard]] core::Result<DiffList> decode_diffs(
    std::span<const uint8_t> data);

} // namespace consensus

#endif // TALLY_CONSENSUS_DIFF_H
