#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "core/serialize.h"
#include "core/types.h"

namespace primitives {

// ---------------------------------------------------------------------------
// Id<Tag> -- a 32-byte digest that only compares with IDs of the same kind.
// ---------------------------------------------------------------------------
template <typename Tag>
class Id {
public:
    constexpr Id() = default;
    constexpr explicit Id(const core::uint256& hash) : hash_(hash) {}

    static Id from_hex(std::string_view hex) {
        return Id(core::uint256::from_hex(hex));
    }

    [[nodiscard]] const core::uint256& hash() const noexcept { return hash_; }
    [[nodiscard]] bool is_null() const noexcept { return hash_.is_zero(); }
    [[nodiscard]] std::string to_hex() const { return hash_.to_hex(); }

    /// First 16 hex characters, for log lines.
    [[nodiscard]] std::string short_hex() const {
        return hash_.to_hex().substr(0, 16);
    }

    bool operator==(const Id& o) const noexcept { return hash_ == o.hash_; }
    std::strong_ordering operator<=>(const Id& o) const noexcept {
        return hash_ <=> o.hash_;
    }

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_uint256(s, hash_);
    }

    template<typename Stream>
    static Id deserialize(Stream& s) {
        return Id(core::ser_read_uint256(s));
    }

private:
    core::uint256 hash_;
};

struct SiacoinOutputIdTag {};
struct SiafundOutputIdTag {};
struct FileContractIdTag {};
struct BlockIdTag {};
struct TransactionIdTag {};
struct UnlockHashTag {};

using SiacoinOutputID = Id<SiacoinOutputIdTag>;
using SiafundOutputID = Id<SiafundOutputIdTag>;
using FileContractID  = Id<FileContractIdTag>;
using BlockID         = Id<BlockIdTag>;
using TransactionID   = Id<TransactionIdTag>;

/// Address an output is locked to. Spend authorization is out of scope
/// here, so the hash is carried but never checked.
using UnlockHash      = Id<UnlockHashTag>;

} // namespace primitives

template <typename Tag>
struct std::hash<primitives::Id<Tag>> {
    std::size_t operator()(const primitives::Id<Tag>& id) const noexcept {
        return std::hash<core::uint256>{}(id.hash());
    }
};
