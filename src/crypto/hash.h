#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Object and domain-separated hashing on top of SHA3-256.
//
//   hash<T>()      -- digest of an object's canonical encoding
//   HashWriter     -- serialization stream that feeds a running digest
//   tagged_hash()  -- SHA3( SHA3(tag) || SHA3(tag) || msg )
//   derive_id()    -- tagged hash of (parent digest, index), used for every
//                     output, contract and payout identifier
// ---------------------------------------------------------------------------

#include "core/serialize.h"
#include "core/types.h"
#include "crypto/keccak.h"

#include <cstdint>
#include <span>
#include <string_view>

namespace crypto {

/// Write-only stream accepted by the serializers; bytes go straight into
/// the digest without being buffered.
class HashWriter {
public:
    HashWriter() = default;

    void write(std::span<const uint8_t> data) {
        hasher_.write(data);
        size_ += data.size();
    }

    /// Consumes the writer.
    [[nodiscard]] core::uint256 finalize() { return hasher_.finalize(); }

    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    Keccak256Hasher hasher_;
    size_t size_ = 0;
};

template <core::Serializable T>
[[nodiscard]] core::uint256 hash(const T& obj) {
    HashWriter writer;
    obj.serialize(writer);
    return writer.finalize();
}

[[nodiscard]] core::uint256 tagged_hash(
    std::string_view tag,
    std::span<const uint8_t> msg);

/// tagged_hash(tag, parent || u64le(index)).
[[nodiscard]] core::uint256 derive_id(
    std::string_view tag,
    const core::uint256& parent,
    uint64_t index);

}  // namespace crypto
