// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/hash.h"

#include <array>
#include <cstring>

namespace crypto {

core::uint256 tagged_hash(
    std::string_view tag,
    std::span<const uint8_t> msg) {
    core::uint256 tag_hash = keccak256(tag.data(), tag.size());

    Keccak256Hasher hasher;
    hasher.write(std::span<const uint8_t>(tag_hash.data(), tag_hash.size()));
    hasher.write(std::span<const uint8_t>(tag_hash.data(), tag_hash.size()));
    hasher.write(msg);
    return hasher.finalize();
}

core::uint256 derive_id(
    std::string_view tag,
    const core::uint256& parent,
    uint64_t index) {
    std::array<uint8_t, 40> preimage{};
    std::memcpy(preimage.data(), parent.data(), 32);
    for (int i = 0; i < 8; ++i) {
        preimage[32 + i] = static_cast<uint8_t>(index >> (8 * i));
    }
    return tagged_hash(tag, std::span<const uint8_t>(preimage));
}

}  // namespace crypto
