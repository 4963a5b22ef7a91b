// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/block.h"

#include "core/stream.h"
#include "crypto/hash.h"

#include <exception>
#include <string>

namespace primitives {

BlockID Block::id() const {
    return BlockID(crypto::hash(*this));
}

SiacoinOutputID Block::miner_payout_id(uint64_t index) const {
    return SiacoinOutputID(
        crypto::derive_id(TAG_MINER_PAYOUT, id().hash(), index));
}

std::vector<uint8_t> Block::encode() const {
    return core::serialize_to_bytes(*this);
}

core::Result<Block> Block::decode(std::span<const uint8_t> data) {
    core::SpanReader reader(data);
    Block block;
    try {
        block = Block::deserialize(reader);
    } catch (const std::exception& e) {
        return core::make_error(core::ErrorCode::PARSE_UNDERFLOW,
                                std::string("block decode: ") + e.what());
    }
    if (!reader.eof()) {
        return core::make_error(
            core::ErrorCode::PARSE_BAD_FORMAT,
            "block decode: " + std::to_string(reader.remaining()) +
                " trailing bytes");
    }
    return block;
}

} // namespace primitives
