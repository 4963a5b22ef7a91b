#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/serialize.h"
#include "primitives/ids.h"
#include "primitives/outputs.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <span>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// Block
// ---------------------------------------------------------------------------
// `work` is the proof-of-work credit the block claims. Difficulty rules are
// not enforced here; fork choice only sums the claimed work.
// ---------------------------------------------------------------------------
struct Block {
    BlockID parent_id;
    uint64_t nonce = 0;
    uint64_t timestamp = 0;
    uint64_t work = 0;
    std::vector<SiacoinOutput> miner_payouts;
    std::vector<Transaction> transactions;

    bool operator==(const Block&) const = default;

    /// SHA3-256 of the canonical encoding.
    [[nodiscard]] BlockID id() const;

    /// ID of the delayed output created for miner payout @p index.
    [[nodiscard]] SiacoinOutputID miner_payout_id(uint64_t index) const;

    [[nodiscard]] std::vector<uint8_t> encode() const;

    /// Decode untrusted bytes. Truncated or trailing data is a PARSE_* error.
    [[nodiscard]] static core::Result<Block> decode(
        std::span<const uint8_t> data);

    template<typename Stream>
    void serialize(Stream& s) const {
        parent_id.serialize(s);
        core::ser_write_u64(s, nonce);
        core::ser_write_u64(s, timestamp);
        core::ser_write_u64(s, work);
        core::ser_write_obj_vector(s, miner_payouts);
        core::ser_write_obj_vector(s, transactions);
    }

    template<typename Stream>
    static Block deserialize(Stream& s) {
        Block b;
        b.parent_id = BlockID::deserialize(s);
        b.nonce = core::ser_read_u64(s);
        b.timestamp = core::ser_read_u64(s);
        b.work = core::ser_read_u64(s);
        b.miner_payouts = core::ser_read_obj_vector<SiacoinOutput>(s);
        b.transactions = core::ser_read_obj_vector<Transaction>(s);
        return b;
    }
};

} // namespace primitives
