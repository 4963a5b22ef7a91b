#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <vector>

#include "core/serialize.h"
#include "core/types.h"
#include "primitives/currency.h"
#include "primitives/ids.h"

namespace primitives {

using BlockHeight = uint64_t;

/// A spendable quantity of siacoins.
struct SiacoinOutput {
    Currency value;
    UnlockHash unlock_hash;

    bool operator==(const SiacoinOutput&) const = default;

    template<typename Stream>
    void serialize(Stream& s) const {
        value.serialize(s);
        unlock_hash.serialize(s);
    }

    template<typename Stream>
    static SiacoinOutput deserialize(Stream& s) {
        SiacoinOutput out;
        out.value = Currency::deserialize(s);
        out.unlock_hash = UnlockHash::deserialize(s);
        return out;
    }
};

/// A quantity of siafunds. claim_start records the pool value at the time
/// the output was created; pool accounting itself is not modelled.
struct SiafundOutput {
    Currency value;
    UnlockHash unlock_hash;
    Currency claim_start;

    bool operator==(const SiafundOutput&) const = default;

    template<typename Stream>
    void serialize(Stream& s) const {
        value.serialize(s);
        unlock_hash.serialize(s);
        claim_start.serialize(s);
    }

    template<typename Stream>
    static SiafundOutput deserialize(Stream& s) {
        SiafundOutput out;
        out.value = Currency::deserialize(s);
        out.unlock_hash = UnlockHash::deserialize(s);
        out.claim_start = Currency::deserialize(s);
        return out;
    }
};

/// A storage agreement. The payout is locked until a storage proof lands in
/// [window_start, window_end), which releases valid_proof_outputs, or the
/// window closes, which releases missed_proof_outputs.
struct FileContract {
    uint64_t file_size = 0;
    core::uint256 file_merkle_root;
    BlockHeight window_start = 0;
    BlockHeight window_end = 0;
    Currency payout;
    std::vector<SiacoinOutput> valid_proof_outputs;
    std::vector<SiacoinOutput> missed_proof_outputs;
    UnlockHash unlock_hash;
    uint64_t revision_number = 0;

    bool operator==(const FileContract&) const = default;

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_u64(s, file_size);
        core::ser_write_uint256(s, file_merkle_root);
        core::ser_write_u64(s, window_start);
        core::ser_write_u64(s, window_end);
        payout.serialize(s);
        core::ser_write_obj_vector(s, valid_proof_outputs);
        core::ser_write_obj_vector(s, missed_proof_outputs);
        unlock_hash.serialize(s);
        core::ser_write_u64(s, revision_number);
    }

    template<typename Stream>
    static FileContract deserialize(Stream& s) {
        FileContract fc;
        fc.file_size = core::ser_read_u64(s);
        fc.file_merkle_root = core::ser_read_uint256(s);
        fc.window_start = core::ser_read_u64(s);
        fc.window_end = core::ser_read_u64(s);
        fc.payout = Currency::deserialize(s);
        fc.valid_proof_outputs = core::ser_read_obj_vector<SiacoinOutput>(s);
        fc.missed_proof_outputs = core::ser_read_obj_vector<SiacoinOutput>(s);
        fc.unlock_hash = UnlockHash::deserialize(s);
        fc.revision_number = core::ser_read_u64(s);
        return fc;
    }
};

} // namespace primitives
