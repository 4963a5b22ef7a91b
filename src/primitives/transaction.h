#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/serialize.h"
#include "core/types.h"
#include "primitives/currency.h"
#include "primitives/ids.h"
#include "primitives/outputs.h"

#include <cstdint>
#include <span>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// Inputs and proofs. Each names the ledger object it consumes; unlock
// conditions and signatures are not part of this model.
// ---------------------------------------------------------------------------

struct SiacoinInput {
    SiacoinOutputID parent_id;

    bool operator==(const SiacoinInput&) const = default;

    template<typename Stream>
    void serialize(Stream& s) const { parent_id.serialize(s); }

    template<typename Stream>
    static SiacoinInput deserialize(Stream& s) {
        return SiacoinInput{SiacoinOutputID::deserialize(s)};
    }
};

struct SiafundInput {
    SiafundOutputID parent_id;

    bool operator==(const SiafundInput&) const = default;

    template<typename Stream>
    void serialize(Stream& s) const { parent_id.serialize(s); }

    template<typename Stream>
    static SiafundInput deserialize(Stream& s) {
        return SiafundInput{SiafundOutputID::deserialize(s)};
    }
};

/// Proof that the host still stores the file of contract @p parent_id.
/// The Merkle segment itself is not verified here.
struct StorageProof {
    FileContractID parent_id;

    bool operator==(const StorageProof&) const = default;

    template<typename Stream>
    void serialize(Stream& s) const { parent_id.serialize(s); }

    template<typename Stream>
    static StorageProof deserialize(Stream& s) {
        return StorageProof{FileContractID::deserialize(s)};
    }
};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------
// Objects created by a transaction are addressed by a tagged hash of the
// transaction ID and the object's index within its own list, so IDs are
// stable and never collide across kinds.
// ---------------------------------------------------------------------------
struct Transaction {
    std::vector<SiacoinInput> siacoin_inputs;
    std::vector<SiacoinOutput> siacoin_outputs;
    std::vector<FileContract> file_contracts;
    std::vector<StorageProof> storage_proofs;
    std::vector<SiafundInput> siafund_inputs;
    std::vector<SiafundOutput> siafund_outputs;
    std::vector<Currency> miner_fees;

    bool operator==(const Transaction&) const = default;

    /// SHA3-256 of the canonical encoding.
    [[nodiscard]] TransactionID id() const;

    [[nodiscard]] SiacoinOutputID siacoin_output_id(uint64_t index) const;
    [[nodiscard]] SiafundOutputID siafund_output_id(uint64_t index) const;
    [[nodiscard]] FileContractID file_contract_id(uint64_t index) const;

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_obj_vector(s, siacoin_inputs);
        core::ser_write_obj_vector(s, siacoin_outputs);
        core::ser_write_obj_vector(s, file_contracts);
        core::ser_write_obj_vector(s, storage_proofs);
        core::ser_write_obj_vector(s, siafund_inputs);
        core::ser_write_obj_vector(s, siafund_outputs);
        core::ser_write_obj_vector(s, miner_fees);
    }

    template<typename Stream>
    static Transaction deserialize(Stream& s) {
        Transaction tx;
        tx.siacoin_inputs = core::ser_read_obj_vector<SiacoinInput>(s);
        tx.siacoin_outputs = core::ser_read_obj_vector<SiacoinOutput>(s);
        tx.file_contracts = core::ser_read_obj_vector<FileContract>(s);
        tx.storage_proofs = core::ser_read_obj_vector<StorageProof>(s);
        tx.siafund_inputs = core::ser_read_obj_vector<SiafundInput>(s);
        tx.siafund_outputs = core::ser_read_obj_vector<SiafundOutput>(s);
        tx.miner_fees = core::ser_read_obj_vector<Currency>(s);
        return tx;
    }
};

/// Derivation tags. Part of the consensus encoding; never change them.
inline constexpr const char* TAG_SIACOIN_OUTPUT = "tally/siacoin-output";
inline constexpr const char* TAG_SIAFUND_OUTPUT = "tally/siafund-output";
inline constexpr const char* TAG_FILE_CONTRACT  = "tally/file-contract";
inline constexpr const char* TAG_MINER_PAYOUT   = "tally/miner-payout";
inline constexpr const char* TAG_VALID_PROOF    = "tally/storage-proof-valid";
inline constexpr const char* TAG_MISSED_PROOF   = "tally/storage-proof-missed";

/// ID of output @p index of a contract resolved by a storage proof
/// (@p valid) or by expiry.
[[nodiscard]] SiacoinOutputID storage_proof_output_id(
    const FileContractID& contract, bool valid, uint64_t index);

} // namespace primitives
