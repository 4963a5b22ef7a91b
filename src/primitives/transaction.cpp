// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"

#include "crypto/hash.h"

namespace primitives {

TransactionID Transaction::id() const {
    return TransactionID(crypto::hash(*this));
}

SiacoinOutputID Transaction::siacoin_output_id(uint64_t index) const {
    return SiacoinOutputID(
        crypto::derive_id(TAG_SIACOIN_OUTPUT, id().hash(), index));
}

SiafundOutputID Transaction::siafund_output_id(uint64_t index) const {
    return SiafundOutputID(
        crypto::derive_id(TAG_SIAFUND_OUTPUT, id().hash(), index));
}

FileContractID Transaction::file_contract_id(uint64_t index) const {
    return FileContractID(
        crypto::derive_id(TAG_FILE_CONTRACT, id().hash(), index));
}

SiacoinOutputID storage_proof_output_id(
    const FileContractID& contract, bool valid, uint64_t index) {
    return SiacoinOutputID(crypto::derive_id(
        valid ? TAG_VALID_PROOF : TAG_MISSED_PROOF, contract.hash(), index));
}

} // namespace primitives
