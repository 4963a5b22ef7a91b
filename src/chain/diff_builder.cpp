// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/diff_builder.h"

#include "core/logging.h"
#include "primitives/transaction.h"

#include <string>
#include <utility>
#include <vector>

namespace chain {

using consensus::DelayedSiacoinOutputDiff;
using consensus::DiffDirection;
using consensus::DiffList;
using consensus::FileContractDiff;
using consensus::SiacoinOutputDiff;
using consensus::SiafundOutputDiff;
using consensus::ValidationResult;

DiffBuilder::DiffBuilder(consensus::LedgerState& state,
                         const consensus::ConsensusParams& params,
                         const consensus::TransactionValidator& validator)
    : state_(state),
      params_(params),
      validator_(validator),
      committer_(state) {}

// ===========================================================================
// connect
// ===========================================================================

core::Result<DiffList> DiffBuilder::connect(
    const primitives::Block& block,
    consensus::BlockValidationState& vstate) {
    const BlockHeight parent_height = state_.height();
    const BlockHeight height = parent_height + 1;

    // Every bucket up to the parent was drained when the parent connected.
    TALLY_TRY_VOID(state_.delayed_outputs().check_elapsed(parent_height));

    DiffList diffs;

    for (size_t tx_idx = 0; tx_idx < block.transactions.size(); ++tx_idx) {
        const auto& tx = block.transactions[tx_idx];

        consensus::TxValidationState tx_state;
        if (!validator_.check_transaction(tx, state_, height, tx_state)) {
            // Unwind this block's partial effects before reporting.
            TALLY_TRY_VOID(committer_.commit_all(diffs, DiffDirection::REVERT));

            const ValidationResult result =
                consensus::is_dos(tx_state.get_result())
                    ? ValidationResult::BLOCK_DOS
                    : tx_state.get_result();
            vstate.invalid(result, tx_state.get_reject_reason(),
                           "tx " + std::to_string(tx_idx) + ": " +
                               tx_state.to_string());

            LOG_DEBUG(core::LogCategory::VALIDATION,
                      "Block at height " + std::to_string(height) +
                      " rejected: " + vstate.to_string() + " (" +
                      std::to_string(diffs.size()) + " diffs unwound)");
            return vstate.to_error();
        }

        TALLY_TRY_VOID(apply_transaction(tx, height, diffs));
    }

    TALLY_TRY_VOID(apply_maintenance(block, height, diffs));

    state_.set_height(height);

    LOG_DEBUG(core::LogCategory::DIFF,
              "Generated " + std::to_string(diffs.size()) +
              " diffs for block at height " + std::to_string(height));

    return diffs;
}

// ===========================================================================
// connect_genesis
// ===========================================================================

core::Result<DiffList> DiffBuilder::connect_genesis(
    const primitives::Block& genesis) {
    DiffList diffs;
    for (const auto& tx : genesis.transactions) {
        TALLY_TRY_VOID(apply_transaction(tx, 0, diffs));
    }
    state_.set_height(0);
    return diffs;
}

// ===========================================================================
// replay / disconnect
// ===========================================================================

core::Result<void> DiffBuilder::replay(const DiffList& diffs,
                                       BlockHeight height) {
    TALLY_TRY_VOID(committer_.commit_all(diffs, DiffDirection::APPLY));
    state_.set_height(height);
    return core::make_ok();
}

core::Result<void> DiffBuilder::disconnect(const DiffList& diffs,
                                           BlockHeight height) {
    if (height == 0 || state_.height() != height) {
        return core::make_error(
            core::ErrorCode::CONSISTENCY_FAULT,
            "disconnect of height " + std::to_string(height) +
                " with ledger at " + std::to_string(state_.height()));
    }
    state_.set_height(height - 1);
    TALLY_TRY_VOID(committer_.commit_all(diffs, DiffDirection::REVERT));
    return core::make_ok();
}

// ===========================================================================
// Diff generation
// ===========================================================================

core::Result<void> DiffBuilder::emit(consensus::Diff d, DiffList& out) {
    TALLY_TRY_VOID(committer_.commit(d, DiffDirection::APPLY));
    out.push_back(std::move(d));
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// apply_transaction
// ---------------------------------------------------------------------------
// Order within one transaction:
//   siacoin inputs (remove), siacoin outputs (add), file contracts (add),
//   storage proofs (remove contract, queue valid-proof outputs),
//   siafund inputs (remove), siafund outputs (add)
// ---------------------------------------------------------------------------
core::Result<void> DiffBuilder::apply_transaction(
    const primitives::Transaction& tx,
    BlockHeight height,
    DiffList& out) {
    const BlockHeight maturity = height + params_.maturity_delay;

    for (const auto& in : tx.siacoin_inputs) {
        const auto* spent = state_.siacoin_outputs().find(in.parent_id);
        if (spent == nullptr) {
            return core::make_error(core::ErrorCode::CONSISTENCY_MISSING,
                                    "validated input " +
                                        in.parent_id.short_hex() +
                                        " is not in the siacoin registry");
        }
        TALLY_TRY_VOID(emit(SiacoinOutputDiff{DiffDirection::REVERT,
                                              in.parent_id, *spent},
                            out));
    }

    for (size_t i = 0; i < tx.siacoin_outputs.size(); ++i) {
        TALLY_TRY_VOID(emit(SiacoinOutputDiff{DiffDirection::APPLY,
                                              tx.siacoin_output_id(i),
                                              tx.siacoin_outputs[i]},
                            out));
    }

    for (size_t i = 0; i < tx.file_contracts.size(); ++i) {
        TALLY_TRY_VOID(emit(FileContractDiff{DiffDirection::APPLY,
                                             tx.file_contract_id(i),
                                             tx.file_contracts[i]},
                            out));
    }

    for (const auto& sp : tx.storage_proofs) {
        const auto* found = state_.file_contracts().find(sp.parent_id);
        if (found == nullptr) {
            return core::make_error(core::ErrorCode::CONSISTENCY_MISSING,
                                    "proven contract " +
                                        sp.parent_id.short_hex() +
                                        " is not in the contract registry");
        }
        // Copy before the REVERT below erases the registry entry.
        const primitives::FileContract fc = *found;
        TALLY_TRY_VOID(emit(FileContractDiff{DiffDirection::REVERT,
                                             sp.parent_id, fc},
                            out));
        for (size_t i = 0; i < fc.valid_proof_outputs.size(); ++i) {
            TALLY_TRY_VOID(emit(
                DelayedSiacoinOutputDiff{
                    DiffDirection::APPLY,
                    primitives::storage_proof_output_id(sp.parent_id, true, i),
                    fc.valid_proof_outputs[i], maturity},
                out));
        }
    }

    for (const auto& in : tx.siafund_inputs) {
        const auto* spent = state_.siafund_outputs().find(in.parent_id);
        if (spent == nullptr) {
            return core::make_error(core::ErrorCode::CONSISTENCY_MISSING,
                                    "validated siafund input " +
                                        in.parent_id.short_hex() +
                                        " is not in the siafund registry");
        }
        TALLY_TRY_VOID(emit(SiafundOutputDiff{DiffDirection::REVERT,
                                              in.parent_id, *spent},
                            out));
    }

    for (size_t i = 0; i < tx.siafund_outputs.size(); ++i) {
        TALLY_TRY_VOID(emit(SiafundOutputDiff{DiffDirection::APPLY,
                                              tx.siafund_output_id(i),
                                              tx.siafund_outputs[i]},
                            out));
    }

    return core::make_ok();
}

// ---------------------------------------------------------------------------
// apply_maintenance
// ---------------------------------------------------------------------------
core::Result<void> DiffBuilder::apply_maintenance(
    const primitives::Block& block,
    BlockHeight height,
    DiffList& out) {
    const BlockHeight maturity = height + params_.maturity_delay;

    // -- Miner payouts ------------------------------------------------------
    for (size_t i = 0; i < block.miner_payouts.size(); ++i) {
        TALLY_TRY_VOID(emit(DelayedSiacoinOutputDiff{DiffDirection::APPLY,
                                                     block.miner_payout_id(i),
                                                     block.miner_payouts[i],
                                                     maturity},
                            out));
    }

    // -- Matured outputs ----------------------------------------------------
    // Snapshot the bucket first: the REVERT diffs below empty it.
    if (const auto* bucket = state_.delayed_outputs().bucket(height)) {
        const auto matured = bucket->entries();
        for (const auto& [id, output] : matured) {
            TALLY_TRY_VOID(emit(
                SiacoinOutputDiff{DiffDirection::APPLY, id, output}, out));
            TALLY_TRY_VOID(emit(DelayedSiacoinOutputDiff{DiffDirection::REVERT,
                                                         id, output, height},
                                out));
        }
        LOG_TRACE(core::LogCategory::DIFF,
                  "Matured " + std::to_string(matured.size()) +
                  " outputs at height " + std::to_string(height));
    }

    // -- Expired contracts --------------------------------------------------
    std::vector<std::pair<primitives::FileContractID, primitives::FileContract>>
        expired;
    state_.file_contracts().for_each(
        [&](const primitives::FileContractID& id,
            const primitives::FileContract& fc) {
            if (fc.window_end == height) {
                expired.emplace_back(id, fc);
            }
        });
    for (const auto& [id, fc] : expired) {
        TALLY_TRY_VOID(emit(FileContractDiff{DiffDirection::REVERT, id, fc},
                            out));
        for (size_t i = 0; i < fc.missed_proof_outputs.size(); ++i) {
            TALLY_TRY_VOID(emit(
                DelayedSiacoinOutputDiff{
                    DiffDirection::APPLY,
                    primitives::storage_proof_output_id(id, false, i),
                    fc.missed_proof_outputs[i], maturity},
                out));
        }
    }
    if (!expired.empty()) {
        LOG_DEBUG(core::LogCategory::DIFF,
                  std::to_string(expired.size()) +
                  " file contracts expired at height " +
                  std::to_string(height));
    }

    return core::make_ok();
}

} // namespace chain
