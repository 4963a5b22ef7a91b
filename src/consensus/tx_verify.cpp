// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/tx_verify.h"

#include "consensus/subsidy.h"
#include "primitives/currency.h"

#include <set>
#include <string>
#include <vector>

namespace consensus {

using primitives::Currency;

// =========================================================================
// Internal helpers
// =========================================================================

namespace {

/// Accumulate @p value into @p total, recording TX_OVERFLOW on failure.
bool add_checked(Currency& total, Currency value, TxValidationState& state,
                 const char* what) {
    auto r = total.add(value);
    if (!r.ok()) {
        return state.invalid(ValidationResult::TX_OVERFLOW,
                             "bad-txns-overflow", what);
    }
    total = r.value();
    return true;
}

bool check_contract(const primitives::FileContract& fc, BlockHeight height,
                    TxValidationState& state) {
    if (fc.window_start <= height) {
        return state.invalid(ValidationResult::TX_BAD_CONTRACT,
                             "bad-contract-window-start",
                             "window opens at " +
                                 std::to_string(fc.window_start) +
                                 ", block height " + std::to_string(height));
    }
    if (fc.window_end <= fc.window_start) {
        return state.invalid(ValidationResult::TX_BAD_CONTRACT,
                             "bad-contract-window-end");
    }

    Currency valid_total;
    for (const auto& out : fc.valid_proof_outputs) {
        if (!add_checked(valid_total, out.value, state, "valid proof outputs"))
            return false;
    }
    Currency missed_total;
    for (const auto& out : fc.missed_proof_outputs) {
        if (!add_checked(missed_total, out.value, state,
                         "missed proof outputs"))
            return false;
    }
    if (valid_total != fc.payout || missed_total != fc.payout) {
        return state.invalid(ValidationResult::TX_BAD_CONTRACT,
                             "bad-contract-payout-split",
                             "payout " + fc.payout.to_string() +
                                 ", valid " + valid_total.to_string() +
                                 ", missed " + missed_total.to_string());
    }
    return true;
}

} // anonymous namespace

// =========================================================================
// Header
// =========================================================================

bool StandardValidator::check_header(const primitives::Block& block,
                                     const primitives::Block& parent,
                                     BlockValidationState& state) const {
    if (block.work == 0) {
        return state.invalid(ValidationResult::BLOCK_BAD_HEADER,
                             "bad-header-work", "block claims no work");
    }
    if (block.timestamp < parent.timestamp) {
        return state.invalid(ValidationResult::BLOCK_TIME_TOO_OLD,
                             "time-too-old",
                             std::to_string(block.timestamp) + " < parent " +
                                 std::to_string(parent.timestamp));
    }
    return true;
}

bool check_miner_payouts(const primitives::Block& block,
                         BlockHeight height,
                         const ConsensusParams& params,
                         BlockValidationState& state) {
    std::vector<Currency> fees;
    for (const auto& tx : block.transactions) {
        fees.insert(fees.end(), tx.miner_fees.begin(), tx.miner_fees.end());
    }
    auto fee_total = primitives::sum(fees);
    if (!fee_total.ok()) {
        return state.invalid(ValidationResult::BLOCK_BAD_PAYOUT,
                             "bad-fees-overflow");
    }
    auto reward = get_block_reward(height, fee_total.value(), params);
    if (!reward.ok()) {
        return state.invalid(ValidationResult::BLOCK_BAD_PAYOUT,
                             "bad-reward-overflow");
    }

    std::vector<Currency> payouts;
    payouts.reserve(block.miner_payouts.size());
    for (const auto& out : block.miner_payouts) {
        payouts.push_back(out.value);
    }
    auto payout_total = primitives::sum(payouts);
    if (!payout_total.ok() || payout_total.value() != reward.value()) {
        return state.invalid(
            ValidationResult::BLOCK_BAD_PAYOUT, "bad-cb-amount",
            "expected " + reward.value().to_string() + ", got " +
                (payout_total.ok() ? payout_total.value().to_string()
                                   : std::string("overflow")));
    }
    return true;
}

// =========================================================================
// Transaction
// =========================================================================

bool StandardValidator::check_transaction(const primitives::Transaction& tx,
                                          const LedgerView& view,
                                          BlockHeight height,
                                          TxValidationState& state) const {
    // -- Siacoin inputs ---------------------------------------------------
    Currency siacoin_in;
    std::set<primitives::SiacoinOutputID> spent_coins;
    for (const auto& in : tx.siacoin_inputs) {
        if (!spent_coins.insert(in.parent_id).second) {
            return state.invalid(ValidationResult::TX_DUPLICATE,
                                 "bad-txns-inputs-duplicate",
                                 in.parent_id.short_hex());
        }
        auto out = view.get_siacoin_output(in.parent_id);
        if (!out) {
            return state.invalid(ValidationResult::TX_MISSING_INPUTS,
                                 "bad-txns-inputs-missing",
                                 in.parent_id.short_hex());
        }
        if (!add_checked(siacoin_in, out->value, state, "siacoin inputs"))
            return false;
    }

    // -- Siacoin outputs --------------------------------------------------
    Currency siacoin_out;
    for (size_t i = 0; i < tx.siacoin_outputs.size(); ++i) {
        if (view.get_siacoin_output(tx.siacoin_output_id(i))) {
            return state.invalid(ValidationResult::TX_DUPLICATE,
                                 "bad-txns-output-exists");
        }
        if (!add_checked(siacoin_out, tx.siacoin_outputs[i].value, state,
                         "siacoin outputs"))
            return false;
    }

    // -- File contracts ---------------------------------------------------
    for (size_t i = 0; i < tx.file_contracts.size(); ++i) {
        const auto& fc = tx.file_contracts[i];
        if (view.get_file_contract(tx.file_contract_id(i))) {
            return state.invalid(ValidationResult::TX_DUPLICATE,
                                 "bad-contract-exists");
        }
        if (!check_contract(fc, height, state)) return false;
        if (!add_checked(siacoin_out, fc.payout, state, "contract payouts"))
            return false;
    }

    // -- Storage proofs ---------------------------------------------------
    std::set<primitives::FileContractID> proven;
    for (const auto& sp : tx.storage_proofs) {
        if (!proven.insert(sp.parent_id).second) {
            return state.invalid(ValidationResult::TX_DUPLICATE,
                                 "bad-proof-duplicate",
                                 sp.parent_id.short_hex());
        }
        auto fc = view.get_file_contract(sp.parent_id);
        if (!fc) {
            return state.invalid(ValidationResult::TX_BAD_STORAGE_PROOF,
                                 "bad-proof-unknown-contract",
                                 sp.parent_id.short_hex());
        }
        if (height < fc->window_start || height >= fc->window_end) {
            return state.invalid(ValidationResult::TX_BAD_STORAGE_PROOF,
                                 "bad-proof-window",
                                 "height " + std::to_string(height) +
                                     " outside [" +
                                     std::to_string(fc->window_start) + ", " +
                                     std::to_string(fc->window_end) + ")");
        }
    }

    // -- Siafunds ---------------------------------------------------------
    Currency siafund_in;
    std::set<primitives::SiafundOutputID> spent_funds;
    for (const auto& in : tx.siafund_inputs) {
        if (!spent_funds.insert(in.parent_id).second) {
            return state.invalid(ValidationResult::TX_DUPLICATE,
                                 "bad-txns-siafund-duplicate",
                                 in.parent_id.short_hex());
        }
        auto out = view.get_siafund_output(in.parent_id);
        if (!out) {
            return state.invalid(ValidationResult::TX_MISSING_INPUTS,
                                 "bad-txns-siafund-missing",
                                 in.parent_id.short_hex());
        }
        if (!add_checked(siafund_in, out->value, state, "siafund inputs"))
            return false;
    }
    Currency siafund_out;
    for (size_t i = 0; i < tx.siafund_outputs.size(); ++i) {
        if (view.get_siafund_output(tx.siafund_output_id(i))) {
            return state.invalid(ValidationResult::TX_DUPLICATE,
                                 "bad-txns-siafund-exists");
        }
        if (!add_checked(siafund_out, tx.siafund_outputs[i].value, state,
                         "siafund outputs"))
            return false;
    }
    if (siafund_in != siafund_out) {
        return state.invalid(ValidationResult::TX_UNBALANCED,
                             "bad-txns-siafund-unbalanced",
                             "in " + siafund_in.to_string() + ", out " +
                                 siafund_out.to_string());
    }

    // -- Siacoin balance --------------------------------------------------
    for (const auto& fee : tx.miner_fees) {
        if (!add_checked(siacoin_out, fee, state, "miner fees")) return false;
    }
    if (siacoin_in > siacoin_out) {
        // Every input exists at this point, so the surplus is value the
        // sender funded and then discarded.
        return state.invalid(ValidationResult::TX_DOS,
                             "bad-txns-funded-unspent",
                             "in " + siacoin_in.to_string() + ", out " +
                                 siacoin_out.to_string());
    }
    if (siacoin_in < siacoin_out) {
        return state.invalid(ValidationResult::TX_UNBALANCED,
                             "bad-txns-in-belowout",
                             "in " + siacoin_in.to_string() + ", out " +
                                 siacoin_out.to_string());
    }
    return true;
}

} // namespace consensus
