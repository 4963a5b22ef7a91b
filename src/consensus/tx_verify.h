#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Block and transaction validity rules
// ---------------------------------------------------------------------------
// check_header()       -- claimed work and timestamp against the parent
// check_miner_payouts() -- payouts against the coinbase schedule and fees
// check_transaction()  -- inputs, contracts, proofs and value balance
//                         against the ledger as it stands mid-block
//
// The block processor treats the validator as an oracle: it asks, records
// the answer in a ValidationState and never second-guesses it. Signature
// and unlock-condition checks belong to a different layer and are not
// performed here.
// ---------------------------------------------------------------------------

#include "consensus/ledger_state.h"
#include "consensus/params.h"
#include "consensus/validation.h"
#include "primitives/block.h"
#include "primitives/transaction.h"

namespace consensus {

class TransactionValidator {
public:
    virtual ~TransactionValidator() = default;

    /// Header-level checks of @p block against its @p parent.
    virtual bool check_header(const primitives::Block& block,
                              const primitives::Block& parent,
                              BlockValidationState& state) const = 0;

    /// Check @p tx for inclusion in the block at @p height. @p view already
    /// reflects every earlier transaction of that block.
    virtual bool check_transaction(const primitives::Transaction& tx,
                                   const LedgerView& view,
                                   BlockHeight height,
                                   TxValidationState& state) const = 0;
};

/// The default rule set.
///
/// Header:
///   - work must be non-zero
///   - timestamp must not be earlier than the parent's
///
/// Transaction:
///   - every siacoin and siafund input names a live output, once
///   - every storage proof names a live contract, once, and lands inside
///     [window_start, window_end)
///   - created outputs and contracts do not collide with live ones
///   - new contracts open in the future, close after they open, and split
///     the payout exactly across both outcome lists
///   - siafund inputs equal siafund outputs
///   - siacoin inputs equal outputs + contract payouts + miner fees;
///     an excess is reported as TX_DOS, a shortfall as TX_UNBALANCED
class StandardValidator : public TransactionValidator {
public:
    bool check_header(const primitives::Block& block,
                      const primitives::Block& parent,
                      BlockValidationState& state) const override;

    bool check_transaction(const primitives::Transaction& tx,
                           const LedgerView& view,
                           BlockHeight height,
                           TxValidationState& state) const override;
};

/// Miner payouts of the block at @p height must add up to exactly the
/// subsidy for that height plus every miner fee the block carries.
bool check_miner_payouts(const primitives::Block& block,
                         BlockHeight height,
                         const ConsensusParams& params,
                         BlockValidationState& state);

} // namespace consensus
