#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// DiffBuilder -- turns a block into committed diffs
// ---------------------------------------------------------------------------
// connect() validates a block's transactions one at a time against the
// live ledger and commits each transaction's diffs before looking at the
// next, so later transactions see earlier ones. After the transactions it
// runs block maintenance:
//
//   1. miner payouts enter the maturity queue at height + maturity_delay
//   2. the maturity bucket for this height drains into the siacoin registry
//   3. contracts whose window closes at this height expire and queue their
//      missed-proof outputs
//
// Every diff is committed while the ledger height is the parent's height.
// The ledger height moves to the block's height only once all of its diffs
// are in, and drops back before any of them are reverted. Delayed diffs
// therefore always mature strictly above the commit height.
//
// Error contract for connect():
//   - rejection: the block state is invalid, every diff this call committed
//     has been reverted, and the returned error is the VALIDATION_* code.
//   - consistency fault: the returned error is a CONSISTENCY_* code and the
//     ledger must be considered corrupt.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "consensus/commit.h"
#include "consensus/diff.h"
#include "consensus/ledger_state.h"
#include "consensus/params.h"
#include "consensus/tx_verify.h"
#include "consensus/validation.h"
#include "primitives/block.h"

namespace chain {

using primitives::BlockHeight;

class DiffBuilder {
public:
    DiffBuilder(consensus::LedgerState& state,
                const consensus::ConsensusParams& params,
                const consensus::TransactionValidator& validator);

    /// Validate and commit the child of the current ledger tip. On success
    /// the ledger height is advanced and the committed diffs are returned.
    [[nodiscard]] core::Result<consensus::DiffList> connect(
        const primitives::Block& block,
        consensus::BlockValidationState& vstate);

    /// Commit the genesis block at height 0. Genesis skips validation and
    /// maintenance; it only creates what its transactions list.
    [[nodiscard]] core::Result<consensus::DiffList> connect_genesis(
        const primitives::Block& genesis);

    /// Re-apply diffs recorded by an earlier connect() of the block at
    /// @p height, then advance the ledger height to it.
    [[nodiscard]] core::Result<void> replay(const consensus::DiffList& diffs,
                                            BlockHeight height);

    /// Undo the block at @p height (the current ledger height): step the
    /// height back, then revert its diffs newest first.
    [[nodiscard]] core::Result<void> disconnect(
        const consensus::DiffList& diffs,
        BlockHeight height);

private:
    /// Commit @p d in the APPLY direction and record it in @p out.
    [[nodiscard]] core::Result<void> emit(consensus::Diff d,
                                          consensus::DiffList& out);

    [[nodiscard]] core::Result<void> apply_transaction(
        const primitives::Transaction& tx,
        BlockHeight height,
        consensus::DiffList& out);

    [[nodiscard]] core::Result<void> apply_maintenance(
        const primitives::Block& block,
        BlockHeight height,
        consensus::DiffList& out);

    consensus::LedgerState& state_;
    const consensus::ConsensusParams& params_;
    const consensus::TransactionValidator& validator_;
    consensus::DiffCommitter committer_;
};

} // namespace chain
