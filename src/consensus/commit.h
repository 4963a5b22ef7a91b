#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TALLY_CONSENSUS_COMMIT_H
#define TALLY_CONSENSUS_COMMIT_H

#include "core/error.h"
#include "consensus/diff.h"
#include "consensus/ledger_state.h"

namespace consensus {

// ---------------------------------------------------------------------------
// DiffCommitter -- the only code that mutates LedgerState's registries
// ---------------------------------------------------------------------------
// commit(diff, dir) ADDs when diff.direction == dir and REMOVEs otherwise.
//
//   ADD     id must be absent            else CONSISTENCY_DUPLICATE
//   REMOVE  id must be present           else CONSISTENCY_MISSING
//           stored value must equal diff else CONSISTENCY_MISMATCH
//
// Delayed diffs first require maturity_height > state height, in both
// directions, and report CONSISTENCY_MATURITY before looking at the queue.
//
// A failed commit leaves the state untouched. Any failure here means the
// ledger and the diff history disagree; callers must stop mutating.
// ---------------------------------------------------------------------------
class DiffCommitter {
public:
    explicit DiffCommitter(LedgerState& state) : state_(state) {}

    [[nodiscard]] core::Result<void> commit(const SiacoinOutputDiff& d,
                                            DiffDirection dir);
    [[nodiscard]] core::Result<void> commit(const SiafundOutputDiff& d,
                                            DiffDirection dir);
    [[nodiscard]] core::Result<void> commit(const FileContractDiff& d,
                                            DiffDirection dir);
    [[nodiscard]] core::Result<void> commit(const DelayedSiacoinOutputDiff& d,
                                            DiffDirection dir);

    [[nodiscard]] core::Result<void> commit(const Diff& d, DiffDirection dir);

    /// APPLY walks @p diffs front to back, REVERT back to front. Stops at the
    /// first fault; diffs already committed stay committed.
    [[nodiscard]] core::Result<void> commit_all(const DiffList& diffs,
                                                DiffDirection dir);

private:
    LedgerState& state_;
};

} // namespace consensus

#endif // TALLY_CONSENSUS_COMMIT_H
