#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"
#include "consensus/diff.h"
#include "primitives/block.h"
#include "primitives/ids.h"

#include <cstdint>
#include <string>

namespace chain {

using primitives::BlockHeight;

// ---------------------------------------------------------------------------
// BlockIndex -- a node in the block tree (every block that passed header
// checks, on the best path or not)
// ---------------------------------------------------------------------------
// Together, BlockIndex nodes form a tree rooted at genesis, linked via the
// `prev` pointer. The block itself is kept inline, as are its diffs once
// they have been generated, so a revert replays exactly what was applied.
// ---------------------------------------------------------------------------
class BlockIndex {
public:
    primitives::BlockID id;

    // Pointer to parent (nullptr for genesis)
    BlockIndex* prev = nullptr;

    BlockHeight height = 0;

    // Cumulative work of the chain ending here, genesis included.
    core::uint256 chain_work;

    primitives::Block block;

    // Peer that delivered the block; blamed if it later proves wasteful.
    std::string source;

    // Diffs recorded the first time this block was connected. Empty and
    // meaningless until BLOCK_HAVE_DIFFS is set.
    consensus::DiffList diffs;

    enum Status : uint32_t {
        BLOCK_VALID_UNKNOWN = 0,
        BLOCK_VALID_HEADER  = 1,   // parent known, header checks passed
        BLOCK_HAVE_DIFFS    = 2,   // connected once; diffs recorded
        BLOCK_FAILED_VALID  = 4,   // a transaction or payout check failed
        BLOCK_FAILED_CHILD  = 8,   // descends from a failed block
        BLOCK_FAILED_MASK   = BLOCK_FAILED_VALID | BLOCK_FAILED_CHILD,
        BLOCK_DOS           = 16,  // failed as funded-but-unspent
    };
    uint32_t status = BLOCK_VALID_UNKNOWN;

    // -- Accessors ----------------------------------------------------------

    bool have_diffs() const { return (status & BLOCK_HAVE_DIFFS) != 0; }

    /// Returns true if this block or an ancestor failed validation.
    bool is_failed() const { return (status & BLOCK_FAILED_MASK) != 0; }

    bool is_dos() const { return (status & BLOCK_DOS) != 0; }

    /// Record the diffs produced by the first successful connect.
    void set_diffs(consensus::DiffList d);

    // -- Ancestor lookup ----------------------------------------------------

    /// Walk the `prev` chain to the ancestor at @p target_height.
    /// Returns nullptr if @p target_height exceeds this block's height.
    BlockIndex* get_ancestor(BlockHeight target_height);
    const BlockIndex* get_ancestor(BlockHeight target_height) const;

    /// Return a human-readable string describing this block index entry.
    std::string to_string() const;
};

} // namespace chain
