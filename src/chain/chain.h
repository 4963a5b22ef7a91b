#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/block_index.h"
#include "primitives/ids.h"

#include <cstddef>
#include <vector>

namespace chain {

// ---------------------------------------------------------------------------
// Chain -- the best path from genesis to tip
// ---------------------------------------------------------------------------
// Maintains a vector of BlockIndex pointers where index 0 is the genesis
// block and the last element is the current tip. Rebuilt whenever the tip
// changes by walking `prev` pointers from the new tip back to genesis.
// ---------------------------------------------------------------------------
class Chain {
public:
    Chain() = default;

    /// Get the genesis block index. Returns nullptr if the chain is empty.
    BlockIndex* genesis() const;

    /// Get the tip (highest block). Returns nullptr if the chain is empty.
    BlockIndex* tip() const;

    /// Get the block index at the given height, or nullptr if out of range.
    BlockIndex* at(BlockHeight height) const;

    BlockIndex* operator[](BlockHeight height) const { return at(height); }

    bool empty() const { return chain_.empty(); }

    /// Height of the tip. 0 for an empty chain as well as for genesis only;
    /// callers that care check empty() first.
    BlockHeight height() const;

    /// Returns true if the given block index is part of this chain.
    bool contains(const BlockIndex* index) const;

    /// Highest block present both in this chain and in the chain ending at
    /// @p index, or nullptr if the two share nothing.
    const BlockIndex* find_fork(const BlockIndex* index) const;

    /// Set the tip to a new block. Passing nullptr empties the chain.
    void set_tip(BlockIndex* index);

    /// Block IDs from genesis to tip.
    std::vector<primitives::BlockID> ids() const;

private:
    std::vector<BlockIndex*> chain_;  // index 0 = genesis
};

} // namespace chain
