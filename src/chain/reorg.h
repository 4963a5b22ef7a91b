#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Chain reorganization paths
// ---------------------------------------------------------------------------
// Computes the blocks to disconnect and connect when switching to a
// heavier tip, and bounds how far back a switch may reach.
// ---------------------------------------------------------------------------

#include "chain/block_index.h"
#include "chain/chain.h"

#include <vector>

namespace chain {

// ---------------------------------------------------------------------------
// ReorgPath -- describes the blocks to disconnect and connect during a reorg
// ---------------------------------------------------------------------------
struct ReorgPath {
    /// Blocks to disconnect, from the current tip back toward (but not
    /// including) the fork point. Newest block first.
    std::vector<BlockIndex*> to_disconnect;

    /// Blocks to connect, from just above the fork point to the new tip.
    /// Oldest block first.
    std::vector<BlockIndex*> to_connect;

    /// The common ancestor of the old and new chains. nullptr when the
    /// chains share no common block, which a tree rooted at one genesis
    /// never produces.
    BlockIndex* fork_point = nullptr;

    /// A plain extension: nothing to disconnect.
    bool is_extension() const { return to_disconnect.empty(); }
};

/// Compute the path from the best chain to @p new_tip. Walks back from
/// both tips to the fork point.
ReorgPath compute_reorg_path(const Chain& active_chain, BlockIndex* new_tip);

/// True if the path disconnects at most @p max_depth blocks.
bool is_reorg_safe(const ReorgPath& path, BlockHeight max_depth);

} // namespace chain
