// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/reorg.h"

#include "core/logging.h"

#include <algorithm>
#include <string>
#include <vector>

namespace chain {

// ---------------------------------------------------------------------------
// compute_reorg_path
// ---------------------------------------------------------------------------
// Algorithm:
//   1. Walk the taller side down until both pointers sit at the same
//      height, recording each block passed.
//   2. Walk both back in lockstep until they meet at the fork point.
//   3. to_disconnect is already newest-first; to_connect was collected
//      newest-first too and is reversed into connect order.
// ---------------------------------------------------------------------------
ReorgPath compute_reorg_path(const Chain& active_chain, BlockIndex* new_tip) {
    ReorgPath path;

    BlockIndex* old_tip = active_chain.tip();

    if (new_tip == nullptr) {
        return path;
    }
    if (old_tip == nullptr) {
        BlockIndex* walk = new_tip;
        while (walk != nullptr) {
            path.to_connect.push_back(walk);
            walk = walk->prev;
        }
        std::reverse(path.to_connect.begin(), path.to_connect.end());
        return path;
    }

    BlockIndex* old_walk = old_tip;
    BlockIndex* new_walk = new_tip;

    while (old_walk != nullptr && new_walk != nullptr &&
           old_walk->height > new_walk->height) {
        path.to_disconnect.push_back(old_walk);
        old_walk = old_walk->prev;
    }
    while (old_walk != nullptr && new_walk != nullptr &&
           new_walk->height > old_walk->height) {
        path.to_connect.push_back(new_walk);
        new_walk = new_walk->prev;
    }

    while (old_walk != new_walk) {
        if (old_walk == nullptr || new_walk == nullptr) {
            // Disjoint trees
            path.fork_point = nullptr;
            std::reverse(path.to_connect.begin(), path.to_connect.end());
            return path;
        }
        path.to_disconnect.push_back(old_walk);
        path.to_connect.push_back(new_walk);
        old_walk = old_walk->prev;
        new_walk = new_walk->prev;
    }

    path.fork_point = old_walk;
    std::reverse(path.to_connect.begin(), path.to_connect.end());

    if (!path.is_extension()) {
        LOG_INFO(core::LogCategory::CHAIN,
                 "Reorg path: disconnect " +
                 std::to_string(path.to_disconnect.size()) +
                 " blocks, connect " +
                 std::to_string(path.to_connect.size()) +
                 " blocks, fork at height " +
                 (path.fork_point ? std::to_string(path.fork_point->height)
                                  : std::string("none")));
    }

    return path;
}

// ---------------------------------------------------------------------------
// is_reorg_safe
// ---------------------------------------------------------------------------
bool is_reorg_safe(const ReorgPath& path, BlockHeight max_depth) {
    return path.to_disconnect.size() <= max_depth;
}

} // namespace chain
