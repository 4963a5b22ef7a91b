// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/block_index.h"

#include <sstream>
#include <string>
#include <utility>

namespace chain {

// ---------------------------------------------------------------------------
// set_diffs
// ---------------------------------------------------------------------------
void BlockIndex::set_diffs(consensus::DiffList d) {
    diffs = std::move(d);
    status |= BLOCK_HAVE_DIFFS;
}

// ---------------------------------------------------------------------------
// get_ancestor  (mutable)
// ---------------------------------------------------------------------------
BlockIndex* BlockIndex::get_ancestor(BlockHeight target_height) {
    if (target_height > height) {
        return nullptr;
    }

    BlockIndex* walk = this;
    while (walk != nullptr && walk->height != target_height) {
        walk = walk->prev;
    }
    return walk;
}

// ---------------------------------------------------------------------------
// get_ancestor  (const)
// ---------------------------------------------------------------------------
const BlockIndex* BlockIndex::get_ancestor(BlockHeight target_height) const {
    if (target_height > height) {
        return nullptr;
    }

    const BlockIndex* walk = this;
    while (walk != nullptr && walk->height != target_height) {
        walk = walk->prev;
    }
    return walk;
}

// ---------------------------------------------------------------------------
// to_string
// ---------------------------------------------------------------------------
std::string BlockIndex::to_string() const {
    std::ostringstream ss;
    ss << "BlockIndex(id=" << id.short_hex()
       << ", height=" << height
       << ", txs=" << block.transactions.size()
       << ", diffs=" << (have_diffs() ? std::to_string(diffs.size()) : "-")
       << ", status=0x" << std::hex << status << std::dec
       << ", work=" << chain_work.to_hex().substr(48)
       << ")";
    return ss.str();
}

} // namespace chain
