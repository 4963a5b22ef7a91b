// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/chain.h"

#include <vector>

namespace chain {

// ---------------------------------------------------------------------------
// genesis
// ---------------------------------------------------------------------------
BlockIndex* Chain::genesis() const {
    if (chain_.empty()) {
        return nullptr;
    }
    return chain_.front();
}

// ---------------------------------------------------------------------------
// tip
// ---------------------------------------------------------------------------
BlockIndex* Chain::tip() const {
    if (chain_.empty()) {
        return nullptr;
    }
    return chain_.back();
}

// ---------------------------------------------------------------------------
// at
// ---------------------------------------------------------------------------
BlockIndex* Chain::at(BlockHeight height) const {
    if (height >= chain_.size()) {
        return nullptr;
    }
    return chain_[static_cast<size_t>(height)];
}

// ---------------------------------------------------------------------------
// height
// ---------------------------------------------------------------------------
BlockHeight Chain::height() const {
    if (chain_.empty()) {
        return 0;
    }
    return static_cast<BlockHeight>(chain_.size() - 1);
}

// ---------------------------------------------------------------------------
// contains
// ---------------------------------------------------------------------------
bool Chain::contains(const BlockIndex* index) const {
    if (index == nullptr) {
        return false;
    }
    if (index->height >= chain_.size()) {
        return false;
    }
    return chain_[static_cast<size_t>(index->height)] == index;
}

// ---------------------------------------------------------------------------
// find_fork
// ---------------------------------------------------------------------------
const BlockIndex* Chain::find_fork(const BlockIndex* index) const {
    if (chain_.empty() || index == nullptr) {
        return nullptr;
    }

    // Walk down to the height of our tip if the candidate is taller.
    const BlockIndex* walk = index;
    while (walk != nullptr && walk->height > height()) {
        walk = walk->prev;
    }

    while (walk != nullptr) {
        if (contains(walk)) {
            return walk;
        }
        walk = walk->prev;
    }

    return nullptr;
}

// ---------------------------------------------------------------------------
// set_tip
// ---------------------------------------------------------------------------
void Chain::set_tip(BlockIndex* index) {
    if (index == nullptr) {
        chain_.clear();
        return;
    }

    chain_.resize(static_cast<size_t>(index->height) + 1);

    // Walk backwards from the new tip, filling in the vector.
    BlockIndex* walk = index;
    while (walk != nullptr) {
        chain_[static_cast<size_t>(walk->height)] = walk;
        walk = walk->prev;
    }
}

// ---------------------------------------------------------------------------
// ids
// ---------------------------------------------------------------------------
std::vector<primitives::BlockID> Chain::ids() const {
    std::vector<primitives::BlockID> out;
    out.reserve(chain_.size());
    for (const BlockIndex* bi : chain_) {
        out.push_back(bi->id);
    }
    return out;
}

} // namespace chain
