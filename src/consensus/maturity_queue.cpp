// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/maturity_queue.h"

#include <string>

namespace consensus {

const DelayedBucket* MaturityQueue::bucket(BlockHeight height) const {
    auto it = buckets_.find(height);
    return it == buckets_.end() ? nullptr : &it->second;
}

bool MaturityQueue::insert(BlockHeight height,
                           const primitives::SiacoinOutputID& id,
                           primitives::SiacoinOutput output) {
    return buckets_[height].insert(id, std::move(output));
}

bool MaturityQueue::erase(BlockHeight height,
                          const primitives::SiacoinOutputID& id) {
    auto it = buckets_.find(height);
    if (it == buckets_.end() || !it->second.erase(id)) {
        return false;
    }
    if (it->second.empty()) {
        buckets_.erase(it);
    }
    return true;
}

const primitives::SiacoinOutput* MaturityQueue::find(
    BlockHeight height, const primitives::SiacoinOutputID& id) const {
    const DelayedBucket* b = bucket(height);
    return b ? b->find(id) : nullptr;
}

bool MaturityQueue::contains(BlockHeight height,
                             const primitives::SiacoinOutputID& id) const {
    return find(height, id) != nullptr;
}

std::size_t MaturityQueue::total_size() const noexcept {
    std::size_t total = 0;
    for (const auto& [height, b] : buckets_) {
        total += b.size();
    }
    return total;
}

core::Result<void> MaturityQueue::check_elapsed(BlockHeight height) const {
    if (buckets_.empty() || buckets_.begin()->first > height) {
        return core::make_ok();
    }
    const auto& [stale_height, stale] = *buckets_.begin();
    return core::make_error(
        core::ErrorCode::CONSISTENCY_MATURITY,
        "maturity bucket " + std::to_string(stale_height) + " still holds " +
            std::to_string(stale.size()) + " outputs at height " +
            std::to_string(height));
}

} // namespace consensus
