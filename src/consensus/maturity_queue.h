#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TALLY_CONSENSUS_MATURITY_QUEUE_H
#define TALLY_CONSENSUS_MATURITY_QUEUE_H

#include "core/error.h"
#include "core/serialize.h"
#include "consensus/registry.h"
#include "primitives/ids.h"
#include "primitives/outputs.h"

#include <cstddef>
#include <map>

namespace consensus {

using primitives::BlockHeight;

using DelayedBucket =
    Registry<primitives::SiacoinOutputID, primitives::SiacoinOutput>;

// ---------------------------------------------------------------------------
// MaturityQueue
// ---------------------------------------------------------------------------
// Siacoin outputs that exist but may not be spent yet (miner payouts and
// contract resolutions), bucketed by the height at which they mature. A
// bucket exists only while it holds at least one output.
// ---------------------------------------------------------------------------
class MaturityQueue {
public:
    /// Outputs maturing at @p height, or nullptr if none.
    [[nodiscard]] const DelayedBucket* bucket(BlockHeight height) const;

    /// Creates the bucket on first use. False if @p id is already queued at
    /// @p height.
    bool insert(BlockHeight height,
                const primitives::SiacoinOutputID& id,
                primitives::SiacoinOutput output);

    /// Drops the bucket when its last output leaves. False if absent.
    bool erase(BlockHeight height, const primitives::SiacoinOutputID& id);

    [[nodiscard]] const primitives::SiacoinOutput* find(
        BlockHeight height, const primitives::SiacoinOutputID& id) const;

    [[nodiscard]] bool contains(BlockHeight height,
                                const primitives::SiacoinOutputID& id) const;

    [[nodiscard]] std::size_t bucket_count() const noexcept {
        return buckets_.size();
    }

    /// Outputs across every bucket.
    [[nodiscard]] std::size_t total_size() const noexcept;

    /// Every bucket at or below @p height should already have been drained
    /// into the siacoin registry. Reports CONSISTENCY_MATURITY otherwise.
    [[nodiscard]] core::Result<void> check_elapsed(BlockHeight height) const;

    [[nodiscard]] const std::map<BlockHeight, DelayedBucket>& buckets()
        const noexcept {
        return buckets_;
    }

    bool operator==(const MaturityQueue&) const = default;

    template <typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_compact_size(s, buckets_.size());
        for (const auto& [height, bucket] : buckets_) {
            core::ser_write_u64(s, height);
            bucket.serialize(s);
        }
    }

private:
    std::map<BlockHeight, DelayedBucket> buckets_;
};

} // namespace consensus

#endif // TALLY_CONSENSUS_MATURITY_QUEUE_H
