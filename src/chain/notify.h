#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"
#include "consensus/diff.h"
#include "primitives/ids.h"
#include "primitives/outputs.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace chain {

using primitives::BlockHeight;

// ---------------------------------------------------------------------------
// NotificationBus -- ordered, synchronous delivery of chain updates
// ---------------------------------------------------------------------------
// Subscribers register in one of three tiers. publish() delivers to every
// LEDGER subscriber, then every TRANSACTION_POOL subscriber, then every
// POOL_DEPENDENT subscriber, each tier in registration order, and returns
// only after the last callback has returned.
//
// Callbacks run on the publishing thread without the bus lock held, so a
// callback may subscribe, unsubscribe or read the ledger. A callback that
// throws is logged and skipped; the rest still receive the update.
// ---------------------------------------------------------------------------

enum class SubscriberTier : uint8_t {
    LEDGER           = 0,   // ledger mirrors and indexers
    TRANSACTION_POOL = 1,
    POOL_DEPENDENT   = 2,   // wallet, miner
};

[[nodiscard]] std::string_view tier_name(SubscriberTier tier) noexcept;

/// One block entering or leaving the best path, with its diffs.
struct BlockChange {
    primitives::BlockID id;
    BlockHeight height = 0;
    consensus::DiffList diffs;
};

/// What changed on the best path since the previous update.
struct ChainUpdate {
    /// Blocks removed from the best path, newest first.
    std::vector<BlockChange> reverted;

    /// Blocks added to the best path, oldest first.
    std::vector<BlockChange> applied;

    /// Best path after the change.
    BlockHeight height = 0;
    primitives::BlockID tip;

    /// Increases by one per published update. Catch-up updates delivered on
    /// subscription reuse the current value.
    uint64_t sequence = 0;
};

using UpdateCallback = std::function<void(const ChainUpdate&)>;

/// Unique identifier for a registered subscriber, used to unsubscribe.
using SubscriptionId = uint64_t;

class NotificationBus {
public:
    NotificationBus() = default;

    NotificationBus(const NotificationBus&) = delete;
    NotificationBus& operator=(const NotificationBus&) = delete;

    SubscriptionId subscribe(SubscriberTier tier, std::string name,
                             UpdateCallback callback);

    /// Returns false if @p id is not registered.
    bool unsubscribe(SubscriptionId id);

    /// Deliver @p update to every subscriber, tier by tier.
    void publish(const ChainUpdate& update);

    /// Deliver @p update to the single subscriber @p id only.
    void deliver_to(SubscriptionId id, const ChainUpdate& update);

    [[nodiscard]] size_t subscriber_count() const;

private:
    struct Entry {
        SubscriptionId id;
        SubscriberTier tier;
        std::string name;
        UpdateCallback callback;
    };

    static void invoke(const Entry& entry, const ChainUpdate& update);

    mutable core::Mutex mutex_{"notify_bus"};
    SubscriptionId next_id_ = 1;
    std::vector<Entry> entries_;
};

} // namespace chain
