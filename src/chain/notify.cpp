// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/notify.h"

#include "core/logging.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace chain {

std::string_view tier_name(SubscriberTier tier) noexcept {
    switch (tier) {
        case SubscriberTier::LEDGER:           return "ledger";
        case SubscriberTier::TRANSACTION_POOL: return "transaction-pool";
        case SubscriberTier::POOL_DEPENDENT:   return "pool-dependent";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

SubscriptionId NotificationBus::subscribe(SubscriberTier tier,
                                          std::string name,
                                          UpdateCallback callback) {
    LOCK(mutex_);
    SubscriptionId id = next_id_++;
    LOG_DEBUG(core::LogCategory::NOTIFY,
              "Subscribed '" + name + "' (" + std::string(tier_name(tier)) +
              ") id=" + std::to_string(id));
    entries_.push_back({id, tier, std::move(name), std::move(callback)});
    return id;
}

bool NotificationBus::unsubscribe(SubscriptionId id) {
    LOCK(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    LOG_DEBUG(core::LogCategory::NOTIFY,
              "Unsubscribed '" + it->name + "' id=" + std::to_string(id));
    entries_.erase(it);
    return true;
}

size_t NotificationBus::subscriber_count() const {
    LOCK(mutex_);
    return entries_.size();
}

// ---------------------------------------------------------------------------
// Delivery
// ---------------------------------------------------------------------------

void NotificationBus::invoke(const Entry& entry, const ChainUpdate& update) {
    try {
        entry.callback(update);
    } catch (const std::exception& e) {
        LOG_ERROR(core::LogCategory::NOTIFY,
                  "Subscriber '" + entry.name + "' failed on update " +
                  std::to_string(update.sequence) + ": " + e.what());
    }
}

void NotificationBus::publish(const ChainUpdate& update) {
    // Copy callbacks under lock, then invoke outside the lock so that a
    // callback can register, unregister or read the ledger.
    std::vector<Entry> snapshot;
    {
        LOCK(mutex_);
        snapshot = entries_;
    }

    // Stable: registration order survives within each tier.
    std::stable_sort(snapshot.begin(), snapshot.end(),
                     [](const Entry& a, const Entry& b) {
                         return a.tier < b.tier;
                     });

    for (const auto& entry : snapshot) {
        invoke(entry, update);
    }

    LOG_TRACE(core::LogCategory::NOTIFY,
              "Update " + std::to_string(update.sequence) + " delivered to " +
              std::to_string(snapshot.size()) + " subscribers");
}

void NotificationBus::deliver_to(SubscriptionId id,
                                 const ChainUpdate& update) {
    std::vector<Entry> target;
    {
        LOCK(mutex_);
        for (const auto& e : entries_) {
            if (e.id == id) {
                target.push_back(e);
                break;
            }
        }
    }
    for (const auto& entry : target) {
        invoke(entry, update);
    }
}

} // namespace chain
