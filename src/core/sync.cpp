// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"

#ifndef NDEBUG

#include "core/logging.h"

#include <atomic>
#include <iterator>
#include <vector>

namespace core {

static std::atomic<uint64_t> g_next_order_id{1};

uint64_t next_mutex_order_id()
{
    return g_next_order_id.fetch_add(1, std::memory_order_relaxed);
}

/// Locks held by this thread, earliest acquired first.
static thread_local std::vector<const LockOrderEntry*> held_locks;

void debug_lock_push(const LockOrderEntry* entry)
{
    for (const LockOrderEntry* held : held_locks) {
        if (held->order >= entry->order) {
            LOG_WARN(LogCategory::LOCK,
                     "potential deadlock: holding '" + held->name +
                     "' (order " + std::to_string(held->order) +
                     ") while acquiring '" + entry->name +
                     "' (order " + std::to_string(entry->order) + ")");
            break;
        }
    }
    held_locks.push_back(entry);
}

void debug_lock_pop(const LockOrderEntry* entry)
{
    // Release order is not always LIFO; erase the most recent match.
    for (auto it = held_locks.rbegin(); it != held_locks.rend(); ++it) {
        if (*it == entry) {
            held_locks.erase(std::next(it).base());
            return;
        }
    }
}

std::size_t debug_held_lock_count()
{
    return held_locks.size();
}

}  // namespace core

#endif  // !NDEBUG
