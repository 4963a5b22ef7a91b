#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TALLY_CONSENSUS_REGISTRY_H
#define TALLY_CONSENSUS_REGISTRY_H

#include "core/serialize.h"

#include <cstddef>
#include <map>
#include <utility>

namespace consensus {

// ---------------------------------------------------------------------------
// Registry<Id, Value>
// ---------------------------------------------------------------------------
// Keyed store of live ledger objects. Ordered by ID so iteration, encoding
// and digests are deterministic. Holds no policy: the commit engine decides
// whether a missing or duplicate key is a fault.
// ---------------------------------------------------------------------------
template <typename Id, typename Value>
class Registry {
public:
    using Map = std::map<Id, Value>;

    [[nodiscard]] bool contains(const Id& id) const {
        return entries_.find(id) != entries_.end();
    }

    /// Pointer to the stored value, or nullptr if absent. Invalidated by
    /// the next erase of the same ID.
    [[nodiscard]] const Value* find(const Id& id) const {
        auto it = entries_.find(id);
        return it == entries_.end() ? nullptr : &it->second;
    }

    /// Returns false, leaving the registry untouched, if @p id is present.
    bool insert(const Id& id, Value value) {
        return entries_.emplace(id, std::move(value)).second;
    }

    /// Returns false if @p id is absent.
    bool erase(const Id& id) {
        return entries_.erase(id) > 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& [id, value] : entries_) {
            fn(id, value);
        }
    }

    [[nodiscard]] const Map& entries() const noexcept { return entries_; }

    bool operator==(const Registry&) const = default;

    /// Count, then (id, value) pairs in ID order.
    template <typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_compact_size(s, entries_.size());
        for (const auto& [id, value] : entries_) {
            id.serialize(s);
            value.serialize(s);
        }
    }

private:
    Map entries_;
};

} // namespace consensus

#endif // TALLY_CONSENSUS_REGISTRY_H
