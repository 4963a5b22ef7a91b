// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/commit.h"

#include "core/logging.h"

#include <string>
#include <string_view>

namespace consensus {

namespace {

core::Error fault(core::ErrorCode code, std::string_view what,
                  const Diff& d, DiffDirection dir) {
    return core::make_error(
        code, std::string(what) + " while committing " + describe(d) +
                  " (" + std::string(direction_name(dir)) + ")");
}

/// ADD/REMOVE against one registry.
template <typename Reg, typename D, typename Value>
core::Result<void> commit_to(Reg& reg, const D& diff, const Value& value,
                             DiffDirection dir) {
    if (diff.direction == dir) {
        if (!reg.insert(diff.id, value)) {
            return fault(core::ErrorCode::CONSISTENCY_DUPLICATE,
                         "id already present", Diff(diff), dir);
        }
        return core::make_ok();
    }

    const Value* stored = reg.find(diff.id);
    if (!stored) {
        return fault(core::ErrorCode::CONSISTENCY_MISSING,
                     "id not present", Diff(diff), dir);
    }
    if (!(*stored == value)) {
        return fault(core::ErrorCode::CONSISTENCY_MISMATCH,
                     "stored value differs", Diff(diff), dir);
    }
    reg.erase(diff.id);
    return core::make_ok();
}

} // anonymous namespace

core::Result<void> DiffCommitter::commit(const SiacoinOutputDiff& d,
                                         DiffDirection dir) {
    return commit_to(state_.siacoin_outputs(), d, d.output, dir);
}

core::Result<void> DiffCommitter::commit(const SiafundOutputDiff& d,
                                         DiffDirection dir) {
    return commit_to(state_.siafund_outputs(), d, d.output, dir);
}

core::Result<void> DiffCommitter::commit(const FileContractDiff& d,
                                         DiffDirection dir) {
    return commit_to(state_.file_contracts(), d, d.contract, dir);
}

core::Result<void> DiffCommitter::commit(const DelayedSiacoinOutputDiff& d,
                                         DiffDirection dir) {
    if (d.maturity_height <= state_.height()) {
        return fault(core::ErrorCode::CONSISTENCY_MATURITY,
                     "maturity height " + std::to_string(d.maturity_height) +
                         " not above state height " +
                         std::to_string(state_.height()),
                     Diff(d), dir);
    }

    MaturityQueue& queue = state_.delayed_outputs();
    if (d.direction == dir) {
        if (!queue.insert(d.maturity_height, d.id, d.output)) {
            return fault(core::ErrorCode::CONSISTENCY_DUPLICATE,
                         "id already queued", Diff(d), dir);
        }
        return core::make_ok();
    }

    const primitives::SiacoinOutput* stored =
        queue.find(d.maturity_height, d.id);
    if (!stored) {
        return fault(core::ErrorCode::CONSISTENCY_MISSING,
                     "id not queued", Diff(d), dir);
    }
    if (!(*stored == d.output)) {
        return fault(core::ErrorCode::CONSISTENCY_MISMATCH,
                     "queued value differs", Diff(d), dir);
    }
    queue.erase(d.maturity_height, d.id);
    return core::make_ok();
}

core::Result<void> DiffCommitter::commit(const Diff& d, DiffDirection dir) {
    LOG_TRACE(core::LogCategory::DIFF,
              std::string(direction_name(dir)) + " " + describe(d));
    return std::visit(
        [this, dir](const auto& alt) { return commit(alt, dir); }, d);
}

core::Result<void> DiffCommitter::commit_all(const DiffList& diffs,
                                             DiffDirection dir) {
    if (dir == DiffDirection::APPLY) {
        for (const auto& d : diffs) {
            TALLY_TRY_VOID(commit(d, dir));
        }
    } else {
        for (auto it = diffs.rbegin(); it != diffs.rend(); ++it) {
            TALLY_TRY_VOID(commit(*it, dir));
        }
    }
    return core::make_ok();
}

} // namespace consensus
