// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/ledger_state.h"

#include "crypto/hash.h"

namespace consensus {

namespace {

template <typename Value, typename Reg, typename Id>
std::optional<Value> lookup(const Reg& reg, const Id& id) {
    const Value* v = reg.find(id);
    if (!v) return std::nullopt;
    return *v;
}

} // anonymous namespace

std::optional<primitives::SiacoinOutput> LedgerState::get_siacoin_output(
    const primitives::SiacoinOutputID& id) const {
    return lookup<primitives::SiacoinOutput>(siacoin_outputs_, id);
}

std::optional<primitives::SiafundOutput> LedgerState::get_siafund_output(
    const primitives::SiafundOutputID& id) const {
    return lookup<primitives::SiafundOutput>(siafund_outputs_, id);
}

std::optional<primitives::FileContract> LedgerState::get_file_contract(
    const primitives::FileContractID& id) const {
    return lookup<primitives::FileContract>(file_contracts_, id);
}

core::uint256 LedgerState::digest() const {
    return crypto::hash(*this);
}

} // namespace consensus
