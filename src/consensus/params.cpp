// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/params.h"

#include "crypto/keccak.h"

#include <string_view>

namespace consensus {

namespace {

primitives::UnlockHash unlock_hash_for(std::string_view label) {
    return primitives::UnlockHash(crypto::keccak256(label.data(), label.size()));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Genesis
// ---------------------------------------------------------------------------

primitives::Block ConsensusParams::genesis_block() const {
    primitives::Transaction allocation;
    allocation.siafund_outputs.push_back(primitives::SiafundOutput{
        primitives::Currency(siafund_count),
        genesis_siafund_unlock_hash,
        primitives::ZERO_CURRENCY});

    primitives::Block genesis;
    genesis.timestamp = genesis_timestamp;
    genesis.work = 1;
    genesis.transactions.push_back(std::move(allocation));
    return genesis;
}

// ---------------------------------------------------------------------------
// Main network
// ---------------------------------------------------------------------------

const ConsensusParams& ConsensusParams::main_params() {
    static const ConsensusParams params = [] {
        ConsensusParams p;
        p.network = "main";
        p.maturity_delay = 144;
        p.initial_coinbase = 300'000;
        p.minimum_coinbase = 30'000;
        p.max_reorg_depth = 100;
        p.genesis_timestamp = 1433600000;  // 2015-06-06 14:13:20 UTC
        p.siafund_count = 10'000;
        p.genesis_siafund_unlock_hash = unlock_hash_for("tally/genesis/main");
        return p;
    }();
    return params;
}

// ---------------------------------------------------------------------------
// Regression test network
// ---------------------------------------------------------------------------

const ConsensusParams& ConsensusParams::regtest_params() {
    static const ConsensusParams params = [] {
        ConsensusParams p;
        p.network = "regtest";
        p.maturity_delay = 3;
        p.initial_coinbase = 300'000;
        p.minimum_coinbase = 30'000;
        p.max_reorg_depth = 20;
        p.genesis_timestamp = 1424139000;
        p.siafund_count = 10'000;
        p.genesis_siafund_unlock_hash =
            unlock_hash_for("tally/genesis/regtest");
        return p;
    }();
    return params;
}

const ConsensusParams* ConsensusParams::for_network(const std::string& name) {
    if (name == "main") return &main_params();
    if (name == "regtest") return &regtest_params();
    return nullptr;
}

} // namespace consensus
