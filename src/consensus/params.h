#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// ConsensusParams -- chain constants for one network
// ---------------------------------------------------------------------------
// Maturity delay, coinbase schedule, genesis allocation and the reorg
// depth limit. Obtained from a static factory and held by reference for the
// lifetime of the ConsensusSet.
// ---------------------------------------------------------------------------

#include "primitives/block.h"
#include "primitives/currency.h"
#include "primitives/ids.h"
#include "primitives/outputs.h"

#include <cstdint>
#include <string>

namespace consensus {

using primitives::BlockHeight;

struct ConsensusParams {
    /// "main" or "regtest".
    std::string network;

    // -- Maturity -----------------------------------------------------------

    /// Blocks a miner payout or contract resolution waits before it can be
    /// spent. An output created by the block at height h matures at
    /// h + maturity_delay.
    BlockHeight maturity_delay = 144;

    // -- Coinbase schedule (whole coins) ------------------------------------

    /// coinbase(h) = max(initial_coinbase - h, minimum_coinbase) coins.
    uint64_t initial_coinbase = 300'000;
    uint64_t minimum_coinbase = 30'000;

    // -- Fork choice --------------------------------------------------------

    /// Deepest reorganization accepted, counted in blocks disconnected.
    BlockHeight max_reorg_depth = 100;

    // -- Genesis ------------------------------------------------------------

    uint64_t genesis_timestamp = 0;

    /// Total siafund supply, created in full by the genesis block.
    uint64_t siafund_count = 10'000;

    /// Recipient of the genesis siafund allocation.
    primitives::UnlockHash genesis_siafund_unlock_hash;

    /// The genesis block: no parent, no payouts, a single transaction
    /// carrying the siafund allocation.
    [[nodiscard]] primitives::Block genesis_block() const;

    // -- Static factory methods ---------------------------------------------

    static const ConsensusParams& main_params();

    /// Short maturity so tests can mature payouts within a few blocks.
    static const ConsensusParams& regtest_params();

    /// main_params() or regtest_params(); nullptr for unknown names.
    static const ConsensusParams* for_network(const std::string& name);
};

} // namespace consensus
