#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Coinbase schedule
// ---------------------------------------------------------------------------
// The subsidy falls by one coin per block from initial_coinbase until it
// reaches minimum_coinbase, and stays there.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "consensus/params.h"
#include "primitives/currency.h"

namespace consensus {

/// Newly created coins for the block at @p height.
[[nodiscard]] primitives::Currency get_block_subsidy(
    BlockHeight height,
    const ConsensusParams& params);

/// Total the block's miner payouts must add up to: subsidy + @p fees.
[[nodiscard]] core::Result<primitives::Currency> get_block_reward(
    BlockHeight height,
    primitives::Currency fees,
    const ConsensusParams& params);

} // namespace consensus
