// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/subsidy.h"

namespace consensus {

primitives::Currency get_block_subsidy(BlockHeight height,
                                       const ConsensusParams& params) {
    uint64_t coins = params.minimum_coinbase;
    if (height < params.initial_coinbase &&
        params.initial_coinbase - height > params.minimum_coinbase) {
        coins = params.initial_coinbase - height;
    }
    return primitives::Currency::coins(coins);
}

core::Result<primitives::Currency> get_block_reward(
    BlockHeight height,
    primitives::Currency fees,
    const ConsensusParams& params) {
    return get_block_subsidy(height, params).add(fees);
}

} // namespace consensus
