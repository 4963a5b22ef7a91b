// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// tallyd -- replays and verifies the stored consensus ledger.

#include "chain/consensus_set.h"
#include "chain/penalizer.h"
#include "chain/storage/chain_store.h"
#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"
#include "consensus/tx_verify.h"
#include "node/config.h"
#include "node/import.h"
#include "node/logging_init.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

int fail(const core::Error& err) {
    LOG_ERROR(core::LogCategory::CONSENSUS, err.format());
    core::Logger::instance().flush();
    std::cerr << "Error: " << err.message() << std::endl;
    return EXIT_FAILURE;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto raw = node::load_config(argc, argv);
    if (!raw.ok()) {
        std::cerr << "Error: " << raw.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    if (raw.value().has("help") || raw.value().has("h") ||
        raw.value().has("?")) {
        node::print_usage();
        return EXIT_SUCCESS;
    }
    if (raw.value().has("version")) {
        node::print_version();
        return EXIT_SUCCESS;
    }

    auto config_result = node::make_node_config(raw.value());
    if (!config_result.ok()) {
        std::cerr << "Error: " << config_result.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    const node::NodeConfig& config = config_result.value();

    auto logging = node::init_logging(config);
    if (!logging.ok()) {
        std::cerr << "Error: " << logging.error().message() << std::endl;
        return EXIT_FAILURE;
    }

    // One process per data directory.
    core::fs::FileLock dir_lock(config.datadir / ".lock");
    if (!dir_lock.try_lock()) {
        return fail(core::Error(core::ErrorCode::STORAGE_ERROR,
            "Data directory " + config.datadir.string() +
            " is in use by another process"));
    }

    const consensus::ConsensusParams params = config.consensus_params();
    consensus::StandardValidator validator;
    chain::LoggingPenalizer penalizer;

    chain::storage::FlatChainStore store(config.datadir);
    auto opened = store.init();
    if (!opened.ok()) {
        return fail(opened.error());
    }

    chain::ConsensusSet chainstate(params, validator, &penalizer, &store);

    core::StopWatch timer;
    auto ready = chainstate.init();
    if (!ready.ok()) {
        return fail(ready.error());
    }
    LOG_INFO(core::LogCategory::BENCH,
             "Replay took " + std::to_string(timer.elapsed_ms()) + " ms");

    // Report every change to the best path made by the import below.
    const chain::SubscriptionId sub = chainstate.subscribe(
        chain::SubscriberTier::LEDGER, "tallyd",
        [](const chain::ChainUpdate& update) {
            if (update.sequence == 0) {
                return;  // catch-up; already reported by init()
            }
            LOG_INFO(core::LogCategory::NOTIFY,
                     "Update " + std::to_string(update.sequence) + ": -" +
                     std::to_string(update.reverted.size()) + " +" +
                     std::to_string(update.applied.size()) +
                     " blocks, height " + std::to_string(update.height));
        });

    if (!config.import_file.empty()) {
        auto imported = node::import_blocks(chainstate, config.import_file);
        if (!imported.ok()) {
            chainstate.unsubscribe(sub);
            return fail(imported.error());
        }
        const node::ImportStats& stats = imported.value();
        std::cout << "imported: " << stats.extended << " extended, "
                  << stats.reorganized << " reorganized, "
                  << stats.side_chain << " side chain, "
                  << stats.rejected << " rejected\n";
    }
    chainstate.unsubscribe(sub);

    std::cout << "network: " << params.network << "\n"
              << "height:  " << chainstate.height() << "\n"
              << "tip:     " << chainstate.tip_id().to_hex() << "\n"
              << "digest:  " << chainstate.digest().to_hex() << "\n";

    auto closed = chainstate.close();
    if (!closed.ok()) {
        return fail(closed.error());
    }
    core::Logger::instance().flush();
    return EXIT_SUCCESS;
}
