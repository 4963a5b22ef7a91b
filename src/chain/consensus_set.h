#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// ConsensusSet -- block processor and fork resolver
// ---------------------------------------------------------------------------
// Owns the block tree, the best path and the ledger, and is the only
// component that changes them. accept_block() runs one block through
//
//   IDLE -> VALIDATING -> COMMITTING -> NOTIFYING -> IDLE
//
// and any consistency fault on the way moves it to HALTED for good.
//
// Thread safety:
//   - accept_mutex_ serializes writers across the whole validate, commit,
//     persist, notify sequence. Subscribers are called with it held, so
//     the next block waits until every subscriber has returned.
//   - state_mutex_ is held exclusively while the tree, path or ledger
//     change, and shared by the read API. Readers never see a partially
//     applied block or reorganization.
//   - Subscriber callbacks may use the read API. They must not call
//     accept_block() or subscribe().
// ---------------------------------------------------------------------------

#include "chain/block_index.h"
#include "chain/chain.h"
#include "chain/diff_builder.h"
#include "chain/notify.h"
#include "chain/penalizer.h"
#include "chain/reorg.h"
#include "chain/storage/chain_store.h"
#include "core/error.h"
#include "core/sync.h"
#include "core/types.h"
#include "consensus/ledger_state.h"
#include "consensus/params.h"
#include "consensus/tx_verify.h"
#include "consensus/validation.h"
#include "primitives/block.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chain {

enum class ProcessorState : uint8_t {
    IDLE,
    VALIDATING,
    COMMITTING,
    NOTIFYING,
    HALTED,
};

[[nodiscard]] std::string_view processor_state_name(ProcessorState s) noexcept;

enum class AcceptStatus : uint8_t {
    EXTENDED,       // the block became the new tip on top of the old one
    REORGANIZED,    // the block's branch replaced part of the best path
    SIDE_CHAIN,     // stored, but not heavier than the best path
};

[[nodiscard]] std::string_view accept_status_name(AcceptStatus s) noexcept;

class ConsensusSet : public consensus::LedgerView {
public:
    /// @param params     Chain constants; must outlive this object.
    /// @param validator  Rule oracle; must outlive this object.
    /// @param penalizer  Required. init() fails when it is null.
    /// @param store      Optional durable storage. Without one the ledger
    ///                   lives in memory only.
    ConsensusSet(const consensus::ConsensusParams& params,
                 const consensus::TransactionValidator& validator,
                 PeerPenalizer* penalizer,
                 storage::ChainStore* store = nullptr);

    ~ConsensusSet() override;

    ConsensusSet(const ConsensusSet&) = delete;
    ConsensusSet& operator=(const ConsensusSet&) = delete;

    // =======================================================================
    // Lifecycle
    // =======================================================================

    /// Apply genesis, then replay every block in the store without
    /// notifying anyone. A stored block that no longer replays to the
    /// stored diffs is STORAGE_CORRUPT.
    core::Result<void> init();

    /// Flush the store. Later accept_block() calls fail.
    core::Result<void> close();

    // =======================================================================
    // Block processing
    // =======================================================================

    /// Validate @p block and, if it wins fork choice, make it the tip.
    ///
    /// Errors:
    ///   VALIDATION_*   the block was refused; nothing changed
    ///   CONSISTENCY_*  the ledger disagrees with its own history; the
    ///                  processor is now HALTED
    ///   STORAGE_*      the block was committed but could not be stored;
    ///                  the processor is now HALTED
    ///
    /// @param source  Opaque peer handle handed to the penalizer.
    core::Result<AcceptStatus> accept_block(const primitives::Block& block,
                                            const std::string& source = "");

    // =======================================================================
    // Read API (shared lock)
    // =======================================================================

    BlockHeight height() const override;

    std::optional<primitives::SiacoinOutput>
    get_siacoin_output(const primitives::SiacoinOutputID& id) const override;

    std::optional<primitives::SiafundOutput>
    get_siafund_output(const primitives::SiafundOutputID& id) const override;

    std::optional<primitives::FileContract>
    get_file_contract(const primitives::FileContractID& id) const override;

    /// Best path, genesis first.
    std::vector<primitives::BlockID> current_path() const;

    primitives::BlockID tip_id() const;

    /// True for any block in the tree, failed ones included.
    bool block_known(const primitives::BlockID& id) const;

    /// True if @p id was refused as funded-but-unspent.
    bool is_dos_block(const primitives::BlockID& id) const;

    /// Outputs waiting in the maturity bucket for @p height.
    std::vector<primitives::SiacoinOutputID> delayed_outputs_at(
        BlockHeight height) const;

    /// Digest of the full ledger state.
    core::uint256 digest() const;

    ProcessorState processor_state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    bool is_halted() const noexcept {
        return processor_state() == ProcessorState::HALTED;
    }

    const consensus::ConsensusParams& params() const { return params_; }

    // =======================================================================
    // Subscribers
    // =======================================================================

    /// Register @p callback and immediately deliver the whole best path to
    /// it as a single catch-up update.
    SubscriptionId subscribe(SubscriberTier tier, std::string name,
                             UpdateCallback callback);

    bool unsubscribe(SubscriptionId id);

private:
    // =======================================================================
    // Hash functor for BlockID keys in unordered_map
    // =======================================================================
    struct BlockIdHash {
        size_t operator()(const primitives::BlockID& id) const noexcept {
            return std::hash<primitives::BlockID>{}(id);
        }
    };

    // =======================================================================
    // Internal helpers
    // =======================================================================

    /// accept_block() body. Caller holds accept_mutex_. @p replaying
    /// suppresses persistence and notification.
    core::Result<AcceptStatus> accept_locked(const primitives::Block& block,
                                             const std::string& source,
                                             bool replaying);

    /// Header stage: duplicate, cached-invalid, DoS and orphan checks, then
    /// the validator's header rules and the payout rule. Returns the parent.
    core::Result<BlockIndex*> check_block(const primitives::Block& block,
                                          const primitives::BlockID& id,
                                          const std::string& source);

    /// Walk the best path along @p path. On a rejection the old path is
    /// restored before returning and @p rejected names the block that
    /// failed. Caller holds state_mutex_ exclusively.
    core::Result<void> switch_to(const ReorgPath& path,
                                 consensus::BlockValidationState& vstate,
                                 std::vector<BlockIndex*>& generated,
                                 BlockIndex*& rejected);

    /// Bring @p bi onto the ledger, replaying recorded diffs if it has any.
    core::Result<void> connect_node(BlockIndex* bi,
                                    consensus::BlockValidationState& vstate,
                                    std::vector<BlockIndex*>& generated);

    core::Result<void> disconnect_node(BlockIndex* bi);

    core::Result<void> persist(const BlockIndex* bi, bool with_diffs);
    /// Store every block of @p connected with its diffs in one batch.
    core::Result<void> persist_connected(
        const std::vector<BlockIndex*>& connected);

    /// Check every stored diff list against the regenerated one.
    core::Result<void> verify_replay(
        const std::vector<storage::BlockRecord>& records) const;

    ChainUpdate build_update(const ReorgPath& path) const;

    /// Enter HALTED and pass @p err through.
    core::Error halt(core::Error err);

    /// Log a rejection and pass it through as an error.
    core::Error reject(const consensus::ValidationState& vstate,
                       const primitives::BlockID& id) const;

    void set_state(ProcessorState s) noexcept {
        state_.store(s, std::memory_order_release);
    }

    BlockIndex* lookup(const primitives::BlockID& id) const;

    // =======================================================================
    // Data members
    // =======================================================================

    const consensus::ConsensusParams& params_;
    const consensus::TransactionValidator& validator_;
    PeerPenalizer* penalizer_;
    storage::ChainStore* store_;

    /// Single-writer lock. Declared before state_mutex_: always taken first.
    mutable core::Mutex accept_mutex_{"accept"};

    /// Guards block_index_, chain_ and ledger_.
    mutable core::SharedMutex state_mutex_{"ledger_state"};

    NotificationBus bus_;

    std::atomic<ProcessorState> state_{ProcessorState::IDLE};
    bool initialized_ = false;
    bool closed_ = false;
    uint64_t sequence_ = 0;

    consensus::LedgerState ledger_;
    DiffBuilder builder_;

    std::unordered_map<primitives::BlockID, std::unique_ptr<BlockIndex>,
                       BlockIdHash> block_index_;

    Chain chain_;
};

} // namespace chain
