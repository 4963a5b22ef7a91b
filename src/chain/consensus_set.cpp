// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/consensus_set.h"

#include "core/logging.h"
#include "consensus/diff.h"

#include <string>
#include <utility>

namespace chain {

using consensus::BlockValidationState;
using consensus::ValidationResult;

std::string_view processor_state_name(ProcessorState s) noexcept {
    switch (s) {
        case ProcessorState::IDLE:       return "IDLE";
        case ProcessorState::VALIDATING: return "VALIDATING";
        case ProcessorState::COMMITTING: return "COMMITTING";
        case ProcessorState::NOTIFYING:  return "NOTIFYING";
        case ProcessorState::HALTED:     return "HALTED";
    }
    return "UNKNOWN";
}

std::string_view accept_status_name(AcceptStatus s) noexcept {
    switch (s) {
        case AcceptStatus::EXTENDED:    return "EXTENDED";
        case AcceptStatus::REORGANIZED: return "REORGANIZED";
        case AcceptStatus::SIDE_CHAIN:  return "SIDE_CHAIN";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

ConsensusSet::ConsensusSet(const consensus::ConsensusParams& params,
                           const consensus::TransactionValidator& validator,
                           PeerPenalizer* penalizer,
                           storage::ChainStore* store)
    : params_(params),
      validator_(validator),
      penalizer_(penalizer),
      store_(store),
      builder_(ledger_, params, validator) {}

ConsensusSet::~ConsensusSet() = default;

// ===========================================================================
// Lifecycle
// ===========================================================================

core::Result<void> ConsensusSet::init() {
    LOCK(accept_mutex_);

    if (initialized_) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
            "ConsensusSet already initialized");
    }
    if (penalizer_ == nullptr) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
            "ConsensusSet requires a peer penalizer");
    }

    const primitives::Block genesis = params_.genesis_block();
    {
        core::WriteLock lock(state_mutex_);

        TALLY_TRY_ASSIGN(diffs, builder_.connect_genesis(genesis));

        auto node = std::make_unique<BlockIndex>();
        node->id = genesis.id();
        node->height = 0;
        node->chain_work = core::uint256::from_uint64(genesis.work);
        node->block = genesis;
        node->status = BlockIndex::BLOCK_VALID_HEADER;
        node->set_diffs(std::move(diffs));

        chain_.set_tip(node.get());
        block_index_.emplace(node->id, std::move(node));
    }

    LOG_INFO(core::LogCategory::CONSENSUS,
             "Genesis " + chain_.genesis()->id.short_hex() + " applied (" +
             params_.network + ")");

    if (store_ != nullptr) {
        TALLY_TRY_ASSIGN(records, store_->load_blocks());

        for (const auto& record : records) {
            const primitives::BlockID id = record.block.id();
            if (lookup(id) != nullptr) {
                continue;
            }
            auto r = accept_locked(record.block, "", /*replaying=*/true);
            if (!r.ok()) {
                if (!r.error().is_rejection()) {
                    return std::move(r).error();
                }
                return halt(core::Error(core::ErrorCode::STORAGE_CORRUPT,
                    "Stored block " + id.short_hex() +
                    " no longer validates: " + r.error().message()));
            }
        }

        auto verified = verify_replay(records);
        if (!verified.ok()) {
            return halt(std::move(verified).error());
        }

        LOG_INFO(core::LogCategory::STORAGE,
                 "Replayed " + std::to_string(records.size()) +
                 " stored records");
    }

    initialized_ = true;

    LOG_INFO(core::LogCategory::CONSENSUS,
             "Consensus set ready at height " +
             std::to_string(chain_.height()) + ", tip " +
             chain_.tip()->id.short_hex());
    return core::make_ok();
}

core::Result<void> ConsensusSet::close() {
    LOCK(accept_mutex_);

    if (closed_) {
        return core::make_ok();
    }
    closed_ = true;

    if (store_ != nullptr) {
        TALLY_TRY_VOID(store_->flush());
    }

    LOG_INFO(core::LogCategory::CONSENSUS,
             "Consensus set closed at height " +
             std::to_string(chain_.height()));
    return core::make_ok();
}

// ===========================================================================
// accept_block
// ===========================================================================

core::Result<AcceptStatus> ConsensusSet::accept_block(
    const primitives::Block& block, const std::string& source) {
    LOCK(accept_mutex_);

    if (is_halted()) {
        return core::Error(core::ErrorCode::CONSISTENCY_HALTED,
            "Block processor halted after a consistency fault");
    }
    if (!initialized_ || closed_) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
            closed_ ? "Consensus set is closed"
                    : "Consensus set not initialized");
    }

    return accept_locked(block, source, /*replaying=*/false);
}

core::Result<AcceptStatus> ConsensusSet::accept_locked(
    const primitives::Block& block,
    const std::string& source,
    bool replaying) {
    const primitives::BlockID id = block.id();

    // -- Header stage -------------------------------------------------------

    set_state(ProcessorState::VALIDATING);

    auto parent_result = check_block(block, id, source);
    if (!parent_result.ok()) {
        set_state(ProcessorState::IDLE);
        return std::move(parent_result).error();
    }
    BlockIndex* parent = parent_result.value();

    auto owned = std::make_unique<BlockIndex>();
    owned->id = id;
    owned->prev = parent;
    owned->height = parent->height + 1;
    owned->chain_work =
        parent->chain_work + core::uint256::from_uint64(block.work);
    owned->block = block;
    owned->source = source;
    owned->status = BlockIndex::BLOCK_VALID_HEADER;
    BlockIndex* node = owned.get();

    // -- Fork choice --------------------------------------------------------

    // Ties keep the current tip.
    if (node->chain_work <= chain_.tip()->chain_work) {
        {
            core::WriteLock lock(state_mutex_);
            block_index_.emplace(id, std::move(owned));
        }
        if (!replaying) {
            auto stored = persist(node, /*with_diffs=*/false);
            if (!stored.ok()) {
                return halt(std::move(stored).error());
            }
        }
        set_state(ProcessorState::IDLE);
        LOG_DEBUG(core::LogCategory::CHAIN,
                  "Side-chain block " + node->to_string());
        return AcceptStatus::SIDE_CHAIN;
    }

    const ReorgPath path = compute_reorg_path(chain_, node);
    if (path.fork_point == nullptr) {
        return halt(core::Error(core::ErrorCode::CONSISTENCY_FAULT,
            "Block " + id.short_hex() + " shares no ancestor with the tip"));
    }

    BlockValidationState vstate;
    if (!is_reorg_safe(path, params_.max_reorg_depth)) {
        vstate.invalid(ValidationResult::BLOCK_REORG_TOO_DEEP,
                       "reorg-too-deep",
                       std::to_string(path.to_disconnect.size()) +
                           " blocks > " +
                           std::to_string(params_.max_reorg_depth));
        set_state(ProcessorState::IDLE);
        return reject(vstate, id);
    }

    // -- Commit -------------------------------------------------------------

    set_state(ProcessorState::COMMITTING);

    std::vector<BlockIndex*> generated;
    BlockIndex* rejected = nullptr;
    core::Result<void> switched;
    {
        core::WriteLock lock(state_mutex_);
        block_index_.emplace(id, std::move(owned));
        switched = switch_to(path, vstate, generated, rejected);
    }

    if (!switched.ok()) {
        core::Error err = std::move(switched).error();
        if (!err.is_rejection()) {
            return halt(std::move(err));
        }
        set_state(ProcessorState::IDLE);
        if (vstate.get_result() == ValidationResult::BLOCK_DOS &&
            rejected != nullptr) {
            penalizer_->penalize(rejected->source,
                                 vstate.get_reject_reason());
        }
        return reject(vstate, id);
    }

    if (!replaying) {
        auto stored = persist_connected(generated);
        if (!stored.ok()) {
            return halt(std::move(stored).error());
        }
    }

    const AcceptStatus status = path.is_extension()
        ? AcceptStatus::EXTENDED
        : AcceptStatus::REORGANIZED;

    if (!path.is_extension()) {
        LOG_INFO(core::LogCategory::CHAIN,
                 "Reorganized at " + path.fork_point->to_string() + ": " +
                 std::to_string(path.to_disconnect.size()) +
                 " disconnected, " +
                 std::to_string(path.to_connect.size()) + " connected");
    }
    LOG_INFO(core::LogCategory::CHAIN,
             "New tip " + node->to_string());

    // -- Notify -------------------------------------------------------------

    if (!replaying) {
        set_state(ProcessorState::NOTIFYING);
        ChainUpdate update = build_update(path);
        update.sequence = ++sequence_;
        bus_.publish(update);
    }

    set_state(ProcessorState::IDLE);
    return status;
}

// ---------------------------------------------------------------------------
// check_block -- everything that can be decided without touching the ledger
// ---------------------------------------------------------------------------

core::Result<BlockIndex*> ConsensusSet::check_block(
    const primitives::Block& block,
    const primitives::BlockID& id,
    const std::string& source) {
    BlockValidationState vstate;

    if (const BlockIndex* known = lookup(id)) {
        if (known->is_dos()) {
            vstate.invalid(ValidationResult::BLOCK_DOS, "block-known-dos",
                           id.short_hex());
            penalizer_->penalize(source, vstate.get_reject_reason());
        } else if (known->is_failed()) {
            vstate.invalid(ValidationResult::BLOCK_CACHED_INVALID,
                           "block-cached-invalid", id.short_hex());
        } else {
            vstate.invalid(ValidationResult::BLOCK_KNOWN, "block-known",
                           id.short_hex());
        }
        return reject(vstate, id);
    }

    BlockIndex* parent = lookup(block.parent_id);
    if (parent == nullptr) {
        vstate.invalid(ValidationResult::BLOCK_MISSING_PREV,
                       "prev-blk-not-found", block.parent_id.short_hex());
        return reject(vstate, id);
    }
    if (parent->is_failed()) {
        vstate.invalid(ValidationResult::BLOCK_CACHED_INVALID,
                       "bad-prevblk", parent->id.short_hex());
        return reject(vstate, id);
    }

    if (!validator_.check_header(block, parent->block, vstate)) {
        return reject(vstate, id);
    }
    if (!consensus::check_miner_payouts(block, parent->height + 1, params_,
                                        vstate)) {
        return reject(vstate, id);
    }

    return parent;
}

// ---------------------------------------------------------------------------
// switch_to -- move the best path, or put it back
// ---------------------------------------------------------------------------

core::Result<void> ConsensusSet::switch_to(
    const ReorgPath& path,
    BlockValidationState& vstate,
    std::vector<BlockIndex*>& generated,
    BlockIndex*& rejected) {
    for (BlockIndex* bi : path.to_disconnect) {
        TALLY_TRY_VOID(disconnect_node(bi));
    }

    for (size_t i = 0; i < path.to_connect.size(); ++i) {
        BlockIndex* bi = path.to_connect[i];

        auto connected = connect_node(bi, vstate, generated);
        if (connected.ok()) {
            continue;
        }
        core::Error err = std::move(connected).error();
        if (!err.is_rejection()) {
            return err;
        }

        rejected = bi;

        // Cache the verdict for this block and everything built on it.
        if (!bi->is_failed()) {
            bi->status |= BlockIndex::BLOCK_FAILED_VALID;
            if (vstate.get_result() == ValidationResult::BLOCK_DOS) {
                bi->status |= BlockIndex::BLOCK_DOS;
            }
        }
        for (size_t j = i + 1; j < path.to_connect.size(); ++j) {
            path.to_connect[j]->status |= BlockIndex::BLOCK_FAILED_CHILD;
        }

        // Unwind the part of the new branch that did connect.
        for (size_t j = i; j-- > 0;) {
            TALLY_TRY_VOID(disconnect_node(path.to_connect[j]));
        }

        // Diffs generated on an abandoned attempt are never persisted;
        // forget them so a later connect regenerates and stores them.
        for (BlockIndex* g : generated) {
            g->diffs.clear();
            g->status &= ~static_cast<uint32_t>(BlockIndex::BLOCK_HAVE_DIFFS);
        }
        generated.clear();

        // Restore the old branch, oldest first.
        for (auto it = path.to_disconnect.rbegin();
             it != path.to_disconnect.rend(); ++it) {
            BlockIndex* old = *it;
            if (!old->have_diffs()) {
                return core::Error(core::ErrorCode::CONSISTENCY_FAULT,
                    "Cannot restore " + old->to_string() +
                    ": no recorded diffs");
            }
            TALLY_TRY_VOID(builder_.replay(old->diffs, old->height));
            chain_.set_tip(old);
        }

        LOG_DEBUG(core::LogCategory::CHAIN,
                  "Restored tip " + chain_.tip()->to_string() +
                  " after rejecting " + bi->id.short_hex());
        return err;
    }

    return core::make_ok();
}

core::Result<void> ConsensusSet::connect_node(
    BlockIndex* bi,
    BlockValidationState& vstate,
    std::vector<BlockIndex*>& generated) {
    if (bi->is_failed()) {
        vstate.invalid(ValidationResult::BLOCK_CACHED_INVALID,
                       "block-cached-invalid", bi->id.short_hex());
        return vstate.to_error();
    }

    if (chain_.tip() != bi->prev || ledger_.height() + 1 != bi->height) {
        return core::Error(core::ErrorCode::CONSISTENCY_FAULT,
            "Connecting " + bi->to_string() + " onto ledger height " +
            std::to_string(ledger_.height()));
    }

    if (bi->have_diffs()) {
        TALLY_TRY_VOID(builder_.replay(bi->diffs, bi->height));
    } else {
        TALLY_TRY_ASSIGN(diffs, builder_.connect(bi->block, vstate));
        bi->set_diffs(std::move(diffs));
        generated.push_back(bi);
    }

    chain_.set_tip(bi);
    return core::make_ok();
}

core::Result<void> ConsensusSet::disconnect_node(BlockIndex* bi) {
    if (chain_.tip() != bi || !bi->have_diffs()) {
        return core::Error(core::ErrorCode::CONSISTENCY_FAULT,
            "Cannot disconnect " + bi->to_string());
    }
    TALLY_TRY_VOID(builder_.disconnect(bi->diffs, bi->height));
    chain_.set_tip(bi->prev);
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

core::Result<void> ConsensusSet::persist(const BlockIndex* bi,
                                         bool with_diffs) {
    if (store_ == nullptr) {
        return core::make_ok();
    }
    storage::BlockRecord record;
    record.block = bi->block;
    if (with_diffs) {
        record.diffs = bi->diffs;
    }
    return store_->write_block(record);
}

core::Result<void> ConsensusSet::persist_connected(
    const std::vector<BlockIndex*>& connected) {
    if (store_ == nullptr || connected.empty()) {
        return core::make_ok();
    }
    // All or none of the branch is durable after a crash.
    std::vector<storage::BlockRecord> records;
    records.reserve(connected.size());
    for (const BlockIndex* bi : connected) {
        storage::BlockRecord record;
        record.block = bi->block;
        record.diffs = bi->diffs;
        records.push_back(std::move(record));
    }
    return store_->write_blocks(records);
}

core::Result<void> ConsensusSet::verify_replay(
    const std::vector<storage::BlockRecord>& records) const {
    for (const auto& record : records) {
        if (!record.diffs) {
            continue;
        }
        const primitives::BlockID id = record.block.id();
        const BlockIndex* bi = lookup(id);
        if (bi == nullptr || !bi->have_diffs()) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "Stored diffs for " + id.short_hex() +
                " were not regenerated on replay");
        }
        if (consensus::encode_diffs(*record.diffs) !=
            consensus::encode_diffs(bi->diffs)) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "Stored diffs for " + id.short_hex() +
                " differ from the replayed ones");
        }
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Notification helpers
// ---------------------------------------------------------------------------

ChainUpdate ConsensusSet::build_update(const ReorgPath& path) const {
    READ_LOCK(state_mutex_);

    ChainUpdate update;
    update.reverted.reserve(path.to_disconnect.size());
    for (const BlockIndex* bi : path.to_disconnect) {
        update.reverted.push_back({bi->id, bi->height, bi->diffs});
    }
    update.applied.reserve(path.to_connect.size());
    for (const BlockIndex* bi : path.to_connect) {
        update.applied.push_back({bi->id, bi->height, bi->diffs});
    }
    update.height = chain_.height();
    update.tip = chain_.tip()->id;
    return update;
}

core::Error ConsensusSet::halt(core::Error err) {
    set_state(ProcessorState::HALTED);
    LOG_FATAL(core::LogCategory::CONSENSUS,
              "Block processor halted: " + err.format());
    return err;
}

core::Error ConsensusSet::reject(const consensus::ValidationState& vstate,
                                 const primitives::BlockID& id) const {
    LOG_INFO(core::LogCategory::VALIDATION,
             "Rejected block " + id.short_hex() + ": " + vstate.to_string());
    return vstate.to_error();
}

BlockIndex* ConsensusSet::lookup(const primitives::BlockID& id) const {
    auto it = block_index_.find(id);
    return it != block_index_.end() ? it->second.get() : nullptr;
}

// ===========================================================================
// Read API
// ===========================================================================

BlockHeight ConsensusSet::height() const {
    READ_LOCK(state_mutex_);
    return ledger_.height();
}

std::optional<primitives::SiacoinOutput> ConsensusSet::get_siacoin_output(
    const primitives::SiacoinOutputID& id) const {
    READ_LOCK(state_mutex_);
    return ledger_.get_siacoin_output(id);
}

std::optional<primitives::SiafundOutput> ConsensusSet::get_siafund_output(
    const primitives::SiafundOutputID& id) const {
    READ_LOCK(state_mutex_);
    return ledger_.get_siafund_output(id);
}

std::optional<primitives::FileContract> ConsensusSet::get_file_contract(
    const primitives::FileContractID& id) const {
    READ_LOCK(state_mutex_);
    return ledger_.get_file_contract(id);
}

std::vector<primitives::BlockID> ConsensusSet::current_path() const {
    READ_LOCK(state_mutex_);
    return chain_.ids();
}

primitives::BlockID ConsensusSet::tip_id() const {
    READ_LOCK(state_mutex_);
    const BlockIndex* tip = chain_.tip();
    return tip != nullptr ? tip->id : primitives::BlockID{};
}

bool ConsensusSet::block_known(const primitives::BlockID& id) const {
    READ_LOCK(state_mutex_);
    return lookup(id) != nullptr;
}

bool ConsensusSet::is_dos_block(const primitives::BlockID& id) const {
    READ_LOCK(state_mutex_);
    const BlockIndex* bi = lookup(id);
    return bi != nullptr && bi->is_dos();
}

std::vector<primitives::SiacoinOutputID> ConsensusSet::delayed_outputs_at(
    BlockHeight height) const {
    READ_LOCK(state_mutex_);
    std::vector<primitives::SiacoinOutputID> ids;
    if (const auto* bucket = ledger_.delayed_outputs().bucket(height)) {
        bucket->for_each([&](const primitives::SiacoinOutputID& id,
                             const primitives::SiacoinOutput&) {
            ids.push_back(id);
        });
    }
    return ids;
}

core::uint256 ConsensusSet::digest() const {
    READ_LOCK(state_mutex_);
    return ledger_.digest();
}

// ===========================================================================
// Subscribers
// ===========================================================================

SubscriptionId ConsensusSet::subscribe(SubscriberTier tier, std::string name,
                                       UpdateCallback callback) {
    LOCK(accept_mutex_);

    const std::string label = name;
    const SubscriptionId id =
        bus_.subscribe(tier, std::move(name), std::move(callback));

    ChainUpdate catch_up;
    {
        READ_LOCK(state_mutex_);
        for (BlockHeight h = 0; !chain_.empty() && h <= chain_.height(); ++h) {
            const BlockIndex* bi = chain_.at(h);
            catch_up.applied.push_back({bi->id, bi->height, bi->diffs});
        }
        catch_up.height = chain_.height();
        if (const BlockIndex* tip = chain_.tip()) {
            catch_up.tip = tip->id;
        }
        catch_up.sequence = sequence_;
    }

    LOG_DEBUG(core::LogCategory::NOTIFY,
              "Subscriber '" + label + "' (" +
              std::string(tier_name(tier)) + ") catching up on " +
              std::to_string(catch_up.applied.size()) + " blocks");
    bus_.deliver_to(id, catch_up);
    return id;
}

bool ConsensusSet::unsubscribe(SubscriptionId id) {
    return bus_.unsubscribe(id);
}

} // namespace chain
