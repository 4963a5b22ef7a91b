// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"
#include "test_util.h"

#include "consensus/commit.h"
#include "consensus/diff.h"
#include "consensus/ledger_state.h"
#include "consensus/maturity_queue.h"
#include "consensus/params.h"
#include "consensus/subsidy.h"
#include "consensus/tx_verify.h"
#include "consensus/validation.h"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

using consensus::DelayedSiacoinOutputDiff;
using consensus::DiffDirection;
using consensus::DiffList;
using consensus::FileContractDiff;
using consensus::SiacoinOutputDiff;
using consensus::SiafundOutputDiff;
using consensus::ValidationResult;
using primitives::BlockHeight;
using primitives::Currency;

namespace {

primitives::SiacoinOutputID coin_id(uint64_t n) {
    return primitives::SiacoinOutputID(core::uint256::from_uint64(n));
}

primitives::SiacoinOutput coin(uint64_t value, std::string_view owner = "a") {
    return {Currency(value), test::test_address(owner)};
}

primitives::FileContract small_contract(BlockHeight start, BlockHeight end) {
    primitives::FileContract fc;
    fc.file_size = 64;
    fc.window_start = start;
    fc.window_end = end;
    fc.payout = Currency(100);
    fc.valid_proof_outputs = {coin(60, "host"), coin(40, "renter")};
    fc.missed_proof_outputs = {coin(100, "renter")};
    return fc;
}

/// One diff of every kind, all APPLY.
DiffList mixed_diffs(BlockHeight maturity) {
    DiffList diffs;
    diffs.push_back(SiacoinOutputDiff{DiffDirection::APPLY, coin_id(1),
                                      coin(10)});
    diffs.push_back(SiafundOutputDiff{
        DiffDirection::APPLY,
        primitives::SiafundOutputID(core::uint256::from_uint64(2)),
        {Currency(5), test::test_address("fund"), Currency(0)}});
    diffs.push_back(FileContractDiff{
        DiffDirection::APPLY,
        primitives::FileContractID(core::uint256::from_uint64(3)),
        small_contract(10, 20)});
    diffs.push_back(DelayedSiacoinOutputDiff{DiffDirection::APPLY, coin_id(4),
                                             coin(7), maturity});
    return diffs;
}

} // anonymous namespace

// ===========================================================================
// Diff
// ===========================================================================

TEST_CASE(Diff, direction_helpers) {
    CHECK(consensus::opposite(DiffDirection::APPLY) == DiffDirection::REVERT);
    CHECK(consensus::opposite(DiffDirection::REVERT) == DiffDirection::APPLY);
    CHECK_NE(consensus::direction_name(DiffDirection::APPLY),
             consensus::direction_name(DiffDirection::REVERT));
}

TEST_CASE(Diff, kind_and_description) {
    const DiffList diffs = mixed_diffs(5);
    CHECK(consensus::diff_kind(diffs[0]) == consensus::DiffKind::SIACOIN_OUTPUT);
    CHECK(consensus::diff_kind(diffs[1]) == consensus::DiffKind::SIAFUND_OUTPUT);
    CHECK(consensus::diff_kind(diffs[2]) == consensus::DiffKind::FILE_CONTRACT);
    CHECK(consensus::diff_kind(diffs[3]) ==
          consensus::DiffKind::DELAYED_SIACOIN_OUTPUT);
    CHECK(consensus::diff_direction(diffs[0]) == DiffDirection::APPLY);
    for (const auto& d : diffs) {
        CHECK(!consensus::describe(d).empty());
    }
}

TEST_CASE(Diff, encoded_list_decodes_identically) {
    DiffList diffs = mixed_diffs(9);
    diffs.push_back(SiacoinOutputDiff{DiffDirection::REVERT, coin_id(11),
                                      coin(3)});

    auto decoded = consensus::decode_diffs(consensus::encode_diffs(diffs));
    CHECK_OK(decoded);
    CHECK(decoded.value() == diffs);
}

TEST_CASE(Diff, decode_rejects_damage) {
    auto bytes = consensus::encode_diffs(mixed_diffs(9));

    auto truncated = bytes;
    truncated.resize(truncated.size() / 2);
    CHECK_ERR_CODE(consensus::decode_diffs(truncated),
                   core::ErrorCode::PARSE_UNDERFLOW);

    auto trailing = bytes;
    trailing.push_back(0);
    CHECK_ERR_CODE(consensus::decode_diffs(trailing),
                   core::ErrorCode::PARSE_BAD_FORMAT);

    // count=1, kind=SIACOIN_OUTPUT, direction byte 7.
    std::vector<uint8_t> bad_direction = {0x01, 0x00, 0x07};
    bad_direction.resize(bad_direction.size() + 80, 0);
    CHECK_ERR_CODE(consensus::decode_diffs(bad_direction),
                   core::ErrorCode::PARSE_UNDERFLOW);

    std::vector<uint8_t> bad_kind = {0x01, 0x09};
    CHECK_ERR(consensus::decode_diffs(bad_kind));
}

// ===========================================================================
// DiffCommitter
// ===========================================================================

TEST_CASE(DiffCommitter, apply_then_revert_restores_state) {
    consensus::LedgerState state;
    state.set_height(3);
    state.siacoin_outputs().insert(coin_id(100), coin(1, "existing"));
    const core::uint256 before = state.digest();

    DiffList diffs = mixed_diffs(8);
    // Spend the pre-existing output too.
    diffs.push_back(SiacoinOutputDiff{DiffDirection::REVERT, coin_id(100),
                                      coin(1, "existing")});

    consensus::DiffCommitter committer(state);
    CHECK_OK(committer.commit_all(diffs, DiffDirection::APPLY));
    CHECK_NE(state.digest(), before);
    CHECK_EQ(state.siacoin_outputs().size(), 1u);
    CHECK(state.get_siacoin_output(coin_id(1)).has_value());
    CHECK(!state.get_siacoin_output(coin_id(100)).has_value());
    CHECK(state.delayed_outputs().contains(8, coin_id(4)));

    CHECK_OK(committer.commit_all(diffs, DiffDirection::REVERT));
    CHECK_EQ(state.digest(), before);
    CHECK_EQ(state.delayed_outputs().bucket_count(), 0u);
}

TEST_CASE(DiffCommitter, duplicate_add_faults) {
    consensus::LedgerState state;
    consensus::DiffCommitter committer(state);
    SiacoinOutputDiff add{DiffDirection::APPLY, coin_id(1), coin(10)};

    CHECK_OK(committer.commit(add, DiffDirection::APPLY));
    CHECK_ERR_CODE(committer.commit(add, DiffDirection::APPLY),
                   core::ErrorCode::CONSISTENCY_DUPLICATE);
    // The registry still holds the first copy only.
    CHECK_EQ(state.siacoin_outputs().size(), 1u);
}

TEST_CASE(DiffCommitter, missing_remove_faults) {
    consensus::LedgerState state;
    consensus::DiffCommitter committer(state);

    SiacoinOutputDiff spend{DiffDirection::REVERT, coin_id(1), coin(10)};
    CHECK_ERR_CODE(committer.commit(spend, DiffDirection::APPLY),
                   core::ErrorCode::CONSISTENCY_MISSING);

    // Reverting an addition that never happened is the same fault.
    SiafundOutputDiff fund{
        DiffDirection::APPLY,
        primitives::SiafundOutputID(core::uint256::from_uint64(2)),
        {Currency(5), test::test_address("fund"), Currency(0)}};
    CHECK_ERR_CODE(committer.commit(fund, DiffDirection::REVERT),
                   core::ErrorCode::CONSISTENCY_MISSING);
}

TEST_CASE(DiffCommitter, remove_with_different_value_faults) {
    consensus::LedgerState state;
    state.file_contracts().insert(
        primitives::FileContractID(core::uint256::from_uint64(3)),
        small_contract(10, 20));
    consensus::DiffCommitter committer(state);

    FileContractDiff wrong{
        DiffDirection::REVERT,
        primitives::FileContractID(core::uint256::from_uint64(3)),
        small_contract(10, 21)};
    CHECK_ERR_CODE(committer.commit(wrong, DiffDirection::APPLY),
                   core::ErrorCode::CONSISTENCY_MISMATCH);
    CHECK_EQ(state.file_contracts().size(), 1u);
}

TEST_CASE(DiffCommitter, delayed_maturity_must_exceed_height) {
    consensus::LedgerState state;
    state.set_height(10);
    consensus::DiffCommitter committer(state);

    DelayedSiacoinOutputDiff at_height{DiffDirection::APPLY, coin_id(1),
                                       coin(5), 10};
    CHECK_ERR_CODE(committer.commit(at_height, DiffDirection::APPLY),
                   core::ErrorCode::CONSISTENCY_MATURITY);
    CHECK_ERR_CODE(committer.commit(at_height, DiffDirection::REVERT),
                   core::ErrorCode::CONSISTENCY_MATURITY);

    DelayedSiacoinOutputDiff below{DiffDirection::REVERT, coin_id(2),
                                   coin(5), 4};
    CHECK_ERR_CODE(committer.commit(below, DiffDirection::APPLY),
                   core::ErrorCode::CONSISTENCY_MATURITY);
    CHECK_ERR_CODE(committer.commit(below, DiffDirection::REVERT),
                   core::ErrorCode::CONSISTENCY_MATURITY);

    DelayedSiacoinOutputDiff above{DiffDirection::APPLY, coin_id(3),
                                   coin(5), 11};
    CHECK_OK(committer.commit(above, DiffDirection::APPLY));
    CHECK_OK(committer.commit(above, DiffDirection::REVERT));
}

TEST_CASE(DiffCommitter, delayed_mismatch_and_missing) {
    consensus::LedgerState state;
    consensus::DiffCommitter committer(state);
    CHECK_OK(committer.commit(
        DelayedSiacoinOutputDiff{DiffDirection::APPLY, coin_id(1), coin(5), 4},
        DiffDirection::APPLY));

    CHECK_ERR_CODE(
        committer.commit(DelayedSiacoinOutputDiff{DiffDirection::REVERT,
                                                  coin_id(1), coin(6), 4},
                         DiffDirection::APPLY),
        core::ErrorCode::CONSISTENCY_MISMATCH);
    CHECK_ERR_CODE(
        committer.commit(DelayedSiacoinOutputDiff{DiffDirection::REVERT,
                                                  coin_id(1), coin(5), 5},
                         DiffDirection::APPLY),
        core::ErrorCode::CONSISTENCY_MISSING);
    CHECK_ERR_CODE(
        committer.commit(DelayedSiacoinOutputDiff{DiffDirection::APPLY,
                                                  coin_id(1), coin(5), 4},
                         DiffDirection::APPLY),
        core::ErrorCode::CONSISTENCY_DUPLICATE);
}

TEST_CASE(DiffCommitter, commit_all_stops_at_first_fault) {
    consensus::LedgerState state;
    consensus::DiffCommitter committer(state);

    DiffList diffs;
    diffs.push_back(SiacoinOutputDiff{DiffDirection::APPLY, coin_id(1), coin(1)});
    diffs.push_back(SiacoinOutputDiff{DiffDirection::REVERT, coin_id(9), coin(1)});
    diffs.push_back(SiacoinOutputDiff{DiffDirection::APPLY, coin_id(2), coin(1)});

    CHECK_ERR_CODE(committer.commit_all(diffs, DiffDirection::APPLY),
                   core::ErrorCode::CONSISTENCY_MISSING);
    CHECK(state.siacoin_outputs().contains(coin_id(1)));
    CHECK(!state.siacoin_outputs().contains(coin_id(2)));
}

// ===========================================================================
// MaturityQueue
// ===========================================================================

TEST_CASE(MaturityQueue, buckets_come_and_go) {
    consensus::MaturityQueue queue;
    CHECK(queue.bucket(5) == nullptr);

    CHECK(queue.insert(5, coin_id(1), coin(1)));
    CHECK(queue.insert(5, coin_id(2), coin(2)));
    CHECK(queue.insert(7, coin_id(1), coin(1)));
    CHECK(!queue.insert(5, coin_id(1), coin(1)));

    CHECK_EQ(queue.bucket_count(), 2u);
    CHECK_EQ(queue.total_size(), 3u);
    CHECK_EQ(queue.bucket(5)->size(), 2u);

    CHECK(queue.erase(5, coin_id(1)));
    CHECK(queue.erase(5, coin_id(2)));
    CHECK(!queue.erase(5, coin_id(2)));
    CHECK(queue.bucket(5) == nullptr);
    CHECK_EQ(queue.bucket_count(), 1u);
}

TEST_CASE(MaturityQueue, check_elapsed) {
    consensus::MaturityQueue queue;
    CHECK_OK(queue.check_elapsed(100));

    queue.insert(10, coin_id(1), coin(1));
    CHECK_OK(queue.check_elapsed(9));
    CHECK_ERR_CODE(queue.check_elapsed(10),
                   core::ErrorCode::CONSISTENCY_MATURITY);
    CHECK_ERR_CODE(queue.check_elapsed(50),
                   core::ErrorCode::CONSISTENCY_MATURITY);
}

// ===========================================================================
// LedgerState
// ===========================================================================

TEST_CASE(LedgerState, digest_tracks_content) {
    consensus::LedgerState a;
    consensus::LedgerState b;
    CHECK_EQ(a.digest(), b.digest());
    CHECK(a == b);

    a.set_height(1);
    CHECK_NE(a.digest(), b.digest());
    b.set_height(1);
    CHECK_EQ(a.digest(), b.digest());

    a.delayed_outputs().insert(4, coin_id(1), coin(1));
    CHECK_NE(a.digest(), b.digest());
    CHECK(!(a == b));

    // Insertion order does not matter.
    a.siacoin_outputs().insert(coin_id(8), coin(8));
    a.siacoin_outputs().insert(coin_id(9), coin(9));
    b.siacoin_outputs().insert(coin_id(9), coin(9));
    b.siacoin_outputs().insert(coin_id(8), coin(8));
    b.delayed_outputs().insert(4, coin_id(1), coin(1));
    CHECK_EQ(a.digest(), b.digest());
}

// ===========================================================================
// Transaction validation
// ===========================================================================

namespace {

struct ValidationFixture {
    consensus::LedgerState state;
    consensus::StandardValidator validator;

    ValidationFixture() {
        state.set_height(10);
        state.siacoin_outputs().insert(coin_id(1), coin(1000));
        state.siacoin_outputs().insert(coin_id(2), coin(500));
        state.siafund_outputs().insert(
            primitives::SiafundOutputID(core::uint256::from_uint64(1)),
            {Currency(50), test::test_address("fund"), Currency(0)});
    }

    ValidationResult check(const primitives::Transaction& tx,
                           BlockHeight height = 11) {
        consensus::TxValidationState vs;
        if (validator.check_transaction(tx, state, height, vs)) {
            return ValidationResult::VALID;
        }
        return vs.get_result();
    }
};

} // anonymous namespace

TEST_CASE(TxValidation, balanced_spend_is_valid) {
    ValidationFixture f;
    primitives::Transaction tx;
    tx.siacoin_inputs.push_back({coin_id(1)});
    tx.siacoin_outputs.push_back(coin(900, "b"));
    tx.miner_fees.push_back(Currency(100));
    CHECK(f.check(tx) == ValidationResult::VALID);
}

TEST_CASE(TxValidation, missing_and_duplicate_inputs) {
    ValidationFixture f;
    primitives::Transaction missing;
    missing.siacoin_inputs.push_back({coin_id(77)});
    missing.siacoin_outputs.push_back(coin(1));
    CHECK(f.check(missing) == ValidationResult::TX_MISSING_INPUTS);

    primitives::Transaction dup;
    dup.siacoin_inputs.push_back({coin_id(1)});
    dup.siacoin_inputs.push_back({coin_id(1)});
    dup.siacoin_outputs.push_back(coin(2000));
    CHECK(f.check(dup) == ValidationResult::TX_DUPLICATE);
}

TEST_CASE(TxValidation, outputs_above_inputs_unbalanced) {
    ValidationFixture f;
    primitives::Transaction tx;
    tx.siacoin_inputs.push_back({coin_id(2)});
    tx.siacoin_outputs.push_back(coin(501));
    CHECK(f.check(tx) == ValidationResult::TX_UNBALANCED);
}

TEST_CASE(TxValidation, unspent_funding_is_dos) {
    ValidationFixture f;
    primitives::Transaction tx;
    tx.siacoin_inputs.push_back({coin_id(1)});
    tx.siacoin_outputs.push_back(coin(999));
    CHECK(f.check(tx) == ValidationResult::TX_DOS);
    CHECK(consensus::is_dos(ValidationResult::TX_DOS));
    CHECK(!consensus::is_dos(ValidationResult::TX_UNBALANCED));
}

TEST_CASE(TxValidation, contract_rules) {
    ValidationFixture f;

    primitives::Transaction ok;
    ok.siacoin_inputs.push_back({coin_id(2)});
    ok.file_contracts.push_back(small_contract(12, 20));
    ok.siacoin_outputs.push_back(coin(400));
    CHECK(f.check(ok) == ValidationResult::VALID);

    auto early = ok;
    early.file_contracts[0] = small_contract(11, 20);
    CHECK(f.check(early) == ValidationResult::TX_BAD_CONTRACT);

    auto empty_window = ok;
    empty_window.file_contracts[0] = small_contract(15, 15);
    CHECK(f.check(empty_window) == ValidationResult::TX_BAD_CONTRACT);

    auto bad_split = ok;
    bad_split.file_contracts[0].valid_proof_outputs.pop_back();
    CHECK(f.check(bad_split) == ValidationResult::TX_BAD_CONTRACT);
}

TEST_CASE(TxValidation, storage_proof_window) {
    ValidationFixture f;
    const primitives::FileContractID fcid(core::uint256::from_uint64(5));
    f.state.file_contracts().insert(fcid, small_contract(12, 15));

    primitives::Transaction proof;
    proof.storage_proofs.push_back({fcid});
    CHECK(f.check(proof, 11) == ValidationResult::TX_BAD_STORAGE_PROOF);
    CHECK(f.check(proof, 12) == ValidationResult::VALID);
    CHECK(f.check(proof, 14) == ValidationResult::VALID);
    CHECK(f.check(proof, 15) == ValidationResult::TX_BAD_STORAGE_PROOF);

    primitives::Transaction unknown;
    unknown.storage_proofs.push_back(
        {primitives::FileContractID(core::uint256::from_uint64(6))});
    CHECK(f.check(unknown) == ValidationResult::TX_BAD_STORAGE_PROOF);

    auto twice = proof;
    twice.storage_proofs.push_back({fcid});
    CHECK(f.check(twice, 12) == ValidationResult::TX_DUPLICATE);
}

TEST_CASE(TxValidation, siafunds_must_balance) {
    ValidationFixture f;
    const primitives::SiafundOutputID fund(core::uint256::from_uint64(1));

    primitives::Transaction split;
    split.siafund_inputs.push_back({fund});
    split.siafund_outputs.push_back(
        {Currency(20), test::test_address("x"), Currency(0)});
    split.siafund_outputs.push_back(
        {Currency(30), test::test_address("y"), Currency(0)});
    CHECK(f.check(split) == ValidationResult::VALID);

    auto leak = split;
    leak.siafund_outputs.pop_back();
    CHECK(f.check(leak) == ValidationResult::TX_UNBALANCED);

    primitives::Transaction missing;
    missing.siafund_inputs.push_back(
        {primitives::SiafundOutputID(core::uint256::from_uint64(2))});
    CHECK(f.check(missing) == ValidationResult::TX_MISSING_INPUTS);
}

TEST_CASE(TxValidation, overflowing_outputs) {
    ValidationFixture f;
    primitives::Transaction tx;
    tx.siacoin_inputs.push_back({coin_id(1)});
    tx.siacoin_outputs.push_back(coin(std::numeric_limits<uint64_t>::max()));
    tx.siacoin_outputs.push_back(coin(1));
    CHECK(f.check(tx) == ValidationResult::TX_OVERFLOW);
}

// ===========================================================================
// Block checks
// ===========================================================================

TEST_CASE(BlockValidation, header_rules) {
    consensus::StandardValidator validator;
    primitives::Block parent;
    parent.timestamp = 1000;
    parent.work = 1;

    primitives::Block child;
    child.timestamp = 1000;
    child.work = 1;

    consensus::BlockValidationState ok;
    CHECK(validator.check_header(child, parent, ok));

    child.work = 0;
    consensus::BlockValidationState no_work;
    CHECK(!validator.check_header(child, parent, no_work));
    CHECK(no_work.get_result() == ValidationResult::BLOCK_BAD_HEADER);

    child.work = 1;
    child.timestamp = 999;
    consensus::BlockValidationState too_old;
    CHECK(!validator.check_header(child, parent, too_old));
    CHECK(too_old.get_result() == ValidationResult::BLOCK_TIME_TOO_OLD);
}

TEST_CASE(BlockValidation, miner_payouts_match_reward) {
    const auto& params = consensus::ConsensusParams::regtest_params();

    primitives::Transaction paying;
    paying.miner_fees.push_back(Currency(250));

    primitives::Block block;
    block.transactions.push_back(paying);
    const Currency reward =
        consensus::get_block_reward(5, Currency(250), params).value();
    const Currency part(reward.value() / 3);
    block.miner_payouts = {{part, test::test_address("m1")},
                           {reward.sub(part).value(), test::test_address("m2")}};

    consensus::BlockValidationState ok;
    CHECK(consensus::check_miner_payouts(block, 5, params, ok));

    consensus::BlockValidationState wrong_height;
    CHECK(!consensus::check_miner_payouts(block, 6, params, wrong_height));
    CHECK(wrong_height.get_result() == ValidationResult::BLOCK_BAD_PAYOUT);

    block.miner_payouts.pop_back();
    consensus::BlockValidationState short_pay;
    CHECK(!consensus::check_miner_payouts(block, 5, params, short_pay));
}

TEST_CASE(BlockValidation, state_to_error) {
    consensus::BlockValidationState state;
    CHECK(state.is_valid());
    CHECK(!state.invalid(ValidationResult::BLOCK_DOS, "bad-dos", "detail"));
    CHECK(state.is_invalid());
    CHECK_EQ(state.get_reject_reason(), "bad-dos");

    core::Error err = state.to_error();
    CHECK_EQ(err.code(), core::ErrorCode::VALIDATION_DOS);
    CHECK(err.is_rejection());

    CHECK(consensus::to_error_code(ValidationResult::BLOCK_MISSING_PREV) ==
          core::ErrorCode::VALIDATION_ORPHAN);
    CHECK(consensus::to_error_code(ValidationResult::BLOCK_REORG_TOO_DEEP) ==
          core::ErrorCode::VALIDATION_RANGE);
}

// ===========================================================================
// Subsidy / params
// ===========================================================================

TEST_CASE(Subsidy, schedule) {
    const auto& params = consensus::ConsensusParams::main_params();
    CHECK_EQ(consensus::get_block_subsidy(0, params), Currency::coins(300'000));
    CHECK_EQ(consensus::get_block_subsidy(1, params), Currency::coins(299'999));
    CHECK_EQ(consensus::get_block_subsidy(269'999, params),
             Currency::coins(30'001));
    CHECK_EQ(consensus::get_block_subsidy(270'000, params),
             Currency::coins(30'000));
    CHECK_EQ(consensus::get_block_subsidy(5'000'000, params),
             Currency::coins(30'000));
}

TEST_CASE(Subsidy, reward_adds_fees) {
    const auto& params = consensus::ConsensusParams::main_params();
    auto reward = consensus::get_block_reward(1, Currency(123), params);
    CHECK_OK(reward);
    CHECK_EQ(reward.value().value(), Currency::coins(299'999).value() + 123);

    CHECK_ERR(consensus::get_block_reward(
        1, Currency(std::numeric_limits<uint64_t>::max()), params));
}

TEST_CASE(ConsensusParams, networks) {
    const auto& main = consensus::ConsensusParams::main_params();
    const auto& reg = consensus::ConsensusParams::regtest_params();
    CHECK_EQ(main.network, "main");
    CHECK_EQ(main.maturity_delay, 144u);
    CHECK_EQ(reg.maturity_delay, 3u);
    CHECK(consensus::ConsensusParams::for_network("regtest") == &reg);
    CHECK(consensus::ConsensusParams::for_network("testnet") == nullptr);
    CHECK_NE(main.genesis_block().id(), reg.genesis_block().id());
}

TEST_CASE(ConsensusParams, genesis_allocates_siafunds) {
    const auto& params = consensus::ConsensusParams::regtest_params();
    const primitives::Block genesis = params.genesis_block();
    CHECK(genesis.parent_id.is_null());
    CHECK(genesis.miner_payouts.empty());
    CHECK_EQ(genesis.transactions.size(), 1u);
    CHECK_EQ(genesis.transactions[0].siafund_outputs.size(), 1u);
    CHECK_EQ(genesis.transactions[0].siafund_outputs[0].value,
             Currency(params.siafund_count));
}
