// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/stream.h"
#include "crypto/hash.h"
#include "crypto/keccak.h"
#include "primitives/outputs.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ===================================================================
// SHA3-256
// ===================================================================

TEST_CASE(Keccak256, EmptyInputVector) {
    // SHA3-256("") = a7ffc6f8...80f8434a. Digest bytes are stored as-is.
    std::vector<uint8_t> empty;
    auto h = crypto::keccak256(std::span<const uint8_t>(empty));
    CHECK_EQ(h.data()[0], 0xa7);
    CHECK_EQ(h.data()[1], 0xff);
    CHECK_EQ(h.data()[30], 0x43);
    CHECK_EQ(h.data()[31], 0x4a);
}

TEST_CASE(Keccak256, AbcVector) {
    // SHA3-256("abc") = 3a985da7...11431532.
    const std::string msg = "abc";
    auto h = crypto::keccak256(msg.data(), msg.size());
    CHECK_EQ(h.data()[0], 0x3a);
    CHECK_EQ(h.data()[1], 0x98);
    CHECK_EQ(h.data()[31], 0x32);

    std::vector<uint8_t> bytes(msg.begin(), msg.end());
    CHECK_EQ(crypto::keccak256(std::span<const uint8_t>(bytes)), h);
}

TEST_CASE(Keccak256, IncrementalHasher) {
    const std::string part1 = "tally ";
    const std::string part2 = "ledger";
    const std::string whole = part1 + part2;

    crypto::Keccak256Hasher hasher;
    hasher.write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(part1.data()), part1.size()));
    hasher.write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(part2.data()), part2.size()));
    auto incremental = hasher.finalize();

    CHECK_EQ(incremental, crypto::keccak256(whole.data(), whole.size()));
}

TEST_CASE(Keccak256, HasherReset) {
    const std::string msg = "reset";
    std::span<const uint8_t> bytes(
        reinterpret_cast<const uint8_t*>(msg.data()), msg.size());

    crypto::Keccak256Hasher hasher;
    hasher.write(bytes);
    auto first = hasher.finalize();

    hasher.reset();
    hasher.write(bytes);
    CHECK_EQ(hasher.finalize(), first);
}

TEST_CASE(Keccak256, FinalizeTwiceThrows) {
    crypto::Keccak256Hasher hasher;
    (void)hasher.finalize();
    bool threw = false;
    try {
        (void)hasher.finalize();
    } catch (const std::logic_error&) {
        threw = true;
    }
    CHECK(threw);
}

// ===================================================================
// Object hashing and ID derivation
// ===================================================================

TEST_CASE(Hash, ObjectHashMatchesEncoding) {
    primitives::SiacoinOutput out{primitives::Currency(42),
                                  primitives::UnlockHash(
                                      core::uint256::from_uint64(7))};

    core::DataStream ds;
    out.serialize(ds);
    CHECK_EQ(crypto::hash(out), crypto::keccak256(ds.bytes()));
}

TEST_CASE(Hash, HashWriterCountsBytes) {
    crypto::HashWriter writer;
    std::vector<uint8_t> data(10, 0x11);
    writer.write(data);
    writer.write(data);
    CHECK_EQ(writer.size(), 20u);
    CHECK(!writer.finalize().is_zero());
}

TEST_CASE(Hash, TaggedHashSeparatesDomains) {
    std::vector<uint8_t> msg = {1, 2, 3};
    auto a = crypto::tagged_hash("tally/a", msg);
    auto b = crypto::tagged_hash("tally/b", msg);
    CHECK_NE(a, b);
    CHECK_EQ(a, crypto::tagged_hash("tally/a", msg));
    CHECK_NE(a, crypto::keccak256(std::span<const uint8_t>(msg)));
}

TEST_CASE(Hash, DeriveIdDependsOnEveryInput) {
    const auto parent = core::uint256::from_uint64(1000);
    const auto base = crypto::derive_id("tally/x", parent, 0);

    CHECK_EQ(crypto::derive_id("tally/x", parent, 0), base);
    CHECK_NE(crypto::derive_id("tally/x", parent, 1), base);
    CHECK_NE(crypto::derive_id("tally/y", parent, 0), base);
    CHECK_NE(crypto::derive_id("tally/x", core::uint256::from_uint64(1001), 0),
             base);
}
