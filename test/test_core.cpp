// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"
#include "test_util.h"

#include "core/config.h"
#include "core/error.h"
#include "core/fs.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/sync.h"
#include "core/types.h"

#include <array>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

// ============================================================================
// uint256
// ============================================================================

TEST_CASE(Uint256, default_is_zero) {
    core::uint256 v;
    CHECK(v.is_zero());
    CHECK_EQ(v.to_hex(), std::string(64, '0'));
}

TEST_CASE(Uint256, from_uint64_is_little_endian) {
    auto v = core::uint256::from_uint64(0x0102030405060708ULL);
    CHECK_EQ(v.data()[0], 0x08);
    CHECK_EQ(v.data()[7], 0x01);
    CHECK_EQ(v.data()[8], 0x00);
    CHECK_EQ(v.to_hex(),
             std::string(48, '0') + "0102030405060708");
}

TEST_CASE(Uint256, hex_roundtrip) {
    const std::string hex =
        "00000000000000000000000000000000000000000000000000000000deadbeef";
    auto v = core::uint256::from_hex(hex);
    CHECK_EQ(v.to_hex(), hex);
    CHECK_EQ(v, core::uint256::from_uint64(0xDEADBEEF));

    // Short input and a 0x prefix are accepted.
    CHECK_EQ(core::uint256::from_hex("0xdeadbeef"), v);
}

TEST_CASE(Uint256, from_hex_rejects_bad_input) {
    bool threw = false;
    try {
        (void)core::uint256::from_hex("zz");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    CHECK(threw);

    threw = false;
    try {
        (void)core::uint256::from_hex(std::string(65, '1'));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(Uint256, from_bytes_keeps_order) {
    std::array<uint8_t, 32> raw{};
    raw[0] = 0xAA;
    raw[31] = 0x55;
    auto v = core::uint256::from_bytes(raw);
    CHECK_EQ(v.data()[0], 0xAA);
    CHECK_EQ(v.data()[31], 0x55);
    CHECK_EQ(v.to_hex().substr(0, 2), "55");
}

TEST_CASE(Uint256, addition_carries) {
    auto a = core::uint256::from_uint64(0xFFFFFFFFFFFFFFFFULL);
    auto b = core::uint256::from_uint64(1);
    auto sum = a + b;
    CHECK_EQ(sum.data()[0], 0x00);
    CHECK_EQ(sum.data()[8], 0x01);
    CHECK(sum > a);

    core::uint256 acc;
    for (int i = 0; i < 10; ++i) {
        acc += core::uint256::from_uint64(7);
    }
    CHECK_EQ(acc, core::uint256::from_uint64(70));
}

TEST_CASE(Uint256, comparison_is_numeric) {
    // High byte dominates even though it sits at the end of storage.
    auto small = core::uint256::from_uint64(0xFF);
    auto big = core::uint256::from_hex("0100");
    CHECK(small < big);
    CHECK(big > small);
    CHECK(small <= small);
    CHECK_NE(small, big);
}

TEST_CASE(Uint256, hash_distinguishes_values) {
    std::unordered_set<core::uint256> set;
    for (uint64_t i = 0; i < 64; ++i) {
        set.insert(core::uint256::from_uint64(i));
    }
    set.insert(core::uint256::from_uint64(5));
    CHECK_EQ(set.size(), 64u);
}

// ============================================================================
// Error / Result
// ============================================================================

TEST_CASE(ErrorResult, error_creation) {
    core::Error err(core::ErrorCode::PARSE_ERROR, "bad input");
    CHECK_EQ(err.code(), core::ErrorCode::PARSE_ERROR);
    CHECK_EQ(err.message(), "bad input");
    CHECK(!err.is_ok());
    CHECK(static_cast<bool>(err));
}

TEST_CASE(ErrorResult, error_none_is_ok) {
    core::Error ok_err;
    CHECK(ok_err.is_ok());
    CHECK(!static_cast<bool>(ok_err));
    CHECK_EQ(ok_err.code(), core::ErrorCode::NONE);
}

TEST_CASE(ErrorResult, classification) {
    CHECK(core::Error(core::ErrorCode::VALIDATION_DOS).is_rejection());
    CHECK(core::Error(core::ErrorCode::VALIDATION_ERROR).is_rejection());
    CHECK(!core::Error(core::ErrorCode::VALIDATION_ERROR).is_consistency_fault());

    CHECK(core::Error(core::ErrorCode::CONSISTENCY_MISSING).is_consistency_fault());
    CHECK(core::Error(core::ErrorCode::CONSISTENCY_HALTED).is_consistency_fault());
    CHECK(!core::Error(core::ErrorCode::CONSISTENCY_FAULT).is_rejection());

    CHECK(!core::Error(core::ErrorCode::STORAGE_CORRUPT).is_rejection());
    CHECK(!core::Error(core::ErrorCode::STORAGE_CORRUPT).is_consistency_fault());
}

TEST_CASE(ErrorResult, format_names_code) {
    core::Error err(core::ErrorCode::CONSISTENCY_DUPLICATE, "id present");
    const std::string text = err.format();
    CHECK(text.find("id present") != std::string::npos);
    CHECK(!core::error_code_name(core::ErrorCode::CONSISTENCY_DUPLICATE).empty());
}

TEST_CASE(ErrorResult, result_with_value) {
    core::Result<int> r = 42;
    CHECK(r.ok());
    CHECK_EQ(r.value(), 42);
}

TEST_CASE(ErrorResult, result_with_error) {
    core::Result<int> r = core::Error(core::ErrorCode::PARSE_ERROR, "fail");
    CHECK(!r.ok());
    CHECK_EQ(r.error().code(), core::ErrorCode::PARSE_ERROR);
}

TEST_CASE(ErrorResult, result_value_or) {
    core::Result<int> good = 42;
    core::Result<int> bad = core::Error(core::ErrorCode::INTERNAL_ERROR, "x");
    CHECK_EQ(good.value_or(0), 42);
    CHECK_EQ(bad.value_or(-1), -1);
}

TEST_CASE(ErrorResult, value_on_error_throws) {
    core::Result<int> bad = core::Error(core::ErrorCode::INTERNAL_ERROR, "x");
    bool threw = false;
    try {
        (void)bad.value();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(ErrorResult, void_result) {
    core::Result<void> ok = core::make_ok();
    CHECK(ok.ok());
    CHECK_NOTHROW(ok.value());

    core::Result<void> err =
        core::make_error(core::ErrorCode::STORAGE_ERROR, "disk");
    CHECK(!err.ok());
    CHECK_EQ(err.error().code(), core::ErrorCode::STORAGE_ERROR);
}

namespace {

core::Result<int> half(int v) {
    if (v % 2 != 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE, "odd");
    }
    return v / 2;
}

core::Result<int> quarter(int v) {
    TALLY_TRY_ASSIGN(h, half(v));
    TALLY_TRY_ASSIGN(q, half(h));
    return q;
}

core::Result<void> require_even(int v) {
    TALLY_TRY_VOID(half(v));
    return core::make_ok();
}

} // anonymous namespace

TEST_CASE(ErrorResult, try_macros_propagate) {
    auto q = quarter(12);
    CHECK_OK(q);
    CHECK_EQ(q.value(), 3);

    CHECK_ERR_CODE(quarter(6), core::ErrorCode::VALIDATION_RANGE);
    CHECK_OK(require_even(4));
    CHECK_ERR_CODE(require_even(5), core::ErrorCode::VALIDATION_RANGE);
}

// ============================================================================
// Stream
// ============================================================================

TEST_CASE(Stream, datastream_write_read) {
    core::DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.write(data);

    CHECK_EQ(ds.size(), 4u);
    CHECK_EQ(ds.remaining(), 4u);
    CHECK(!ds.eof());

    uint8_t buf[4];
    ds.read(std::span<uint8_t>(buf, 4));
    CHECK_EQ(buf[0], 0x01);
    CHECK_EQ(buf[3], 0x04);
    CHECK(ds.eof());
    CHECK_EQ(ds.remaining(), 0u);
}

TEST_CASE(Stream, datastream_read_past_end_throws) {
    core::DataStream ds(std::vector<uint8_t>{0x01});
    uint8_t buf[2];
    bool threw = false;
    try {
        ds.read(std::span<uint8_t>(buf, 2));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(Stream, datastream_release) {
    core::DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02};
    ds.write(data);
    CHECK_EQ(ds.bytes().size(), 2u);

    auto released = ds.release();
    CHECK_EQ(released.size(), 2u);
    CHECK_EQ(ds.size(), 0u);
}

TEST_CASE(Stream, span_reader_basic) {
    std::vector<uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF};
    core::SpanReader reader{std::span<const uint8_t>(data)};

    CHECK_EQ(reader.remaining(), 4u);
    CHECK(!reader.eof());

    uint8_t buf[2];
    reader.read(std::span<uint8_t>(buf, 2));
    CHECK_EQ(buf[0], 0xDE);
    CHECK_EQ(buf[1], 0xAD);
    CHECK_EQ(reader.remaining(), 2u);

    reader.read(std::span<uint8_t>(buf, 2));
    CHECK_EQ(buf[0], 0xBE);
    CHECK(reader.eof());
}

// ============================================================================
// Serialization
// ============================================================================

TEST_CASE(Serialization, ser_u32_little_endian) {
    core::DataStream ds;
    core::ser_write_u32(ds, 0x12345678);

    CHECK_EQ(ds.size(), 4u);
    CHECK_EQ(ds.data()[0], 0x78);
    CHECK_EQ(ds.data()[3], 0x12);
    CHECK_EQ(core::ser_read_u32(ds), 0x12345678u);
}

TEST_CASE(Serialization, ser_compact_size) {
    core::DataStream ds1;
    core::ser_write_compact_size(ds1, 100);
    CHECK_EQ(ds1.size(), 1u);
    CHECK_EQ(core::ser_read_compact_size(ds1), 100u);

    core::DataStream ds2;
    core::ser_write_compact_size(ds2, 0xFFFF);
    CHECK_EQ(ds2.size(), 3u);
    CHECK_EQ(core::ser_read_compact_size(ds2), 0xFFFFu);

    core::DataStream ds3;
    core::ser_write_compact_size(ds3, 0x10000);
    CHECK_EQ(ds3.size(), 5u);
    CHECK_EQ(core::ser_read_compact_size(ds3), 0x10000u);
}

TEST_CASE(Serialization, ser_string_and_uint256) {
    core::DataStream ds;
    core::ser_write_string(ds, "tally");
    core::ser_write_uint256(ds, core::uint256::from_uint64(99));
    core::ser_write_u64(ds, 7);

    CHECK_EQ(core::ser_read_string(ds), "tally");
    CHECK_EQ(core::ser_read_uint256(ds), core::uint256::from_uint64(99));
    CHECK_EQ(core::ser_read_u64(ds), 7u);
    CHECK(ds.eof());
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args_forms) {
    const char* argv[] = {"tallyd", "-datadir=/tmp/x", "--loglevel=debug",
                          "-regtest", "-debug=chain", "-debug=diff",
                          "positional"};
    core::Config cfg;
    cfg.parse_args(7, argv);

    CHECK_EQ(cfg.get_or("datadir", ""), "/tmp/x");
    CHECK_EQ(cfg.get_or("loglevel", ""), "debug");
    CHECK(cfg.get_bool("regtest"));
    CHECK_EQ(cfg.get_list("debug").size(), 2u);
    CHECK(!cfg.has("positional"));
    CHECK_EQ(cfg.network(), "regtest");
}

TEST_CASE(Config, cli_overrides_file) {
    test::TempDir dir("config");
    const auto conf = dir.path() / "tally.conf";
    {
        std::ofstream f(conf);
        f << "# comment\n"
          << "maxreorgdepth=12\n"
          << "loglevel=warn\n"
          << "printtoconsole\n";
    }

    const char* argv[] = {"tallyd", "-loglevel=trace"};
    core::Config cfg;
    cfg.parse_args(2, argv);
    CHECK_OK(cfg.parse_file(conf));

    CHECK_EQ(cfg.get_or("loglevel", ""), "trace");
    auto depth = cfg.get_uint("maxreorgdepth");
    CHECK_OK(depth);
    CHECK_EQ(*depth.value(), 12u);
    CHECK(cfg.get_bool("printtoconsole"));
    CHECK_ERR_CODE(cfg.parse_file(dir.path() / "missing.conf"),
                   core::ErrorCode::PARSE_ERROR);
}

TEST_CASE(Config, bad_file_line_rejects_whole_file) {
    test::TempDir dir("config_bad");
    const auto conf = dir.path() / "tally.conf";
    {
        std::ofstream f(conf);
        f << "loglevel=warn\n"
          << "=orphan\n";
    }

    core::Config cfg;
    auto r = cfg.parse_file(conf);
    CHECK_ERR_CODE(r, core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK(r.error().message().find(":2:") != std::string::npos);
    CHECK(!cfg.has("loglevel"));
}

TEST_CASE(Config, typed_getters) {
    core::Config cfg;
    cfg.set("depth", "not-a-number");
    cfg.set("negative", "-3");
    cfg.set("flag", "yes");
    cfg.set("empty", "");

    CHECK_ERR_CODE(cfg.get_uint("depth"), core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_ERR_CODE(cfg.get_uint("negative"),
                   core::ErrorCode::PARSE_BAD_FORMAT);
    auto absent = cfg.get_uint("absent");
    CHECK_OK(absent);
    CHECK(!absent.value().has_value());

    CHECK(cfg.get_bool("flag"));
    CHECK(!cfg.get_bool("absent"));
    CHECK(cfg.get_bool("absent", true));
    CHECK(!cfg.get("absent").has_value());
    CHECK(!cfg.get_path("empty").has_value());
}

TEST_CASE(Config, regtest_gets_own_data_dir) {
    core::Config main_cfg;
    main_cfg.set("datadir", "/var/tally");
    core::Config reg_cfg;
    reg_cfg.set("datadir", "/var/tally");
    reg_cfg.set("network", "regtest");

    CHECK_EQ(main_cfg.data_dir(), std::filesystem::path("/var/tally"));
    CHECK_NE(reg_cfg.data_dir(), main_cfg.data_dir());
    CHECK_EQ(main_cfg.network(), "main");
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, parse_levels) {
    CHECK(core::parse_log_level("trace") == core::LogLevel::TRACE);
    CHECK(core::parse_log_level("DEBUG") == core::LogLevel::DEBUG);
    CHECK(core::parse_log_level("off") == core::LogLevel::OFF);
    CHECK(core::parse_log_level("nonsense") == core::LogLevel::INFO);
    CHECK_EQ(core::log_level_string(core::LogLevel::WARN), "WARN");
}

TEST_CASE(Logging, category_mask_operators) {
    core::LogCategory mask = core::LogCategory::CHAIN;
    mask |= core::LogCategory::DIFF;
    CHECK((mask & core::LogCategory::DIFF) == core::LogCategory::DIFF);
    CHECK((mask & core::LogCategory::STORAGE) == core::LogCategory::NONE);
    CHECK(!core::log_category_string(core::LogCategory::CHAIN).empty());
}

// ============================================================================
// Sync
// ============================================================================

TEST_CASE(Sync, lock_guards_serialize_writers) {
    core::Mutex mtx("test_counter");
    int counter = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) {
                LOCK(mtx);
                ++counter;
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK_EQ(counter, 4000);
}

TEST_CASE(Sync, shared_mutex_readers_and_writer) {
    core::SharedMutex mtx("test_shared");
    int value = 0;
    {
        core::WriteLock w(mtx);
        value = 5;
        CHECK(w.owns_lock());
        w.unlock();
        CHECK(!w.owns_lock());
    }

    int seen_a = 0;
    int seen_b = 0;
    {
        READ_LOCK(mtx);
        seen_a = value;
        // A second reader on another thread is not blocked.
        std::thread reader([&] {
            READ_LOCK(mtx);
            seen_b = value;
        });
        reader.join();
    }
    CHECK_EQ(seen_a, 5);
    CHECK_EQ(seen_b, 5);
}

TEST_CASE(Sync, try_lock) {
    core::Mutex mtx("test_try");
    CHECK(mtx.try_lock());
    mtx.unlock();

    core::UniqueLock lock(mtx, std::defer_lock);
    CHECK(!lock.owns_lock());
    lock.lock();
    CHECK(lock.owns_lock());
}

// ============================================================================
// Filesystem
// ============================================================================

TEST_CASE(Filesystem, ensure_directory_and_size) {
    test::TempDir dir("fs");
    const auto nested = dir.path() / "a" / "b";
    CHECK(core::fs::ensure_directory(nested));
    CHECK(core::fs::dir_exists(nested));
    CHECK(!core::fs::file_exists(nested));

    const auto file = nested / "data.bin";
    {
        std::ofstream f(file, std::ios::binary);
        f << "12345";
    }
    CHECK(core::fs::file_exists(file));
    CHECK(!core::fs::dir_exists(file));
    auto size = core::fs::file_size(file);
    CHECK(size.has_value());
    CHECK_EQ(*size, 5u);
    CHECK(!core::fs::file_size(nested / "missing").has_value());
}

TEST_CASE(Filesystem, file_lock_is_exclusive) {
    test::TempDir dir("lock");
    core::fs::FileLock first(dir.path() / ".lock");
    CHECK(first.try_lock());
    CHECK(first.locked());

    first.unlock();
    CHECK(!first.locked());

    core::fs::FileLock second(dir.path() / ".lock");
    CHECK(second.try_lock());
}
