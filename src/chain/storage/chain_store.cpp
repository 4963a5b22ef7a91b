// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/storage/chain_store.h"

#include "core/logging.h"
#include "core/stream.h"
#include "crypto/keccak.h"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace chain { namespace storage {

namespace {

uint32_t payload_checksum(std::span<const uint8_t> payload) {
    core::uint256 digest = crypto::keccak256(payload);
    const uint8_t* p = digest.data();
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

std::string hex32(uint32_t v) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08X", v);
    return std::string(buf);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

FlatChainStore::FlatChainStore(const std::filesystem::path& data_dir)
    : path_(data_dir / "consensus.dat") {}

FlatChainStore::~FlatChainStore() = default;

// ---------------------------------------------------------------------------
// init -- open (or create) consensus.dat
// ---------------------------------------------------------------------------

core::Result<void> FlatChainStore::init() {
    file_ = std::make_unique<FlatFile>(path_);
    TALLY_TRY_VOID(file_->open());
    LOG_DEBUG(core::LogCategory::STORAGE,
              "Opened " + path_.string());
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// write_blocks -- append one frame and make it durable
// ---------------------------------------------------------------------------

core::Result<void> FlatChainStore::write_blocks(
    const std::vector<BlockRecord>& records) {
    if (!file_ || !file_->is_open()) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "FlatChainStore not initialized");
    }
    if (records.empty()) {
        return core::make_ok();
    }

    core::DataStream payload;
    core::ser_write_compact_size(payload, records.size());
    for (const auto& record : records) {
        record.serialize(payload);
    }

    if (payload.size() > static_cast<size_t>(UINT32_MAX)) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Frame payload too large: " + std::to_string(payload.size()));
    }

    // Header and payload go out in a single write.
    core::DataStream out;
    core::ser_write_u32(out, RECORD_MAGIC);
    core::ser_write_u32(out, static_cast<uint32_t>(payload.size()));
    core::ser_write_u32(out, payload_checksum(payload.bytes()));
    core::ser_write_bytes(out, payload.bytes());

    TALLY_TRY_ASSIGN(offset, file_->append(out.bytes()));
    TALLY_TRY_VOID(file_->sync());

    LOG_TRACE(core::LogCategory::STORAGE,
              "Stored " + std::to_string(records.size()) +
              " block record(s) ending with " +
              records.back().block.id().short_hex() +
              " at offset " + std::to_string(offset));
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// load_blocks -- scan consensus.dat from the start
// ---------------------------------------------------------------------------

core::Result<std::vector<BlockRecord>> FlatChainStore::load_blocks() {
    if (!file_ || !file_->is_open()) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "FlatChainStore not initialized");
    }

    TALLY_TRY_ASSIGN(file_size, file_->size());

    std::vector<BlockRecord> records;
    int64_t pos = 0;
    while (pos < file_size) {
        const int64_t remaining = file_size - pos;

        // A header or payload that runs past the end is a torn append.
        if (remaining < static_cast<int64_t>(RECORD_HEADER_SIZE)) {
            break;
        }

        TALLY_TRY_ASSIGN(hdr_bytes, file_->read_at(pos, RECORD_HEADER_SIZE));
        core::DataStream hdr(std::move(hdr_bytes));
        const uint32_t magic = core::ser_read_u32(hdr);
        const uint32_t size = core::ser_read_u32(hdr);
        const uint32_t checksum = core::ser_read_u32(hdr);

        if (magic != RECORD_MAGIC) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "Invalid record magic at offset " + std::to_string(pos) +
                ": expected 0x" + hex32(RECORD_MAGIC) + ", got 0x" +
                hex32(magic));
        }

        const int64_t record_end =
            pos + static_cast<int64_t>(RECORD_HEADER_SIZE) + size;
        if (record_end > file_size) {
            break;
        }

        TALLY_TRY_ASSIGN(payload,
                         file_->read_at(pos + static_cast<int64_t>(
                                                  RECORD_HEADER_SIZE),
                                        size));
        if (payload_checksum(payload) != checksum) {
            if (record_end == file_size) {
                // Last record, partly overwritten by a crash.
                break;
            }
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "Checksum mismatch in record at offset " +
                std::to_string(pos));
        }

        core::SpanReader reader{std::span<const uint8_t>(payload)};
        try {
            const uint64_t count = core::ser_read_compact_size(reader);
            if (count == 0 || count > core::MAX_VECTOR_SIZE) {
                throw std::runtime_error("bad record count " +
                                         std::to_string(count));
            }
            for (uint64_t i = 0; i < count; ++i) {
                records.push_back(BlockRecord::deserialize(reader));
            }
        } catch (const std::exception& e) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "Failed to decode frame at offset " + std::to_string(pos) +
                ": " + e.what());
        }
        if (!reader.eof()) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "Trailing bytes in frame at offset " + std::to_string(pos));
        }

        pos = record_end;
    }

    if (pos < file_size) {
        LOG_WARN(core::LogCategory::STORAGE,
                 "Discarding torn record at offset " + std::to_string(pos) +
                 " (" + std::to_string(file_size - pos) + " bytes)");
        TALLY_TRY_VOID(file_->truncate(pos));
        TALLY_TRY_VOID(file_->sync());
    }

    LOG_INFO(core::LogCategory::STORAGE,
             "Loaded " + std::to_string(records.size()) + " block records from " +
             path_.string());
    return records;
}

// ---------------------------------------------------------------------------
// flush / total_size
// ---------------------------------------------------------------------------

core::Result<void> FlatChainStore::flush() {
    if (!file_ || !file_->is_open()) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "FlatChainStore not initialized");
    }
    return file_->sync();
}

core::Result<int64_t> FlatChainStore::total_size() const {
    if (!file_ || !file_->is_open()) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "FlatChainStore not initialized");
    }
    return file_->size();
}

const std::filesystem::path& FlatChainStore::path() const {
    return path_;
}

}} // namespace chain::storage
