#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/storage/flatfile.h"
#include "core/error.h"
#include "core/serialize.h"
#include "consensus/diff.h"
#include "primitives/block.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace chain { namespace storage {

// ---------------------------------------------------------------------------
// BlockRecord -- one accepted block, as persisted
// ---------------------------------------------------------------------------
// Side-chain blocks are stored without diffs; they get them the first time
// a reorganization connects them, and are stored again at that point.
// ---------------------------------------------------------------------------
struct BlockRecord {
    primitives::Block block;
    std::optional<consensus::DiffList> diffs;

    template <typename Stream>
    void serialize(Stream& s) const {
        block.serialize(s);
        core::ser_write_u8(s, diffs ? 1 : 0);
        if (diffs) {
            core::ser_write_compact_size(s, diffs->size());
            for (const auto& d : *diffs) {
                consensus::serialize_diff(s, d);
            }
        }
    }

    template <typename Stream>
    static BlockRecord deserialize(Stream& s) {
        BlockRecord r;
        r.block = primitives::Block::deserialize(s);
        uint8_t has_diffs = core::ser_read_u8(s);
        if (has_diffs > 1) {
            throw std::runtime_error("block record: bad diff flag");
        }
        if (has_diffs) {
            uint64_t n = core::ser_read_compact_size(s);
            if (n > core::MAX_VECTOR_SIZE) {
                throw std::runtime_error("block record: too many diffs");
            }
            consensus::DiffList diffs;
            diffs.reserve(static_cast<size_t>(n));
            for (uint64_t i = 0; i < n; ++i) {
                diffs.push_back(consensus::deserialize_diff(s));
            }
            r.diffs = std::move(diffs);
        }
        return r;
    }
};

// ---------------------------------------------------------------------------
// ChainStore -- durability contract for accepted blocks
// ---------------------------------------------------------------------------
// write_blocks() returns only once the whole batch is durable, and a crash
// leaves either all of it or none of it. Records come back from
// load_blocks() in write order; a block may appear more than once (first
// without diffs, later with them).
// ---------------------------------------------------------------------------
class ChainStore {
public:
    virtual ~ChainStore() = default;

    /// Persist @p records as one atomic unit.
    virtual core::Result<void> write_blocks(
        const std::vector<BlockRecord>& records) = 0;

    core::Result<void> write_block(const BlockRecord& record) {
        return write_blocks(std::vector<BlockRecord>{record});
    }

    virtual core::Result<std::vector<BlockRecord>> load_blocks() = 0;

    virtual core::Result<void> flush() = 0;
};

// ---------------------------------------------------------------------------
// FlatChainStore -- consensus.dat
// ---------------------------------------------------------------------------
// Append-only layout, one frame per write_blocks() batch:
//
//   [magic u32][size u32][checksum u32][payload]   -- first batch
//   [magic u32][size u32][checksum u32][payload]   -- second batch
//   ...
//
// payload is a CompactSize record count followed by the records. checksum
// is the first four bytes of SHA3-256(payload). A frame cut short at the
// end of the file (a crash mid-append) is trimmed on load, dropping its
// whole batch; any other damage is STORAGE_CORRUPT.
// ---------------------------------------------------------------------------

/// Size of a serialized frame header: 4 (magic) + 4 (size) + 4 (checksum).
static constexpr size_t RECORD_HEADER_SIZE = 12;

/// "TLY1"
static constexpr uint32_t RECORD_MAGIC = 0x31594C54;

class FlatChainStore : public ChainStore {
public:
    explicit FlatChainStore(const std::filesystem::path& data_dir);
    ~FlatChainStore() override;

    /// Open (or create) consensus.dat.
    core::Result<void> init();

    core::Result<void> write_blocks(
        const std::vector<BlockRecord>& records) override;

    core::Result<std::vector<BlockRecord>> load_blocks() override;

    core::Result<void> flush() override;

    /// Bytes currently in consensus.dat.
    core::Result<int64_t> total_size() const;

    [[nodiscard]] const std::filesystem::path& path() const;

private:
    std::filesystem::path path_;
    std::unique_ptr<FlatFile> file_;
};

}} // namespace chain::storage
