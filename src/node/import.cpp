// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/import.h"

#include "chain/consensus_set.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/time.h"

#include <fstream>
#include <iterator>
#include <string>

namespace node {

core::Result<ImportStats> import_blocks(chain::ConsensusSet& chainstate,
                                        const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return core::Error(core::ErrorCode::STORAGE_NOT_FOUND,
            "Cannot open block file " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());

    core::StopWatch timer;
    ImportStats stats;
    core::SpanReader reader{std::span<const uint8_t>(data)};
    uint64_t index = 0;

    while (!reader.eof()) {
        if (reader.remaining() < 4) {
            return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                "Truncated frame header in " + path.string() +
                " at block " + std::to_string(index));
        }
        const uint32_t length = core::ser_read_u32(reader);
        if (reader.remaining() < length) {
            return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                "Truncated block " + std::to_string(index) + " in " +
                path.string());
        }
        std::vector<uint8_t> frame(length);
        core::ser_read_bytes(reader, std::span<uint8_t>(frame));

        TALLY_TRY_ASSIGN(block, primitives::Block::decode(frame));

        auto accepted = chainstate.accept_block(
            block, "import:" + path.filename().string());
        if (!accepted.ok()) {
            if (!accepted.error().is_rejection()) {
                return std::move(accepted).error();
            }
            ++stats.rejected;
        } else {
            switch (accepted.value()) {
                case chain::AcceptStatus::EXTENDED:    ++stats.extended;    break;
                case chain::AcceptStatus::REORGANIZED: ++stats.reorganized; break;
                case chain::AcceptStatus::SIDE_CHAIN:  ++stats.side_chain;  break;
            }
        }
        ++index;
    }

    LOG_INFO(core::LogCategory::BENCH,
             "Imported " + std::to_string(index) + " blocks from " +
             path.string() + " in " + std::to_string(timer.elapsed_ms()) +
             " ms (" + std::to_string(stats.rejected) + " rejected)");
    return stats;
}

core::Result<void> write_block_file(
    const std::filesystem::path& path,
    const std::vector<primitives::Block>& blocks) {
    core::DataStream out;
    for (const auto& block : blocks) {
        std::vector<uint8_t> bytes = block.encode();
        core::ser_write_u32(out, static_cast<uint32_t>(bytes.size()));
        core::ser_write_bytes(out, std::span<const uint8_t>(bytes));
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Cannot create block file " + path.string());
    }
    auto bytes = out.bytes();
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Failed writing block file " + path.string());
    }
    return core::make_ok();
}

} // namespace node
