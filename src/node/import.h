#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Block import files
// ---------------------------------------------------------------------------
// A block file is a plain concatenation of frames:
//
//   [length u32 LE][Block::encode() bytes]
//
// import_blocks() feeds each frame through ConsensusSet::accept_block().
// Refused blocks are counted and skipped; a consistency or storage failure
// stops the import and is returned.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "primitives/block.h"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace chain {
class ConsensusSet;
} // namespace chain

namespace node {

struct ImportStats {
    uint64_t extended = 0;
    uint64_t reorganized = 0;
    uint64_t side_chain = 0;
    uint64_t rejected = 0;
};

[[nodiscard]] core::Result<ImportStats> import_blocks(
    chain::ConsensusSet& chainstate,
    const std::filesystem::path& path);

/// Write @p blocks to @p path in import format, replacing the file.
[[nodiscard]] core::Result<void> write_block_file(
    const std::filesystem::path& path,
    const std::vector<primitives::Block>& blocks);

} // namespace node
