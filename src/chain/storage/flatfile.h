#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <span>
#include <vector>

namespace chain { namespace storage {

// ---------------------------------------------------------------------------
// FlatFile -- append-only file with positional reads
// ---------------------------------------------------------------------------
// Each append is a single write of the caller's buffer; sync() makes
// everything appended so far durable (fsync). truncate() cuts a torn tail
// left by a crash mid-append. Thread-safe via an internal mutex.
// ---------------------------------------------------------------------------
class FlatFile {
public:
    explicit FlatFile(const std::filesystem::path& path);
    ~FlatFile();

    FlatFile(const FlatFile&) = delete;
    FlatFile& operator=(const FlatFile&) = delete;

    /// Open the file, creating it and its directory if needed.
    core::Result<void> open();

    void close();

    [[nodiscard]] bool is_open() const;

    /// Append @p data at the end of the file. Returns the offset it was
    /// written at.
    core::Result<int64_t> append(std::span<const uint8_t> data);

    /// Read exactly @p length bytes at @p offset.
    core::Result<std::vector<uint8_t>> read_at(int64_t offset, size_t length);

    core::Result<int64_t> size() const;

    /// fsync: everything appended so far survives a crash.
    core::Result<void> sync();

    /// Cut the file back to @p new_size bytes.
    core::Result<void> truncate(int64_t new_size);

    [[nodiscard]] const std::filesystem::path& path() const;

private:
    std::filesystem::path path_;
    int fd_ = -1;
    int64_t current_size_ = 0;
    mutable std::mutex mutex_;
};

}} // namespace chain::storage
