#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <filesystem>
#include <optional>

namespace core::fs {

using path = std::filesystem::path;

/// Platform default data directory:
///   Windows : %APPDATA%/Tally
///   macOS   : ~/Library/Application Support/Tally
///   Linux   : ~/.tally
path get_default_data_dir();

/// Creates the directory (and parents) if it does not exist.
/// Returns true on success or if the directory already exists.
bool ensure_directory(const path& dir);

/// True if `p` is an existing regular file.
bool file_exists(const path& p);

/// True if `p` is an existing directory.
bool dir_exists(const path& p);

/// Size of the file in bytes, or std::nullopt on error.
std::optional<uint64_t> file_size(const path& p);

// ---------------------------------------------------------------------------
// FileLock - advisory lock on a file (flock), released on destruction.
// Used to keep two daemons off the same data directory.
// ---------------------------------------------------------------------------
class FileLock {
public:
    explicit FileLock(const path& p);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /// Non-blocking. False if another process holds the lock.
    bool try_lock();

    void unlock();

    bool locked() const noexcept { return locked_; }

private:
    path lock_path_;
    bool locked_{false};
    int fd_{-1};
};

} // namespace core::fs
