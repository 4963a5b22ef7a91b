// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/fs.h"

#include <cstdlib>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace core::fs {

// ---------------------------------------------------------------------------
// get_default_data_dir
// ---------------------------------------------------------------------------

path get_default_data_dir()
{
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata && appdata[0] != '\0') {
        return path(appdata) / "Tally";
    }
    return path("C:\\Tally");
#elif defined(__APPLE__)
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return path(home) / "Library" / "Application Support" / "Tally";
    }
    return path("/tmp/Tally");
#else
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return path(home) / ".tally";
    }
    return path("/tmp/.tally");
#endif
}

// ---------------------------------------------------------------------------
// Directory / path utilities
// ---------------------------------------------------------------------------

bool ensure_directory(const path& dir)
{
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    return std::filesystem::create_directories(dir, ec) || !ec;
}

bool file_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

bool dir_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_directory(p, ec);
}

std::optional<uint64_t> file_size(const path& p)
{
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(sz);
}

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

FileLock::FileLock(const path& p)
    : lock_path_(p)
{
}

FileLock::~FileLock()
{
    unlock();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool FileLock::try_lock()
{
    if (locked_) {
        return true;
    }
    if (fd_ < 0) {
        fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT, 0644);
        if (fd_ < 0) {
            return false;
        }
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        return false;
    }
    locked_ = true;
    return true;
}

void FileLock::unlock()
{
    if (!locked_) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    locked_ = false;
}

} // namespace core::fs
