// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/storage/flatfile.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chain { namespace storage {

namespace {

std::string errno_string() {
    return std::strerror(errno);
}

} // anonymous namespace

FlatFile::FlatFile(const std::filesystem::path& path)
    : path_(path) {}

FlatFile::~FlatFile() {
    close();
}

core::Result<void> FlatFile::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ >= 0) {
        return core::make_ok();
    }

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                "Failed to create directory: " + parent.string() +
                " (" + ec.message() + ")");
        }
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND, 0644);
    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Failed to open file: " + path_.string() +
            " (" + errno_string() + ")");
    }

    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        std::string why = errno_string();
        ::close(fd_);
        fd_ = -1;
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Failed to determine file size: " + path_.string() +
            " (" + why + ")");
    }
    current_size_ = static_cast<int64_t>(st.st_size);

    return core::make_ok();
}

void FlatFile::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    current_size_ = 0;
}

bool FlatFile::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

core::Result<int64_t> FlatFile::append(std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "File not open for append: " + path_.string());
    }

    const int64_t offset = current_size_;
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            // Whatever made it out is a torn tail; the next open trims it.
            current_size_ = offset + static_cast<int64_t>(written);
            return core::Error(
                err == ENOSPC ? core::ErrorCode::STORAGE_FULL
                              : core::ErrorCode::STORAGE_ERROR,
                "Failed to write to file: " + path_.string() + " (" +
                std::strerror(err) + ")");
        }
        written += static_cast<size_t>(n);
    }

    current_size_ = offset + static_cast<int64_t>(data.size());
    return offset;
}

core::Result<std::vector<uint8_t>> FlatFile::read_at(int64_t offset,
                                                      size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "File not open for read: " + path_.string());
    }

    if (offset < 0 ||
        offset + static_cast<int64_t>(length) > current_size_) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Read past end of file: offset=" + std::to_string(offset) +
            " length=" + std::to_string(length) +
            " file_size=" + std::to_string(current_size_));
    }

    std::vector<uint8_t> buffer(length);
    size_t done = 0;
    while (done < length) {
        ssize_t n = ::pread(fd_, buffer.data() + done, length - done,
                            static_cast<off_t>(offset + static_cast<int64_t>(done)));
        if (n < 0) {
            if (errno == EINTR) continue;
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                "Failed to read from file: " + path_.string() +
                " (" + errno_string() + ")");
        }
        if (n == 0) {
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                "Unexpected end of file: " + path_.string());
        }
        done += static_cast<size_t>(n);
    }

    return buffer;
}

core::Result<int64_t> FlatFile::size() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "File not open: " + path_.string());
    }

    return current_size_;
}

core::Result<void> FlatFile::sync() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "File not open for sync: " + path_.string());
    }

    if (::fsync(fd_) != 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Failed to sync file: " + path_.string() +
            " (" + errno_string() + ")");
    }

    return core::make_ok();
}

core::Result<void> FlatFile::truncate(int64_t new_size) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ < 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "File not open for truncate: " + path_.string());
    }

    if (new_size < 0 || new_size > current_size_) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Invalid truncate size: " + std::to_string(new_size));
    }

    if (::ftruncate(fd_, static_cast<off_t>(new_size)) != 0) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
            "Failed to truncate file: " + path_.string() +
            " (" + errno_string() + ")");
    }

    current_size_ = new_size;
    return core::make_ok();
}

const std::filesystem::path& FlatFile::path() const {
    return path_;
}

}} // namespace chain::storage
