#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// DataStream -- growable byte buffer with a read cursor
// ---------------------------------------------------------------------------
// Reads past the end throw std::runtime_error; decoders at a trust boundary
// catch it and report PARSE_UNDERFLOW.
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;

    explicit DataStream(std::vector<uint8_t> data)
        : buf_(std::move(data)) {}

    explicit DataStream(std::span<const uint8_t> data)
        : buf_(data.begin(), data.end()) {}

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void read(std::span<uint8_t> buf) {
        if (read_pos_ + buf.size() > buf_.size()) {
            throw std::runtime_error(
                "DataStream::read(): attempted read past end of stream");
        }
        if (!buf.empty()) {
            std::memcpy(buf.data(), buf_.data() + read_pos_, buf.size());
        }
        read_pos_ += buf.size();
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    [[nodiscard]] size_t remaining() const noexcept {
        return buf_.size() - read_pos_;
    }

    [[nodiscard]] bool eof() const noexcept {
        return read_pos_ >= buf_.size();
    }

    [[nodiscard]] const uint8_t* data() const noexcept {
        return buf_.data();
    }

    /// Everything written so far, regardless of the read cursor.
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return std::span<const uint8_t>(buf_.data(), buf_.size());
    }

    /// Move the internal buffer out and reset the stream.
    [[nodiscard]] std::vector<uint8_t> release() {
        read_pos_ = 0;
        return std::move(buf_);
    }

private:
    std::vector<uint8_t> buf_;
    size_t               read_pos_ = 0;
};

// ---------------------------------------------------------------------------
// SpanReader -- zero-copy read-only stream over an existing byte span
// ---------------------------------------------------------------------------
class SpanReader {
public:
    explicit SpanReader(std::span<const uint8_t> data)
        : data_(data) {}

    void read(std::span<uint8_t> buf) {
        if (pos_ + buf.size() > data_.size()) {
            throw std::runtime_error(
                "SpanReader::read(): attempted read past end of span");
        }
        if (!buf.empty()) {
            std::memcpy(buf.data(), data_.data() + pos_, buf.size());
        }
        pos_ += buf.size();
    }

    [[nodiscard]] size_t remaining() const noexcept {
        return data_.size() - pos_;
    }

    [[nodiscard]] bool eof() const noexcept {
        return pos_ >= data_.size();
    }

private:
    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

}  // namespace core
