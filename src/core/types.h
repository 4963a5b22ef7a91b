#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// uint256 -- 32-byte value used for digests and cumulative chain work
// ---------------------------------------------------------------------------
// Bytes are stored LITTLE-ENDIAN (least-significant byte at index 0) so the
// arithmetic below is a straight carry loop. Hex display is BIG-ENDIAN, most
// significant byte first.
// ---------------------------------------------------------------------------
class uint256 {
public:
    static constexpr std::size_t SIZE = 32;

    constexpr uint256() noexcept : bytes_{} {}

    /// Construct from raw little-endian bytes (digest output is taken as-is).
    static uint256 from_bytes(std::span<const uint8_t, 32> bytes) noexcept;

    /// Parse big-endian hex (at most 64 chars, optional "0x"). Shorter input
    /// is left-padded with zeros. Throws std::invalid_argument on bad input.
    static uint256 from_hex(std::string_view hex);

    static uint256 from_uint64(uint64_t v) noexcept;

    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }
    [[nodiscard]] const std::array<uint8_t, 32>& bytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] constexpr std::size_t size() const noexcept { return SIZE; }

    [[nodiscard]] bool is_zero() const noexcept;

    /// Wrapping 256-bit addition.
    uint256& operator+=(const uint256& other) noexcept;

    [[nodiscard]] uint256 operator+(const uint256& other) const noexcept {
        uint256 result = *this;
        result += other;
        return result;
    }

    /// Numeric comparison, as big unsigned integers.
    [[nodiscard]] std::strong_ordering operator<=>(
        const uint256& other) const noexcept;
    [[nodiscard]] bool operator==(const uint256& other) const noexcept {
        return bytes_ == other.bytes_;
    }

private:
    std::array<uint8_t, 32> bytes_;
};

}  // namespace core

template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept;
};
