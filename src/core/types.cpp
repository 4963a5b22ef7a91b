// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

constexpr int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

uint256 uint256::from_bytes(std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

uint256 uint256::from_uint64(uint64_t v) noexcept {
    uint256 result;
    for (std::size_t i = 0; i < 8; ++i) {
        result.bytes_[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return result;
}

uint256 uint256::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() > SIZE * 2) {
        throw std::invalid_argument(
            "uint256::from_hex: input longer than 64 hex chars");
    }

    // Walk from the least-significant (rightmost) nibble.
    uint256 result;
    std::size_t nibble = 0;
    for (auto it = hex.rbegin(); it != hex.rend(); ++it, ++nibble) {
        int v = hex_digit_value(*it);
        if (v < 0) {
            throw std::invalid_argument(
                "uint256::from_hex: invalid hex character");
        }
        uint8_t& byte = result.bytes_[nibble / 2];
        byte |= static_cast<uint8_t>(nibble % 2 == 0 ? v : v << 4);
    }
    return result;
}

std::string uint256::to_hex() const {
    std::string out;
    out.reserve(SIZE * 2);
    for (std::size_t i = SIZE; i > 0; --i) {
        uint8_t byte = bytes_[i - 1];
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

bool uint256::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

uint256& uint256::operator+=(const uint256& other) noexcept {
    unsigned carry = 0;
    for (std::size_t i = 0; i < SIZE; ++i) {
        unsigned sum = static_cast<unsigned>(bytes_[i]) +
                       static_cast<unsigned>(other.bytes_[i]) + carry;
        bytes_[i] = static_cast<uint8_t>(sum & 0xFF);
        carry = sum >> 8;
    }
    return *this;
}

std::strong_ordering uint256::operator<=>(
    const uint256& other) const noexcept {
    for (std::size_t i = SIZE; i > 0; --i) {
        if (bytes_[i - 1] != other.bytes_[i - 1]) {
            return bytes_[i - 1] <=> other.bytes_[i - 1];
        }
    }
    return std::strong_ordering::equal;
}

}  // namespace core

std::size_t std::hash<core::uint256>::operator()(
    const core::uint256& v) const noexcept {
    // Digests are already uniformly distributed; the low word is enough.
    std::size_t h = 0;
    std::memcpy(&h, v.data(), sizeof(h));
    return h;
}
