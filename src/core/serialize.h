#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"
#include "core/types.h"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// ===================================================================
// Serialization concepts
// ===================================================================

template <typename T>
concept Serializable = requires(const T t, DataStream& s) {
    { t.serialize(s) };
};

template <typename T>
concept Deserializable = requires(DataStream& s) {
    { T::deserialize(s) } -> std::same_as<T>;
};

// ===================================================================
// Safety limits
// ===================================================================

inline constexpr size_t MAX_STRING_LENGTH = 1u << 20;
inline constexpr size_t MAX_VECTOR_SIZE = 1u << 20;
inline constexpr uint64_t MAX_COMPACT_SIZE = 0xFFFFFFFFULL;

// ===================================================================
// Primitive serializers -- little-endian
// ===================================================================

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) {
    s.write(std::span<const uint8_t>(&v, 1));
}

template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 4));
}

template <typename Stream>
inline void ser_write_u64(Stream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 8));
}

template <typename Stream>
inline void ser_write_bytes(Stream& s, std::span<const uint8_t> data) {
    s.write(data);
}

template <typename Stream>
inline uint8_t ser_read_u8(Stream& s) {
    uint8_t v{};
    s.read(std::span<uint8_t>(&v, 1));
    return v;
}

template <typename Stream>
inline uint32_t ser_read_u32(Stream& s) {
    uint8_t buf[4];
    s.read(std::span<uint8_t>(buf, 4));
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(buf[i]) << (8 * i);
    }
    return v;
}

template <typename Stream>
inline uint64_t ser_read_u64(Stream& s) {
    uint8_t buf[8];
    s.read(std::span<uint8_t>(buf, 8));
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return v;
}

template <typename Stream>
inline void ser_read_bytes(Stream& s, std::span<uint8_t> buf) {
    s.read(buf);
}

// ===================================================================
// CompactSize
// ===================================================================
//   0   .. 252              -> 1 byte
//   253 .. 0xFFFF           -> 0xFD + 2 bytes LE
//   0x10000 .. 0xFFFFFFFF   -> 0xFE + 4 bytes LE
//   larger                  -> 0xFF + 8 bytes LE
// ===================================================================

template <typename Stream>
void ser_write_compact_size(Stream& s, uint64_t n) {
    if (n < 253) {
        ser_write_u8(s, static_cast<uint8_t>(n));
    } else if (n <= 0xFFFF) {
        ser_write_u8(s, 0xFD);
        uint8_t buf[2] = {static_cast<uint8_t>(n & 0xFF),
                          static_cast<uint8_t>((n >> 8) & 0xFF)};
        s.write(std::span<const uint8_t>(buf, 2));
    } else if (n <= 0xFFFFFFFFULL) {
        ser_write_u8(s, 0xFE);
        ser_write_u32(s, static_cast<uint32_t>(n));
    } else {
        ser_write_u8(s, 0xFF);
        ser_write_u64(s, n);
    }
}

/// Throws std::runtime_error on non-canonical encodings and on values
/// above MAX_COMPACT_SIZE.
template <typename Stream>
uint64_t ser_read_compact_size(Stream& s) {
    uint8_t hdr = ser_read_u8(s);
    uint64_t n;
    uint64_t min_canonical = 0;
    if (hdr < 253) {
        n = hdr;
    } else if (hdr == 0xFD) {
        uint8_t buf[2];
        s.read(std::span<uint8_t>(buf, 2));
        n = static_cast<uint64_t>(buf[0]) |
            (static_cast<uint64_t>(buf[1]) << 8);
        min_canonical = 253;
    } else if (hdr == 0xFE) {
        n = ser_read_u32(s);
        min_canonical = 0x10000ULL;
    } else {
        n = ser_read_u64(s);
        min_canonical = 0x100000000ULL;
    }

    if (n < min_canonical) {
        throw std::runtime_error(
            "ser_read_compact_size(): non-canonical encoding");
    }
    if (n > MAX_COMPACT_SIZE) {
        throw std::runtime_error(
            "ser_read_compact_size(): size exceeds MAX_COMPACT_SIZE");
    }
    return n;
}

// ===================================================================
// Strings, hashes and object vectors
// ===================================================================

template <typename Stream>
void ser_write_string(Stream& s, std::string_view str) {
    ser_write_compact_size(s, str.size());
    if (!str.empty()) {
        s.write(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(str.data()), str.size()));
    }
}

template <typename Stream>
std::string ser_read_string(Stream& s) {
    uint64_t len = ser_read_compact_size(s);
    if (len > MAX_STRING_LENGTH) {
        throw std::runtime_error(
            "ser_read_string(): string exceeds MAX_STRING_LENGTH");
    }
    std::string result(static_cast<size_t>(len), '\0');
    if (len > 0) {
        s.read(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(result.data()),
            static_cast<size_t>(len)));
    }
    return result;
}

/// 32 raw bytes, no length prefix.
template <typename Stream>
inline void ser_write_uint256(Stream& s, const core::uint256& v) {
    s.write(std::span<const uint8_t>(v.data(), 32));
}

template <typename Stream>
inline core::uint256 ser_read_uint256(Stream& s) {
    std::array<uint8_t, 32> bytes{};
    s.read(std::span<uint8_t>(bytes));
    return core::uint256::from_bytes(std::span<const uint8_t, 32>(bytes));
}

template <typename Stream, Serializable T>
void ser_write_obj_vector(Stream& s, const std::vector<T>& v) {
    ser_write_compact_size(s, v.size());
    for (const auto& elem : v) {
        elem.serialize(s);
    }
}

template <Deserializable T, typename Stream>
std::vector<T> ser_read_obj_vector(Stream& s) {
    uint64_t count = ser_read_compact_size(s);
    if (count > MAX_VECTOR_SIZE) {
        throw std::runtime_error(
            "ser_read_obj_vector(): count exceeds MAX_VECTOR_SIZE");
    }
    std::vector<T> result;
    result.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        result.push_back(T::deserialize(s));
    }
    return result;
}

/// Serialize @p obj into a fresh byte vector.
template <Serializable T>
inline std::vector<uint8_t> serialize_to_bytes(const T& obj) {
    DataStream tmp;
    obj.serialize(tmp);
    return tmp.release();
}

}  // namespace core
