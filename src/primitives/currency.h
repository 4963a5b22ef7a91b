#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

#include "core/error.h"
#include "core/serialize.h"

namespace primitives {

/// A quantity of siacoins or siafunds in indivisible base units.
/// Arithmetic that can leave the unsigned 64-bit range is checked and
/// reports VALIDATION_RANGE instead of wrapping.
class Currency {
    uint64_t value_ = 0;

public:
    /// Base units per whole coin.
    static constexpr uint64_t COIN = 1'000'000;

    constexpr Currency() = default;
    constexpr explicit Currency(uint64_t v) : value_(v) {}

    static constexpr Currency coins(uint64_t n) { return Currency(n * COIN); }

    [[nodiscard]] constexpr uint64_t value() const { return value_; }
    [[nodiscard]] constexpr bool is_zero() const { return value_ == 0; }

    [[nodiscard]] core::Result<Currency> add(Currency other) const;

    /// Fails when @p other is larger than this value.
    [[nodiscard]] core::Result<Currency> sub(Currency other) const;

    bool operator==(const Currency& o) const = default;
    auto operator<=>(const Currency& o) const = default;

    /// "<coins>.<fraction>" with the fraction zero-padded.
    [[nodiscard]] std::string to_string() const;

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_u64(s, value_);
    }

    template<typename Stream>
    static Currency deserialize(Stream& s) {
        return Currency(core::ser_read_u64(s));
    }
};

inline constexpr Currency ZERO_CURRENCY{0};

/// Checked sum of a sequence of values.
[[nodiscard]] core::Result<Currency> sum(const std::vector<Currency>& values);

} // namespace primitives
