// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/currency.h"

#include <cstdio>
#include <limits>

namespace primitives {

core::Result<Currency> Currency::add(Currency other) const {
    if (value_ > std::numeric_limits<uint64_t>::max() - other.value_) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "currency addition overflows: " + to_string() + " + " +
                other.to_string());
    }
    return Currency(value_ + other.value_);
}

core::Result<Currency> Currency::sub(Currency other) const {
    if (other.value_ > value_) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "currency subtraction underflows: " + to_string() + " - " +
                other.to_string());
    }
    return Currency(value_ - other.value_);
}

std::string Currency::to_string() const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%llu.%06llu",
                  static_cast<unsigned long long>(value_ / COIN),
                  static_cast<unsigned long long>(value_ % COIN));
    return buf;
}

core::Result<Currency> sum(const std::vector<Currency>& values) {
    Currency total;
    for (const auto& v : values) {
        auto next = total.add(v);
        if (!next.ok()) {
            return next.error();
        }
        total = next.value();
    }
    return total;
}

} // namespace primitives
