// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                  return "NONE";

        case ErrorCode::PARSE_ERROR:           return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:        return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_UNDERFLOW:       return "PARSE_UNDERFLOW";
        case ErrorCode::PARSE_BAD_FORMAT:      return "PARSE_BAD_FORMAT";

        case ErrorCode::VALIDATION_ERROR:      return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:      return "VALIDATION_RANGE";
        case ErrorCode::VALIDATION_ORPHAN:     return "VALIDATION_ORPHAN";
        case ErrorCode::VALIDATION_DUPLICATE:  return "VALIDATION_DUPLICATE";
        case ErrorCode::VALIDATION_WORK:       return "VALIDATION_WORK";
        case ErrorCode::VALIDATION_DOS:        return "VALIDATION_DOS";

        case ErrorCode::STORAGE_ERROR:         return "STORAGE_ERROR";
        case ErrorCode::STORAGE_NOT_FOUND:     return "STORAGE_NOT_FOUND";
        case ErrorCode::STORAGE_CORRUPT:       return "STORAGE_CORRUPT";
        case ErrorCode::STORAGE_FULL:          return "STORAGE_FULL";

        case ErrorCode::CONSISTENCY_FAULT:     return "CONSISTENCY_FAULT";
        case ErrorCode::CONSISTENCY_DUPLICATE: return "CONSISTENCY_DUPLICATE";
        case ErrorCode::CONSISTENCY_MISSING:   return "CONSISTENCY_MISSING";
        case ErrorCode::CONSISTENCY_MISMATCH:  return "CONSISTENCY_MISMATCH";
        case ErrorCode::CONSISTENCY_MATURITY:  return "CONSISTENCY_MATURITY";
        case ErrorCode::CONSISTENCY_HALTED:    return "CONSISTENCY_HALTED";

        case ErrorCode::INTERNAL_ERROR:        return "INTERNAL_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:       return "NOT_IMPLEMENTED";
        case ErrorCode::OUT_OF_MEMORY:         return "OUT_OF_MEMORY";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file << ':' << location_.line() << ']';
    }

    return oss.str();
}

} // namespace core
