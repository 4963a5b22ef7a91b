// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"

namespace consensus {

std::string_view validation_result_name(ValidationResult r) noexcept {
    switch (r) {
        case ValidationResult::VALID:                return "VALID";
        case ValidationResult::TX_MISSING_INPUTS:    return "TX_MISSING_INPUTS";
        case ValidationResult::TX_DUPLICATE:         return "TX_DUPLICATE";
        case ValidationResult::TX_UNBALANCED:        return "TX_UNBALANCED";
        case ValidationResult::TX_BAD_CONTRACT:      return "TX_BAD_CONTRACT";
        case ValidationResult::TX_BAD_STORAGE_PROOF: return "TX_BAD_STORAGE_PROOF";
        case ValidationResult::TX_OVERFLOW:          return "TX_OVERFLOW";
        case ValidationResult::TX_DOS:               return "TX_DOS";
        case ValidationResult::BLOCK_KNOWN:          return "BLOCK_KNOWN";
        case ValidationResult::BLOCK_CACHED_INVALID: return "BLOCK_CACHED_INVALID";
        case ValidationResult::BLOCK_DOS:            return "BLOCK_DOS";
        case ValidationResult::BLOCK_MISSING_PREV:   return "BLOCK_MISSING_PREV";
        case ValidationResult::BLOCK_BAD_HEADER:     return "BLOCK_BAD_HEADER";
        case ValidationResult::BLOCK_TIME_TOO_OLD:   return "BLOCK_TIME_TOO_OLD";
        case ValidationResult::BLOCK_BAD_PAYOUT:     return "BLOCK_BAD_PAYOUT";
        case ValidationResult::BLOCK_REORG_TOO_DEEP: return "BLOCK_REORG_TOO_DEEP";
        case ValidationResult::INTERNAL_ERROR:       return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

core::ErrorCode to_error_code(ValidationResult r) noexcept {
    switch (r) {
        case ValidationResult::VALID:
            return core::ErrorCode::NONE;
        case ValidationResult::BLOCK_KNOWN:
        case ValidationResult::TX_DUPLICATE:
            return core::ErrorCode::VALIDATION_DUPLICATE;
        case ValidationResult::BLOCK_MISSING_PREV:
            return core::ErrorCode::VALIDATION_ORPHAN;
        case ValidationResult::BLOCK_BAD_HEADER:
            return core::ErrorCode::VALIDATION_WORK;
        case ValidationResult::TX_DOS:
        case ValidationResult::BLOCK_DOS:
            return core::ErrorCode::VALIDATION_DOS;
        case ValidationResult::TX_OVERFLOW:
        case ValidationResult::BLOCK_REORG_TOO_DEEP:
            return core::ErrorCode::VALIDATION_RANGE;
        case ValidationResult::INTERNAL_ERROR:
            return core::ErrorCode::INTERNAL_ERROR;
        default:
            return core::ErrorCode::VALIDATION_ERROR;
    }
}

bool ValidationState::invalid(ValidationResult result,
                              const std::string& reject_reason,
                              const std::string& debug_message) {
    result_ = result;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    is_valid_ = false;
    return false;
}

std::string ValidationState::to_string() const {
    if (is_valid_) {
        return "valid";
    }
    std::string s = reject_reason_;
    if (!debug_message_.empty()) {
        s += " (";
        s += debug_message_;
        s += ')';
    }
    return s;
}

core::Error ValidationState::to_error(std::source_location loc) const {
    return core::Error(to_error_code(result_),
                       std::string(validation_result_name(result_)) + ": " +
                           to_string(),
                       loc);
}

} // namespace consensus
