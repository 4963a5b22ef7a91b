#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// ValidationState -- why a block or transaction was refused
// ---------------------------------------------------------------------------
// Records the typed reason for a rejection. The block processor turns it
// into a core::Error in the VALIDATION_* range with to_error(). Rejections
// never touch ledger state.
// ---------------------------------------------------------------------------

#include "core/error.h"

#include <source_location>
#include <string>
#include <string_view>

namespace consensus {

enum class ValidationResult {
    VALID,

    // Transaction-level rejection reasons
    TX_MISSING_INPUTS,      // spends an output that does not exist
    TX_DUPLICATE,           // spends or creates the same object twice
    TX_UNBALANCED,          // inputs do not cover outputs, payouts and fees
    TX_BAD_CONTRACT,        // malformed contract window or payout split
    TX_BAD_STORAGE_PROOF,   // unknown contract or outside its proof window
    TX_OVERFLOW,            // a currency sum left the 64-bit range
    TX_DOS,                 // funded, but part of the funding is never spent

    // Block-level rejection reasons
    BLOCK_KNOWN,
    BLOCK_CACHED_INVALID,
    BLOCK_DOS,
    BLOCK_MISSING_PREV,
    BLOCK_BAD_HEADER,       // zero work claimed
    BLOCK_TIME_TOO_OLD,     // timestamp before the parent's
    BLOCK_BAD_PAYOUT,       // miner payouts != subsidy + fees
    BLOCK_REORG_TOO_DEEP,

    INTERNAL_ERROR,
};

[[nodiscard]] std::string_view validation_result_name(
    ValidationResult r) noexcept;

/// VALIDATION_* code reported for @p r.
[[nodiscard]] core::ErrorCode to_error_code(ValidationResult r) noexcept;

/// True for reasons that indicate a deliberately wasteful peer.
[[nodiscard]] constexpr bool is_dos(ValidationResult r) noexcept {
    return r == ValidationResult::TX_DOS || r == ValidationResult::BLOCK_DOS;
}

class ValidationState {
public:
    ValidationState() = default;

    [[nodiscard]] bool is_valid() const noexcept { return is_valid_; }
    [[nodiscard]] bool is_invalid() const noexcept { return !is_valid_; }

    [[nodiscard]] ValidationResult get_result() const noexcept {
        return result_;
    }

    /// Short machine-readable reason (e.g. "bad-txns-inputs-missing").
    [[nodiscard]] const std::string& get_reject_reason() const noexcept {
        return reject_reason_;
    }

    [[nodiscard]] const std::string& get_debug_message() const noexcept {
        return debug_message_;
    }

    /// Record a failure. Always returns false so checks can
    /// `return state.invalid(...)`.
    bool invalid(ValidationResult result,
                 const std::string& reject_reason,
                 const std::string& debug_message = "");

    [[nodiscard]] std::string to_string() const;

    /// The rejection as an error value. Requires is_invalid().
    [[nodiscard]] core::Error to_error(
        std::source_location loc = std::source_location::current()) const;

private:
    ValidationResult result_ = ValidationResult::VALID;
    std::string reject_reason_;
    std::string debug_message_;
    bool is_valid_ = true;
};

class BlockValidationState : public ValidationState {};

class TxValidationState : public ValidationState {};

} // namespace consensus
