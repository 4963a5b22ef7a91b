#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the Tally ledger core
enum class ErrorCode : uint16_t {
    NONE                  = 0,
    // Parsing / serialization (100-199)
    PARSE_ERROR           = 100, PARSE_OVERFLOW   = 101,
    PARSE_UNDERFLOW       = 102, PARSE_BAD_FORMAT = 103,
    // Block rejection (200-299). Recoverable: state is left untouched.
    VALIDATION_ERROR      = 200, VALIDATION_RANGE     = 201,
    VALIDATION_ORPHAN     = 202, VALIDATION_DUPLICATE = 203,
    VALIDATION_WORK       = 204, VALIDATION_DOS       = 205,
    // Storage (500-599)
    STORAGE_ERROR         = 500, STORAGE_NOT_FOUND = 501,
    STORAGE_CORRUPT       = 502, STORAGE_FULL      = 503,
    // Ledger consistency (800-899). Fatal: never retried, never healed.
    CONSISTENCY_FAULT     = 800, CONSISTENCY_DUPLICATE = 801,
    CONSISTENCY_MISSING   = 802, CONSISTENCY_MISMATCH  = 803,
    CONSISTENCY_MATURITY  = 804, CONSISTENCY_HALTED    = 805,
    // Internal (900-999)
    INTERNAL_ERROR        = 900, NOT_IMPLEMENTED = 901,
    OUT_OF_MEMORY         = 902,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

/// True for the 800-range codes raised by the diff commit engine.
[[nodiscard]] constexpr bool is_consistency_fault(ErrorCode code) noexcept {
    auto v = static_cast<uint16_t>(code);
    return v >= 800 && v < 900;
}

/// True for the 200-range codes returned when a candidate block is refused.
[[nodiscard]] constexpr bool is_rejection(ErrorCode code) noexcept {
    auto v = static_cast<uint16_t>(code);
    return v >= 200 && v < 300;
}

// Error: rich error value carrying code, message, and origin location
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }

    [[nodiscard]] bool is_consistency_fault() const noexcept {
        return core::is_consistency_fault(code_);
    }
    [[nodiscard]] bool is_rejection() const noexcept {
        return core::is_rejection(code_);
    }

    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<T>(storage_) : std::move(default_val);
    }

private:
    std::variant<T, E> storage_;
};

// Void-specialization: Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// TALLY_TRY: propagate errors (GCC/Clang statement-expression)
// Usage:  auto val = TALLY_TRY(some_result_expr);
#define TALLY_TRY(expr)                                                   \
    ({                                                                    \
        auto&& _tally_res = (expr);                                       \
        if (!_tally_res.ok()) return std::move(_tally_res).error();       \
        std::move(_tally_res).value();                                    \
    })

// TALLY_TRY_ASSIGN: portable alternative (no statement-expressions)
// Usage:  TALLY_TRY_ASSIGN(val, some_result_expr);
#define TALLY_TRY_ASSIGN(var, expr)                                       \
    auto _tally_tmp_##var = (expr);                                       \
    if (!_tally_tmp_##var.ok())                                           \
        return std::move(_tally_tmp_##var).error();                       \
    auto var = std::move(_tally_tmp_##var).value()

// TALLY_TRY_VOID: propagate errors from Result<void> expressions
#define TALLY_TRY_VOID(expr)                                              \
    do {                                                                  \
        auto _tally_tmp = (expr);                                         \
        if (!_tally_tmp.ok()) return std::move(_tally_tmp).error();       \
    } while (false)

} // namespace core
