#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
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

// ErrorCode: what went wrong, grouped by subsystem
enum class ErrorCode : uint16_t {
    NONE              = 0,
    // Parsing (100-199)
    PARSE_ERROR       = 100, PARSE_OVERFLOW  = 101,
    PARSE_BAD_FORMAT  = 102,
    // Validation (200-299)
    VALIDATION_ERROR  = 200, VALIDATION_RANGE = 201,
    // Network (300-399)
    NETWORK_ERROR     = 300, NETWORK_TIMEOUT = 301,
    NETWORK_REFUSED   = 302, NETWORK_CLOSED  = 303,
    NETWORK_TLS       = 304,
    // Cryptography (400-499)
    CRYPTO_ERROR      = 400, CRYPTO_SIG_FAIL = 401,
    CRYPTO_KEY_FAIL   = 402,
    // Storage (500-599)
    STORAGE_ERROR     = 500, STORAGE_NOT_FOUND = 501,
    STORAGE_CORRUPT   = 502, STORAGE_LOCKED    = 503,
    // JSON-RPC (700-799)
    RPC_BAD_RESPONSE  = 701, RPC_REMOTE_ERROR = 702,
    // Publishing (800-849)
    TX_ERROR          = 800,
    // Configuration (850-899)
    CONFIG_ERROR      = 850, CONFIG_MISSING = 851,
    // Internal (900-999)
    INTERNAL_ERROR    = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

/// True for the NETWORK_* range: the node may answer if asked again.
[[nodiscard]] constexpr bool is_network_error(ErrorCode code) noexcept {
    const auto c = static_cast<uint16_t>(code);
    return c >= static_cast<uint16_t>(ErrorCode::NETWORK_ERROR) &&
           c < static_cast<uint16_t>(ErrorCode::CRYPTO_ERROR);
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
    [[nodiscard]] explicit operator bool() const noexcept {
        return code_ != ErrorCode::NONE;
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

// CHAINBOARD_TRY_ASSIGN: bind the value or return the error
// Usage:  CHAINBOARD_TRY_ASSIGN(val, some_result_expr);
#define CHAINBOARD_TRY_ASSIGN(var, expr)                                  \
    auto _cb_tmp_##var = (expr);                                          \
    if (!_cb_tmp_##var.ok())                                              \
        return std::move(_cb_tmp_##var).error();                          \
    auto var = std::move(_cb_tmp_##var).value()

// CHAINBOARD_TRY_VOID: propagate errors from Result<void> expressions
#define CHAINBOARD_TRY_VOID(expr)                                         \
    do {                                                                  \
        auto _cb_tmp = (expr);                                            \
        if (!_cb_tmp.ok()) return std::move(_cb_tmp).error();             \
    } while (false)

} // namespace core
