#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the Sluice stack
enum class ErrorCode : uint16_t {
    NONE              = 0,
    // Byte streams / channels (100-199)
    STREAM_ERROR      = 100, STREAM_CLOSED   = 101,
    STREAM_IO         = 102,
    // Producers (200-299)
    PRODUCER_ERROR    = 200, PRODUCER_FAULT  = 201,
    // Handlers (300-399)
    HANDLER_ERROR     = 300, HANDLER_FAULT   = 301,
    // Context (400-499)
    CONTEXT_CANCELLED = 400, CONTEXT_DEADLINE = 401,
    // Configuration (500-599)
    CONFIG_ERROR      = 500, CONFIG_INVALID  = 501,
    // File I/O (600-699)
    IO_ERROR          = 600, IO_NOT_FOUND    = 601,
    // Cryptography (700-799)
    CRYPTO_ERROR      = 700,
    // Internal (900-999)
    INTERNAL_ERROR    = 900, NOT_IMPLEMENTED = 901,
    OUT_OF_MEMORY     = 902,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: error value carrying code, message, and origin location.
// A default-constructed Error (code NONE) is the "null" error.
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

    /// "NAME(code): message [file:line:col]"
    [[nodiscard]] std::string format() const;

    /// Code and message both match (location is ignored).
    [[nodiscard]] bool same_as(const Error& o) const noexcept {
        return code_ == o.code_ && message_ == o.message_;
    }

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: holds either a value T or an error E.  T may be move-only;
// the copying members are only instantiated when used.
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::logic_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::logic_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::logic_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::logic_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::logic_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::logic_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T fallback) const {
        return ok() ? std::get<T>(storage_) : std::move(fallback);
    }

    // and_then: Result<T,E> -> (T -> Result<U,E>) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) &&
        -> std::invoke_result_t<F, T&&> {
        using R = std::invoke_result_t<F, T&&>;
        if (ok()) return func(std::get<T>(std::move(storage_)));
        return R{std::get<E>(std::move(storage_))};
    }

private:
    std::variant<T, E> storage_;
};

// Result<void, E>: success carries no value.
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] E& error() & {
        if (ok()) throw std::logic_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::logic_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::logic_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// SLUICE_TRY: propagate errors (GCC/Clang statement-expression)
// Usage:  auto val = SLUICE_TRY(some_result_expr);
#define SLUICE_TRY(expr)                                                  \
    ({                                                                    \
        auto&& _sluice_res = (expr);                                      \
        if (!_sluice_res.ok()) return std::move(_sluice_res).error();     \
        std::move(_sluice_res).value();                                   \
    })

// SLUICE_TRY_ASSIGN: MSVC-compatible alternative (no statement-expressions)
// Usage:  SLUICE_TRY_ASSIGN(val, some_result_expr);
#define SLUICE_TRY_ASSIGN(var, expr)                                      \
    auto _sluice_tmp_##var = (expr);                                      \
    if (!_sluice_tmp_##var.ok())                                          \
        return std::move(_sluice_tmp_##var).error();                      \
    auto var = std::move(_sluice_tmp_##var).value()

// SLUICE_TRY_VOID: propagate errors from Result<void> expressions
#define SLUICE_TRY_VOID(expr)                                             \
    do {                                                                  \
        auto _sluice_tmp = (expr);                                        \
        if (!_sluice_tmp.ok()) return std::move(_sluice_tmp).error();     \
    } while (false)

} // namespace core
