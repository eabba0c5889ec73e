/// @file error.hpp
/// @brief Error codes, the Error value type, Result<T> and exceptions.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace docsync_cpp {

/// Canonical error codes reported by the backend and by the client.
///
/// The numbering follows the canonical RPC status codes so that a
/// transport can map wire statuses without a lookup table.
enum class ErrorCode : std::uint8_t {
    ok = 0,
    cancelled = 1,
    unknown = 2,
    invalid_argument = 3,
    deadline_exceeded = 4,
    not_found = 5,
    already_exists = 6,
    permission_denied = 7,
    resource_exhausted = 8,
    failed_precondition = 9,
    aborted = 10,
    out_of_range = 11,
    unimplemented = 12,
    internal = 13,
    unavailable = 14,
    data_loss = 15,
    unauthenticated = 16,
};

/// Convert an ErrorCode to its string representation.
constexpr auto to_string_view(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::ok:                  return "ok";
        case ErrorCode::cancelled:           return "cancelled";
        case ErrorCode::unknown:             return "unknown";
        case ErrorCode::invalid_argument:    return "invalid_argument";
        case ErrorCode::deadline_exceeded:   return "deadline_exceeded";
        case ErrorCode::not_found:           return "not_found";
        case ErrorCode::already_exists:      return "already_exists";
        case ErrorCode::permission_denied:   return "permission_denied";
        case ErrorCode::resource_exhausted:  return "resource_exhausted";
        case ErrorCode::failed_precondition: return "failed_precondition";
        case ErrorCode::aborted:             return "aborted";
        case ErrorCode::out_of_range:        return "out_of_range";
        case ErrorCode::unimplemented:       return "unimplemented";
        case ErrorCode::internal:            return "internal";
        case ErrorCode::unavailable:         return "unavailable";
        case ErrorCode::data_loss:           return "data_loss";
        case ErrorCode::unauthenticated:     return "unauthenticated";
    }
    return "unknown";
}

/// True if an RPC failing with this code should not be retried.
///
/// Retryable codes drive backoff and reconnect; everything else aborts the
/// affected batch or target and is surfaced to the caller.
constexpr auto is_permanent_error(ErrorCode code) noexcept -> bool {
    switch (code) {
        case ErrorCode::ok:
        case ErrorCode::cancelled:
        case ErrorCode::unknown:
        case ErrorCode::deadline_exceeded:
        case ErrorCode::resource_exhausted:
        case ErrorCode::internal:
        case ErrorCode::unavailable:
        case ErrorCode::unauthenticated:
            return false;
        case ErrorCode::invalid_argument:
        case ErrorCode::not_found:
        case ErrorCode::already_exists:
        case ErrorCode::permission_denied:
        case ErrorCode::failed_precondition:
        case ErrorCode::aborted:
        case ErrorCode::out_of_range:
        case ErrorCode::unimplemented:
        case ErrorCode::data_loss:
            return true;
    }
    return true;
}

/// Write errors are permanent except ABORTED, which the backend uses for
/// contention and which succeeds on retry.
constexpr auto is_permanent_write_error(ErrorCode code) noexcept -> bool {
    return is_permanent_error(code) && code != ErrorCode::aborted;
}

/// A structured error with a code and a human-readable message.
struct Error {
    ErrorCode code;       ///< The category of this error.
    std::string message;  ///< A human-readable description.

    /// Construct an Error with the given code and message.
    Error(ErrorCode c, std::string msg)
        : code{c}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Either a value or an Error, used for results delivered through
/// callbacks and futures.
template <typename T>
class Result {
public:
    Result(T value) : inner_{std::move(value)} {}
    Result(Error error) : inner_{std::move(error)} {}

    auto ok() const -> bool { return std::holds_alternative<T>(inner_); }
    explicit operator bool() const { return ok(); }

    auto value() const& -> const T& { return std::get<T>(inner_); }
    auto value() && -> T&& { return std::get<T>(std::move(inner_)); }
    auto error() const -> const Error& { return std::get<Error>(inner_); }

    auto operator->() const -> const T* { return &value(); }
    auto operator*() const& -> const T& { return value(); }

private:
    std::variant<T, Error> inner_;
};

/// Thrown for API misuse (malformed paths, invalid settings) and for
/// failures the caller must handle, such as a locked persistence directory.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorCode code, std::string message)
        : Exception{Error{code, std::move(message)}} {}

    auto error() const -> const Error& { return error_; }
    auto code() const -> ErrorCode { return error_.code; }

private:
    Error error_;
};

/// Thrown when an internal invariant is violated. The engine never catches
/// it: the client is in an unknown state and must not continue.
class InternalError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace docsync_cpp
