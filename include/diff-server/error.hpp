/// @file error.hpp
/// @brief Error types for the diff-server library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace diff_server {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    bad_request,             ///< A request field is missing, malformed or unknown.
    method_not_allowed,      ///< The transport verb is not supported by the endpoint.
    not_found,               ///< The endpoint does not exist or is disabled.
    upstream_fetch_failure,  ///< The account backend could not produce a client view.
    unknown_state,           ///< A stateID is not part of the client's history.
    storage_failure,         ///< The content store could not read or record data.
    invalid_patch,           ///< A patch operation cannot be applied.
    invalid_operation,       ///< An operation is invalid in the current context.
    bad_config,              ///< The server configuration is malformed.
    internal,                ///< An unexpected failure.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::bad_request:            return "bad_request";
        case ErrorKind::method_not_allowed:     return "method_not_allowed";
        case ErrorKind::not_found:              return "not_found";
        case ErrorKind::upstream_fetch_failure: return "upstream_fetch_failure";
        case ErrorKind::unknown_state:          return "unknown_state";
        case ErrorKind::storage_failure:        return "storage_failure";
        case ErrorKind::invalid_patch:          return "invalid_patch";
        case ErrorKind::invalid_operation:      return "invalid_operation";
        case ErrorKind::bad_config:             return "bad_config";
        case ErrorKind::internal:               return "internal";
    }
    return "unknown";
}

/// HTTP status code a failure of this kind is reported with.
constexpr auto http_status(ErrorKind kind) noexcept -> int {
    switch (kind) {
        case ErrorKind::bad_request:        return 400;
        case ErrorKind::method_not_allowed: return 405;
        case ErrorKind::not_found:          return 404;
        default:                            return 500;
    }
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by library operations. Carries a structured Error so
/// callers at the service boundary can map it to a response.
class Exception : public std::runtime_error {
public:
    Exception(ErrorKind kind, std::string message)
        : std::runtime_error{message}, error_{kind, std::move(message)} {}

    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace diff_server
