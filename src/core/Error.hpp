// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolgate
{

/// @brief Error codes for categorizing failures across the gateway.
enum class ErrorCode
{
    Unknown,
    ConfigError,
    NotFound,
    AlreadyExists,
    AlreadyRunning,
    NotRunning,
    InvalidTransition,
    StartFailed,
    TransportError,
    ProtocolError,
    Timeout,
    RuntimeFailed,
    ToolNotAllowed,
    InvalidRequest,
    Internal,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns a stable, human readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::AlreadyExists: return "already_exists";
        case ErrorCode::AlreadyRunning: return "already_running";
        case ErrorCode::NotRunning: return "not_running";
        case ErrorCode::InvalidTransition: return "invalid_transition";
        case ErrorCode::StartFailed: return "start_failed";
        case ErrorCode::TransportError: return "transport_error";
        case ErrorCode::ProtocolError: return "protocol_error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::RuntimeFailed: return "runtime_failed";
        case ErrorCode::ToolNotAllowed: return "tool_not_allowed";
        case ErrorCode::InvalidRequest: return "invalid_request";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

/// @brief Maps an error code to the HTTP status reported to gateway callers.
[[nodiscard]] constexpr auto httpStatusFor(ErrorCode code) -> int
{
    switch (code)
    {
        case ErrorCode::NotFound: return 404;
        case ErrorCode::AlreadyExists:
        case ErrorCode::AlreadyRunning:
        case ErrorCode::InvalidTransition: return 409;
        case ErrorCode::NotRunning:
        case ErrorCode::RuntimeFailed: return 503;
        case ErrorCode::TransportError:
        case ErrorCode::ProtocolError: return 502;
        case ErrorCode::Timeout: return 504;
        case ErrorCode::ToolNotAllowed: return 403;
        case ErrorCode::InvalidRequest: return 400;
        case ErrorCode::Unknown:
        case ErrorCode::ConfigError:
        case ErrorCode::StartFailed:
        case ErrorCode::Internal: return 500;
    }
    return 500;
}

} // namespace toolgate

template <>
struct std::formatter<toolgate::Error>: std::formatter<std::string>
{
    auto format(const toolgate::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolgate::errorCodeName(error.code), error.message), ctx);
    }
};
