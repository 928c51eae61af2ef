// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace netmcp
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    LaunchError,
    TransportError,
    DecodeError,
    ProtocolError,
    TimeoutError,
    ToolError,
};

/// @brief Returns the symbolic name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::LaunchError: return "LaunchError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::ToolError: return "ToolError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
///
/// The payload holds structured data reported by the remote side, unmodified
/// (for example the `error` member of a failed tool call).
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    nlohmann::json payload {};
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
    return std::unexpected<Error>(Error { code, std::move(message), nullptr });
}

/// @brief Creates an unexpected Error value carrying a structured payload.
/// @param code The error code.
/// @param message A descriptive error message.
/// @param payload Structured data to attach verbatim.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message, nlohmann::json payload)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message), std::move(payload) });
}

} // namespace netmcp

template <>
struct std::formatter<netmcp::Error>: std::formatter<std::string>
{
    auto format(const netmcp::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", netmcp::errorCodeName(error.code), error.message), ctx);
    }
};
