// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netmcp::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error.
///
/// `raw` is the error member exactly as received. Servers do not always follow
/// the {code, message, data} shape, so code and message are best effort.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
    nlohmann::json raw;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    int64_t id = 0;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Returns the integer id of a message that is a response, i.e. carries
///        an integer id together with a result or an error member.
[[nodiscard]] auto responseId(const nlohmann::json& message) -> std::optional<int64_t>;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or a ProtocolError.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

} // namespace netmcp::jsonrpc
