// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace netmcp
{

/// @brief Lifecycle of an MCP client session.
enum class ClientState
{
    Unstarted,
    Started,
    Initialized,
    Ready,
    Closed,
};

/// @brief Converts a ClientState to its string representation.
[[nodiscard]] constexpr auto clientStateToString(ClientState state) -> std::string_view
{
    switch (state)
    {
        case ClientState::Unstarted: return "unstarted";
        case ClientState::Started: return "started";
        case ClientState::Initialized: return "initialized";
        case ClientState::Ready: return "ready";
        case ClientState::Closed: return "closed";
    }
    return "unknown";
}

/// @brief Identity the server reports in its initialize reply.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
    bool hasTools = false;
};

/// @brief A tool exposed by the server through tools/list.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

} // namespace netmcp
