// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/PendingResponses.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace netmcp
{

/// @brief Receives undecodable server lines that look like warnings or errors.
/// Invoked on the reader thread.
using DiagnosticSink = std::function<void(std::string_view line)>;

/// @brief Tunables of an McpClient session.
struct McpClientOptions
{
    std::string clientName = "netmcp";
    std::string clientVersion = "0.1.0";
    std::string protocolVersion = "2025-03-26";

    std::chrono::milliseconds initializeTimeout { 25000 };
    std::chrono::milliseconds listToolsTimeout { 10000 };
    std::chrono::milliseconds callTimeout { 90000 };

    /// @brief Longest a waiter sleeps before re-checking its deadline.
    std::chrono::milliseconds pollInterval { 20 };

    /// @brief Pause after notifications/initialized before the first request.
    std::chrono::milliseconds settleDelay { 400 };

    /// @brief Where diagnostic lines go; empty logs them as warnings.
    DiagnosticSink diagnosticSink;
};

/// @brief Returns true if a raw server line carries a WARNING or ERROR marker
///        (case-insensitive).
[[nodiscard]] auto isDiagnosticLine(std::string_view line) -> bool;

/// @brief Client for the Model Context Protocol (MCP).
///
/// A background reader drains the transport and files every response by id;
/// callers send requests and wait for their id with a deadline. Replies may
/// arrive in any order.
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param transport The transport to use for communication.
    /// @param options Session tunables.
    explicit McpClient(std::unique_ptr<Transport> transport, McpClientOptions options = {});
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Starts the background reader. Called by initialize() if needed.
    void start();

    /// @brief Returns a fresh request id; ids strictly increase and are never reused.
    [[nodiscard]] auto nextId() -> int64_t;

    /// @brief Writes a request line.
    /// @param method The method name.
    /// @param params Parameters; null omits the member.
    /// @param id Explicit id; a fresh one is generated when absent. Reusing the
    ///           id of a timed-out request retries it.
    /// @return The id used, or a TransportError.
    [[nodiscard]] auto send(std::string_view method,
                            nlohmann::json params = nullptr,
                            std::optional<int64_t> id = std::nullopt) -> Result<int64_t>;

    /// @brief Waits for the response with the given id and consumes it.
    /// @return The response document, or a TimeoutError naming the id and method.
    [[nodiscard]] auto wait(int64_t id, std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    /// @brief Sends a request and waits for its response document.
    [[nodiscard]] auto request(std::string_view method,
                               nlohmann::json params,
                               std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    /// @brief Writes a notification line (no id, no reply).
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Performs the initialize request and the initialized notification.
    /// @return The server identity or an error.
    [[nodiscard]] auto initialize() -> Result<ServerInfo>;

    /// @brief Lists available tools from the server.
    /// @return A vector of tool definitions or an error.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @param timeout Deadline; the configured call timeout when absent.
    /// @return The `result` member, or a ToolError carrying the server's error verbatim.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Calls a tool and merges its content exactly as the server sent it.
    [[nodiscard]] auto callToolRaw(std::string_view name,
                                   const nlohmann::json& arguments,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Calls a tool and merges its content into the fixed display schema.
    [[nodiscard]] auto callToolForDisplay(std::string_view name,
                                          const nlohmann::json& arguments,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Terminates the server and stops the reader. Idempotent.
    void close();

    [[nodiscard]] auto state() const -> ClientState;
    [[nodiscard]] auto isInitialized() const -> bool;

    /// @brief Returns the server identity (valid after initialize).
    [[nodiscard]] auto serverInfo() const -> const ServerInfo&;

    /// @brief Returns the tools reported by the last listTools().
    [[nodiscard]] auto tools() const -> const std::vector<ToolDefinition>&;

    /// @brief Returns the number of responses received but not yet consumed.
    [[nodiscard]] auto pendingCount() const -> std::size_t;

  private:
    std::unique_ptr<Transport> _transport;
    McpClientOptions _options;
    PendingResponses _pending;
    std::atomic<int64_t> _lastId = 0;
    std::atomic<ClientState> _state = ClientState::Unstarted;
    ServerInfo _serverInfo;
    std::vector<ToolDefinition> _tools;
    std::mutex _inflightMutex;
    std::map<int64_t, std::string> _inflight;
    std::mutex _lifecycleMutex;
    std::jthread _reader;

    void readLoop(const std::stop_token& stopToken);
    void handleLine(const std::string& line);
    [[nodiscard]] auto requireSession(std::string_view operation) const -> VoidResult;
};

} // namespace netmcp
