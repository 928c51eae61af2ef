// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace netmcp
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;

    /// @brief Overrides applied on top of the inherited environment.
    std::map<std::string, std::string> env;

    /// @brief Directory the child starts in; empty keeps the current one.
    std::string workingDirectory;

    /// @brief Joins the child's stderr to its stdout so that its warnings
    ///        travel through the same stream as its replies.
    bool mergeStderr = true;

    /// @brief Time the child gets to exit after SIGTERM before SIGKILL.
    std::chrono::milliseconds terminateGrace { 2000 };
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and communicates via its stdin/stdout. The child
/// handle is owned exclusively by the transport.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the MCP server process.
    /// @param config The process configuration.
    /// @return Success, or a LaunchError if the process could not be started.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receiveLine() -> Result<std::string> override;

    /// @brief Terminates the child: closes its stdin, sends SIGTERM and reaps it.
    void close() override;

    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the child's process id, or -1 when not running.
    [[nodiscard]] auto pid() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace netmcp
