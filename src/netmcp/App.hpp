// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <netmcp/Config.hpp>

#include <iosfwd>
#include <memory>

namespace netmcp
{

class McpClient;

/// @brief Main application orchestrator: launches the server, performs the
///        session handshake and drives the tool menu.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    /// @param in Operator input.
    /// @param out Operator output.
    App(AppConfig config, std::istream& in, std::ostream& out);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Launches the server and completes initialize + tools/list.
    /// @return Success or an error (LaunchError, TimeoutError, ProtocolError, ...).
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Uses an already constructed client instead of launching a server.
    [[nodiscard]] auto initialize(std::unique_ptr<McpClient> client) -> VoidResult;

    /// @brief Runs the interactive menu until the operator quits.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace netmcp
