// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/McpClient.hpp>
#include <netmcp/Config.hpp>
#include <netmcp/Menu.hpp>
#include <netmcp/Prompt.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace netmcp
{

/// @brief Combined output of one tool run against several devices.
struct AggregateResult
{
    std::string raw;
    nlohmann::json parsed = nlohmann::json::array();
    int failures = 0;
};

/// @brief Pulls the device names out of a list_devices result.
///
/// Accepts {"devices": [...]} and, failing that, a `raw` member holding the
/// same object or a bare array as JSON text.
[[nodiscard]] auto extractDeviceNames(const nlohmann::json& merged) -> std::vector<std::string>;

/// @brief Derives set_interface_ip arguments that move a failed loopback's
///        address onto a physical interface.
[[nodiscard]] auto makeLoopbackFallbackArgs(const nlohmann::json& loopbackArgs, std::string_view interface)
    -> nlohmann::json;

/// @brief Operator flows for the device-automation tools.
///
/// Every flow reports tool failures to the operator and returns; nothing
/// here ends the session.
class DeviceWorkflows
{
  public:
    DeviceWorkflows(McpClient& client, Prompt& prompt, const AppConfig& config);

    /// @brief Runs the flow registered for a tool, or a plain call for unknown tools.
    void run(std::string_view tool);

    [[nodiscard]] auto listDevices() -> std::vector<std::string>;
    [[nodiscard]] auto pickDevice(bool allowAll, std::string_view label) -> DeviceSelection;

    /// @brief Calls a read-only tool on every device, printing each result.
    ///        A failing device is recorded and the batch continues.
    [[nodiscard]] auto runAcrossDevices(std::string_view tool, std::span<const std::string> names)
        -> AggregateResult;

    /// @return The arguments, or std::nullopt if the operator cancelled.
    [[nodiscard]] auto setInterfaceIpWizard() -> std::optional<nlohmann::json>;
    [[nodiscard]] auto createLoopbackWizard() -> std::optional<nlohmann::json>;

  private:
    McpClient& _client;
    Prompt& _prompt;
    const AppConfig& _config;

    void runListDevices();
    void runShowCommand(std::string_view tool);
    void runSetInterfaceIp();
    void runCreateLoopback();
    void runGeneric(std::string_view tool);
    void offerLoopbackFallback(const nlohmann::json& loopbackArgs);

    [[nodiscard]] auto readTimeout() const -> std::chrono::milliseconds;
    [[nodiscard]] auto configureTimeout() const -> std::chrono::milliseconds;
    [[nodiscard]] auto confirmArguments(const nlohmann::json& args) -> std::optional<bool>;
};

} // namespace netmcp
