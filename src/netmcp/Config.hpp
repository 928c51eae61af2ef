// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/StdioTransport.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace netmcp
{

/// @brief How to launch the device-automation server.
struct ServerConfig
{
    std::string command = "python3";
    std::vector<std::string> args = { "mcp_server.py", "--inventory", "devices.yaml" };
    std::map<std::string, std::string> env;
    std::string workingDirectory;
    bool mergeStderr = true;
};

/// @brief Session settings of the MCP client.
struct ClientConfig
{
    std::string protocolVersion = "2025-03-26";
    std::string name = "netmcp";
    std::string version = "0.1.0";
    int64_t initializeTimeoutMs = 25000;
    int64_t listToolsTimeoutMs = 10000;
    int64_t callTimeoutMs = 90000;
    int64_t configureTimeoutMs = 120000;
    int64_t pollIntervalMs = 20;
    int64_t settleDelayMs = 400;
};

/// @brief Values the configuration wizards offer as defaults.
struct WizardDefaults
{
    std::string interface = "Ethernet0/0";
    std::string ip = "10.10.10.1/24";
    std::string mask;
    bool replace = true;
    bool noShutdown = true;
    bool save = false;
    bool dryRun = true;
    int loopbackId = 0;
    std::string loopbackIp = "192.0.2.100/32";
    std::string loopbackDescription = "MCP-created loopback";
};

/// @brief Top-level application configuration, built once at startup.
struct AppConfig
{
    ServerConfig server;
    ClientConfig client;
    WizardDefaults defaults;
    log::Level logLevel = log::Level::Info;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document; absent keys keep their defaults.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Translates the server section into a transport configuration.
[[nodiscard]] auto toTransportConfig(const ServerConfig& server) -> StdioTransportConfig;

/// @brief Translates the client section into client options.
[[nodiscard]] auto toClientOptions(const ClientConfig& client) -> McpClientOptions;

} // namespace netmcp
