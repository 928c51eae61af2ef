// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <netmcp/App.hpp>
#include <netmcp/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "netmcp - Interactive operator console for MCP network-device tools" };

    auto configPath = std::string {};
    auto serverCommand = std::string {};
    auto serverArgs = std::vector<std::string> {};
    auto envOverrides = std::vector<std::string> {};
    auto timeoutSeconds = 0;
    auto verbose = false;
    auto writeConfig = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--server-command", serverCommand, "Executable that runs the MCP server");
    app.add_option("--server-arg", serverArgs, "Argument passed to the server (repeatable)");
    app.add_option("--env", envOverrides, "Environment override KEY=VALUE for the server (repeatable)");
    app.add_option("--timeout", timeoutSeconds, "Tool call timeout in seconds")->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--write-config", writeConfig, "Write the effective configuration to the config path and exit");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? netmcp::loadConfig() : netmcp::loadConfigFromFile(configPath);
    if (!configResult)
    {
        netmcp::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    netmcp::log::setLevel(verbose ? netmcp::log::Level::Debug : config.logLevel);

    // Apply CLI overrides
    if (!serverCommand.empty())
        config.server.command = serverCommand;
    if (!serverArgs.empty())
        config.server.args = serverArgs;
    for (const auto& entry: envOverrides)
    {
        auto const eq = entry.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            netmcp::log::error("Invalid --env value '{}', expected KEY=VALUE", entry);
            return 1;
        }
        config.server.env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    if (timeoutSeconds > 0)
        config.client.callTimeoutMs = static_cast<int64_t>(timeoutSeconds) * 1000;

    if (writeConfig)
    {
        auto const path = configPath.empty() ? netmcp::defaultConfigPath() : configPath;
        if (auto saved = netmcp::saveConfigToFile(path, config); !saved)
        {
            netmcp::log::error("Failed to write config: {}", saved.error().message);
            return 1;
        }
        netmcp::log::info("Configuration written to {}", path);
        return 0;
    }

    auto application = netmcp::App(std::move(config), std::cin, std::cout);
    auto initResult = application.initialize();
    if (!initResult)
    {
        netmcp::log::error("Initialization failed: {}", initResult.error());
        return 2;
    }

    return application.run();
}
