// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace netmcp
{

namespace
{
    auto levelName(log::Level level) -> std::string_view
    {
        switch (level)
        {
            case log::Level::Error: return "error";
            case log::Level::Warning: return "warning";
            case log::Level::Info: return "info";
            case log::Level::Debug: return "debug";
            case log::Level::Trace: return "trace";
        }
        return "info";
    }

    /// @brief Reads a millisecond setting, rejecting negative values.
    auto getDurationMs(const nlohmann::json& obj, std::string_view key, int64_t defaultValue) -> Result<int64_t>
    {
        auto const value = json::getIntOr(obj, key, defaultValue);
        if (value < 0)
            return makeError(ErrorCode::ConfigError, std::format("'{}' must not be negative", key));
        return value;
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/netmcp";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/netmcp";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // Server section
    if (root.contains("server"))
    {
        auto const& server = root["server"];
        config.server.command = json::getStringOr(server, "command", config.server.command);
        if (server.contains("args"))
            config.server.args = json::getStringArray(server, "args");
        config.server.env = json::getStringMap(server, "env");
        config.server.workingDirectory = json::getStringOr(server, "workingDirectory", "");
        config.server.mergeStderr = json::getBoolOr(server, "mergeStderr", true);

        if (config.server.command.empty())
            return makeError(ErrorCode::ConfigError, "server.command must not be empty");
    }

    // Client section
    if (root.contains("client"))
    {
        auto const& client = root["client"];
        auto& c = config.client;
        c.protocolVersion = json::getStringOr(client, "protocolVersion", c.protocolVersion);
        c.name = json::getStringOr(client, "name", c.name);
        c.version = json::getStringOr(client, "version", c.version);

        auto const durations = {
            std::pair { "initializeTimeoutMs", &c.initializeTimeoutMs },
            std::pair { "listToolsTimeoutMs", &c.listToolsTimeoutMs },
            std::pair { "callTimeoutMs", &c.callTimeoutMs },
            std::pair { "configureTimeoutMs", &c.configureTimeoutMs },
            std::pair { "pollIntervalMs", &c.pollIntervalMs },
            std::pair { "settleDelayMs", &c.settleDelayMs },
        };
        for (auto const& [key, target]: durations)
        {
            auto value = getDurationMs(client, key, *target);
            if (!value)
                return std::unexpected(value.error());
            *target = *value;
        }
    }

    // Wizard defaults section
    if (root.contains("defaults"))
    {
        auto const& defaults = root["defaults"];
        auto& d = config.defaults;
        d.interface = json::getStringOr(defaults, "interface", d.interface);
        d.ip = json::getStringOr(defaults, "ip", d.ip);
        d.mask = json::getStringOr(defaults, "mask", d.mask);
        d.replace = json::getBoolOr(defaults, "replace", d.replace);
        d.noShutdown = json::getBoolOr(defaults, "noShutdown", d.noShutdown);
        d.save = json::getBoolOr(defaults, "save", d.save);
        d.dryRun = json::getBoolOr(defaults, "dryRun", d.dryRun);
        d.loopbackId = static_cast<int>(json::getIntOr(defaults, "loopbackId", d.loopbackId));
        d.loopbackIp = json::getStringOr(defaults, "loopbackIp", d.loopbackIp);
        d.loopbackDescription = json::getStringOr(defaults, "loopbackDescription", d.loopbackDescription);

        if (d.loopbackId < 0)
            return makeError(ErrorCode::ConfigError, "defaults.loopbackId must be >= 0");
    }

    if (root.contains("logLevel"))
    {
        auto const name = json::getStringOr(root, "logLevel", "");
        auto const level = log::levelFromString(name);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown logLevel '{}'", name));
        config.logLevel = *level;
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    return parseConfig(*parseResult);
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Server section
    auto server = nlohmann::json::object();
    server["command"] = config.server.command;
    server["args"] = config.server.args;
    if (!config.server.env.empty())
        server["env"] = config.server.env;
    if (!config.server.workingDirectory.empty())
        server["workingDirectory"] = config.server.workingDirectory;
    server["mergeStderr"] = config.server.mergeStderr;
    root["server"] = std::move(server);

    // Client section
    auto const& c = config.client;
    root["client"] = nlohmann::json {
        { "protocolVersion", c.protocolVersion },
        { "name", c.name },
        { "version", c.version },
        { "initializeTimeoutMs", c.initializeTimeoutMs },
        { "listToolsTimeoutMs", c.listToolsTimeoutMs },
        { "callTimeoutMs", c.callTimeoutMs },
        { "configureTimeoutMs", c.configureTimeoutMs },
        { "pollIntervalMs", c.pollIntervalMs },
        { "settleDelayMs", c.settleDelayMs },
    };

    // Wizard defaults section
    auto const& d = config.defaults;
    auto defaults = nlohmann::json {
        { "interface", d.interface },
        { "ip", d.ip },
        { "replace", d.replace },
        { "noShutdown", d.noShutdown },
        { "save", d.save },
        { "dryRun", d.dryRun },
        { "loopbackId", d.loopbackId },
        { "loopbackIp", d.loopbackIp },
        { "loopbackDescription", d.loopbackDescription },
    };
    if (!d.mask.empty())
        defaults["mask"] = d.mask;
    root["defaults"] = std::move(defaults);

    root["logLevel"] = levelName(config.logLevel);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << json::dump(root, 4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto toTransportConfig(const ServerConfig& server) -> StdioTransportConfig
{
    return StdioTransportConfig {
        .command = server.command,
        .args = server.args,
        .env = server.env,
        .workingDirectory = server.workingDirectory,
        .mergeStderr = server.mergeStderr,
    };
}

auto toClientOptions(const ClientConfig& client) -> McpClientOptions
{
    auto options = McpClientOptions {};
    options.clientName = client.name;
    options.clientVersion = client.version;
    options.protocolVersion = client.protocolVersion;
    options.initializeTimeout = std::chrono::milliseconds(client.initializeTimeoutMs);
    options.listToolsTimeout = std::chrono::milliseconds(client.listToolsTimeoutMs);
    options.callTimeout = std::chrono::milliseconds(client.callTimeoutMs);
    options.pollInterval = std::chrono::milliseconds(client.pollIntervalMs);
    options.settleDelay = std::chrono::milliseconds(client.settleDelayMs);
    return options;
}

} // namespace netmcp
