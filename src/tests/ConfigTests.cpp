// SPDX-License-Identifier: Apache-2.0
#include <netmcp/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace netmcp;

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.server.command == "python3");
    CHECK(config.server.mergeStderr);
    CHECK(config.client.protocolVersion == "2025-03-26");
    CHECK(config.client.initializeTimeoutMs == 25000);
    CHECK(config.client.callTimeoutMs == 90000);
    CHECK(config.client.settleDelayMs == 400);
    CHECK(config.defaults.interface == "Ethernet0/0");
    CHECK(config.defaults.dryRun == true);
    CHECK(config.defaults.loopbackIp == "192.0.2.100/32");
    CHECK(config.logLevel == log::Level::Info);
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "netmcp_test_config.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({
            "server": {
                "command": "/opt/netmcp/bin/server",
                "args": ["--inventory", "lab.yaml"],
                "env": {"NET_USER": "admin"},
                "workingDirectory": "/opt/netmcp",
                "mergeStderr": false
            },
            "client": {
                "protocolVersion": "2024-11-05",
                "callTimeoutMs": 30000,
                "settleDelayMs": 0
            },
            "defaults": {
                "interface": "GigabitEthernet0/1",
                "dryRun": false,
                "loopbackId": 7
            },
            "logLevel": "debug"
        })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Server config")
    {
        CHECK(config.server.command == "/opt/netmcp/bin/server");
        REQUIRE(config.server.args.size() == 2);
        CHECK(config.server.args[1] == "lab.yaml");
        REQUIRE(config.server.env.contains("NET_USER"));
        CHECK(config.server.env.at("NET_USER") == "admin");
        CHECK(config.server.workingDirectory == "/opt/netmcp");
        CHECK(!config.server.mergeStderr);
    }

    SECTION("Client config")
    {
        CHECK(config.client.protocolVersion == "2024-11-05");
        CHECK(config.client.callTimeoutMs == 30000);
        CHECK(config.client.settleDelayMs == 0);
        CHECK(config.client.initializeTimeoutMs == 25000);
    }

    SECTION("Wizard defaults")
    {
        CHECK(config.defaults.interface == "GigabitEthernet0/1");
        CHECK(!config.defaults.dryRun);
        CHECK(config.defaults.loopbackId == 7);
        CHECK(config.defaults.loopbackDescription == "MCP-created loopback");
    }

    CHECK(config.logLevel == log::Level::Debug);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile reports a missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/netmcp/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile reports malformed JSON", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "netmcp_test_bad_config.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({ "server": { "command": )";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("parseConfig rejects invalid values", "[config]")
{
    SECTION("negative duration")
    {
        auto result = parseConfig(nlohmann::json { { "client", { { "callTimeoutMs", -1 } } } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("empty server command")
    {
        auto result = parseConfig(nlohmann::json { { "server", { { "command", "" } } } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("negative loopback id")
    {
        auto result = parseConfig(nlohmann::json { { "defaults", { { "loopbackId", -3 } } } });
        REQUIRE(!result.has_value());
    }

    SECTION("unknown log level")
    {
        auto result = parseConfig(nlohmann::json { { "logLevel", "chatty" } });
        REQUIRE(!result.has_value());
        CHECK(result.error().message.find("chatty") != std::string::npos);
    }

    SECTION("non-object root")
    {
        REQUIRE(!parseConfig(nlohmann::json::array()).has_value());
    }
}

TEST_CASE("saveConfigToFile round-trips through loadConfigFromFile", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "netmcp_test_save";
    auto const tempPath = tempDir / "nested" / "config.json";
    std::filesystem::remove_all(tempDir);

    auto config = AppConfig {};
    config.server.command = "uv";
    config.server.args = { "run", "server.py" };
    config.server.env["INVENTORY"] = "lab.yaml";
    config.client.configureTimeoutMs = 60000;
    config.defaults.mask = "255.255.255.0";
    config.logLevel = log::Level::Warning;

    auto saved = saveConfigToFile(tempPath.string(), config);
    REQUIRE(saved.has_value());
    REQUIRE(std::filesystem::exists(tempPath));

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->server.command == "uv");
    CHECK(loaded->server.args == std::vector<std::string> { "run", "server.py" });
    CHECK(loaded->server.env.at("INVENTORY") == "lab.yaml");
    CHECK(loaded->client.configureTimeoutMs == 60000);
    CHECK(loaded->defaults.mask == "255.255.255.0");
    CHECK(loaded->logLevel == log::Level::Warning);

    std::filesystem::remove_all(tempDir);
}

TEST_CASE("toClientOptions converts milliseconds", "[config]")
{
    auto client = ClientConfig {};
    client.callTimeoutMs = 1500;
    client.pollIntervalMs = 5;

    auto const options = toClientOptions(client);
    CHECK(options.callTimeout == std::chrono::milliseconds(1500));
    CHECK(options.pollInterval == std::chrono::milliseconds(5));
    CHECK(options.clientName == "netmcp");
}

TEST_CASE("toTransportConfig copies the launch settings", "[config]")
{
    auto server = ServerConfig {};
    server.env["A"] = "1";

    auto const transport = toTransportConfig(server);
    CHECK(transport.command == "python3");
    CHECK(transport.args == server.args);
    CHECK(transport.env.at("A") == "1");
    CHECK(transport.mergeStderr);
}
