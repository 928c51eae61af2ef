// SPDX-License-Identifier: Apache-2.0
#include <netmcp/DeviceWorkflows.hpp>

#include "ScriptedTransport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace netmcp;
using netmcp::test::ScriptedTransport;

namespace
{

using ToolHandler = std::function<std::string(const nlohmann::json& request, const nlohmann::json& arguments)>;

/// @brief A connected client whose tools/call requests are routed by tool name.
struct Lab
{
    ScriptedTransport* server = nullptr;
    std::unique_ptr<McpClient> client;
    AppConfig config;
    std::istringstream in;
    std::ostringstream out;
    Prompt prompt { in, out };
    std::map<std::string, ToolHandler> tools;

    explicit Lab(std::string input): in(std::move(input))
    {
        config.client.callTimeoutMs = 2000;
        config.client.configureTimeoutMs = 2000;

        auto transport = std::make_unique<ScriptedTransport>();
        server = transport.get();
        test::scriptHandshake(
            *server, { "list_devices", "get_interfaces", "get_version", "set_interface_ip", "create_loopback" });
        server->on("tools/call", [this](const nlohmann::json& request) {
            auto const name = request["params"]["name"].get<std::string>();
            auto const it = tools.find(name);
            if (it == tools.end())
                return std::vector<std::string> { test::errorTo(request, { { "code", -32601 }, { "message", "no such tool" } }) };
            return std::vector<std::string> { it->second(request, request["params"]["arguments"]) };
        });

        client = std::make_unique<McpClient>(std::move(transport), test::testClientOptions());
        REQUIRE(client->initialize().has_value());
        REQUIRE(client->listTools().has_value());
    }

    void serveDevices(std::vector<std::string> names)
    {
        tools["list_devices"] = [names](const nlohmann::json& request, const nlohmann::json&) {
            return test::replyTo(request, test::structuredResult({ { "devices", names } }));
        };
    }

    [[nodiscard]] auto callsTo(const std::string& tool) const -> std::vector<nlohmann::json>
    {
        auto calls = std::vector<nlohmann::json> {};
        for (const auto& request: server->sentRequests("tools/call"))
            if (request["params"]["name"] == tool)
                calls.push_back(request["params"]["arguments"]);
        return calls;
    }
};

} // namespace

TEST_CASE("extractDeviceNames reads the devices member", "[workflows]")
{
    CHECK(extractDeviceNames(nlohmann::json { { "devices", { "R1", "R2" } } })
          == std::vector<std::string> { "R1", "R2" });
}

TEST_CASE("extractDeviceNames falls back to JSON in raw", "[workflows]")
{
    CHECK(extractDeviceNames(nlohmann::json { { "raw", R"({"devices": ["SW1"]})" } })
          == std::vector<std::string> { "SW1" });
    CHECK(extractDeviceNames(nlohmann::json { { "raw", R"(["R1", 7, "R3"])" } })
          == std::vector<std::string> { "R1", "R3" });
}

TEST_CASE("extractDeviceNames yields nothing for unusable results", "[workflows]")
{
    CHECK(extractDeviceNames(nlohmann::json::object()).empty());
    CHECK(extractDeviceNames(nlohmann::json { { "raw", "R1 R2" } }).empty());
    CHECK(extractDeviceNames(nlohmann::json { { "devices", "R1" } }).empty());
    CHECK(extractDeviceNames(nullptr).empty());
}

TEST_CASE("makeLoopbackFallbackArgs targets a physical interface", "[workflows]")
{
    auto const loopback = nlohmann::json {
        { "loopback_id", 5 }, { "ip", "192.0.2.5" }, { "mask", "32" },
        { "device", "R1" },   { "save", true },      { "dry_run", true },
    };

    auto const args = makeLoopbackFallbackArgs(loopback, "Ethernet0/1");
    CHECK(args
          == nlohmann::json {
              { "ip", "192.0.2.5" },
              { "mask", "32" },
              { "device", "R1" },
              { "interface", "Ethernet0/1" },
              { "replace", true },
              { "no_shutdown", true },
              { "save", false },
              { "dry_run", false },
          });

    auto const minimal = makeLoopbackFallbackArgs(nlohmann::json { { "ip", "10.0.0.1/32" } }, "Ethernet0/0");
    CHECK(!minimal.contains("mask"));
    CHECK(!minimal.contains("device"));
}

TEST_CASE("runAcrossDevices keeps going after a failing device", "[workflows]")
{
    auto lab = Lab("");
    lab.tools["get_version"] = [](const nlohmann::json& request, const nlohmann::json& arguments) {
        auto const device = arguments["device"].get<std::string>();
        if (device == "R2")
            return test::errorTo(request, { { "message", "R2 unreachable" } });
        return test::replyTo(request,
                             test::structuredResult({
                                 { "device", device },
                                 { "raw", "Cisco IOS XE Software, Version 17.3.2, RELEASE" },
                                 { "parsed", { { "hostname", device }, { "version", nullptr } } },
                             }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    auto const names = std::vector<std::string> { "R1", "R2", "R3" };
    auto const aggregate = workflows.runAcrossDevices("get_version", names);

    CHECK(aggregate.failures == 1);
    CHECK(aggregate.raw
          == "=== R1 ===\nCisco IOS XE Software, Version 17.3.2, RELEASE\n\n"
             "=== R3 ===\nCisco IOS XE Software, Version 17.3.2, RELEASE\n");

    REQUIRE(aggregate.parsed.size() == 3);
    CHECK(aggregate.parsed[0]["device"] == "R1");
    CHECK(aggregate.parsed[0]["parsed"]["version"] == "17.3.2");
    CHECK(aggregate.parsed[1]["device"] == "R2");
    CHECK(aggregate.parsed[1]["error"].get<std::string>().find("R2 unreachable") != std::string::npos);
    CHECK(aggregate.parsed[2]["device"] == "R3");

    CHECK(lab.callsTo("get_version").size() == 3);
}

TEST_CASE("get_interfaces on all devices prints the aggregate", "[workflows]")
{
    auto lab = Lab("a\n");
    lab.serveDevices({ "R1", "R2" });
    lab.tools["get_interfaces"] = [](const nlohmann::json& request, const nlohmann::json& arguments) {
        return test::replyTo(request,
                             test::structuredResult({
                                 { "device", arguments["device"] },
                                 { "raw", "Ethernet0/0 up up" },
                                 { "parsed", nlohmann::json::array({ { { "name", "Ethernet0/0" } } }) },
                             }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("get_interfaces");

    auto const text = lab.out.str();
    CHECK(text.find("=== get_interfaces [R1] ===") != std::string::npos);
    CHECK(text.find("=== get_interfaces [R2] ===") != std::string::npos);
    CHECK(text.find("=== Aggregated (all devices) ===") != std::string::npos);
    CHECK(text.find("=== R2 ===\nEthernet0/0 up up") != std::string::npos);
}

TEST_CASE("get_version on a single device", "[workflows]")
{
    auto lab = Lab("2\n");
    lab.serveDevices({ "R1", "R2" });
    lab.tools["get_version"] = [](const nlohmann::json& request, const nlohmann::json& arguments) {
        return test::replyTo(request,
                             test::structuredResult({
                                 { "device", arguments["device"] },
                                 { "raw", "Cisco IOS XE Software, Version 17.3.2, RELEASE" },
                                 { "parsed", { { "version", "" } } },
                             }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("get_version");

    auto const calls = lab.callsTo("get_version");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0] == nlohmann::json { { "device", "R2" } });

    auto const text = lab.out.str();
    CHECK(text.find("=== get_version [R2] ===") != std::string::npos);
    CHECK(text.find("\"version\": \"17.3.2\"") != std::string::npos);
}

TEST_CASE("Show commands use the server default device without a device list", "[workflows]")
{
    auto lab = Lab("");
    lab.tools["list_devices"] = [](const nlohmann::json& request, const nlohmann::json&) {
        return test::replyTo(request, test::structuredResult({ { "raw", "inventory unavailable" } }));
    };
    lab.tools["get_interfaces"] = [](const nlohmann::json& request, const nlohmann::json&) {
        return test::replyTo(request, test::structuredResult({ { "raw", "" } }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("get_interfaces");

    auto const calls = lab.callsTo("get_interfaces");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0] == nlohmann::json::object());
    CHECK(lab.out.str().find("<no raw output>") != std::string::npos);
}

TEST_CASE("set_interface_ip wizard repeats until the operator confirms", "[workflows]")
{
    // First pass is declined at review, second pass is accepted.
    auto lab = Lab("1\nEthernet0/2\n10.0.0.1/30\n\n\n\n\nn\n"
                   "1\n\n10.0.0.9\n255.255.255.252\nn\nn\ny\nn\ny\n");
    lab.serveDevices({ "R1" });
    lab.tools["set_interface_ip"] = [](const nlohmann::json& request, const nlohmann::json& arguments) {
        return test::replyTo(request,
                             test::structuredResult({
                                 { "device", arguments["device"] },
                                 { "commands", { "interface Ethernet0/0", "ip address 10.0.0.9 255.255.255.252" } },
                                 { "raw", "" },
                                 { "saved", true },
                                 { "dry_run", false },
                             }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("set_interface_ip");

    auto const calls = lab.callsTo("set_interface_ip");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0]
          == nlohmann::json {
              { "device", "R1" },
              { "interface", "Ethernet0/0" },
              { "ip", "10.0.0.9" },
              { "mask", "255.255.255.252" },
              { "replace", false },
              { "no_shutdown", false },
              { "save", true },
              { "dry_run", false },
          });

    auto const text = lab.out.str();
    CHECK(text.find("Review arguments:") != std::string::npos);
    CHECK(text.find("  - ip address 10.0.0.9 255.255.255.252") != std::string::npos);
    CHECK(text.find("Saved to NVRAM: true") != std::string::npos);
}

TEST_CASE("set_interface_ip wizard can be cancelled at the device prompt", "[workflows]")
{
    auto lab = Lab("q\n");
    lab.serveDevices({ "R1" });

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    CHECK(!workflows.setInterfaceIpWizard().has_value());
    CHECK(lab.callsTo("set_interface_ip").empty());
}

TEST_CASE("create_loopback failure offers the interface fallback", "[workflows]")
{
    auto lab = Lab("1\n5\n192.0.2.5/32\n\n\nn\ny\n"
                   "y\nEthernet0/1\ny\n");
    lab.serveDevices({ "R1" });
    lab.tools["create_loopback"] = [](const nlohmann::json& request, const nlohmann::json& arguments) {
        return test::replyTo(request,
                             test::structuredResult({
                                 { "device", arguments["device"] },
                                 { "error", "Loopback interfaces are not supported on this platform" },
                             }));
    };
    lab.tools["set_interface_ip"] = [](const nlohmann::json& request, const nlohmann::json& arguments) {
        return test::replyTo(request, test::structuredResult({ { "device", arguments["device"] }, { "raw", "ok" } }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("create_loopback");

    auto const loopbackCalls = lab.callsTo("create_loopback");
    REQUIRE(loopbackCalls.size() == 1);
    CHECK(loopbackCalls[0]
          == nlohmann::json {
              { "device", "R1" },
              { "loopback_id", 5 },
              { "ip", "192.0.2.5/32" },
              { "description", "MCP-created loopback" },
              { "save", false },
              { "dry_run", false },
          });

    auto const fallbackCalls = lab.callsTo("set_interface_ip");
    REQUIRE(fallbackCalls.size() == 1);
    CHECK(fallbackCalls[0]
          == nlohmann::json {
              { "device", "R1" },
              { "interface", "Ethernet0/1" },
              { "ip", "192.0.2.5/32" },
              { "replace", true },
              { "no_shutdown", true },
              { "save", false },
              { "dry_run", false },
          });

    auto const text = lab.out.str();
    CHECK(text.find("Server error: Loopback interfaces are not supported") != std::string::npos);
    CHECK(text.find("=== set_interface_ip (fallback) [R1] ===") != std::string::npos);
}

TEST_CASE("create_loopback success does not offer the fallback", "[workflows]")
{
    auto lab = Lab("1\n\n\n\n\n\ny\n");
    lab.serveDevices({ "R1" });
    lab.tools["create_loopback"] = [](const nlohmann::json& request, const nlohmann::json& arguments) {
        return test::replyTo(request,
                             test::structuredResult({ { "device", arguments["device"] }, { "error", nullptr } }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("create_loopback");

    auto const calls = lab.callsTo("create_loopback");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0]["loopback_id"] == 0);
    CHECK(calls[0]["ip"] == "192.0.2.100/32");
    CHECK(calls[0]["dry_run"] == true);
    CHECK(lab.callsTo("set_interface_ip").empty());
    CHECK(lab.out.str().find("physical interface") == std::string::npos);
}

TEST_CASE("create_loopback accepts a description that is not valid UTF-8", "[workflows]")
{
    auto lab = Lab("1\n\n\nLab\xE9 loopback\n\n\ny\n");
    lab.serveDevices({ "R1" });
    lab.tools["create_loopback"] = [](const nlohmann::json& request, const nlohmann::json& arguments) {
        return test::replyTo(request,
                             test::structuredResult({ { "device", arguments["device"] }, { "error", nullptr } }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("create_loopback");

    auto const calls = lab.callsTo("create_loopback");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0]["description"] == "Lab\xE9 loopback");
    CHECK(lab.out.str().find("Lab\xEF\xBF\xBD loopback") != std::string::npos);
}

TEST_CASE("Unknown tools are called without arguments", "[workflows]")
{
    auto lab = Lab("");
    lab.tools["ping_all"] = [](const nlohmann::json& request, const nlohmann::json&) {
        return test::replyTo(request, test::structuredResult({ { "raw", "3/3 reachable" } }));
    };

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("ping_all");

    auto const calls = lab.callsTo("ping_all");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0] == nlohmann::json::object());
    CHECK(lab.out.str().find("3/3 reachable") != std::string::npos);
}

TEST_CASE("Tool failures are reported and the flow returns", "[workflows]")
{
    auto lab = Lab("");

    auto workflows = DeviceWorkflows(*lab.client, lab.prompt, lab.config);
    workflows.run("list_devices");

    CHECK(lab.out.str().find("Tool call failed: ") != std::string::npos);
    CHECK(lab.client->isInitialized());
}
