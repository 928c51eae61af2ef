// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/StdioTransport.hpp>
#include <netmcp/DeviceWorkflows.hpp>
#include <netmcp/Menu.hpp>
#include <netmcp/Prompt.hpp>

#include <algorithm>
#include <format>
#include <iterator>
#include <ostream>
#include <print>
#include <ranges>

namespace netmcp
{

struct App::Impl
{
    AppConfig config;
    Prompt prompt;
    std::unique_ptr<McpClient> client;
    std::vector<std::string> toolNames;

    Impl(AppConfig cfg, std::istream& in, std::ostream& out): config(std::move(cfg)), prompt(in, out) {}
};

App::App(AppConfig config, std::istream& in, std::ostream& out):
    _impl(std::make_unique<Impl>(std::move(config), in, out))
{
}

App::~App()
{
    if (_impl->client)
        _impl->client->close();
}

auto App::initialize() -> VoidResult
{
    auto transport = std::make_unique<StdioTransport>();
    auto started = transport->start(toTransportConfig(_impl->config.server));
    if (!started)
        return std::unexpected(started.error());

    return initialize(std::make_unique<McpClient>(std::move(transport), toClientOptions(_impl->config.client)));
}

auto App::initialize(std::unique_ptr<McpClient> client) -> VoidResult
{
    auto& out = _impl->prompt.out();
    _impl->client = std::move(client);

    auto serverInfo = _impl->client->initialize();
    if (!serverInfo)
        return std::unexpected(serverInfo.error());
    std::println(out, "Connected to MCP server: {}", serverInfo->name);

    auto tools = _impl->client->listTools();
    if (!tools)
        return std::unexpected(tools.error());
    if (tools->empty())
        return makeError(ErrorCode::ProtocolError, "No tools exposed by server.");

    _impl->toolNames.clear();
    std::ranges::transform(*tools, std::back_inserter(_impl->toolNames), &ToolDefinition::name);

    auto joined = std::string {};
    for (const auto& name: _impl->toolNames)
        joined += joined.empty() ? name : ", " + name;
    std::println(out, "Tools available: {}", joined);

    return {};
}

auto App::run() -> int
{
    if (!_impl->client || !_impl->client->isInitialized())
    {
        log::error("App::run() called before a successful initialize()");
        return 1;
    }

    auto& out = _impl->prompt.out();
    auto workflows = DeviceWorkflows(*_impl->client, _impl->prompt, _impl->config);

    while (true)
    {
        printMenu(out, _impl->client->tools());
        auto const input = _impl->prompt.readLine("\nChoice: ");
        if (!input)
            break;

        auto const choice = parseMenuChoice(*input, _impl->toolNames);
        if (choice.kind == MenuChoice::Kind::Quit)
            break;
        if (choice.kind == MenuChoice::Kind::Invalid)
        {
            std::println(out, "{}", choice.message);
            continue;
        }

        workflows.run(choice.tool);

        if (_impl->client->state() == ClientState::Closed)
        {
            log::error("MCP server connection lost");
            return 2;
        }
    }

    std::println(out, "Bye.");
    _impl->client->close();
    return 0;
}

} // namespace netmcp
