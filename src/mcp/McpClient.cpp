// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/ResultNormalizer.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace netmcp
{

namespace
{
    auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool
    {
        auto const it = std::ranges::search(haystack, needle, [](char a, char b) {
                            return std::toupper(static_cast<unsigned char>(a))
                                   == std::toupper(static_cast<unsigned char>(b));
                        }).begin();
        return it != haystack.end();
    }
} // namespace

auto isDiagnosticLine(std::string_view line) -> bool
{
    return containsIgnoreCase(line, "WARNING") || containsIgnoreCase(line, "ERROR");
}

McpClient::McpClient(std::unique_ptr<Transport> transport, McpClientOptions options):
    _transport(std::move(transport)), _options(std::move(options)), _pending(_options.pollInterval)
{
}

McpClient::~McpClient()
{
    close();
}

void McpClient::start()
{
    auto const lock = std::lock_guard(_lifecycleMutex);
    if (_state != ClientState::Unstarted)
        return;

    _state = ClientState::Started;
    _reader = std::jthread([this](std::stop_token stopToken) { readLoop(stopToken); });
    log::debug("MCP reader started");
}

auto McpClient::nextId() -> int64_t
{
    return ++_lastId;
}

auto McpClient::send(std::string_view method, nlohmann::json params, std::optional<int64_t> id)
    -> Result<int64_t>
{
    auto const requestId = id ? *id : nextId();
    auto message = jsonrpc::makeRequest(requestId, method, std::move(params));

    _pending.expect(requestId);
    {
        auto const lock = std::lock_guard(_inflightMutex);
        _inflight.insert_or_assign(requestId, std::string(method));
    }

    auto sent = _transport->send(message);
    if (!sent)
    {
        auto const lock = std::lock_guard(_inflightMutex);
        _inflight.erase(requestId);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to send '{}' (id {}): {}", method, requestId, sent.error().message));
    }

    return requestId;
}

auto McpClient::wait(int64_t id, std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto response = _pending.take(id, timeout);

    auto method = std::string {};
    {
        auto const lock = std::lock_guard(_inflightMutex);
        if (auto it = _inflight.find(id); it != _inflight.end())
        {
            method = std::move(it->second);
            _inflight.erase(it);
        }
    }

    if (response)
        return std::move(*response);

    auto const label = method.empty() ? std::format("request {}", id) : std::format("{} (id {})", method, id);

    if (_pending.isClosed())
        return makeError(ErrorCode::TransportError, std::format("Connection closed while waiting for {}", label));

    return makeError(ErrorCode::TimeoutError,
                     std::format("Timeout waiting for {} after {} ms", label, timeout.count()));
}

auto McpClient::request(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    return send(method, std::move(params)).and_then([this, timeout](int64_t id) { return wait(id, timeout); });
}

auto McpClient::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    auto sent = _transport->send(jsonrpc::makeNotification(method, std::move(params)));
    if (!sent)
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to send notification '{}': {}", method, sent.error().message));
    return {};
}

auto McpClient::initialize() -> Result<ServerInfo>
{
    start();

    auto params = nlohmann::json {
        { "protocolVersion", _options.protocolVersion },
        { "capabilities", { { "tools", nlohmann::json::object() } } },
        { "clientInfo",
          nlohmann::json {
              { "name", _options.clientName },
              { "version", _options.clientVersion },
          } },
    };

    auto response = request("initialize", std::move(params), _options.initializeTimeout);
    if (!response)
        return std::unexpected(response.error());

    auto parsed = jsonrpc::parseResponse(*response);
    if (!parsed)
        return std::unexpected(parsed.error());
    if (parsed->error)
        return makeError(ErrorCode::ProtocolError,
                         std::format("initialize failed: {}", parsed->error->message),
                         parsed->error->raw);

    auto const& result = *parsed->result;
    auto const serverInfo = result.is_object() && result.contains("serverInfo") ? result["serverInfo"]
                                                                                : nlohmann::json::object();
    _serverInfo = ServerInfo {
        .name = json::getStringOr(serverInfo, "name", "unknown"),
        .version = json::getStringOr(serverInfo, "version", ""),
        .protocolVersion = json::getStringOr(result, "protocolVersion", ""),
        .hasTools = result.is_object() && result.contains("capabilities") && result["capabilities"].is_object()
                    && result["capabilities"].contains("tools"),
    };

    auto notified = notify("notifications/initialized", nlohmann::json::object());
    if (!notified)
        return std::unexpected(notified.error());

    if (_options.settleDelay.count() > 0)
        std::this_thread::sleep_for(_options.settleDelay);

    _state = ClientState::Initialized;
    log::info("MCP server initialized: {} {}", _serverInfo.name, _serverInfo.version);

    return _serverInfo;
}

auto McpClient::listTools() -> Result<std::vector<ToolDefinition>>
{
    if (auto ok = requireSession("tools/list"); !ok)
        return std::unexpected(ok.error());

    auto response = request("tools/list", nullptr, _options.listToolsTimeout);
    if (!response)
        return std::unexpected(response.error());

    auto parsed = jsonrpc::parseResponse(*response);
    if (!parsed)
        return std::unexpected(parsed.error());
    if (parsed->error)
        return makeError(ErrorCode::ProtocolError,
                         std::format("tools/list failed: {}", parsed->error->message),
                         parsed->error->raw);

    auto tools = std::vector<ToolDefinition> {};
    auto const& result = *parsed->result;

    if (result.is_object() && result.contains("tools") && result["tools"].is_array())
    {
        for (const auto& toolJson: result["tools"])
        {
            auto name = json::getStringOr(toolJson, "name", "");
            if (name.empty())
            {
                log::warning("Skipping tool descriptor without a name");
                continue;
            }

            tools.push_back(ToolDefinition {
                .name = std::move(name),
                .description = json::getStringOr(toolJson, "description", ""),
                .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
            });
        }
    }

    _tools = tools;
    _state = ClientState::Ready;
    log::debug("Server exposes {} tool(s)", _tools.size());
    return tools;
}

auto McpClient::callTool(std::string_view name,
                         const nlohmann::json& arguments,
                         std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    if (auto ok = requireSession(name); !ok)
        return std::unexpected(ok.error());

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto response = request("tools/call", std::move(params), timeout.value_or(_options.callTimeout));
    if (!response)
        return std::unexpected(response.error());

    if (response->contains("error"))
    {
        auto const& error = (*response)["error"];
        return makeError(ErrorCode::ToolError, std::format("Tool '{}' error: {}", name, json::dump(error)), error);
    }

    log::debug("Tool '{}' replied", name);
    return response->value("result", nlohmann::json::object());
}

auto McpClient::callToolRaw(std::string_view name,
                            const nlohmann::json& arguments,
                            std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    return callTool(name, arguments, timeout).transform([](const nlohmann::json& result) {
        return normalizeRaw(result);
    });
}

auto McpClient::callToolForDisplay(std::string_view name,
                                   const nlohmann::json& arguments,
                                   std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    return callTool(name, arguments, timeout).transform([name](const nlohmann::json& result) {
        return normalizeForDisplay(name, result);
    });
}

void McpClient::close()
{
    auto const lock = std::lock_guard(_lifecycleMutex);
    if (_state == ClientState::Closed && !_reader.joinable())
        return;

    _transport->close();
    if (_reader.joinable())
    {
        _reader.request_stop();
        _reader.join();
    }
    if (auto const dropped = _pending.sweep(); dropped > 0)
        log::debug("Discarded {} late response(s)", dropped);
    _pending.close();
    _state = ClientState::Closed;

    if (auto const leftover = _pending.size(); leftover > 0)
        log::debug("{} response(s) were never consumed", leftover);
}

auto McpClient::state() const -> ClientState
{
    return _state;
}

auto McpClient::isInitialized() const -> bool
{
    auto const current = _state.load();
    return current == ClientState::Initialized || current == ClientState::Ready;
}

auto McpClient::serverInfo() const -> const ServerInfo&
{
    return _serverInfo;
}

auto McpClient::tools() const -> const std::vector<ToolDefinition>&
{
    return _tools;
}

auto McpClient::pendingCount() const -> std::size_t
{
    return _pending.size();
}

void McpClient::readLoop(const std::stop_token& stopToken)
{
    while (!stopToken.stop_requested())
    {
        auto line = _transport->receiveLine();
        if (!line)
        {
            log::debug("MCP reader stopped: {}", line.error().message);
            break;
        }
        handleLine(*line);
    }

    _pending.close();
    _state = ClientState::Closed;
}

void McpClient::handleLine(const std::string& line)
{
    auto message = json::parse(line);
    if (!message)
    {
        if (isDiagnosticLine(line))
        {
            if (_options.diagnosticSink)
                _options.diagnosticSink(line);
            else
                log::warning("server: {}", line);
        }
        else
        {
            log::trace("Discarding non-JSON line from server: {}", line);
        }
        return;
    }

    auto const id = jsonrpc::responseId(*message);
    if (!id)
    {
        log::debug("Ignoring server message: {}", json::getStringOr(*message, "method", "<no method>"));
        return;
    }

    _pending.deposit(*id, std::move(*message));
}

auto McpClient::requireSession(std::string_view operation) const -> VoidResult
{
    if (!isInitialized())
        return makeError(ErrorCode::ProtocolError,
                         std::format("Client not initialized (state: {}), cannot run '{}'",
                                     clientStateToString(_state),
                                     operation));
    return {};
}

} // namespace netmcp
