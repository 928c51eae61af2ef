// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace netmcp::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto responseId(const nlohmann::json& message) -> std::optional<int64_t>
{
    if (!message.is_object())
        return std::nullopt;

    auto const it = message.find("id");
    if (it == message.end() || !it->is_number_integer())
        return std::nullopt;

    if (!message.contains("result") && !message.contains("error"))
        return std::nullopt;

    return it->get<int64_t>();
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    auto const id = responseId(message);
    if (!id)
        return makeError(ErrorCode::ProtocolError,
                         "JSON-RPC message is not a response (needs an integer id and a result or error)");

    auto response = Response {};
    response.id = *id;

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else
    {
        auto const& err = message["error"];
        auto rpcError = RpcError {};
        rpcError.raw = err;
        if (err.is_object())
        {
            rpcError.code = static_cast<int>(json::getIntOr(err, "code", 0));
            rpcError.message = json::getStringOr(err, "message", "Unknown error");
            if (err.contains("data"))
                rpcError.data = err["data"];
        }
        else if (err.is_string())
        {
            rpcError.message = err.get<std::string>();
        }
        else
        {
            rpcError.message = json::dump(err);
        }
        response.error = std::move(rpcError);
    }

    return response;
}

} // namespace netmcp::jsonrpc
