// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolgate::jsonrpc
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

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto isResponse(const nlohmann::json& message) -> bool
{
    return message.is_object() && !message.contains("method")
           && (message.contains("result") || message.contains("error"));
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        if (!err.contains("code") || !err["code"].is_number_integer())
            return makeError(ErrorCode::ProtocolError,
                             std::format("JSON-RPC error object has no integer code: {}", err.dump()));

        response.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }
    else if (!message.contains("method"))
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto parseRequest(const nlohmann::json& message) -> Result<Request>
{
    if (!message.is_object() || json::getStringOr(message, "jsonrpc", "") != "2.0")
        return makeError(ErrorCode::InvalidRequest, "Not a valid JSON-RPC 2.0 message");

    if (!message.contains("method") || !message["method"].is_string())
        return makeError(ErrorCode::InvalidRequest, "JSON-RPC request is missing a method");

    auto request = Request {
        .id = std::nullopt,
        .method = message["method"].get<std::string>(),
        .params = message.contains("params") ? message["params"] : nlohmann::json::object(),
    };

    if (message.contains("id"))
    {
        auto const& id = message["id"];
        if (!id.is_string() && !id.is_number_integer() && !id.is_null())
            return makeError(ErrorCode::InvalidRequest, std::format("Invalid JSON-RPC id: {}", id.dump()));
        request.id = id;
    }

    return request;
}

} // namespace toolgate::jsonrpc
