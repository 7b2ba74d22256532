// SPDX-License-Identifier: Apache-2.0
#include "ToolBridge.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Overloaded.hpp>
#include <core/Version.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <format>
#include <random>

namespace toolgate
{

namespace
{
    auto newSessionId() -> std::string
    {
        static thread_local auto engine = std::mt19937_64 { std::random_device {}() };
        return std::format("{:016x}{:016x}", engine(), engine());
    }

    auto rpcCodeFor(ErrorCode code) -> int
    {
        switch (code)
        {
            case ErrorCode::InvalidRequest:
            case ErrorCode::ToolNotAllowed: return jsonrpc::codes::InvalidParams;
            default: return jsonrpc::codes::InternalError;
        }
    }
} // namespace

auto toBridgeContent(const ContentItem& item) -> nlohmann::json
{
    return std::visit(Overloaded {
                          [](const TextContent& text) -> nlohmann::json {
                              return { { "type", "text" }, { "text", text.text } };
                          },
                          [](const ImageContent& image) -> nlohmann::json {
                              return { { "type", "image" }, { "data", image.data }, { "mimeType", image.mimeType } };
                          },
                          [](const ResourceContent& resource) -> nlohmann::json {
                              log::warning("Resource content is forwarded as text: {}", resource.uri);
                              return { { "type", "text" },
                                       { "text",
                                         std::format("Resource: {} ({})",
                                                     resource.uri,
                                                     resource.mimeType.value_or("unknown")) } };
                          },
                      },
                      item);
}

ToolBridge::ToolBridge(const PathRouter& router, std::string path, std::chrono::milliseconds requestTimeout):
    _router(router), _path(std::move(path)), _requestTimeout(requestTimeout)
{
}

auto ToolBridge::handle(const nlohmann::json& message) const -> BridgeReply
{
    auto reply = BridgeReply {};

    if (!message.is_array())
    {
        reply.body = handleOne(message, reply.sessionId);
        return reply;
    }

    if (message.empty())
    {
        reply.body = jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::InvalidRequest, "Empty batch");
        return reply;
    }

    auto answers = nlohmann::json::array();
    for (const auto& item: message)
    {
        if (auto answer = handleOne(item, reply.sessionId))
            answers.push_back(std::move(*answer));
    }
    if (!answers.empty())
        reply.body = std::move(answers);
    return reply;
}

auto ToolBridge::handleOne(const nlohmann::json& message, std::optional<std::string>& sessionId) const
    -> std::optional<nlohmann::json>
{
    // Replies from the caller to server-initiated requests need no answer.
    if (jsonrpc::isResponse(message))
        return std::nullopt;

    auto request = jsonrpc::parseRequest(message);
    if (!request)
        return jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::InvalidRequest, request.error().message);

    log::debug("Bridge '{}' received {}", _path, request->method);

    if (request->isNotification())
        return std::nullopt;

    auto const& id = *request->id;
    auto const& method = request->method;

    auto result = Result<nlohmann::json> {};
    if (method == "initialize")
        result = initialize(request->params, sessionId);
    else if (method == "ping")
        result = nlohmann::json::object();
    else if (method == "tools/list")
        result = listTools();
    else if (method == "tools/call")
        result = callTool(request->params);
    else
        return jsonrpc::makeErrorResponse(
            id, jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", method));

    if (!result)
    {
        log::warning("Bridge '{}' failed to handle {}: {}", _path, method, result.error());
        return jsonrpc::makeErrorResponse(id, rpcCodeFor(result.error().code), result.error().message);
    }

    return jsonrpc::makeResult(id, std::move(*result));
}

auto ToolBridge::initialize(const nlohmann::json& params, std::optional<std::string>& sessionId) const
    -> nlohmann::json
{
    auto const route = _router.getRoute(_path);
    auto const endpointName = route ? route->endpointName : _path;

    sessionId = newSessionId();
    return nlohmann::json {
        { "protocolVersion", json::getStringOr(params, "protocolVersion", McpProtocolVersion) },
        { "capabilities", { { "tools", { { "listChanged", false } } } } },
        { "serverInfo", { { "name", std::format("{}-{}", ProductName, endpointName) }, { "version", ProductVersion } } },
        { "instructions", std::format("Proxy to {} MCP server", endpointName) },
    };
}

auto ToolBridge::listTools() const -> Result<nlohmann::json>
{
    auto routed = _router.getClient(_path);
    if (!routed)
        return std::unexpected(routed.error());

    auto tools = routed->client->listTools(_requestTimeout);
    if (!tools)
        return makeError(tools.error().code, std::format("Failed to list tools: {}", tools.error().message));

    auto list = nlohmann::json::array();
    for (auto& tool: applyToolFilter(std::move(*tools), routed->toolFilter))
    {
        if (!tool.inputSchema.is_object())
        {
            log::warning("Tool '{}' on '{}' has a non-object input schema, exposing {{}}", tool.name, _path);
            tool.inputSchema = nlohmann::json::object();
        }
        list.push_back(toJson(tool));
    }

    return nlohmann::json { { "tools", std::move(list) } };
}

auto ToolBridge::callTool(const nlohmann::json& params) const -> Result<nlohmann::json>
{
    auto request = parseToolCallRequest(params);
    if (!request)
        return std::unexpected(request.error());

    auto routed = _router.getClient(_path);
    if (!routed)
        return std::unexpected(routed.error());

    if (!isToolAllowed(request->name, routed->toolFilter))
        return makeError(ErrorCode::ToolNotAllowed,
                         std::format("Tool '{}' is not allowed on endpoint '{}'", request->name, _path));

    auto const toolName = request->name;
    auto response = routed->client->callTool(std::move(*request), _requestTimeout);
    if (!response)
        return makeError(response.error().code,
                         std::format("Failed to call tool '{}': {}", toolName, response.error().message));

    auto content = nlohmann::json::array();
    for (const auto& item: response->content)
        content.push_back(toBridgeContent(item));

    auto result = nlohmann::json { { "content", std::move(content) } };
    if (response->isError)
        result["isError"] = *response->isError;
    return result;
}

} // namespace toolgate
