// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Version.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>
#include <future>
#include <set>
#include <thread>

namespace toolgate
{

McpClient::McpClient(std::unique_ptr<Transport> transport, std::string name):
    _transport(std::move(transport)), _name(std::move(name))
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize() -> Result<McpServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", ProductName },
              { "version", ProductVersion },
          } },
    };

    auto handshake =
        sendRequest("initialize", std::move(params))
            .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
                if (!result.is_object())
                    return makeError(ErrorCode::ProtocolError,
                                     std::format("initialize result is not an object: {}", result.dump()));

                auto const serverInfo = result.contains("serverInfo") ? result["serverInfo"] : nlohmann::json {};
                _capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
                _capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
                _capabilities.protocolVersion =
                    json::getStringOr(result, "protocolVersion", McpProtocolVersion);

                if (result.contains("capabilities") && result["capabilities"].is_object())
                {
                    auto const& caps = result["capabilities"];
                    _capabilities.hasTools = caps.contains("tools");
                    _capabilities.hasResources = caps.contains("resources");
                    _capabilities.hasPrompts = caps.contains("prompts");
                }

                return _transport->send(jsonrpc::makeNotification("notifications/initialized"))
                    .transform([this] { return _capabilities; });
            });

    if (!handshake)
    {
        // An interrupted handshake keeps its Timeout code; everything else is a protocol failure.
        if (handshake.error().code == ErrorCode::Timeout)
            return handshake;
        return makeError(ErrorCode::ProtocolError,
                         std::format("MCP handshake with '{}' failed: {}", _name, handshake.error().message));
    }

    _initialized = true;
    log::info("MCP server '{}' initialized: {} v{}",
              _name,
              _capabilities.serverName,
              _capabilities.serverVersion);
    return handshake;
}

auto McpClient::initializeWithTimeout(std::chrono::milliseconds timeout) -> Result<McpServerCapabilities>
{
    auto task = std::packaged_task<Result<McpServerCapabilities>()>([this] { return initialize(); });
    auto future = task.get_future();
    auto helper = std::thread(std::move(task));

    if (future.wait_for(timeout) == std::future_status::timeout)
    {
        _transport->interrupt();
        helper.join();
        log::warning("MCP handshake with '{}' did not finish within {} ms", _name, timeout.count());
        return makeError(ErrorCode::Timeout,
                         std::format("MCP handshake with '{}' timed out after {} ms", _name, timeout.count()));
    }

    helper.join();
    try
    {
        return future.get();
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("MCP handshake with '{}' failed: {}", _name, e.what()));
    }
}

auto McpClient::listTools() -> Result<std::vector<ToolDefinition>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto tools = std::vector<ToolDefinition> {};
    auto cursor = std::optional<std::string> {};
    auto seenCursors = std::set<std::string> {};

    do
    {
        auto params = cursor ? nlohmann::json { { "cursor", *cursor } } : nlohmann::json {};
        auto page = sendRequest("tools/list", std::move(params));
        if (!page)
            return std::unexpected(page.error());

        if (page->contains("tools") && (*page)["tools"].is_array())
        {
            for (const auto& toolJson: (*page)["tools"])
            {
                if (!toolJson.is_object() || !toolJson.contains("name") || !toolJson["name"].is_string())
                {
                    log::warning("Skipping malformed tool entry from '{}': {}", _name, toolJson.dump());
                    continue;
                }

                auto tool = ToolDefinition {
                    .name = toolJson["name"].get<std::string>(),
                    .description = std::nullopt,
                    .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
                };
                if (toolJson.contains("description") && toolJson["description"].is_string())
                    tool.description = toolJson["description"].get<std::string>();
                tools.push_back(std::move(tool));
            }
        }

        auto next = std::optional<std::string> {};
        if (page->contains("nextCursor") && (*page)["nextCursor"].is_string())
            next = (*page)["nextCursor"].get<std::string>();

        if (next && !seenCursors.insert(*next).second)
        {
            log::warning("MCP server '{}' repeated tools/list cursor '{}', stopping", _name, *next);
            break;
        }
        cursor = std::move(next);
    } while (cursor);

    log::debug("MCP server '{}' offers {} tools", _name, tools.size());
    return tools;
}

auto McpClient::callTool(const ToolCallRequest& request) -> Result<ToolCallResponse>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", request.name },
        { "arguments", request.arguments },
    };

    return sendRequest("tools/call", std::move(params))
        .and_then([this, &request](const nlohmann::json& result) -> Result<ToolCallResponse> {
            auto response = ToolCallResponse {};
            if (result.contains("isError") && result["isError"].is_boolean())
                response.isError = result["isError"].get<bool>();

            if (result.contains("content") && result["content"].is_array())
            {
                for (const auto& item: result["content"])
                {
                    if (auto mapped = mapContentItem(item))
                        response.content.push_back(std::move(*mapped));
                    else
                        log::debug("Dropping unsupported content of type '{}' from tool '{}' on '{}'",
                                   json::getStringOr(item, "type", "?"),
                                   request.name,
                                   _name);
                }
            }

            log::debug("Tool '{}' on '{}' returned {} content items (isError: {})",
                       request.name,
                       _name,
                       response.content.size(),
                       response.isError.value_or(false));
            return response;
        });
}

auto McpClient::close() -> VoidResult
{
    _initialized = false;
    return _transport->close();
}

void McpClient::interrupt()
{
    _transport->interrupt();
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    if (auto sent = _transport->send(request); !sent)
        return std::unexpected(sent.error());

    // Skip server notifications, server requests and stale replies until our answer arrives.
    while (true)
    {
        auto message = _transport->receive();
        if (!message)
            return std::unexpected(message.error());

        if (message->is_object() && message->contains("method"))
        {
            if (message->contains("id"))
            {
                if (auto answered = answerServerRequest(*message); !answered)
                    return std::unexpected(answered.error());
            }
            else
            {
                log::trace("Ignoring notification '{}' from '{}'", json::getStringOr(*message, "method", ""), _name);
            }
            continue;
        }

        auto response = jsonrpc::parseResponse(*message);
        if (!response)
            return std::unexpected(response.error());

        if (response->id != id)
        {
            log::debug("Skipping reply with unexpected id {} from '{}'", response->id.dump(), _name);
            continue;
        }

        if (response->error)
            return makeError(ErrorCode::ProtocolError,
                             std::format("RPC error {}: {}", response->error->code, response->error->message));

        return response->result.value_or(nlohmann::json::object());
    }
}

auto McpClient::answerServerRequest(const nlohmann::json& message) -> VoidResult
{
    auto const method = json::getStringOr(message, "method", "");
    if (method == "ping")
        return _transport->send(jsonrpc::makeResult(message["id"], nlohmann::json::object()));

    log::debug("Rejecting server request '{}' from '{}'", method, _name);
    return _transport->send(jsonrpc::makeErrorResponse(
        message["id"], jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", method)));
}

auto mapContentItem(const nlohmann::json& item) -> std::optional<ContentItem>
{
    auto const type = json::getStringOr(item, "type", "");

    if (type == "text")
        return TextContent { .text = json::getStringOr(item, "text", "") };

    if (type == "image")
        return ImageContent {
            .data = json::getStringOr(item, "data", ""),
            .mimeType = json::getStringOr(item, "mimeType", ""),
        };

    if (type == "resource" && item.contains("resource") && item["resource"].is_object())
    {
        // Embedded text and blob resources both collapse to a reference.
        auto const& resource = item["resource"];
        auto mapped = ResourceContent { .uri = json::getStringOr(resource, "uri", ""), .mimeType = std::nullopt };
        if (resource.contains("mimeType") && resource["mimeType"].is_string())
            mapped.mimeType = resource["mimeType"].get<std::string>();
        return mapped;
    }

    return std::nullopt;
}

} // namespace toolgate
