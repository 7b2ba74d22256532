// SPDX-License-Identifier: Apache-2.0
#include "ApiHandlers.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <core/Version.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/ToolBridge.hpp>

#include <array>
#include <format>

namespace toolgate
{

namespace
{
    /// Request headers passed through to remote endpoints.
    constexpr auto ForwardedRequestHeaders = std::array<std::string_view, 6> {
        "Content-Type", "Accept", "Authorization", "Mcp-Session-Id", "Mcp-Protocol-Version", "Last-Event-ID",
    };

    /// Response headers passed back from remote endpoints.
    constexpr auto ForwardedResponseHeaders = std::array<std::string_view, 3> {
        "Content-Type",
        "Mcp-Session-Id",
        "Mcp-Protocol-Version",
    };

    auto splitPath(std::string_view path) -> std::vector<std::string_view>
    {
        auto segments = std::vector<std::string_view> {};
        while (!path.empty())
        {
            auto const slash = path.find('/');
            auto const segment = path.substr(0, slash);
            if (!segment.empty())
                segments.push_back(segment);
            if (slash == std::string_view::npos)
                break;
            path.remove_prefix(slash + 1);
        }
        return segments;
    }

    auto methodNotAllowed(std::string_view allowed) -> HttpResponse
    {
        auto response = HttpResponse::json(405, { { "error", "Method not allowed" }, { "code", 405 } });
        response.headers.emplace_back("Allow", allowed);
        return response;
    }

    auto toMethod(std::string_view method) -> std::optional<net::Method>
    {
        if (method == "GET")
            return net::Method::Get;
        if (method == "POST")
            return net::Method::Post;
        if (method == "DELETE")
            return net::Method::Delete;
        return std::nullopt;
    }
} // namespace

auto HttpResponse::json(unsigned status, const nlohmann::json& body) -> HttpResponse
{
    return HttpResponse {
        .status = status,
        .headers = { { "Content-Type", "application/json" } },
        .body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
    };
}

auto HttpResponse::fromError(const Error& error) -> HttpResponse
{
    auto const status = httpStatusFor(error.code);
    return json(status, { { "error", error.message }, { "code", status } });
}

ApiHandlers::ApiHandlers(EndpointManager& manager,
                         const PathRouter& router,
                         std::chrono::milliseconds requestTimeout):
    _manager(manager), _router(router), _requestTimeout(requestTimeout)
{
}

auto ApiHandlers::handle(const HttpRequest& request) const -> HttpResponse
{
    auto const target = std::string_view(request.target);
    auto const queryStart = target.find('?');
    auto const path = target.substr(0, queryStart);
    auto const query = queryStart == std::string_view::npos ? std::string_view {} : target.substr(queryStart + 1);

    try
    {
        auto response = dispatch(request, path, query, splitPath(path));
        log::debug("{} {} -> {}", request.method, path, response.status);
        return response;
    }
    catch (const std::exception& e)
    {
        log::error("Unhandled error in {} {}: {}", request.method, path, e.what());
        return HttpResponse::fromError(Error { ErrorCode::Internal, e.what() });
    }
}

auto ApiHandlers::dispatch(const HttpRequest& request,
                           std::string_view path,
                           std::string_view query,
                           const std::vector<std::string_view>& segments) const -> HttpResponse
{
    auto const& method = request.method;
    auto const n = segments.size();

    if (n == 1 && segments[0] == "health")
    {
        if (method != "GET")
            return methodNotAllowed("GET");
        return HttpResponse::json(200,
                                  {
                                      { "status", "ok" },
                                      { "service", ProductName },
                                      { "version", ProductVersion },
                                  });
    }

    if (n == 1 && segments[0] == "info")
    {
        if (method != "GET")
            return methodNotAllowed("GET");
        return HttpResponse::json(200,
                                  {
                                      { "name", ProductName },
                                      { "version", ProductVersion },
                                      { "description", ProductDescription },
                                  });
    }

    if (n == 1 && segments[0] == "servers")
        return method == "GET" ? listServers() : methodNotAllowed("GET");

    if (n == 3 && segments[0] == "servers")
    {
        auto const action = segments[2];
        if (action == "status")
            return method == "GET" ? serverStatus(segments[1]) : methodNotAllowed("GET");
        if (action == "start" || action == "stop" || action == "restart")
            return method == "POST" ? serverAction(segments[1], action) : methodNotAllowed("POST");
    }

    if (n >= 2 && segments[0] == "mcp")
    {
        auto const endpointPath = segments[1];

        if (n == 3 && segments[2] == "tools")
            return method == "GET" ? listTools(endpointPath) : methodNotAllowed("GET");
        if (n == 4 && segments[2] == "tools" && segments[3] == "call")
            return method == "POST" ? callTool(endpointPath, request.body) : methodNotAllowed("POST");

        auto endpoint = _manager.getEndpointInfoByPath(endpointPath);
        if (!endpoint)
            return HttpResponse::fromError(endpoint.error());

        if (endpoint->kind == EndpointKind::Remote)
        {
            auto rest = std::string {};
            for (auto i = size_t { 2 }; i < n; ++i)
                rest += std::format("/{}", segments[i]);
            return proxy(*endpoint, rest, query, request);
        }

        if (n == 2)
            return bridge(endpointPath, request);
    }

    return HttpResponse::json(404, { { "error", std::format("No route for {} {}", method, path) }, { "code", 404 } });
}

auto ApiHandlers::listServers() const -> HttpResponse
{
    auto servers = nlohmann::json::array();
    for (const auto& info: _manager.listEndpoints())
        servers.push_back(toJson(info));
    return HttpResponse::json(200, { { "servers", std::move(servers) } });
}

auto ApiHandlers::serverStatus(std::string_view name) const -> HttpResponse
{
    auto info = _manager.getEndpointInfo(name);
    if (!info)
        return HttpResponse::fromError(info.error());
    return HttpResponse::json(200, toJson(*info));
}

auto ApiHandlers::serverAction(std::string_view name, std::string_view action) const -> HttpResponse
{
    log::info("Received request to {} endpoint '{}'", action, name);

    auto result = action == "start"  ? _manager.start(name)
                  : action == "stop" ? _manager.stop(name)
                                     : _manager.restart(name);
    if (!result)
        return HttpResponse::fromError(result.error());

    return HttpResponse::json(200,
                              {
                                  { "name", name },
                                  { "action", action },
                                  { "status", "success" },
                              });
}

auto ApiHandlers::listTools(std::string_view path) const -> HttpResponse
{
    auto routed = _router.getClient(path);
    if (!routed)
        return HttpResponse::fromError(routed.error());

    auto tools = routed->client->listTools(_requestTimeout);
    if (!tools)
        return HttpResponse::fromError(tools.error());

    auto list = nlohmann::json::array();
    for (const auto& tool: applyToolFilter(std::move(*tools), routed->toolFilter))
        list.push_back(toJson(tool));

    return HttpResponse::json(200,
                              {
                                  { "server", routed->client->name() },
                                  { "tools", std::move(list) },
                                  { "filter_active", routed->toolFilter.has_value() },
                              });
}

auto ApiHandlers::callTool(std::string_view path, const std::string& body) const -> HttpResponse
{
    auto routed = _router.getClient(path);
    if (!routed)
        return HttpResponse::fromError(routed.error());

    auto request = json::parse(body, ErrorCode::InvalidRequest).and_then(parseToolCallRequest);
    if (!request)
        return HttpResponse::fromError(request.error());

    if (!isToolAllowed(request->name, routed->toolFilter))
        return HttpResponse::fromError(
            Error { ErrorCode::ToolNotAllowed, std::format("Tool '{}' is not allowed", request->name) });

    auto response = routed->client->callTool(std::move(*request), _requestTimeout);
    if (!response)
        return HttpResponse::fromError(response.error());

    return HttpResponse::json(200, toJson(*response));
}

auto ApiHandlers::bridge(std::string_view path, const HttpRequest& request) const -> HttpResponse
{
    if (request.method == "DELETE")
        return HttpResponse { .status = 204, .headers = {}, .body = {} };
    if (request.method != "POST")
        return methodNotAllowed("POST, DELETE");

    auto message = json::parse(request.body, ErrorCode::InvalidRequest);
    if (!message)
        return HttpResponse::json(
            400, jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, message.error().message));

    auto const toolBridge = ToolBridge(_router, std::string(path), _requestTimeout);
    auto reply = toolBridge.handle(*message);

    auto response = reply.body ? HttpResponse::json(200, *reply.body)
                               : HttpResponse { .status = 202, .headers = {}, .body = {} };
    if (reply.sessionId)
        response.headers.emplace_back("Mcp-Session-Id", *reply.sessionId);
    return response;
}

auto ApiHandlers::proxy(const EndpointInfo& endpoint,
                        std::string_view rest,
                        std::string_view query,
                        const HttpRequest& request) const -> HttpResponse
{
    auto const method = toMethod(request.method);
    if (!method)
        return methodNotAllowed("GET, POST, DELETE");

    auto upstream = _manager.remoteUrl(endpoint.name);
    if (!upstream)
        return HttpResponse::fromError(upstream.error());

    auto url = *upstream;
    if (!rest.empty())
    {
        while (url.ends_with('/'))
            url.pop_back();
        url += rest;
    }
    if (!query.empty())
        url += std::format("{}{}", url.find('?') == std::string::npos ? '?' : '&', query);

    auto forwarded = net::ClientRequest { .method = *method, .url = url, .headers = {}, .body = request.body };
    for (auto const name: ForwardedRequestHeaders)
    {
        if (auto value = request.header(name))
            forwarded.headers.emplace_back(name, std::move(*value));
    }

    log::debug("Proxying {} /mcp/{}{} to {}", request.method, endpoint.path, rest, url);

    auto client = net::HttpClient(_requestTimeout);
    auto upstreamResponse = client.request(forwarded);
    if (!upstreamResponse)
        return HttpResponse::fromError(upstreamResponse.error());

    auto response =
        HttpResponse { .status = upstreamResponse->status, .headers = {}, .body = std::move(upstreamResponse->body) };
    for (auto const name: ForwardedResponseHeaders)
    {
        if (auto value = upstreamResponse->header(name))
            response.headers.emplace_back(name, std::move(*value));
    }
    return response;
}

} // namespace toolgate
