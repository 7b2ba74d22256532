// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <endpoint/EndpointManager.hpp>
#include <net/HttpClient.hpp>
#include <routing/PathRouter.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief An inbound HTTP request, independent of the server implementation.
struct HttpRequest
{
    std::string method;
    std::string target;
    net::HeaderList headers;
    std::string body;

    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>
    {
        return net::findHeader(headers, name);
    }
};

/// @brief The response to an HttpRequest.
struct HttpResponse
{
    unsigned status = 200;
    net::HeaderList headers;
    std::string body;

    [[nodiscard]] static auto json(unsigned status, const nlohmann::json& body) -> HttpResponse;
    [[nodiscard]] static auto fromError(const Error& error) -> HttpResponse;
};

/// @brief The gateway's HTTP API: health, endpoint control, tool discovery and invocation,
/// and the per-endpoint MCP surface.
///
/// Local endpoints are served through a ToolBridge; traffic for remote endpoints is
/// forwarded to the upstream URL unchanged.
class ApiHandlers
{
  public:
    ApiHandlers(EndpointManager& manager, const PathRouter& router, std::chrono::milliseconds requestTimeout);

    /// @brief Dispatches one request. Never throws.
    [[nodiscard]] auto handle(const HttpRequest& request) const -> HttpResponse;

  private:
    [[nodiscard]] auto dispatch(const HttpRequest& request,
                                std::string_view path,
                                std::string_view query,
                                const std::vector<std::string_view>& segments) const -> HttpResponse;

    [[nodiscard]] auto listServers() const -> HttpResponse;
    [[nodiscard]] auto serverStatus(std::string_view name) const -> HttpResponse;
    [[nodiscard]] auto serverAction(std::string_view name, std::string_view action) const -> HttpResponse;
    [[nodiscard]] auto listTools(std::string_view path) const -> HttpResponse;
    [[nodiscard]] auto callTool(std::string_view path, const std::string& body) const -> HttpResponse;
    [[nodiscard]] auto bridge(std::string_view path, const HttpRequest& request) const -> HttpResponse;
    [[nodiscard]] auto proxy(const EndpointInfo& endpoint,
                             std::string_view rest,
                             std::string_view query,
                             const HttpRequest& request) const -> HttpResponse;

    EndpointManager& _manager;
    const PathRouter& _router;
    std::chrono::milliseconds _requestTimeout;
};

} // namespace toolgate
