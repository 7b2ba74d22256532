// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace toolgate
{

namespace
{
    constexpr auto SessionHeader = std::string_view { "Mcp-Session-Id" };
} // namespace

auto parseSseData(std::string_view body) -> std::vector<std::string>
{
    auto events = std::vector<std::string> {};
    auto data = std::string {};
    auto hasData = false;

    auto dispatch = [&] {
        if (hasData)
            events.push_back(std::move(data));
        data.clear();
        hasData = false;
    };

    while (!body.empty())
    {
        auto const eol = body.find('\n');
        auto line = body.substr(0, eol);
        body.remove_prefix(eol == std::string_view::npos ? body.size() : eol + 1);
        if (line.ends_with('\r'))
            line.remove_suffix(1);

        if (line.empty())
        {
            dispatch();
            continue;
        }

        if (!line.starts_with("data:"))
            continue;

        auto value = line.substr(5);
        if (value.starts_with(' '))
            value.remove_prefix(1);
        if (hasData)
            data += '\n';
        data += value;
        hasData = true;
    }

    dispatch();
    return events;
}

HttpTransport::HttpTransport(std::string url, std::chrono::milliseconds timeout):
    _url(std::move(url)), _client(timeout)
{
}

HttpTransport::~HttpTransport()
{
    if (auto result = close(); !result)
        log::warning("Closing HTTP transport to {} failed: {}", _url, result.error());
}

auto HttpTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto request = net::ClientRequest {
        .method = net::Method::Post,
        .url = _url,
        .headers = {
            { "Content-Type", "application/json" },
            { "Accept", "application/json, text/event-stream" },
        },
        .body = message.dump(),
    };
    if (_sessionId)
        request.headers.emplace_back(SessionHeader, *_sessionId);

    auto response = _client.request(request);
    if (!response)
        return std::unexpected(response.error());

    if (response->status >= 400)
        return makeError(ErrorCode::TransportError,
                         std::format("HTTP {} from {}: {}", response->status, _url, response->body));

    if (auto session = response->header(SessionHeader); session && !session->empty())
        _sessionId = std::move(session);

    return enqueueBody(*response);
}

auto HttpTransport::enqueueBody(const net::ClientResponse& response) -> VoidResult
{
    // 202 Accepted answers notifications and carries no body.
    if (response.body.empty())
        return {};

    auto const contentType = response.header("Content-Type").value_or("application/json");
    auto payloads = contentType.starts_with("text/event-stream") ? parseSseData(response.body)
                                                                 : std::vector<std::string> { response.body };

    for (const auto& payload: payloads)
    {
        auto parsed = json::parse(payload);
        if (!parsed)
            return std::unexpected(parsed.error());

        if (parsed->is_array())
        {
            for (auto& item: *parsed)
                _inbox.push_back(std::move(item));
        }
        else
        {
            _inbox.push_back(std::move(*parsed));
        }
    }
    return {};
}

auto HttpTransport::receive() -> Result<nlohmann::json>
{
    if (_inbox.empty())
        return makeError(ErrorCode::TransportError, std::format("No pending message from {}", _url));

    auto message = std::move(_inbox.front());
    _inbox.pop_front();
    return message;
}

auto HttpTransport::close() -> VoidResult
{
    if (!_connected)
        return {};
    _connected = false;
    _inbox.clear();

    if (!_sessionId)
        return {};

    auto request = net::ClientRequest {
        .method = net::Method::Delete,
        .url = _url,
        .headers = { { std::string(SessionHeader), *_sessionId } },
        .body = {},
    };

    // Servers may refuse explicit session termination.
    if (auto response = _client.request(request); !response)
        log::debug("Terminating MCP session at {} failed: {}", _url, response.error());
    else if (response->status >= 400 && response->status != 405)
        log::debug("Terminating MCP session at {} returned HTTP {}", _url, response->status);

    _sessionId.reset();
    return {};
}

void HttpTransport::interrupt()
{
    _client.interrupt();
}

auto HttpTransport::isConnected() const -> bool
{
    return _connected;
}

} // namespace toolgate
