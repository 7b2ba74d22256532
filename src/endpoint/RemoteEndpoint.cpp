// SPDX-License-Identifier: Apache-2.0
#include "RemoteEndpoint.hpp"

#include <core/Log.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/McpClient.hpp>

#include <format>

namespace toolgate
{

RemoteEndpoint::RemoteEndpoint(std::string name,
                               std::string path,
                               std::string url,
                               std::chrono::milliseconds handshakeTimeout,
                               std::chrono::milliseconds requestTimeout):
    _name(std::move(name)),
    _path(std::move(path)),
    _url(std::move(url)),
    _handshakeTimeout(handshakeTimeout),
    _requestTimeout(requestTimeout)
{
}

auto RemoteEndpoint::connect() -> Result<ClientHandle>
{
    auto client = std::make_unique<McpClient>(std::make_unique<HttpTransport>(_url, _requestTimeout), _name);
    auto capabilities = client->initializeWithTimeout(_handshakeTimeout);
    if (!capabilities)
    {
        if (auto closed = client->close(); !closed)
            log::warning("Cleaning up endpoint '{}' failed: {}", _name, closed.error());
        return std::unexpected(capabilities.error());
    }

    return std::make_shared<SessionActor>(std::move(client));
}

auto RemoteEndpoint::start() -> VoidResult
{
    if (_slot.hasSession())
        return makeError(ErrorCode::AlreadyRunning, std::format("Endpoint '{}' is already running", _name));

    log::info("Starting remote MCP endpoint '{}' at {}", _name, _url);

    auto handle = connect();
    if (!handle)
        return std::unexpected(handle.error());

    if (auto tools = (*handle)->listTools(_handshakeTimeout); tools)
        log::info("Connected to remote endpoint '{}' ({} tools available)", _name, tools->size());
    else
        log::warning("Connected to remote endpoint '{}' but failed to list tools: {}", _name, tools.error());

    _slot.set(std::move(*handle));
    return {};
}

auto RemoteEndpoint::stop() -> VoidResult
{
    auto handle = _slot.take();
    if (!handle)
        return makeError(ErrorCode::NotRunning, std::format("Endpoint '{}' is not running", _name));

    // A failed session cannot be stopped; dropping the handle closes it.
    if (auto const state = handle->state(); state.state == RuntimeState::Failed)
    {
        log::info("Discarding failed session of remote endpoint '{}': {}", _name, state.reason);
        return {};
    }

    log::info("Stopping remote MCP endpoint '{}'", _name);
    return handle->stop();
}

auto RemoteEndpoint::getOrCreateClient() -> Result<ClientHandle>
{
    if (auto cached = _slot.get(_name); cached)
        return cached;

    log::info("Creating one-off HTTP session for remote endpoint '{}'", _name);
    return connect();
}

void RemoteEndpoint::discardSession()
{
    if (auto stale = _slot.take())
        log::debug("Discarding stale session of endpoint '{}'", _name);
}

} // namespace toolgate
