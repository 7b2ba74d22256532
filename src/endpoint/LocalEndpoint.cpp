// SPDX-License-Identifier: Apache-2.0
#include "LocalEndpoint.hpp"

#include <core/Log.hpp>
#include <mcp/McpClient.hpp>

#include <format>

namespace toolgate
{

LocalEndpoint::LocalEndpoint(std::string name,
                             std::string path,
                             StdioTransportConfig process,
                             bool autoStart,
                             std::chrono::milliseconds handshakeTimeout):
    _name(std::move(name)),
    _path(std::move(path)),
    _process(std::move(process)),
    _autoStart(autoStart),
    _handshakeTimeout(handshakeTimeout)
{
}

auto LocalEndpoint::start() -> VoidResult
{
    if (_slot.hasSession())
        return makeError(ErrorCode::AlreadyRunning, std::format("Endpoint '{}' is already running", _name));

    log::info("Starting local MCP endpoint '{}': {}", _name, _process.command);

    auto transport = std::make_unique<StdioTransport>();
    if (auto spawned = transport->start(_process); !spawned)
        return makeError(ErrorCode::StartFailed, std::format("{}: {}", _name, spawned.error().message));

    auto client = std::make_unique<McpClient>(std::move(transport), _name);
    auto capabilities = client->initializeWithTimeout(_handshakeTimeout);
    if (!capabilities)
    {
        // Terminate and reap the child before reporting the failure.
        if (auto closed = client->close(); !closed)
            log::warning("Cleaning up endpoint '{}' failed: {}", _name, closed.error());
        return std::unexpected(capabilities.error());
    }

    _slot.set(std::make_shared<SessionActor>(std::move(client)));
    log::info("Local MCP endpoint '{}' is up ({} v{})",
              _name,
              capabilities->serverName,
              capabilities->serverVersion);
    return {};
}

auto LocalEndpoint::stop() -> VoidResult
{
    auto handle = _slot.take();
    if (!handle)
        return makeError(ErrorCode::NotRunning, std::format("Endpoint '{}' is not running", _name));

    // A failed session cannot be stopped; dropping the handle closes it.
    if (auto const state = handle->state(); state.state == RuntimeState::Failed)
    {
        log::info("Discarding failed session of local endpoint '{}': {}", _name, state.reason);
        return {};
    }

    log::info("Stopping local MCP endpoint '{}'", _name);
    return handle->stop();
}

auto LocalEndpoint::getOrCreateClient() -> Result<ClientHandle>
{
    return _slot.get(_name);
}

void LocalEndpoint::discardSession()
{
    if (auto stale = _slot.take())
        log::debug("Discarding stale session of endpoint '{}'", _name);
}

} // namespace toolgate
