// SPDX-License-Identifier: Apache-2.0
#include "EndpointManager.hpp"

#include <core/Log.hpp>
#include <core/Overloaded.hpp>

#include <format>
#include <thread>

namespace toolgate
{

EndpointManager::EndpointManager(ManagerOptions options): _options(options)
{
}

EndpointManager::~EndpointManager() = default;

auto EndpointManager::addEndpoint(const EndpointConfig& config) -> VoidResult
{
    auto const& path = config.effectivePath();
    auto const kind = std::holds_alternative<LocalEndpointSettings>(config.settings) ? EndpointKind::Local
                                                                                       : EndpointKind::Remote;

    auto lock = std::unique_lock(_mutex);
    if (auto registered = _registry.registerEndpoint(config.name, path, kind, config.tools); !registered)
        return registered;

    auto managed = std::visit(
        Overloaded {
            [&](const LocalEndpointSettings& local) {
                return std::make_shared<Managed>(std::in_place_type<LocalEndpoint>,
                                                 config.name,
                                                 path,
                                                 StdioTransportConfig {
                                                     .command = local.command,
                                                     .args = local.args,
                                                     .env = local.env,
                                                 },
                                                 local.autoStart,
                                                 _options.handshakeTimeout);
            },
            [&](const RemoteEndpointSettings& remote) {
                return std::make_shared<Managed>(std::in_place_type<RemoteEndpoint>,
                                                 config.name,
                                                 path,
                                                 remote.url,
                                                 _options.handshakeTimeout,
                                                 _options.requestTimeout);
            },
        },
        config.settings);

    _endpoints.emplace(config.name, std::move(managed));
    log::info("Configured {} MCP endpoint '{}' at /mcp/{}", toString(kind), config.name, path);
    return {};
}

auto EndpointManager::initFromConfig(const std::vector<EndpointConfig>& endpoints) -> VoidResult
{
    for (const auto& config: endpoints)
    {
        if (auto added = addEndpoint(config); !added)
            return added;
    }

    for (const auto& config: endpoints)
    {
        auto const* local = std::get_if<LocalEndpointSettings>(&config.settings);
        if (!local || !local->autoStart)
            continue;

        if (auto started = start(config.name); !started)
            log::error("Failed to auto-start endpoint '{}': {}", config.name, started.error());
    }

    return {};
}

auto EndpointManager::find(std::string_view name) const -> Result<std::shared_ptr<Managed>>
{
    auto lock = std::shared_lock(_mutex);
    if (auto const i = _endpoints.find(name); i != _endpoints.end())
        return i->second;
    return makeError(ErrorCode::NotFound, std::format("Endpoint '{}' not found", name));
}

auto EndpointManager::start(std::string_view name) -> VoidResult
{
    auto managed = find(name);
    if (!managed)
        return std::unexpected(managed.error());

    auto lock = std::lock_guard((*managed)->lifecycle);

    auto info = _registry.get(name);
    if (!info)
        return std::unexpected(info.error());
    if (info->status == EndpointStatus::Running)
        return makeError(ErrorCode::AlreadyRunning, std::format("Endpoint '{}' is already running", name));

    if (auto starting = _registry.setStatus(name, EndpointStatus::Starting); !starting)
        return starting;

    auto result = std::visit(
        [](auto& endpoint) -> VoidResult {
            // A Failed endpoint may still hold the session that failed.
            endpoint.discardSession();
            return endpoint.start();
        },
        (*managed)->endpoint);

    if (!result)
    {
        markFailed(name);
        log::error("Failed to start endpoint '{}': {}", name, result.error());
        return result;
    }

    if (auto running = _registry.setStatus(name, EndpointStatus::Running); !running)
        return running;

    log::info("Endpoint '{}' is running", name);
    return {};
}

auto EndpointManager::stop(std::string_view name) -> VoidResult
{
    auto managed = find(name);
    if (!managed)
        return std::unexpected(managed.error());

    auto lock = std::lock_guard((*managed)->lifecycle);
    return stopLocked(name, **managed);
}

auto EndpointManager::stopLocked(std::string_view name, Managed& managed) -> VoidResult
{
    auto info = _registry.get(name);
    if (!info)
        return std::unexpected(info.error());
    if (info->status == EndpointStatus::Stopped)
        return makeError(ErrorCode::NotRunning, std::format("Endpoint '{}' is not running", name));

    auto const hasSession = std::visit([](const auto& endpoint) { return endpoint.isStarted(); }, managed.endpoint);

    if (auto stopping = _registry.setStatus(name, EndpointStatus::Stopping); !stopping)
        return stopping;

    if (info->status == EndpointStatus::Failed && !hasSession)
    {
        // Nothing is alive; only the bookkeeping needs to be reset.
        if (auto stopped = _registry.setStatus(name, EndpointStatus::Stopped); !stopped)
            return stopped;
        log::info("Endpoint '{}' reset from failed to stopped", name);
        return {};
    }

    auto result = std::visit([](auto& endpoint) { return endpoint.stop(); }, managed.endpoint);
    if (!result)
    {
        markFailed(name);
        log::error("Failed to stop endpoint '{}': {}", name, result.error());
        return result;
    }

    if (auto stopped = _registry.setStatus(name, EndpointStatus::Stopped); !stopped)
        return stopped;

    log::info("Endpoint '{}' stopped", name);
    return {};
}

auto EndpointManager::restart(std::string_view name) -> VoidResult
{
    log::info("Restarting endpoint '{}'", name);
    return stop(name).and_then([&]() -> VoidResult {
        std::this_thread::sleep_for(_options.restartDelay);
        return start(name);
    });
}

void EndpointManager::shutdown()
{
    auto const endpoints = _registry.list();
    log::info("Shutting down MCP endpoints");

    for (const auto& info: endpoints)
    {
        if (info.kind != EndpointKind::Local || info.status == EndpointStatus::Stopped)
            continue;

        if (auto stopped = stop(info.name); !stopped)
            log::error("Failed to stop endpoint '{}' during shutdown: {}", info.name, stopped.error());
    }
}

auto EndpointManager::getClient(std::string_view name) -> Result<ClientHandle>
{
    auto managed = find(name);
    if (!managed)
        return std::unexpected(managed.error());

    auto info = _registry.get(name);
    if (!info)
        return std::unexpected(info.error());
    if (info->status != EndpointStatus::Running)
        return makeError(ErrorCode::NotRunning, std::format("Endpoint '{}' is not running", name));

    auto handle = std::visit([](auto& endpoint) { return endpoint.getOrCreateClient(); }, (*managed)->endpoint);
    if (!handle)
        return handle;

    auto const state = (*handle)->state();
    switch (state.state)
    {
        case RuntimeState::Running: return handle;
        case RuntimeState::Stopped:
            return makeError(ErrorCode::NotRunning, std::format("Endpoint '{}' is not running", name));
        case RuntimeState::Failed: break;
    }

    // Keep the registry in line with the dead session, unless a lifecycle change is under way.
    if (auto lock = std::unique_lock((*managed)->lifecycle, std::try_to_lock); lock.owns_lock())
        markFailed(name);

    return makeError(ErrorCode::RuntimeFailed,
                     std::format("MCP runtime for '{}' failed: {}", name, state.reason));
}

void EndpointManager::markFailed(std::string_view name)
{
    if (auto failed = _registry.setStatus(name, EndpointStatus::Failed); !failed)
        log::error("Failed to mark endpoint '{}' as failed: {}", name, failed.error());
}

auto EndpointManager::getEndpointInfo(std::string_view name) const -> Result<EndpointInfo>
{
    return _registry.get(name);
}

auto EndpointManager::getEndpointInfoByPath(std::string_view path) const -> Result<EndpointInfo>
{
    return _registry.getByPath(path);
}

auto EndpointManager::listEndpoints() const -> std::vector<EndpointInfo>
{
    return _registry.list();
}

auto EndpointManager::remoteUrl(std::string_view name) const -> Result<std::string>
{
    return find(name).and_then([&](const std::shared_ptr<Managed>& managed) -> Result<std::string> {
        if (auto const* remote = std::get_if<RemoteEndpoint>(&managed->endpoint))
            return remote->url();
        return makeError(ErrorCode::InvalidRequest, std::format("Endpoint '{}' is not a remote endpoint", name));
    });
}

} // namespace toolgate
