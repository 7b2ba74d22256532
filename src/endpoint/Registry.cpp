// SPDX-License-Identifier: Apache-2.0
#include "Registry.hpp"

#include <core/Log.hpp>

#include <format>

namespace toolgate
{

auto toString(EndpointKind kind) -> std::string_view
{
    switch (kind)
    {
        case EndpointKind::Local: return "local";
        case EndpointKind::Remote: return "remote";
    }
    return "unknown";
}

auto toString(EndpointStatus status) -> std::string_view
{
    switch (status)
    {
        case EndpointStatus::Starting: return "starting";
        case EndpointStatus::Running: return "running";
        case EndpointStatus::Stopping: return "stopping";
        case EndpointStatus::Stopped: return "stopped";
        case EndpointStatus::Failed: return "failed";
    }
    return "unknown";
}

auto isValidTransition(EndpointStatus from, EndpointStatus to) -> bool
{
    using enum EndpointStatus;

    if (from == to)
        return true;

    switch (to)
    {
        case Starting: return from == Stopped || from == Failed;
        case Running: return from == Starting;
        case Stopping: return from == Running || from == Failed;
        case Stopped: return from == Stopping;
        case Failed: return from == Starting || from == Running || from == Stopping;
    }
    return false;
}

auto toJson(const EndpointInfo& info) -> nlohmann::json
{
    return nlohmann::json {
        { "name", info.name },
        { "path", info.path },
        { "type", toString(info.kind) },
        { "status", toString(info.status) },
    };
}

auto EndpointRegistry::registerEndpoint(std::string name,
                                        std::string path,
                                        EndpointKind kind,
                                        std::optional<ToolFilter> toolFilter) -> VoidResult
{
    auto lock = std::unique_lock(_mutex);

    if (_entries.contains(name))
        return makeError(ErrorCode::AlreadyExists, std::format("Endpoint '{}' already exists", name));

    if (auto const existing = _pathIndex.find(path); existing != _pathIndex.end())
        return makeError(ErrorCode::AlreadyExists,
                         std::format("Path '{}' of endpoint '{}' is already used by endpoint '{}'",
                                     path,
                                     name,
                                     existing->second));

    auto entry = std::make_shared<Entry>();
    entry->info = EndpointInfo {
        .name = name,
        .path = path,
        .kind = kind,
        .status = EndpointStatus::Stopped,
        .toolFilter = std::move(toolFilter),
    };

    log::debug("Registered {} endpoint '{}' at path '{}'", toString(kind), name, path);
    _pathIndex.emplace(std::move(path), name);
    _entries.emplace(std::move(name), std::move(entry));
    return {};
}

auto EndpointRegistry::find(std::string_view name) const -> std::shared_ptr<Entry>
{
    auto lock = std::shared_lock(_mutex);
    if (auto const i = _entries.find(name); i != _entries.end())
        return i->second;
    return nullptr;
}

auto EndpointRegistry::get(std::string_view name) const -> Result<EndpointInfo>
{
    auto const entry = find(name);
    if (!entry)
        return makeError(ErrorCode::NotFound, std::format("Endpoint '{}' not found", name));

    auto lock = std::lock_guard(entry->mutex);
    return entry->info;
}

auto EndpointRegistry::getByPath(std::string_view path) const -> Result<EndpointInfo>
{
    auto name = std::string {};
    {
        auto lock = std::shared_lock(_mutex);
        auto const i = _pathIndex.find(path);
        if (i == _pathIndex.end())
            return makeError(ErrorCode::NotFound, std::format("No endpoint at path '{}'", path));
        name = i->second;
    }
    return get(name);
}

auto EndpointRegistry::setStatus(std::string_view name, EndpointStatus status) -> VoidResult
{
    auto const entry = find(name);
    if (!entry)
        return makeError(ErrorCode::NotFound, std::format("Endpoint '{}' not found", name));

    auto lock = std::lock_guard(entry->mutex);
    auto const current = entry->info.status;
    if (!isValidTransition(current, status))
        return makeError(ErrorCode::InvalidTransition,
                         std::format("Endpoint '{}' cannot go from {} to {}",
                                     name,
                                     toString(current),
                                     toString(status)));

    entry->info.status = status;
    log::trace("Endpoint '{}': {} -> {}", name, toString(current), toString(status));
    return {};
}

auto EndpointRegistry::list() const -> std::vector<EndpointInfo>
{
    auto entries = std::vector<std::shared_ptr<Entry>> {};
    {
        auto lock = std::shared_lock(_mutex);
        entries.reserve(_entries.size());
        for (const auto& [_, entry]: _entries)
            entries.push_back(entry);
    }

    auto infos = std::vector<EndpointInfo> {};
    infos.reserve(entries.size());
    for (const auto& entry: entries)
    {
        auto lock = std::lock_guard(entry->mutex);
        infos.push_back(entry->info);
    }
    return infos;
}

} // namespace toolgate
