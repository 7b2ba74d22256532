// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <routing/ToolFilter.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief How the gateway talks to an endpoint.
enum class EndpointKind
{
    Local,
    Remote,
};

/// @brief Lifecycle status of an endpoint.
///
/// Stopped -> Starting -> Running -> Stopping -> Stopped, and any active state -> Failed.
/// A Failed endpoint recovers through Starting (start) or Stopping (stop).
enum class EndpointStatus
{
    Starting,
    Running,
    Stopping,
    Stopped,
    Failed,
};

[[nodiscard]] auto toString(EndpointKind kind) -> std::string_view;
[[nodiscard]] auto toString(EndpointStatus status) -> std::string_view;

/// @brief Returns true if the registry accepts a status write from @p from to @p to.
[[nodiscard]] auto isValidTransition(EndpointStatus from, EndpointStatus to) -> bool;

/// @brief Snapshot of one registered endpoint.
struct EndpointInfo
{
    std::string name;
    std::string path;
    EndpointKind kind = EndpointKind::Local;
    EndpointStatus status = EndpointStatus::Stopped;
    std::optional<ToolFilter> toolFilter;
};

/// @brief Serializes the caller-visible fields {name, path, type, status}.
[[nodiscard]] auto toJson(const EndpointInfo& info) -> nlohmann::json;

/// @brief Concurrency-safe table of endpoint descriptors, indexed by name and path.
///
/// Every entry carries its own lock, so status writes for one endpoint never wait
/// for another endpoint. The table lock is only taken exclusively on registration.
class EndpointRegistry
{
  public:
    /// @brief Adds an endpoint in status Stopped.
    /// @return AlreadyExists if the name or the path is taken; the existing entry is untouched.
    [[nodiscard]] auto registerEndpoint(std::string name,
                                        std::string path,
                                        EndpointKind kind,
                                        std::optional<ToolFilter> toolFilter = std::nullopt) -> VoidResult;

    [[nodiscard]] auto get(std::string_view name) const -> Result<EndpointInfo>;
    [[nodiscard]] auto getByPath(std::string_view path) const -> Result<EndpointInfo>;

    /// @brief Writes a new status.
    /// @return NotFound for unknown names, InvalidTransition for writes outside the status graph.
    [[nodiscard]] auto setStatus(std::string_view name, EndpointStatus status) -> VoidResult;

    /// @brief Returns a snapshot of all endpoints ordered by name.
    [[nodiscard]] auto list() const -> std::vector<EndpointInfo>;

  private:
    struct Entry
    {
        mutable std::mutex mutex;
        EndpointInfo info;
    };

    [[nodiscard]] auto find(std::string_view name) const -> std::shared_ptr<Entry>;

    mutable std::shared_mutex _mutex;
    std::map<std::string, std::shared_ptr<Entry>, std::less<>> _entries;
    std::map<std::string, std::string, std::less<>> _pathIndex;
};

} // namespace toolgate
