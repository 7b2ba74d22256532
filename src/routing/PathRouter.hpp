// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <endpoint/EndpointManager.hpp>
#include <routing/ToolFilter.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolgate
{

/// @brief Endpoint selected by a routing key.
struct Route
{
    std::string endpointName;
    std::optional<ToolFilter> toolFilter;
};

/// @brief Live session plus the filter that applies to it.
struct RoutedClient
{
    ClientHandle client;
    std::optional<ToolFilter> toolFilter;
};

/// @brief Maps routing keys (endpoint paths) to endpoints and their sessions.
class PathRouter
{
  public:
    explicit PathRouter(EndpointManager& manager): _manager(manager) {}

    /// @return The route, or NotFound for an unknown path.
    [[nodiscard]] auto getRoute(std::string_view path) const -> Result<Route>;

    /// @return The routed session, or the manager's NotFound / NotRunning / RuntimeFailed.
    [[nodiscard]] auto getClient(std::string_view path) const -> Result<RoutedClient>;

    /// @brief All (path, endpoint name) pairs, ordered by endpoint name.
    [[nodiscard]] auto listRoutes() const -> std::vector<std::pair<std::string, std::string>>;

  private:
    EndpointManager& _manager;
};

} // namespace toolgate
