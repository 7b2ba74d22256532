// SPDX-License-Identifier: Apache-2.0
#include "PathRouter.hpp"

namespace toolgate
{

auto PathRouter::getRoute(std::string_view path) const -> Result<Route>
{
    return _manager.getEndpointInfoByPath(path).transform([](EndpointInfo info) {
        return Route { .endpointName = std::move(info.name), .toolFilter = std::move(info.toolFilter) };
    });
}

auto PathRouter::getClient(std::string_view path) const -> Result<RoutedClient>
{
    return getRoute(path).and_then([this](Route route) -> Result<RoutedClient> {
        return _manager.getClient(route.endpointName).transform([&](ClientHandle client) {
            return RoutedClient { .client = std::move(client), .toolFilter = std::move(route.toolFilter) };
        });
    });
}

auto PathRouter::listRoutes() const -> std::vector<std::pair<std::string, std::string>>
{
    auto routes = std::vector<std::pair<std::string, std::string>> {};
    for (auto& info: _manager.listEndpoints())
        routes.emplace_back(std::move(info.path), std::move(info.name));
    return routes;
}

} // namespace toolgate
