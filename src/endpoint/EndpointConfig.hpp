// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <routing/ToolFilter.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolgate
{

/// @brief Settings of an endpoint backed by a spawned subprocess.
struct LocalEndpointSettings
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool autoStart = true;
};

/// @brief Settings of an endpoint reached over streamable HTTP.
struct RemoteEndpointSettings
{
    std::string url;
};

/// @brief One configured endpoint.
struct EndpointConfig
{
    std::string name;
    std::optional<std::string> path;
    std::variant<LocalEndpointSettings, RemoteEndpointSettings> settings;
    std::optional<ToolFilter> tools;

    /// @brief The routing key; defaults to the endpoint name.
    [[nodiscard]] auto effectivePath() const -> const std::string& { return path ? *path : name; }
};

} // namespace toolgate
