// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace toolgate
{

namespace
{
    auto configError(std::string message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigError, std::move(message));
    }

    /// Reads an integer setting; values that do not fit into an int are rejected.
    auto intSetting(const nlohmann::json& section, std::string_view sectionName, std::string_view key, int current)
        -> Result<int>
    {
        if (auto const value = json::getIntegerOr(section, key, current))
            return *value;
        return configError(std::format("Invalid {}.{}: {}", sectionName, key, section[std::string(key)].dump()));
    }

    auto parseToolFilter(const nlohmann::json& tools) -> Result<ToolFilter>
    {
        if (!tools.is_object())
            return configError("'tools' must be an object with 'include' and/or 'exclude' lists");

        auto filter = ToolFilter {};
        for (auto const* key: { "include", "exclude" })
        {
            if (!tools.contains(key))
                continue;
            if (!tools[key].is_array())
                return configError(std::format("'tools.{}' must be an array of tool names", key));

            auto names = ToolNameSet {};
            for (const auto& name: tools[key])
            {
                if (!name.is_string())
                    return configError(std::format("'tools.{}' must contain strings only", key));
                names.insert(name.get<std::string>());
            }
            (std::string_view(key) == "include" ? filter.include : filter.exclude) = std::move(names);
        }
        return filter;
    }

    auto parseEndpoint(const nlohmann::json& entry) -> Result<EndpointConfig>
    {
        if (!entry.is_object())
            return configError("Endpoint entries must be objects");

        auto config = EndpointConfig {};
        config.name = json::getStringOr(entry, "name", "");
        if (entry.contains("path"))
        {
            if (!entry["path"].is_string())
                return configError(std::format("Endpoint '{}': 'path' must be a string", config.name));
            config.path = entry["path"].get<std::string>();
        }

        auto const type = json::getStringOr(entry, "type", "");
        if (type == "local")
        {
            config.settings = LocalEndpointSettings {
                .command = json::getStringOr(entry, "command", ""),
                .args = json::getStringList(entry, "args"),
                .env = json::getStringMap(entry, "env"),
                .autoStart = json::getBoolOr(entry, "autoStart", true),
            };
        }
        else if (type == "remote")
        {
            config.settings = RemoteEndpointSettings { .url = json::getStringOr(entry, "url", "") };
        }
        else
        {
            return configError(
                std::format("Endpoint '{}' has unknown type '{}' (expected local or remote)", config.name, type));
        }

        if (entry.contains("tools") && !entry["tools"].is_null())
        {
            auto filter = parseToolFilter(entry["tools"]);
            if (!filter)
                return makeError(ErrorCode::ConfigError,
                                 std::format("Endpoint '{}': {}", config.name, filter.error().message));
            config.tools = std::move(*filter);
        }

        return config;
    }
} // namespace

auto parseConfig(const nlohmann::json& root) -> Result<GatewayConfig>
{
    if (!root.is_object())
        return configError("Configuration root must be an object");

    auto config = GatewayConfig {};

    if (root.contains("http"))
    {
        auto const& http = root["http"];
        config.http.host = json::getStringOr(http, "host", config.http.host);
        auto const port = intSetting(http, "http", "port", config.http.port);
        if (!port)
            return std::unexpected(port.error());
        if (*port < 0 || *port > 65535)
            return configError(std::format("Invalid http.port: {}", *port));
        config.http.port = static_cast<unsigned short>(*port);
    }

    if (root.contains("logging"))
    {
        auto const& logging = root["logging"];
        config.logging.level = json::getStringOr(logging, "level", config.logging.level);
        config.logging.format = json::getStringOr(logging, "format", config.logging.format);
    }

    if (root.contains("mcp"))
    {
        auto const& mcp = root["mcp"];
        for (auto [key, target]: { std::pair { "requestTimeoutSecs", &config.mcp.requestTimeoutSecs },
                                   std::pair { "handshakeTimeoutSecs", &config.mcp.handshakeTimeoutSecs },
                                   std::pair { "restartDelayMs", &config.mcp.restartDelayMs } })
        {
            auto value = intSetting(mcp, "mcp", key, *target);
            if (!value)
                return std::unexpected(value.error());
            *target = *value;
        }
    }

    if (root.contains("endpoints"))
    {
        if (!root["endpoints"].is_array())
            return configError("'endpoints' must be an array");

        for (const auto& entry: root["endpoints"])
        {
            auto endpoint = parseEndpoint(entry);
            if (!endpoint)
                return std::unexpected(endpoint.error());
            config.endpoints.push_back(std::move(*endpoint));
        }
    }

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<GatewayConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return configError(std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto root = json::parse(ss.str(), ErrorCode::ConfigError);
    if (!root)
        return configError(std::format("Failed to parse {}: {}", path, root.error().message));

    log::debug("Loaded configuration from {}", path);
    return parseConfig(*root);
}

auto validateConfig(const GatewayConfig& config) -> VoidResult
{
    auto names = std::set<std::string, std::less<>> {};
    auto paths = std::set<std::string, std::less<>> {};

    for (const auto& endpoint: config.endpoints)
    {
        if (endpoint.name.empty())
            return configError("Endpoint name must not be empty");
        if (!names.insert(endpoint.name).second)
            return configError(std::format("Duplicate endpoint name '{}' found in configuration", endpoint.name));

        auto const& path = endpoint.effectivePath();
        if (path.empty())
            return configError(std::format("Endpoint '{}' has an empty path", endpoint.name));
        if (path.find_first_of("/\\.") != std::string::npos)
            return configError(std::format("Endpoint path '{}' contains invalid characters (/, \\, or .)", path));
        if (!paths.insert(path).second)
            return configError(std::format("Duplicate endpoint path '{}' found in configuration", path));

        if (auto const* local = std::get_if<LocalEndpointSettings>(&endpoint.settings); local && local->command.empty())
            return configError(std::format("Local endpoint '{}' requires a command", endpoint.name));
        if (auto const* remote = std::get_if<RemoteEndpointSettings>(&endpoint.settings); remote && remote->url.empty())
            return configError(std::format("Remote endpoint '{}' requires a url", endpoint.name));
    }

    if (!log::parseLevel(config.logging.level))
        return configError(std::format("Invalid log level '{}'. Valid levels: trace, debug, info, warn, error",
                                       config.logging.level));

    if (!log::parseFormat(config.logging.format))
        return configError(
            std::format("Invalid log format '{}'. Valid formats: pretty, json", config.logging.format));

    if (config.mcp.requestTimeoutSecs < 5)
        return configError(std::format("Invalid mcp.requestTimeoutSecs: {}. Minimum value is 5 seconds",
                                       config.mcp.requestTimeoutSecs));

    if (config.mcp.handshakeTimeoutSecs <= 0)
        return configError(std::format("Invalid mcp.handshakeTimeoutSecs: {}", config.mcp.handshakeTimeoutSecs));

    if (config.mcp.restartDelayMs < 0)
        return configError(std::format("Invalid mcp.restartDelayMs: {}", config.mcp.restartDelayMs));

    return {};
}

} // namespace toolgate
