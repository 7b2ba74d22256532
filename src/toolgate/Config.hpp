// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <endpoint/EndpointConfig.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief HTTP listener configuration section.
struct HttpConfig
{
    std::string host = "127.0.0.1";
    unsigned short port = 3000;
};

/// @brief Logging configuration section.
struct LoggingConfig
{
    /// One of trace, debug, info, warn, error.
    std::string level = "info";
    /// One of pretty, json.
    std::string format = "pretty";
};

/// @brief MCP session configuration section.
struct McpConfig
{
    /// Upper bound for a single tool request, in seconds. Must be at least 5.
    int requestTimeoutSecs = 30;
    int handshakeTimeoutSecs = 30;
    int restartDelayMs = 500;
};

/// @brief Top-level gateway configuration.
struct GatewayConfig
{
    HttpConfig http;
    LoggingConfig logging;
    McpConfig mcp;
    std::vector<EndpointConfig> endpoints;
};

/// @brief Builds a configuration from a parsed JSON document and validates it.
/// @return The configuration or a ConfigError.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<GatewayConfig>;

/// @brief Loads and validates the configuration file at @p path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<GatewayConfig>;

/// @brief Checks cross-field constraints: unique names and paths, path characters,
/// kind-specific required fields, logging values and timeouts.
[[nodiscard]] auto validateConfig(const GatewayConfig& config) -> VoidResult;

} // namespace toolgate
