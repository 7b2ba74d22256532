// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <routing/PathRouter.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace toolgate
{

/// @brief Outcome of one bridged JSON-RPC exchange.
struct BridgeReply
{
    /// Reply body; empty when the input consisted of notifications only.
    std::optional<nlohmann::json> body;
    /// Session id issued by an initialize request.
    std::optional<std::string> sessionId;
};

/// @brief Converts a content item to the wire shape exposed by the bridge.
///
/// Resources are not forwarded as such; they become a text item naming the URI.
[[nodiscard]] auto toBridgeContent(const ContentItem& item) -> nlohmann::json;

/// @brief MCP server facade in front of a local endpoint's session actor.
///
/// Answers initialize and ping itself and forwards tools/list and tools/call to the
/// endpoint routed at @p path, applying the endpoint's tool filter in both directions.
class ToolBridge
{
  public:
    ToolBridge(const PathRouter& router, std::string path, std::chrono::milliseconds requestTimeout);

    /// @brief Handles a single JSON-RPC message or a batch.
    [[nodiscard]] auto handle(const nlohmann::json& message) const -> BridgeReply;

  private:
    [[nodiscard]] auto handleOne(const nlohmann::json& message, std::optional<std::string>& sessionId) const
        -> std::optional<nlohmann::json>;
    [[nodiscard]] auto initialize(const nlohmann::json& params, std::optional<std::string>& sessionId) const
        -> nlohmann::json;
    [[nodiscard]] auto listTools() const -> Result<nlohmann::json>;
    [[nodiscard]] auto callTool(const nlohmann::json& params) const -> Result<nlohmann::json>;

    const PathRouter& _router;
    std::string _path;
    std::chrono::milliseconds _requestTimeout;
};

} // namespace toolgate
