// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolgate
{

/// @brief Defines a tool offered by a backend.
struct ToolDefinition
{
    std::string name;
    std::optional<std::string> description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

/// @brief A request to invoke a tool.
struct ToolCallRequest
{
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

/// @brief Plain text content.
struct TextContent
{
    std::string text;
};

/// @brief Base64 encoded image content.
struct ImageContent
{
    std::string data;
    std::string mimeType;
};

/// @brief Reference to a resource; the payload itself is never decoded.
struct ResourceContent
{
    std::string uri;
    std::optional<std::string> mimeType;
};

/// @brief One item of a tool call result.
using ContentItem = std::variant<TextContent, ImageContent, ResourceContent>;

/// @brief The result of a tool invocation.
struct ToolCallResponse
{
    std::vector<ContentItem> content;
    std::optional<bool> isError;
};

/// @brief Serializes a tool definition as {name, description?, inputSchema}.
[[nodiscard]] auto toJson(const ToolDefinition& tool) -> nlohmann::json;

/// @brief Serializes a content item as a "type"-tagged object.
[[nodiscard]] auto toJson(const ContentItem& item) -> nlohmann::json;

/// @brief Serializes a tool call response as {content: [...], isError?}.
[[nodiscard]] auto toJson(const ToolCallResponse& response) -> nlohmann::json;

/// @brief Parses a tool call request body of the shape {name, arguments?}.
/// @return The request or an InvalidRequest error.
[[nodiscard]] auto parseToolCallRequest(const nlohmann::json& body) -> Result<ToolCallRequest>;

} // namespace toolgate
