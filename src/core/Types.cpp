// SPDX-License-Identifier: Apache-2.0
#include "Types.hpp"

#include <core/Overloaded.hpp>

#include <format>

namespace toolgate
{

auto toJson(const ToolDefinition& tool) -> nlohmann::json
{
    auto out = nlohmann::json {
        { "name", tool.name },
        { "inputSchema", tool.inputSchema },
    };
    if (tool.description)
        out["description"] = *tool.description;
    return out;
}

auto toJson(const ContentItem& item) -> nlohmann::json
{
    return std::visit(Overloaded {
                          [](const TextContent& text) -> nlohmann::json {
                              return { { "type", "text" }, { "text", text.text } };
                          },
                          [](const ImageContent& image) -> nlohmann::json {
                              return { { "type", "image" }, { "data", image.data }, { "mimeType", image.mimeType } };
                          },
                          [](const ResourceContent& resource) -> nlohmann::json {
                              auto out = nlohmann::json { { "type", "resource" }, { "uri", resource.uri } };
                              if (resource.mimeType)
                                  out["mimeType"] = *resource.mimeType;
                              return out;
                          },
                      },
                      item);
}

auto toJson(const ToolCallResponse& response) -> nlohmann::json
{
    auto content = nlohmann::json::array();
    for (const auto& item: response.content)
        content.push_back(toJson(item));

    auto out = nlohmann::json { { "content", std::move(content) } };
    if (response.isError)
        out["isError"] = *response.isError;
    return out;
}

auto parseToolCallRequest(const nlohmann::json& body) -> Result<ToolCallRequest>
{
    if (!body.is_object())
        return makeError(ErrorCode::InvalidRequest, "Invalid request format: expected a JSON object");

    if (!body.contains("name") || !body["name"].is_string())
        return makeError(ErrorCode::InvalidRequest, "Invalid request format: missing string field 'name'");

    auto request = ToolCallRequest { .name = body["name"].get<std::string>() };

    if (body.contains("arguments") && !body["arguments"].is_null())
    {
        if (!body["arguments"].is_object())
            return makeError(ErrorCode::InvalidRequest,
                             std::format("Invalid request format: 'arguments' of tool '{}' must be an object",
                                         request.name));
        request.arguments = body["arguments"];
    }

    return request;
}

} // namespace toolgate
