// SPDX-License-Identifier: Apache-2.0
#include "ToolFilter.hpp"

#include <algorithm>

namespace toolgate
{

auto ToolFilter::allows(std::string_view toolName) const -> bool
{
    if (include && !include->empty() && !include->contains(toolName))
        return false;

    return !(exclude && exclude->contains(toolName));
}

auto isToolAllowed(std::string_view toolName, const std::optional<ToolFilter>& filter) -> bool
{
    return !filter || filter->allows(toolName);
}

auto applyToolFilter(std::vector<ToolDefinition> tools, const std::optional<ToolFilter>& filter)
    -> std::vector<ToolDefinition>
{
    if (!filter)
        return tools;

    std::erase_if(tools, [&](const ToolDefinition& tool) { return !filter->allows(tool.name); });
    return tools;
}

} // namespace toolgate
