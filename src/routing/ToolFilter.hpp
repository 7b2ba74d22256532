// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

using ToolNameSet = std::set<std::string, std::less<>>;

/// @brief Include/exclude policy narrowing which tools of an endpoint are exposed.
///
/// A name is allowed if the include set is absent or empty or contains it, and the
/// exclude set does not contain it. Exclusion always wins.
struct ToolFilter
{
    std::optional<ToolNameSet> include;
    std::optional<ToolNameSet> exclude;

    [[nodiscard]] auto allows(std::string_view toolName) const -> bool;
};

/// @brief Returns true if @p toolName passes @p filter; no filter allows everything.
[[nodiscard]] auto isToolAllowed(std::string_view toolName, const std::optional<ToolFilter>& filter) -> bool;

/// @brief Drops every tool that @p filter rejects, keeping the order of the rest.
[[nodiscard]] auto applyToolFilter(std::vector<ToolDefinition> tools, const std::optional<ToolFilter>& filter)
    -> std::vector<ToolDefinition>;

} // namespace toolgate
