// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>

namespace toolgate
{

constexpr auto ProductName = std::string_view { "toolgate" };
constexpr auto ProductVersion = std::string_view { "0.1.0" };
constexpr auto ProductDescription = std::string_view { "HTTP gateway for MCP tool servers" };

} // namespace toolgate
