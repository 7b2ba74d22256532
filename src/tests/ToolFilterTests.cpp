// SPDX-License-Identifier: Apache-2.0
#include <routing/ToolFilter.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolgate;

namespace
{
auto tools(std::initializer_list<std::string_view> names) -> std::vector<ToolDefinition>
{
    auto out = std::vector<ToolDefinition> {};
    for (auto const name: names)
        out.push_back(ToolDefinition { .name = std::string(name), .description = std::nullopt, .inputSchema = {} });
    return out;
}

auto names(const std::vector<ToolDefinition>& list) -> std::vector<std::string>
{
    auto out = std::vector<std::string> {};
    for (const auto& tool: list)
        out.push_back(tool.name);
    return out;
}
} // namespace

TEST_CASE("ToolFilter include only", "[filter]")
{
    auto const filter = ToolFilter { .include = ToolNameSet { "a", "b" }, .exclude = std::nullopt };
    CHECK(filter.allows("a"));
    CHECK(filter.allows("b"));
    CHECK(!filter.allows("c"));
}

TEST_CASE("ToolFilter exclude only", "[filter]")
{
    auto const filter = ToolFilter { .include = std::nullopt, .exclude = ToolNameSet { "rm" } };
    CHECK(!filter.allows("rm"));
    CHECK(filter.allows("ls"));
}

TEST_CASE("ToolFilter exclude wins over include", "[filter]")
{
    auto const filter = ToolFilter { .include = ToolNameSet { "a", "b" }, .exclude = ToolNameSet { "b" } };
    CHECK(filter.allows("a"));
    CHECK(!filter.allows("b"));
    CHECK(!filter.allows("c"));
}

TEST_CASE("ToolFilter with an empty include set is unrestricted", "[filter]")
{
    auto const filter = ToolFilter { .include = ToolNameSet {}, .exclude = ToolNameSet {} };
    CHECK(filter.allows("anything"));
}

TEST_CASE("isToolAllowed without a filter allows everything", "[filter]")
{
    CHECK(isToolAllowed("x", std::nullopt));
    CHECK(!isToolAllowed("x", ToolFilter { .include = ToolNameSet { "y" }, .exclude = std::nullopt }));
}

TEST_CASE("applyToolFilter keeps the order of allowed tools", "[filter]")
{
    auto const filter = ToolFilter { .include = ToolNameSet { "c", "a", "d" }, .exclude = ToolNameSet { "d" } };
    CHECK(names(applyToolFilter(tools({ "a", "b", "c", "d" }), filter)) == std::vector<std::string> { "a", "c" });
    CHECK(names(applyToolFilter(tools({ "b", "a" }), std::nullopt)) == std::vector<std::string> { "b", "a" });
}
