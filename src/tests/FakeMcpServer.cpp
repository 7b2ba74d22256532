// SPDX-License-Identifier: Apache-2.0
// Minimal MCP server speaking newline framed JSON-RPC over stdio, used by the tests.
//
// Options:
//   --hang         read requests but never answer (handshake timeout tests)
//   --ping-first   send a ping and a notification before answering tools/list
//   --page-size N  tools per tools/list page (default 2)

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

namespace
{

struct Options
{
    bool hang = false;
    bool pingFirst = false;
    bool badInitialize = false; // answer initialize with a non-object result
    std::size_t pageSize = 2;
};

struct FakeTool
{
    std::string_view name;
    std::string_view description;
};

constexpr auto Tools = std::array<FakeTool, 6> { {
    { "echo", "Returns the given text" },
    { "image", "Returns a tiny PNG" },
    { "resource", "Returns a resource reference" },
    { "slow", "Sleeps for 'ms' milliseconds, then answers" },
    { "fail", "Always reports a tool error" },
    { "secret", "Should normally be filtered out" },
} };

void write(const nlohmann::json& message)
{
    std::cout << message.dump() << '\n' << std::flush;
}

auto result(const nlohmann::json& id, nlohmann::json value) -> nlohmann::json
{
    return { { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(value) } };
}

auto error(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return { { "jsonrpc", "2.0" }, { "id", id }, { "error", { { "code", code }, { "message", message } } } };
}

auto listTools(const nlohmann::json& params, std::size_t pageSize) -> nlohmann::json
{
    auto start = std::size_t { 0 };
    if (params.is_object() && params.contains("cursor") && params["cursor"].is_string())
        start = std::stoul(params["cursor"].get<std::string>());

    auto tools = nlohmann::json::array();
    for (auto i = start; i < Tools.size() && i < start + pageSize; ++i)
    {
        tools.push_back({
            { "name", Tools[i].name },
            { "description", Tools[i].description },
            { "inputSchema", { { "type", "object" }, { "properties", nlohmann::json::object() } } },
        });
    }

    auto page = nlohmann::json { { "tools", std::move(tools) } };
    if (start + pageSize < Tools.size())
        page["nextCursor"] = std::to_string(start + pageSize);
    return page;
}

auto text(std::string_view value) -> nlohmann::json
{
    return { { "type", "text" }, { "text", value } };
}

auto callTool(const nlohmann::json& id, const nlohmann::json& params) -> nlohmann::json
{
    auto const name = params.value("name", std::string {});
    auto const arguments = params.value("arguments", nlohmann::json::object());

    if (name == "echo")
        return result(id, { { "content", { text(arguments.value("text", std::string {})) } } });

    if (name == "image")
        return result(id,
                      { { "content",
                          { { { "type", "image" }, { "data", "iVBORw0KGgo=" }, { "mimeType", "image/png" } } } } });

    if (name == "resource")
        return result(id,
                      { { "content",
                          { { { "type", "resource" },
                              { "resource",
                                { { "uri", "file:///tmp/report.txt" },
                                  { "mimeType", "text/plain" },
                                  { "text", "contents" } } } },
                            { { "type", "audio" }, { "data", "AAAA" }, { "mimeType", "audio/wav" } } } } });

    if (name == "slow")
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(arguments.value("ms", 2000)));
        return result(id, { { "content", { text("done") } } });
    }

    if (name == "fail")
        return result(id, { { "content", { text("tool failed") } }, { "isError", true } });

    if (name == "secret")
        return result(id, { { "content", { text("classified") } } });

    return error(id, -32602, "Unknown tool: " + name);
}

/// Sends a ping to the client and waits for its reply.
auto pingClient() -> bool
{
    write({ { "jsonrpc", "2.0" }, { "method", "notifications/message" }, { "params", { { "level", "info" } } } });
    write({ { "jsonrpc", "2.0" }, { "id", "srv-1" }, { "method", "ping" } });

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        auto const message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_object() && message.value("id", nlohmann::json {}) == "srv-1")
            return message.contains("result");
    }
    return false;
}

} // namespace

int main(int argc, char** argv)
{
    auto options = Options {};
    for (auto i = 1; i < argc; ++i)
    {
        auto const arg = std::string_view(argv[i]);
        if (arg == "--hang")
            options.hang = true;
        else if (arg == "--ping-first")
            options.pingFirst = true;
        else if (arg == "--bad-initialize")
            options.badInitialize = true;
        else if (arg == "--page-size" && i + 1 < argc)
            options.pageSize = std::strtoul(argv[++i], nullptr, 10);
    }

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (options.hang)
            continue;

        auto const message = nlohmann::json::parse(line, nullptr, false);
        if (!message.is_object() || !message.contains("method"))
            continue;

        auto const method = message["method"].get<std::string>();
        if (!message.contains("id"))
            continue; // notification

        auto const& id = message["id"];
        auto const params = message.value("params", nlohmann::json::object());

        if (method == "initialize" && options.badInitialize)
            write(result(id, nlohmann::json::array()));
        else if (method == "initialize")
        {
            write(result(id,
                         {
                             { "protocolVersion", "2024-11-05" },
                             { "capabilities", { { "tools", nlohmann::json::object() } } },
                             { "serverInfo", { { "name", "fake-mcp-server" }, { "version", "1.0.0" } } },
                         }));
        }
        else if (method == "tools/list")
        {
            if (options.pingFirst && !pingClient())
                return 1;
            write(result(id, listTools(params, options.pageSize)));
        }
        else if (method == "tools/call")
            write(callTool(id, params));
        else if (method == "ping")
            write(result(id, nlohmann::json::object()));
        else
            write(error(id, -32601, "Method not found: " + method));
    }

    return 0;
}
