// SPDX-License-Identifier: Apache-2.0
#include <http/ApiHandlers.hpp>
#include <http/HttpServer.hpp>

#include <catch2/catch_test_macros.hpp>

#include "FakeServer.hpp"

#include <format>
#include <thread>

using namespace toolgate;
using namespace std::chrono_literals;
using toolgate::test::fakeEndpoint;

namespace
{
/// Gateway with "files" at /mcp/fs (hides "secret") and an unfiltered "plain" endpoint.
struct ApiFixture
{
    EndpointManager manager { ManagerOptions { .restartDelay = 10ms, .handshakeTimeout = 5s, .requestTimeout = 5s } };
    PathRouter router { manager };
    ApiHandlers handlers { manager, router, 5s };

    ApiFixture()
    {
        auto const filter = ToolFilter { .include = std::nullopt, .exclude = ToolNameSet { "secret" } };
        REQUIRE(manager.addEndpoint(fakeEndpoint("files", "fs", filter)).has_value());
        REQUIRE(manager.addEndpoint(fakeEndpoint("plain")).has_value());
    }

    ~ApiFixture() { manager.shutdown(); }

    auto call(std::string method, std::string target, std::string body = {}) const -> HttpResponse
    {
        return handlers.handle(HttpRequest {
            .method = std::move(method),
            .target = std::move(target),
            .headers = { { "Content-Type", "application/json" } },
            .body = std::move(body),
        });
    }

    static auto bodyOf(const HttpResponse& response) -> nlohmann::json
    {
        return nlohmann::json::parse(response.body);
    }
};
} // namespace

TEST_CASE_METHOD(ApiFixture, "ApiHandlers health and info", "[api]")
{
    auto health = call("GET", "/health");
    CHECK(health.status == 200);
    CHECK(net::findHeader(health.headers, "content-type") == "application/json");
    CHECK(bodyOf(health)["status"] == "ok");
    CHECK(bodyOf(health)["service"] == "toolgate");

    auto info = call("GET", "/info?verbose=1");
    CHECK(info.status == 200);
    CHECK(bodyOf(info)["version"] == std::string(ProductVersion));

    auto wrongMethod = call("POST", "/health");
    CHECK(wrongMethod.status == 405);
    CHECK(net::findHeader(wrongMethod.headers, "Allow") == "GET");
}

TEST_CASE_METHOD(ApiFixture, "ApiHandlers unknown routes", "[api]")
{
    auto response = call("GET", "/nowhere");
    CHECK(response.status == 404);
    CHECK(bodyOf(response)["error"] == "No route for GET /nowhere");
    CHECK(bodyOf(response)["code"] == 404);

    CHECK(call("GET", "/mcp/unknown/tools").status == 404);
    CHECK(call("POST", "/mcp/unknown").status == 404);
    CHECK(call("GET", "/servers/files/explode").status == 404);
}

TEST_CASE_METHOD(ApiFixture, "ApiHandlers server control", "[api][process]")
{
    auto servers = bodyOf(call("GET", "/servers"))["servers"];
    REQUIRE(servers.size() == 2);
    CHECK(servers[0] == nlohmann::json { { "name", "files" }, { "path", "fs" }, { "type", "local" }, { "status", "stopped" } });
    CHECK(servers[1]["name"] == "plain");

    CHECK(call("GET", "/servers/ghost/status").status == 404);
    CHECK(call("GET", "/servers/files/start").status == 405);

    auto started = call("POST", "/servers/files/start");
    CHECK(started.status == 200);
    CHECK(bodyOf(started) == nlohmann::json { { "name", "files" }, { "action", "start" }, { "status", "success" } });
    CHECK(bodyOf(call("GET", "/servers/files/status"))["status"] == "running");

    auto again = call("POST", "/servers/files/start");
    CHECK(again.status == 409);
    CHECK(bodyOf(again)["code"] == 409);

    CHECK(call("POST", "/servers/files/restart").status == 200);
    CHECK(call("POST", "/servers/files/stop").status == 200);
    CHECK(bodyOf(call("GET", "/servers/files/status"))["status"] == "stopped");
    CHECK(call("POST", "/servers/files/stop").status == 503);
}

TEST_CASE_METHOD(ApiFixture, "ApiHandlers tool discovery and invocation", "[api][process]")
{
    SECTION("a stopped endpoint is unavailable")
    {
        auto response = call("GET", "/mcp/fs/tools");
        CHECK(response.status == 503);
        CHECK(call("POST", "/mcp/fs/tools/call", R"({"name":"echo"})").status == 503);
    }

    SECTION("running endpoints")
    {
        REQUIRE(manager.start("files").has_value());
        REQUIRE(manager.start("plain").has_value());

        auto filtered = bodyOf(call("GET", "/mcp/fs/tools"));
        CHECK(filtered["server"] == "files");
        CHECK(filtered["filter_active"] == true);
        CHECK(filtered["tools"].size() == 5);

        auto unfiltered = bodyOf(call("GET", "/mcp/plain/tools"));
        CHECK(unfiltered["filter_active"] == false);
        CHECK(unfiltered["tools"].size() == 6);

        auto echo = call("POST", "/mcp/fs/tools/call", R"({"name":"echo","arguments":{"text":"hi"}})");
        CHECK(echo.status == 200);
        CHECK(bodyOf(echo)["content"][0]["text"] == "hi");

        auto failing = call("POST", "/mcp/fs/tools/call", R"({"name":"fail"})");
        CHECK(failing.status == 200);
        CHECK(bodyOf(failing)["isError"] == true);

        auto denied = call("POST", "/mcp/fs/tools/call", R"({"name":"secret"})");
        CHECK(denied.status == 403);
        CHECK(bodyOf(denied)["error"] == "Tool 'secret' is not allowed");

        CHECK(call("POST", "/mcp/plain/tools/call", R"({"name":"secret"})").status == 200);
        CHECK(call("POST", "/mcp/fs/tools/call", "{not json").status == 400);
        CHECK(call("POST", "/mcp/fs/tools/call", R"({"arguments":{}})").status == 400);
        CHECK(call("GET", "/mcp/fs/tools/call").status == 405);
    }
}

TEST_CASE_METHOD(ApiFixture, "ApiHandlers MCP surface of a local endpoint", "[api][process]")
{
    REQUIRE(manager.start("files").has_value());

    auto init = call("POST", "/mcp/fs", R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    CHECK(init.status == 200);
    CHECK(net::findHeader(init.headers, "Mcp-Session-Id").has_value());
    CHECK(bodyOf(init)["result"]["serverInfo"]["name"] == "toolgate-files");

    auto notification = call("POST", "/mcp/fs", R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    CHECK(notification.status == 202);
    CHECK(notification.body.empty());

    auto list = call("POST", "/mcp/fs", R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    CHECK(list.status == 200);
    CHECK(bodyOf(list)["result"]["tools"].size() == 5);

    auto garbage = call("POST", "/mcp/fs", "{");
    CHECK(garbage.status == 400);
    CHECK(bodyOf(garbage)["error"]["code"] == -32700);

    CHECK(call("DELETE", "/mcp/fs").status == 204);

    auto get = call("GET", "/mcp/fs");
    CHECK(get.status == 405);
    CHECK(net::findHeader(get.headers, "Allow") == "POST, DELETE");

    CHECK(call("POST", "/mcp/fs/extra", "{}").status == 404);
}

TEST_CASE("HttpServer serves the API over the network", "[api][process]")
{
    auto manager = EndpointManager();
    auto router = PathRouter(manager);
    auto handlers = ApiHandlers(manager, router, 5s);
    auto server = HttpServer(handlers, ServerOptions { .host = "127.0.0.1", .port = 0, .workerThreads = 2, .handleSignals = false });

    auto port = server.listen();
    REQUIRE(port.has_value());
    REQUIRE(*port != 0);

    auto runResult = VoidResult {};
    auto runner = std::jthread([&] { runResult = server.run(); });

    auto client = net::HttpClient(5s);
    auto health = client.request(net::ClientRequest {
        .method = net::Method::Get, .url = std::format("http://127.0.0.1:{}/health", *port), .headers = {}, .body = {} });
    REQUIRE(health.has_value());
    CHECK(health->status == 200);
    CHECK(nlohmann::json::parse(health->body)["status"] == "ok");

    auto missing = client.request(net::ClientRequest {
        .method = net::Method::Post, .url = std::format("http://127.0.0.1:{}/servers/x/start", *port), .headers = {}, .body = {} });
    REQUIRE(missing.has_value());
    CHECK(missing->status == 404);

    server.stop();
    runner.join();
    CHECK(runResult.has_value());
}

TEST_CASE("HttpServer reports a port that is already taken", "[api]")
{
    auto manager = EndpointManager();
    auto router = PathRouter(manager);
    auto handlers = ApiHandlers(manager, router, 5s);

    auto first = HttpServer(handlers, ServerOptions { .host = "127.0.0.1", .port = 0, .workerThreads = 1, .handleSignals = false });
    auto port = first.listen();
    REQUIRE(port.has_value());

    auto second =
        HttpServer(handlers, ServerOptions { .host = "127.0.0.1", .port = *port, .workerThreads = 1, .handleSignals = false });
    auto result = second.listen();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::StartFailed);
}
