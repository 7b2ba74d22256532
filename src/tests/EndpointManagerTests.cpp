// SPDX-License-Identifier: Apache-2.0
#include <endpoint/EndpointManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include "FakeServer.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace toolgate;
using namespace std::chrono_literals;
using toolgate::test::fakeEndpoint;

namespace
{
auto fastOptions() -> ManagerOptions
{
    return ManagerOptions { .restartDelay = 10ms, .handshakeTimeout = 5s, .requestTimeout = 5s };
}

auto localEndpoint(std::string name, std::string command, std::vector<std::string> args = {}) -> EndpointConfig
{
    return EndpointConfig {
        .name = std::move(name),
        .path = std::nullopt,
        .settings = LocalEndpointSettings {
            .command = std::move(command),
            .args = std::move(args),
            .env = {},
            .autoStart = false,
        },
        .tools = std::nullopt,
    };
}

auto remoteEndpoint(std::string name, std::string url) -> EndpointConfig
{
    return EndpointConfig {
        .name = std::move(name),
        .path = std::nullopt,
        .settings = RemoteEndpointSettings { .url = std::move(url) },
        .tools = std::nullopt,
    };
}

auto statusOf(const EndpointManager& manager, std::string_view name) -> EndpointStatus
{
    auto info = manager.getEndpointInfo(name);
    REQUIRE(info.has_value());
    return info->status;
}
} // namespace

TEST_CASE("EndpointManager auto-starts local endpoints from config", "[manager][process]")
{
    auto manager = EndpointManager(fastOptions());
    REQUIRE(manager
                .initFromConfig({
                    fakeEndpoint("files", "fs", std::nullopt, true),
                    fakeEndpoint("manual", std::nullopt, std::nullopt, false),
                })
                .has_value());

    CHECK(statusOf(manager, "files") == EndpointStatus::Running);
    CHECK(statusOf(manager, "manual") == EndpointStatus::Stopped);
    CHECK(manager.getEndpointInfoByPath("fs")->name == "files");
    CHECK(manager.getEndpointInfoByPath("manual")->name == "manual");

    auto client = manager.getClient("files");
    REQUIRE(client.has_value());
    auto tools = (*client)->listTools(5s);
    REQUIRE(tools.has_value());
    CHECK(tools->size() == 6);

    manager.shutdown();
    CHECK(statusOf(manager, "files") == EndpointStatus::Stopped);
}

TEST_CASE("EndpointManager rejects duplicate endpoints at load time", "[manager]")
{
    auto manager = EndpointManager(fastOptions());

    auto byName = manager.initFromConfig({ fakeEndpoint("a", "x"), fakeEndpoint("a", "y") });
    REQUIRE(!byName.has_value());
    CHECK(byName.error().code == ErrorCode::AlreadyExists);

    auto byPath = manager.addEndpoint(fakeEndpoint("b", "x"));
    REQUIRE(!byPath.has_value());
    CHECK(byPath.error().code == ErrorCode::AlreadyExists);
}

TEST_CASE("EndpointManager lifecycle of a local endpoint", "[manager][process]")
{
    auto manager = EndpointManager(fastOptions());
    REQUIRE(manager.addEndpoint(fakeEndpoint("files")).has_value());

    auto notYet = manager.getClient("files");
    REQUIRE(!notYet.has_value());
    CHECK(notYet.error().code == ErrorCode::NotRunning);

    REQUIRE(manager.start("files").has_value());
    CHECK(statusOf(manager, "files") == EndpointStatus::Running);

    auto again = manager.start("files");
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::AlreadyRunning);

    REQUIRE(manager.restart("files").has_value());
    CHECK(statusOf(manager, "files") == EndpointStatus::Running);
    auto client = manager.getClient("files");
    REQUIRE(client.has_value());
    CHECK((*client)->callTool(ToolCallRequest { .name = "echo", .arguments = { { "text", "hi" } } }, 5s).has_value());

    REQUIRE(manager.stop("files").has_value());
    CHECK(statusOf(manager, "files") == EndpointStatus::Stopped);

    // A handle obtained before the stop is dead now
    auto stale = (*client)->listTools(1s);
    REQUIRE(!stale.has_value());
    CHECK(stale.error().code == ErrorCode::NotRunning);

    auto stopAgain = manager.stop("files");
    REQUIRE(!stopAgain.has_value());
    CHECK(stopAgain.error().code == ErrorCode::NotRunning);

    auto restartStopped = manager.restart("files");
    REQUIRE(!restartStopped.has_value());
    CHECK(restartStopped.error().code == ErrorCode::NotRunning);
}

TEST_CASE("EndpointManager reports unknown endpoints", "[manager]")
{
    auto manager = EndpointManager(fastOptions());
    CHECK(manager.start("ghost").error().code == ErrorCode::NotFound);
    CHECK(manager.stop("ghost").error().code == ErrorCode::NotFound);
    CHECK(manager.restart("ghost").error().code == ErrorCode::NotFound);
    CHECK(manager.getClient("ghost").error().code == ErrorCode::NotFound);
    CHECK(manager.getEndpointInfoByPath("ghost").error().code == ErrorCode::NotFound);
}

TEST_CASE("EndpointManager start failures leave the endpoint failed", "[manager][process]")
{
    auto manager =
        EndpointManager(ManagerOptions { .restartDelay = 10ms, .handshakeTimeout = 2s, .requestTimeout = 5s });

    SECTION("command that cannot be spawned")
    {
        REQUIRE(manager.addEndpoint(localEndpoint("missing", "/nonexistent/mcp-server")).has_value());
        auto started = manager.start("missing");
        REQUIRE(!started.has_value());
        // posix_spawnp may defer the exec failure to the child, which then looks like a dead server.
        CHECK((started.error().code == ErrorCode::StartFailed || started.error().code == ErrorCode::ProtocolError));
        CHECK(statusOf(manager, "missing") == EndpointStatus::Failed);
    }

    SECTION("process that exits before the handshake")
    {
        REQUIRE(manager.addEndpoint(localEndpoint("quitter", "true")).has_value());
        auto const started = std::chrono::steady_clock::now();
        auto result = manager.start("quitter");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
        CHECK(std::chrono::steady_clock::now() - started < 2s);
        CHECK(statusOf(manager, "quitter") == EndpointStatus::Failed);
    }

    SECTION("process that never answers the handshake")
    {
        REQUIRE(manager.addEndpoint(fakeEndpoint("silent", std::nullopt, std::nullopt, false, { "--hang" })).has_value());
        auto const started = std::chrono::steady_clock::now();
        auto result = manager.start("silent");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::Timeout);
        CHECK(std::chrono::steady_clock::now() - started < 5s);
        CHECK(statusOf(manager, "silent") == EndpointStatus::Failed);

        auto client = manager.getClient("silent");
        REQUIRE(!client.has_value());
        CHECK(client.error().code == ErrorCode::NotRunning);

        // A failed endpoint without a session is reset without touching a backend
        REQUIRE(manager.stop("silent").has_value());
        CHECK(statusOf(manager, "silent") == EndpointStatus::Stopped);
    }

    SECTION("process that answers the handshake with garbage")
    {
        REQUIRE(manager.addEndpoint(fakeEndpoint("garbled", std::nullopt, std::nullopt, false, { "--bad-initialize" }))
                    .has_value());
        auto result = manager.start("garbled");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
        CHECK(statusOf(manager, "garbled") == EndpointStatus::Failed);
    }

    SECTION("remote endpoint that is unreachable")
    {
        REQUIRE(manager.addEndpoint(remoteEndpoint("far", "http://127.0.0.1:1/mcp")).has_value());
        auto result = manager.start("far");
        REQUIRE(!result.has_value());
        CHECK((result.error().code == ErrorCode::ProtocolError || result.error().code == ErrorCode::Timeout));
        CHECK(statusOf(manager, "far") == EndpointStatus::Failed);
    }
}

TEST_CASE("EndpointManager auto-start survives a malformed handshake", "[manager][process]")
{
    auto manager = EndpointManager(fastOptions());
    REQUIRE(manager
                .initFromConfig({
                    fakeEndpoint("garbled", std::nullopt, std::nullopt, true, { "--bad-initialize" }),
                    fakeEndpoint("healthy", std::nullopt, std::nullopt, true),
                })
                .has_value());

    CHECK(statusOf(manager, "garbled") == EndpointStatus::Failed);
    CHECK(statusOf(manager, "healthy") == EndpointStatus::Running);
    manager.shutdown();
}

TEST_CASE("EndpointManager recovers a runtime that failed underneath", "[manager][process]")
{
    auto manager = EndpointManager(fastOptions());
    REQUIRE(manager.addEndpoint(fakeEndpoint("files")).has_value());
    REQUIRE(manager.start("files").has_value());

    auto client = manager.getClient("files");
    REQUIRE(client.has_value());

    // Arguments that cannot be serialized make the session worker throw.
    auto broken = (*client)->callTool(
        ToolCallRequest { .name = "echo", .arguments = { { "text", std::string("\xff\xfe") } } }, 5s);
    REQUIRE(!broken.has_value());
    CHECK(broken.error().code == ErrorCode::RuntimeFailed);
    CHECK((*client)->state().state == RuntimeState::Failed);

    SECTION("getClient marks the endpoint failed")
    {
        auto failed = manager.getClient("files");
        REQUIRE(!failed.has_value());
        CHECK(failed.error().code == ErrorCode::RuntimeFailed);
        CHECK(statusOf(manager, "files") == EndpointStatus::Failed);

        REQUIRE(manager.restart("files").has_value());
    }

    SECTION("stop resets the endpoint in one call")
    {
        REQUIRE(manager.stop("files").has_value());
        CHECK(statusOf(manager, "files") == EndpointStatus::Stopped);
        REQUIRE(manager.start("files").has_value());
    }

    CHECK(statusOf(manager, "files") == EndpointStatus::Running);
    auto fresh = manager.getClient("files");
    REQUIRE(fresh.has_value());
    auto echo = (*fresh)->callTool(ToolCallRequest { .name = "echo", .arguments = { { "text", "back" } } }, 5s);
    REQUIRE(echo.has_value());
    CHECK(std::get<TextContent>(echo->content.at(0)).text == "back");

    manager.shutdown();
}

TEST_CASE("EndpointManager remote endpoints need an explicit start", "[manager]")
{
    auto manager = EndpointManager(fastOptions());
    REQUIRE(manager.initFromConfig({ remoteEndpoint("far", "http://127.0.0.1:1/mcp") }).has_value());

    CHECK(statusOf(manager, "far") == EndpointStatus::Stopped);
    CHECK(manager.getClient("far").error().code == ErrorCode::NotRunning);
    CHECK(manager.remoteUrl("far") == "http://127.0.0.1:1/mcp");

    // shutdown leaves remote endpoints alone
    manager.shutdown();
    CHECK(statusOf(manager, "far") == EndpointStatus::Stopped);
}

TEST_CASE("EndpointManager remoteUrl rejects local endpoints", "[manager]")
{
    auto manager = EndpointManager(fastOptions());
    REQUIRE(manager.addEndpoint(fakeEndpoint("files")).has_value());
    CHECK(manager.remoteUrl("files").error().code == ErrorCode::InvalidRequest);
}

TEST_CASE("EndpointManager serializes concurrent starts of one endpoint", "[manager][process]")
{
    auto manager = EndpointManager(fastOptions());
    REQUIRE(manager.addEndpoint(fakeEndpoint("files")).has_value());

    auto succeeded = std::atomic<int> { 0 };
    auto alreadyRunning = std::atomic<int> { 0 };
    {
        auto starters = std::vector<std::jthread> {};
        for (auto i = 0; i < 4; ++i)
        {
            starters.emplace_back([&] {
                auto result = manager.start("files");
                if (result)
                    ++succeeded;
                else if (result.error().code == ErrorCode::AlreadyRunning)
                    ++alreadyRunning;
            });
        }
    }

    CHECK(succeeded == 1);
    CHECK(alreadyRunning == 3);
    CHECK(statusOf(manager, "files") == EndpointStatus::Running);

    manager.shutdown();
}

TEST_CASE("EndpointManager lists endpoints by name", "[manager]")
{
    auto manager = EndpointManager(fastOptions());
    REQUIRE(manager.addEndpoint(fakeEndpoint("b")).has_value());
    REQUIRE(manager.addEndpoint(remoteEndpoint("a", "http://127.0.0.1:1/")).has_value());

    auto const list = manager.listEndpoints();
    REQUIRE(list.size() == 2);
    CHECK(list[0].name == "a");
    CHECK(list[0].kind == EndpointKind::Remote);
    CHECK(list[1].name == "b");
    CHECK(list[1].kind == EndpointKind::Local);
}

TEST_CASE("EndpointManager keeps failed endpoints listed", "[manager][process]")
{
    auto manager =
        EndpointManager(ManagerOptions { .restartDelay = 10ms, .handshakeTimeout = 1s, .requestTimeout = 1s });
    REQUIRE(manager
                .initFromConfig({
                    fakeEndpoint("svc-a", "a", std::nullopt, false, { "--hang" }),
                    remoteEndpoint("svc-b", "http://127.0.0.1:1/mcp"),
                })
                .has_value());

    CHECK(!manager.start("svc-a").has_value());
    CHECK(!manager.start("svc-b").has_value());
    CHECK(statusOf(manager, "svc-a") == EndpointStatus::Failed);
    CHECK(statusOf(manager, "svc-b") == EndpointStatus::Failed);

    CHECK(manager.getClient("svc-a").error().code == ErrorCode::NotRunning);
    CHECK(manager.getClient("svc-b").error().code == ErrorCode::NotRunning);

    auto const list = manager.listEndpoints();
    REQUIRE(list.size() == 2);
    CHECK(list[0].name == "svc-a");
    CHECK(list[0].path == "a");
    CHECK(list[0].status == EndpointStatus::Failed);
    CHECK(list[1].name == "svc-b");
    CHECK(list[1].path == "svc-b");
    CHECK(list[1].status == EndpointStatus::Failed);
}
