// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace toolgate;

TEST_CASE("httpStatusFor maps the error taxonomy", "[core]")
{
    CHECK(httpStatusFor(ErrorCode::NotFound) == 404);
    CHECK(httpStatusFor(ErrorCode::AlreadyRunning) == 409);
    CHECK(httpStatusFor(ErrorCode::AlreadyExists) == 409);
    CHECK(httpStatusFor(ErrorCode::NotRunning) == 503);
    CHECK(httpStatusFor(ErrorCode::RuntimeFailed) == 503);
    CHECK(httpStatusFor(ErrorCode::ProtocolError) == 502);
    CHECK(httpStatusFor(ErrorCode::Timeout) == 504);
    CHECK(httpStatusFor(ErrorCode::ToolNotAllowed) == 403);
    CHECK(httpStatusFor(ErrorCode::InvalidRequest) == 400);
    CHECK(httpStatusFor(ErrorCode::StartFailed) == 500);
}

TEST_CASE("Error formats with its code name", "[core]")
{
    auto const error = Error { ErrorCode::ToolNotAllowed, "Tool 'rm' is not allowed" };
    CHECK(std::format("{}", error) == "[tool_not_allowed] Tool 'rm' is not allowed");
}

TEST_CASE("Log level and format names parse", "[core][log]")
{
    CHECK(log::parseLevel("warn") == log::Level::Warning);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK(!log::parseLevel("verbose").has_value());
    CHECK(log::parseFormat("json") == log::Format::Json);
    CHECK(!log::parseFormat("xml").has_value());
}

TEST_CASE("Log callback receives messages at or above the level", "[core][log]")
{
    auto messages = std::vector<std::string> {};
    auto const previous = log::getLevel();
    log::setCallback([&](log::Level, std::string_view message) { messages.emplace_back(message); });
    log::setLevel(log::Level::Info);

    log::info("endpoint {} started", "files");
    log::debug("hidden {}", 1);
    log::error("failed: {}", 42);

    log::setCallback({});
    log::setLevel(previous);

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == "endpoint files started");
    CHECK(messages[1] == "failed: 42");
}

TEST_CASE("json::parse reports the requested error code", "[core]")
{
    auto ok = json::parse(R"({"a": 1})");
    REQUIRE(ok.has_value());
    CHECK((*ok)["a"] == 1);

    auto bad = json::parse("{not json", ErrorCode::InvalidRequest);
    REQUIRE(!bad.has_value());
    CHECK(bad.error().code == ErrorCode::InvalidRequest);
}

TEST_CASE("parseToolCallRequest validates the body", "[core]")
{
    SECTION("name with arguments")
    {
        auto request = parseToolCallRequest({ { "name", "echo" }, { "arguments", { { "text", "hi" } } } });
        REQUIRE(request.has_value());
        CHECK(request->name == "echo");
        CHECK(request->arguments["text"] == "hi");
    }

    SECTION("arguments default to an empty object")
    {
        auto request = parseToolCallRequest({ { "name", "echo" } });
        REQUIRE(request.has_value());
        CHECK(request->arguments == nlohmann::json::object());
    }

    SECTION("missing name")
    {
        auto request = parseToolCallRequest({ { "arguments", nlohmann::json::object() } });
        REQUIRE(!request.has_value());
        CHECK(request.error().code == ErrorCode::InvalidRequest);
    }

    SECTION("non-object arguments")
    {
        auto request = parseToolCallRequest({ { "name", "echo" }, { "arguments", "text" } });
        REQUIRE(!request.has_value());
        CHECK(request.error().code == ErrorCode::InvalidRequest);
    }
}

TEST_CASE("ToolCallResponse serializes content and error flag", "[core]")
{
    auto const response = ToolCallResponse {
        .content = { TextContent { .text = "hi" },
                     ImageContent { .data = "aGk=", .mimeType = "image/png" },
                     ResourceContent { .uri = "file:///x", .mimeType = std::nullopt } },
        .isError = true,
    };

    auto const out = toJson(response);
    REQUIRE(out["content"].size() == 3);
    CHECK(out["content"][0] == nlohmann::json { { "type", "text" }, { "text", "hi" } });
    CHECK(out["content"][1]["mimeType"] == "image/png");
    CHECK(out["content"][2]["type"] == "resource");
    CHECK(out["content"][2]["uri"] == "file:///x");
    CHECK(!out["content"][2].contains("mimeType"));
    CHECK(out["isError"] == true);

    CHECK(!toJson(ToolCallResponse {}).contains("isError"));
}

TEST_CASE("ToolDefinition serialization omits a missing description", "[core]")
{
    auto const tool = ToolDefinition { .name = "echo", .description = std::nullopt, .inputSchema = {} };
    auto const out = toJson(tool);
    CHECK(out["name"] == "echo");
    CHECK(!out.contains("description"));
}
