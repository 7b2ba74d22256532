// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace toolgate::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalFormat = std::atomic<Format> { Format::Pretty };
    auto globalCallback = LogCallback {};
    auto outputMutex = std::mutex {};

    constexpr auto levelName(Level l) -> std::string_view
    {
        switch (l)
        {
            case Level::Error: return "error";
            case Level::Warning: return "warn";
            case Level::Info: return "info";
            case Level::Debug: return "debug";
            case Level::Trace: return "trace";
        }
        return "unknown";
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(outputMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

void setFormat(Format format)
{
    globalFormat = format;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto parseFormat(std::string_view name) -> std::optional<Format>
{
    if (name == "pretty")
        return Format::Pretty;
    if (name == "json")
        return Format::Json;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto lock = std::lock_guard(outputMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    if (globalFormat == Format::Json)
    {
        auto const line = nlohmann::json {
            { "timestamp", std::format("{:%FT%TZ}", std::chrono::system_clock::now()) },
            { "level", levelName(level) },
            { "message", message },
        };
        std::println(stderr, "{}", line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace toolgate::log
