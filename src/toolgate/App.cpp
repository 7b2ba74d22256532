// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <core/Version.hpp>
#include <endpoint/EndpointManager.hpp>
#include <http/ApiHandlers.hpp>
#include <http/HttpServer.hpp>
#include <routing/PathRouter.hpp>

#include <print>

namespace toolgate
{

struct App::Impl
{
    GatewayConfig config;
    EndpointManager manager;
    PathRouter router;
    ApiHandlers handlers;
    HttpServer server;
    unsigned short boundPort = 0;

    explicit Impl(GatewayConfig cfg):
        config(std::move(cfg)),
        manager(ManagerOptions {
            .restartDelay = std::chrono::milliseconds(config.mcp.restartDelayMs),
            .handshakeTimeout = std::chrono::seconds(config.mcp.handshakeTimeoutSecs),
            .requestTimeout = std::chrono::seconds(config.mcp.requestTimeoutSecs),
        }),
        router(manager),
        handlers(manager, router, std::chrono::seconds(config.mcp.requestTimeoutSecs)),
        server(handlers, ServerOptions { .host = config.http.host, .port = config.http.port })
    {
    }

    void printBanner() const
    {
        std::println("{} {} - {}", ProductName, ProductVersion, ProductDescription);
        std::println("Listening on http://{}:{}", config.http.host, boundPort);
        for (const auto& info: manager.listEndpoints())
            std::println("  /mcp/{:<20} {} ({}, {})", info.path, info.name, toString(info.kind), toString(info.status));
    }
};

App::App(GatewayConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    log::info("Starting {} {}", ProductName, ProductVersion);

    if (auto initialized = _impl->manager.initFromConfig(_impl->config.endpoints); !initialized)
        return initialized;

    auto port = _impl->server.listen();
    if (!port)
    {
        _impl->manager.shutdown();
        return std::unexpected(port.error());
    }
    _impl->boundPort = *port;
    return {};
}

auto App::run() -> int
{
    _impl->printBanner();

    auto served = _impl->server.run();
    if (!served)
        log::error("HTTP server stopped with an error: {}", served.error());

    _impl->manager.shutdown();
    log::info("Shutdown complete");
    return served ? 0 : 1;
}

} // namespace toolgate
