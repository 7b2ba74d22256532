// SPDX-License-Identifier: Apache-2.0
#include "HttpServer.hpp"

#include <core/Log.hpp>
#include <core/Version.hpp>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <csignal>
#include <format>

namespace toolgate
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = asio::ip::tcp;

namespace
{
    constexpr auto MaxRequestBody = std::uint64_t { 16 } * 1024 * 1024;
    constexpr auto IdleTimeout = std::chrono::seconds(60);

    auto toHttpRequest(const http::request<http::string_body>& req) -> HttpRequest
    {
        auto request = HttpRequest {
            .method = req.method_string().to_string(),
            .target = req.target().to_string(),
            .headers = {},
            .body = req.body(),
        };
        for (const auto& field: req)
            request.headers.emplace_back(field.name_string().to_string(), field.value().to_string());
        return request;
    }

    auto toBeastResponse(HttpResponse response, unsigned version, bool keepAlive)
        -> http::response<http::string_body>
    {
        auto res = http::response<http::string_body> { static_cast<http::status>(response.status), version };
        res.set(http::field::server, std::format("{}/{}", ProductName, ProductVersion));
        for (const auto& [name, value]: response.headers)
            res.set(beast::string_view(name.data(), name.size()), beast::string_view(value.data(), value.size()));
        res.keep_alive(keepAlive);
        res.body() = std::move(response.body);
        res.prepare_payload();
        return res;
    }

    auto isDisconnect(const boost::system::error_code& ec) -> bool
    {
        return ec == http::error::end_of_stream || ec == asio::error::eof || ec == asio::error::connection_reset
               || ec == asio::error::operation_aborted || ec == beast::error::timeout;
    }
} // namespace

struct HttpServer::Impl
{
    const ApiHandlers& handlers;
    ServerOptions options;
    asio::io_context ioc;
    tcp::acceptor acceptor;
    asio::signal_set signals;
    asio::thread_pool workers;
    std::atomic<bool> stopped = false;

    Impl(const ApiHandlers& handlers, ServerOptions options):
        handlers(handlers),
        options(std::move(options)),
        ioc(1),
        acceptor(ioc),
        signals(ioc),
        workers(this->options.workerThreads)
    {
    }

    auto dispatchToWorkers(HttpRequest request) -> asio::awaitable<HttpResponse>
    {
        return asio::co_spawn(
            workers.get_executor(),
            [this, request = std::move(request)]() -> asio::awaitable<HttpResponse> {
                co_return handlers.handle(request);
            },
            asio::use_awaitable);
    }

    auto session(beast::tcp_stream stream) -> asio::awaitable<void>
    {
        auto buffer = beast::flat_buffer {};
        auto ec = boost::system::error_code {};

        for (;;)
        {
            auto parser = http::request_parser<http::string_body> {};
            parser.body_limit(MaxRequestBody);

            stream.expires_after(IdleTimeout);
            co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
            {
                if (!isDisconnect(ec))
                    log::debug("Failed to read HTTP request: {}", ec.message());
                break;
            }

            auto req = parser.release();
            auto const keepAlive = req.keep_alive() && !stopped;
            auto response = co_await dispatchToWorkers(toHttpRequest(req));
            auto res = toBeastResponse(std::move(response), req.version(), keepAlive);

            stream.expires_after(IdleTimeout);
            co_await http::async_write(stream, res, asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
            {
                if (!isDisconnect(ec))
                    log::debug("Failed to write HTTP response: {}", ec.message());
                break;
            }
            if (!keepAlive)
                break;
        }

        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    auto acceptLoop() -> asio::awaitable<void>
    {
        auto ec = boost::system::error_code {};
        while (acceptor.is_open())
        {
            auto socket = co_await acceptor.async_accept(asio::redirect_error(asio::use_awaitable, ec));
            if (ec == asio::error::operation_aborted)
                break;
            if (ec)
            {
                log::warning("Failed to accept connection: {}", ec.message());
                continue;
            }

            asio::co_spawn(
                ioc,
                [this, stream = beast::tcp_stream(std::move(socket))]() mutable -> asio::awaitable<void> {
                    try
                    {
                        co_await session(std::move(stream));
                    }
                    catch (const std::exception& e)
                    {
                        log::warning("HTTP connection terminated: {}", e.what());
                    }
                },
                asio::detached);
        }
    }

    void shutdown()
    {
        if (stopped.exchange(true))
            return;

        log::info("Stopping HTTP server");
        auto ec = boost::system::error_code {};
        acceptor.close(ec);
        signals.cancel(ec);
        ioc.stop();
    }
};

HttpServer::HttpServer(const ApiHandlers& handlers, ServerOptions options):
    _impl(std::make_unique<Impl>(handlers, std::move(options)))
{
}

HttpServer::~HttpServer()
{
    stop();
    _impl->workers.join();
}

auto HttpServer::listen() -> Result<unsigned short>
{
    auto const& host = _impl->options.host;
    auto const port = _impl->options.port;
    auto const failed = [&](const boost::system::error_code& ec) {
        return makeError(ErrorCode::StartFailed, std::format("Failed to listen on {}:{}: {}", host, port, ec.message()));
    };

    auto ec = boost::system::error_code {};
    auto resolver = tcp::resolver(_impl->ioc);
    auto const endpoints = resolver.resolve(host, std::to_string(port), tcp::resolver::passive, ec);
    if (ec)
        return failed(ec);
    if (endpoints.empty())
        return failed(asio::error::host_not_found);

    auto const endpoint = endpoints.begin()->endpoint();
    auto& acceptor = _impl->acceptor;
    acceptor.open(endpoint.protocol(), ec);
    if (!ec)
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec)
        acceptor.bind(endpoint, ec);
    if (!ec)
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
    {
        auto ignored = boost::system::error_code {};
        acceptor.close(ignored);
        return failed(ec);
    }

    auto const bound = acceptor.local_endpoint(ec);
    if (ec)
        return failed(ec);

    log::info("HTTP server listening on {}:{}", bound.address().to_string(), bound.port());
    return bound.port();
}

auto HttpServer::run() -> VoidResult
{
    if (!_impl->acceptor.is_open())
        return makeError(ErrorCode::Internal, "HTTP server is not listening");

    if (_impl->options.handleSignals)
    {
        _impl->signals.add(SIGINT);
        _impl->signals.add(SIGTERM);
        _impl->signals.async_wait([this](const boost::system::error_code& ec, int signal) {
            if (ec)
                return;
            log::info("Received signal {}, shutting down", signal);
            _impl->shutdown();
        });
    }

    asio::co_spawn(_impl->ioc, _impl->acceptLoop(), asio::detached);

    try
    {
        _impl->ioc.run();
    }
    catch (const std::exception& e)
    {
        _impl->shutdown();
        return makeError(ErrorCode::Internal, std::format("HTTP server failed: {}", e.what()));
    }

    return {};
}

void HttpServer::stop()
{
    asio::post(_impl->ioc, [impl = _impl.get()] { impl->shutdown(); });
}

} // namespace toolgate
