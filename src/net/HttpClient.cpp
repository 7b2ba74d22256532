// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>
#include <core/Version.hpp>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <atomic>
#include <format>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace toolgate::net
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;

namespace
{
    constexpr auto MaxResponseBody = std::uint64_t { 64 } * 1024 * 1024;

    auto toVerb(Method method) -> http::verb
    {
        switch (method)
        {
            case Method::Get: return http::verb::get;
            case Method::Post: return http::verb::post;
            case Method::Delete: return http::verb::delete_;
        }
        return http::verb::get;
    }

    /// Writes @p req and reads the full response; @p tcp carries the deadline.
    template <typename Stream>
    auto exchange(Stream& stream,
                  beast::tcp_stream& tcp,
                  http::request<http::string_body>& req,
                  std::chrono::milliseconds timeout) -> asio::awaitable<ClientResponse>
    {
        tcp.expires_after(timeout);
        co_await http::async_write(stream, req, asio::use_awaitable);

        auto buffer = beast::flat_buffer {};
        auto parser = http::response_parser<http::string_body> {};
        parser.body_limit(MaxResponseBody);
        tcp.expires_after(timeout);
        co_await http::async_read(stream, buffer, parser, asio::use_awaitable);

        auto res = parser.release();
        auto out = ClientResponse { .status = res.result_int(), .headers = {}, .body = {} };
        for (const auto& field: res)
            out.headers.emplace_back(field.name_string().to_string(), field.value().to_string());
        out.body = std::move(res.body());
        co_return out;
    }
} // namespace

auto Url::hostHeader() const -> std::string
{
    auto const defaultPort = isTls() ? "443" : "80";
    auto const bracketed = host.find(':') != std::string::npos ? std::format("[{}]", host) : host;
    if (port == defaultPort)
        return bracketed;
    return std::format("{}:{}", bracketed, port);
}

auto parseUrl(std::string_view url) -> Result<Url>
{
    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos)
        return makeError(ErrorCode::InvalidRequest, std::format("URL '{}' has no scheme", url));

    auto parts = Url {};
    parts.scheme = std::string(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https")
        return makeError(ErrorCode::InvalidRequest, std::format("Unsupported URL scheme '{}'", parts.scheme));

    auto rest = url.substr(schemeEnd + 3);
    auto const slash = rest.find_first_of("/?");
    auto hostPort = rest.substr(0, slash);
    parts.target = slash == std::string_view::npos ? std::string("/") : std::string(rest.substr(slash));
    if (parts.target.front() == '?')
        parts.target.insert(0, "/");

    if (hostPort.starts_with('['))
    {
        auto const close = hostPort.find(']');
        if (close == std::string_view::npos)
            return makeError(ErrorCode::InvalidRequest, std::format("Malformed IPv6 host in URL '{}'", url));
        parts.host = std::string(hostPort.substr(1, close - 1));
        hostPort.remove_prefix(close + 1);
        if (hostPort.starts_with(':'))
            parts.port = std::string(hostPort.substr(1));
    }
    else
    {
        auto const colon = hostPort.rfind(':');
        parts.host = std::string(hostPort.substr(0, colon));
        if (colon != std::string_view::npos)
            parts.port = std::string(hostPort.substr(colon + 1));
    }

    if (parts.host.empty())
        return makeError(ErrorCode::InvalidRequest, std::format("URL '{}' has no host", url));
    if (parts.port.empty())
        parts.port = parts.isTls() ? "443" : "80";

    return parts;
}

auto findHeader(const HeaderList& headers, std::string_view name) -> std::optional<std::string>
{
    for (const auto& [key, value]: headers)
    {
        if (beast::iequals(beast::string_view(key.data(), key.size()), beast::string_view(name.data(), name.size())))
            return value;
    }
    return std::nullopt;
}

struct HttpClient::Impl
{
    std::chrono::milliseconds timeout;
    asio::io_context ioc;
    std::optional<ssl::context> tlsContext;
    std::atomic<bool> interrupted = false;

    auto tls() -> ssl::context&
    {
        if (!tlsContext)
        {
            tlsContext.emplace(ssl::context::tls_client);
            auto ec = beast::error_code {};
            tlsContext->set_default_verify_paths(ec);
            if (ec)
                log::debug("TLS: set_default_verify_paths failed: {}", ec.message());
            tlsContext->set_verify_mode(ssl::verify_peer);
        }
        return *tlsContext;
    }

    auto perform(Url url, http::request<http::string_body> req) -> asio::awaitable<ClientResponse>
    {
        auto executor = co_await asio::this_coro::executor;
        auto resolver = tcp::resolver(executor);
        auto const endpoints = co_await resolver.async_resolve(url.host, url.port, asio::use_awaitable);

        if (!url.isTls())
        {
            auto stream = beast::tcp_stream(executor);
            stream.expires_after(timeout);
            co_await stream.async_connect(endpoints, asio::use_awaitable);

            auto response = co_await exchange(stream, stream, req, timeout);
            auto ec = beast::error_code {};
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return response;
        }

        auto stream = beast::ssl_stream<beast::tcp_stream>(executor, tls());
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        asio::error::get_ssl_category()));
        ::SSL_set1_host(stream.native_handle(), url.host.c_str());

        stream.next_layer().expires_after(timeout);
        co_await stream.next_layer().async_connect(endpoints, asio::use_awaitable);
        stream.next_layer().expires_after(timeout);
        co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);

        auto response = co_await exchange(stream, stream.next_layer(), req, timeout);
        auto ec = beast::error_code {};
        stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return response;
    }
};

HttpClient::HttpClient(std::chrono::milliseconds timeout): _impl(std::make_unique<Impl>())
{
    _impl->timeout = timeout;
}

HttpClient::~HttpClient() = default;

auto HttpClient::request(const ClientRequest& request) -> Result<ClientResponse>
{
    auto url = parseUrl(request.url);
    if (!url)
        return std::unexpected(url.error());

    auto req = http::request<http::string_body> { toVerb(request.method), url->target, 11 };
    req.set(http::field::host, url->hostHeader());
    req.set(http::field::user_agent, std::format("{}/{}", ProductName, ProductVersion));
    req.set(http::field::connection, "close");
    for (const auto& [name, value]: request.headers)
        req.set(name, value);
    if (!request.body.empty() || request.method == Method::Post)
    {
        req.body() = request.body;
        req.prepare_payload();
    }

    _impl->ioc.restart();
    if (_impl->interrupted)
        return makeError(ErrorCode::Timeout, std::format("HTTP request to {} interrupted", request.url));

    auto outcome = std::optional<Result<ClientResponse>> {};
    asio::co_spawn(_impl->ioc,
                   _impl->perform(*url, std::move(req)),
                   [&outcome, &request](std::exception_ptr eptr, ClientResponse response) {
                       if (!eptr)
                       {
                           outcome = std::move(response);
                           return;
                       }
                       try
                       {
                           std::rethrow_exception(eptr);
                       }
                       catch (const beast::system_error& e)
                       {
                           auto const code =
                               e.code() == beast::error::timeout ? ErrorCode::Timeout : ErrorCode::TransportError;
                           outcome = makeError(
                               code, std::format("HTTP request to {} failed: {}", request.url, e.code().message()));
                       }
                       catch (const std::exception& e)
                       {
                           outcome = makeError(ErrorCode::TransportError,
                                               std::format("HTTP request to {} failed: {}", request.url, e.what()));
                       }
                   });
    _impl->ioc.run();

    if (!outcome || _impl->interrupted)
        return makeError(ErrorCode::Timeout, std::format("HTTP request to {} interrupted", request.url));

    log::trace("HTTP {} {} -> {}",
               http::to_string(toVerb(request.method)).to_string(),
               request.url,
               outcome->has_value() ? (*outcome)->status : 0u);
    return std::move(*outcome);
}

void HttpClient::interrupt()
{
    _impl->interrupted = true;
    _impl->ioc.stop();
}

} // namespace toolgate::net
