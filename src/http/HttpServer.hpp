// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <http/ApiHandlers.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace toolgate
{

struct ServerOptions
{
    std::string host = "127.0.0.1";
    unsigned short port = 3000;
    /// Threads running ApiHandlers; each may block for up to the request timeout.
    std::size_t workerThreads = 16;
    /// Stop on SIGINT/SIGTERM.
    bool handleSignals = true;
};

/// @brief HTTP/1.1 server (Boost.Beast) that feeds requests to ApiHandlers.
///
/// Connections are served by coroutines on a single io_context. Handler calls are
/// moved onto a worker pool so that a slow backend never stalls other connections.
class HttpServer
{
  public:
    HttpServer(const ApiHandlers& handlers, ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Binds the listening socket.
    /// @return The bound port (useful when port 0 was requested).
    [[nodiscard]] auto listen() -> Result<unsigned short>;

    /// @brief Serves connections until stop() is called or a termination signal arrives.
    [[nodiscard]] auto run() -> VoidResult;

    /// @brief Stops accepting and ends run(). Safe to call from any thread.
    void stop();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
