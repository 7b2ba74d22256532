// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <endpoint/Registry.hpp>
#include <endpoint/SessionSlot.hpp>

#include <chrono>
#include <string>

namespace toolgate
{

/// @brief Endpoint reached over the MCP streamable HTTP binding.
class RemoteEndpoint
{
  public:
    RemoteEndpoint(std::string name,
                   std::string path,
                   std::string url,
                   std::chrono::milliseconds handshakeTimeout,
                   std::chrono::milliseconds requestTimeout);

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto path() const -> const std::string& { return _path; }
    [[nodiscard]] auto url() const -> const std::string& { return _url; }
    [[nodiscard]] static constexpr auto kind() -> EndpointKind { return EndpointKind::Remote; }
    [[nodiscard]] static constexpr auto autoStart() -> bool { return false; }

    /// @brief Opens a session, then lists tools once for diagnostics.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops the cached session; its close terminates the HTTP session.
    [[nodiscard]] auto stop() -> VoidResult;

    /// @brief Returns the cached session, or opens an uncached one-off session.
    [[nodiscard]] auto getOrCreateClient() -> Result<ClientHandle>;

    /// @brief Drops a cached session without going through stop().
    void discardSession();

    [[nodiscard]] auto isStarted() const -> bool { return _slot.hasSession(); }

  private:
    [[nodiscard]] auto connect() -> Result<ClientHandle>;

    std::string _name;
    std::string _path;
    std::string _url;
    std::chrono::milliseconds _handshakeTimeout;
    std::chrono::milliseconds _requestTimeout;
    SessionSlot _slot;
};

} // namespace toolgate
