// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <endpoint/Registry.hpp>
#include <endpoint/SessionSlot.hpp>
#include <mcp/StdioTransport.hpp>

#include <chrono>
#include <string>

namespace toolgate
{

/// @brief Endpoint backed by a subprocess speaking MCP over stdin/stdout.
class LocalEndpoint
{
  public:
    LocalEndpoint(std::string name,
                  std::string path,
                  StdioTransportConfig process,
                  bool autoStart,
                  std::chrono::milliseconds handshakeTimeout);

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto path() const -> const std::string& { return _path; }
    [[nodiscard]] static constexpr auto kind() -> EndpointKind { return EndpointKind::Local; }
    [[nodiscard]] auto autoStart() const -> bool { return _autoStart; }

    /// @brief Spawns the process, performs the handshake and caches a new session actor.
    /// @return AlreadyRunning, StartFailed, ProtocolError or Timeout on failure; nothing is left behind.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops the cached session; the actor terminates and reaps the process.
    [[nodiscard]] auto stop() -> VoidResult;

    /// @brief Returns the cached session actor.
    [[nodiscard]] auto getOrCreateClient() -> Result<ClientHandle>;

    /// @brief Drops a cached session without going through stop().
    void discardSession();

    [[nodiscard]] auto isStarted() const -> bool { return _slot.hasSession(); }

  private:
    std::string _name;
    std::string _path;
    StdioTransportConfig _process;
    bool _autoStart;
    std::chrono::milliseconds _handshakeTimeout;
    SessionSlot _slot;
};

} // namespace toolgate
