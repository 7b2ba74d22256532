// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace toolgate
{

/// @brief Abstract interface for MCP transport communication.
///
/// A transport is driven by a single thread at a time. The only member that may be
/// called concurrently from another thread is interrupt().
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives a JSON message from the server (blocking).
    /// @return The received JSON message or an error.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Closes the transport connection and releases the backend.
    /// @return Success, or the error hit while tearing down.
    [[nodiscard]] virtual auto close() -> VoidResult = 0;

    /// @brief Wakes up a blocked send() or receive() from another thread.
    ///
    /// After an interrupt every pending and future I/O call fails with ErrorCode::Timeout.
    virtual void interrupt() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace toolgate
