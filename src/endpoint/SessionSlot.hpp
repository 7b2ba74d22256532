// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/SessionActor.hpp>

#include <format>
#include <mutex>
#include <string_view>
#include <utility>

namespace toolgate
{

/// @brief Holds at most one live session handle for an endpoint.
class SessionSlot
{
  public:
    /// @brief Returns the cached handle, or NotRunning if the slot is empty.
    [[nodiscard]] auto get(std::string_view endpointName) const -> Result<ClientHandle>
    {
        auto lock = std::lock_guard(_mutex);
        if (!_handle)
            return makeError(ErrorCode::NotRunning, std::format("Endpoint '{}' is not running", endpointName));
        return _handle;
    }

    void set(ClientHandle handle)
    {
        auto lock = std::lock_guard(_mutex);
        _handle = std::move(handle);
    }

    /// @brief Empties the slot and hands the previous handle (possibly null) to the caller.
    [[nodiscard]] auto take() -> ClientHandle
    {
        auto lock = std::lock_guard(_mutex);
        return std::exchange(_handle, nullptr);
    }

    [[nodiscard]] auto hasSession() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _handle != nullptr;
    }

  private:
    mutable std::mutex _mutex;
    ClientHandle _handle;
};

} // namespace toolgate
