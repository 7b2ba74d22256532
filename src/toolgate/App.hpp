// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolgate/Config.hpp>

#include <memory>

namespace toolgate
{

/// @brief Wires the endpoint manager, router, HTTP API and server together.
class App
{
  public:
    explicit App(GatewayConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Registers and auto-starts endpoints and binds the HTTP listener.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Serves until a termination signal arrives, then shuts the endpoints down.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
