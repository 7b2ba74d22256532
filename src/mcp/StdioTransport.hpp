// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolgate
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and exchanges newline framed JSON over its stdin/stdout.
/// The child's stderr is inherited from the gateway.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the MCP server process.
    /// @param config The process configuration.
    /// @return Success or a StartFailed error.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    [[nodiscard]] auto close() -> VoidResult override;
    void interrupt() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the child's process id, or -1 if no child is running.
    [[nodiscard]] auto pid() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
