// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace toolgate
{

/// @brief MCP protocol revision spoken by the gateway.
constexpr auto McpProtocolVersion = std::string_view { "2024-11-05" };

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP lifecycle: initialize, list tools, call tools, close.
/// Not thread-safe; a SessionActor serializes all access to one client.
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param transport The transport to use for communication.
    /// @param name Endpoint name used in log and error messages.
    explicit McpClient(std::unique_ptr<Transport> transport, std::string name = "mcp");
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the MCP initialize handshake.
    /// @return The server's capabilities, or a ProtocolError if the handshake failed.
    [[nodiscard]] auto initialize() -> Result<McpServerCapabilities>;

    /// @brief Performs the handshake on a helper thread and waits at most @p timeout.
    ///
    /// On expiry the transport is interrupted, the helper thread is joined and
    /// ErrorCode::Timeout is returned.
    [[nodiscard]] auto initializeWithTimeout(std::chrono::milliseconds timeout) -> Result<McpServerCapabilities>;

    /// @brief Lists available tools from the server, following every page.
    /// @return All tool definitions in page order or an error.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>>;

    /// @brief Calls a tool on the server.
    /// @param request The tool name and its arguments.
    /// @return The mapped tool result or an error.
    [[nodiscard]] auto callTool(const ToolCallRequest& request) -> Result<ToolCallResponse>;

    /// @brief Ends the session and releases the transport.
    [[nodiscard]] auto close() -> VoidResult;

    /// @brief Aborts blocked I/O from another thread.
    void interrupt();

    /// @brief Returns the server capabilities (valid after initialize).
    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

    [[nodiscard]] auto name() const -> const std::string& { return _name; }

  private:
    std::unique_ptr<Transport> _transport;
    std::string _name;
    McpServerCapabilities _capabilities;
    int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params = nullptr)
        -> Result<nlohmann::json>;

    [[nodiscard]] auto answerServerRequest(const nlohmann::json& message) -> VoidResult;
};

/// @brief Maps one backend content entry onto the gateway's content model.
/// @return The mapped item, or std::nullopt for kinds the gateway does not carry.
[[nodiscard]] auto mapContentItem(const nlohmann::json& item) -> std::optional<ContentItem>;

} // namespace toolgate
