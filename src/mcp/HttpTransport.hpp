// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>
#include <net/HttpClient.hpp>

#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief Splits a text/event-stream body into the data payloads of its events.
///
/// Multiple data lines of one event are joined with a newline; comments and other
/// fields are ignored.
[[nodiscard]] auto parseSseData(std::string_view body) -> std::vector<std::string>;

/// @brief Transport for the MCP streamable HTTP binding.
///
/// Every send() POSTs one JSON-RPC message; messages carried by the reply (a JSON body
/// or SSE events) are queued and handed out by receive().
class HttpTransport: public Transport
{
  public:
    explicit HttpTransport(std::string url, std::chrono::milliseconds timeout = std::chrono::seconds(30));
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    [[nodiscard]] auto close() -> VoidResult override;
    void interrupt() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Session id assigned by the server, if any.
    [[nodiscard]] auto sessionId() const -> const std::optional<std::string>& { return _sessionId; }

  private:
    [[nodiscard]] auto enqueueBody(const net::ClientResponse& response) -> VoidResult;

    std::string _url;
    net::HttpClient _client;
    std::optional<std::string> _sessionId;
    std::deque<nlohmann::json> _inbox;
    bool _connected = true;
};

} // namespace toolgate
