// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolgate::net
{

/// @brief An http(s) URL split into the parts needed to open a connection.
struct Url
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    [[nodiscard]] auto isTls() const noexcept -> bool { return scheme == "https"; }

    /// @brief Value for the Host header (port omitted when it is the scheme's default).
    [[nodiscard]] auto hostHeader() const -> std::string;
};

/// @brief Parses an absolute http:// or https:// URL.
/// @return The URL parts or an InvalidRequest error.
[[nodiscard]] auto parseUrl(std::string_view url) -> Result<Url>;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// @brief Looks up a header by case-insensitive name.
[[nodiscard]] auto findHeader(const HeaderList& headers, std::string_view name) -> std::optional<std::string>;

enum class Method
{
    Get,
    Post,
    Delete,
};

/// @brief An outgoing HTTP request.
struct ClientRequest
{
    Method method = Method::Get;
    std::string url;
    HeaderList headers;
    std::string body;
};

/// @brief A complete HTTP response.
struct ClientResponse
{
    unsigned status = 0;
    HeaderList headers;
    std::string body;

    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>
    {
        return findHeader(headers, name);
    }
};

/// @brief Blocking HTTP/1.1 client on top of Boost.Beast.
///
/// Each request uses a fresh connection (Connection: close). Requests are executed on a
/// private io_context by the calling thread; interrupt() aborts a running request from
/// any other thread and makes every later request fail with ErrorCode::Timeout.
class HttpClient
{
  public:
    /// @param timeout Deadline applied to each connect, write and read step.
    explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(30));
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// @brief Performs one request.
    /// @return The response (of any status), or TransportError / Timeout.
    [[nodiscard]] auto request(const ClientRequest& request) -> Result<ClientResponse>;

    /// @brief Cancels a running request and poisons the client.
    void interrupt();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate::net
