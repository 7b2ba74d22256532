// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <endpoint/EndpointConfig.hpp>
#include <endpoint/LocalEndpoint.hpp>
#include <endpoint/Registry.hpp>
#include <endpoint/RemoteEndpoint.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolgate
{

/// @brief Timing knobs of the endpoint lifecycle.
struct ManagerOptions
{
    std::chrono::milliseconds restartDelay = std::chrono::milliseconds(500);
    std::chrono::milliseconds handshakeTimeout = std::chrono::seconds(30);
    std::chrono::milliseconds requestTimeout = std::chrono::seconds(30);
};

/// @brief Owns all endpoints and enforces the lifecycle rules.
///
/// Lifecycle operations on one endpoint are serialized by that endpoint's own mutex;
/// operations on different endpoints run in parallel.
class EndpointManager
{
  public:
    explicit EndpointManager(ManagerOptions options = {});
    ~EndpointManager();

    EndpointManager(const EndpointManager&) = delete;
    EndpointManager& operator=(const EndpointManager&) = delete;

    /// @brief Registers every configured endpoint, then starts local ones flagged autoStart.
    ///
    /// Registration errors (duplicate name or path) abort; failing auto-starts are logged
    /// and leave the endpoint Failed.
    [[nodiscard]] auto initFromConfig(const std::vector<EndpointConfig>& endpoints) -> VoidResult;

    /// @brief Registers one endpoint in status Stopped.
    [[nodiscard]] auto addEndpoint(const EndpointConfig& config) -> VoidResult;

    [[nodiscard]] auto start(std::string_view name) -> VoidResult;
    [[nodiscard]] auto stop(std::string_view name) -> VoidResult;

    /// @brief stop(), the configured delay, then start(); stops at the first failing step.
    [[nodiscard]] auto restart(std::string_view name) -> VoidResult;

    /// @brief Stops every local endpoint that is not stopped; errors are logged only.
    void shutdown();

    /// @brief Returns a session for a Running endpoint.
    /// @return NotRunning unless Running; RuntimeFailed (and the endpoint turns Failed) if
    ///         the session died underneath.
    [[nodiscard]] auto getClient(std::string_view name) -> Result<ClientHandle>;

    [[nodiscard]] auto getEndpointInfo(std::string_view name) const -> Result<EndpointInfo>;
    [[nodiscard]] auto getEndpointInfoByPath(std::string_view path) const -> Result<EndpointInfo>;
    [[nodiscard]] auto listEndpoints() const -> std::vector<EndpointInfo>;

    /// @brief Upstream URL of a remote endpoint; InvalidRequest for local endpoints.
    [[nodiscard]] auto remoteUrl(std::string_view name) const -> Result<std::string>;

    [[nodiscard]] auto options() const -> const ManagerOptions& { return _options; }

  private:
    struct Managed
    {
        template <typename T, typename... Args>
        explicit Managed(std::in_place_type_t<T> tag, Args&&... args):
            endpoint(tag, std::forward<Args>(args)...)
        {
        }

        std::mutex lifecycle;
        std::variant<LocalEndpoint, RemoteEndpoint> endpoint;
    };

    [[nodiscard]] auto find(std::string_view name) const -> Result<std::shared_ptr<Managed>>;
    [[nodiscard]] auto stopLocked(std::string_view name, Managed& managed) -> VoidResult;
    void markFailed(std::string_view name);

    ManagerOptions _options;
    EndpointRegistry _registry;
    mutable std::shared_mutex _mutex;
    std::map<std::string, std::shared_ptr<Managed>, std::less<>> _endpoints;
};

} // namespace toolgate
