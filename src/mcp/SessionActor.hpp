// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace toolgate
{

/// @brief Lifecycle of a session actor.
enum class RuntimeState
{
    Running,
    Stopped,
    Failed,
};

/// @brief Snapshot of an actor's state; @c reason is set when the state is Failed.
struct ActorState
{
    RuntimeState state = RuntimeState::Running;
    std::string reason;
};

/// @brief Owns one established MCP session and serializes every operation on it.
///
/// A dedicated worker thread processes ListTools, CallTool and Stop messages from a
/// bounded FIFO queue, one at a time. Callers get their answer through a single-use
/// reply and may stop waiting early; an abandoned request still runs to completion
/// on the backend and its result is dropped.
///
/// The state cell is independent of the queue, so state() never waits behind a slow
/// backend call. Once Failed, the actor refuses further work until it is replaced.
class SessionActor
{
  public:
    /// @brief Number of messages that may be queued before senders block.
    static constexpr std::size_t QueueCapacity = 32;

    /// @brief Timeout value meaning "wait until the backend answers".
    static constexpr auto WaitForever = std::chrono::milliseconds::max();

    /// @brief Takes ownership of an initialized client and starts the worker thread.
    explicit SessionActor(std::unique_ptr<McpClient> client);

    /// @brief Closes the session (if stop() was not called) and joins the worker.
    ~SessionActor();

    SessionActor(const SessionActor&) = delete;
    SessionActor& operator=(const SessionActor&) = delete;

    /// @brief Returns the endpoint name of the owned session.
    [[nodiscard]] auto name() const -> const std::string&;

    /// @brief Returns the current state without touching the queue.
    [[nodiscard]] auto state() const -> ActorState;

    /// @brief Lists every tool of the backend (all pages).
    /// @param timeout Maximum time to wait for the reply.
    [[nodiscard]] auto listTools(std::chrono::milliseconds timeout = WaitForever)
        -> Result<std::vector<ToolDefinition>>;

    /// @brief Invokes a tool on the backend.
    /// @param request The tool name and its arguments.
    /// @param timeout Maximum time to wait for the reply.
    [[nodiscard]] auto callTool(ToolCallRequest request, std::chrono::milliseconds timeout = WaitForever)
        -> Result<ToolCallResponse>;

    /// @brief Closes the session and joins the worker.
    /// @return Success, NotRunning / RuntimeFailed if not running, or the close error.
    [[nodiscard]] auto stop() -> VoidResult;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Shared handle to a running session actor.
using ClientHandle = std::shared_ptr<SessionActor>;

} // namespace toolgate
