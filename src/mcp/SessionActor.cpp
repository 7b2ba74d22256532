// SPDX-License-Identifier: Apache-2.0
#include "SessionActor.hpp"

#include <core/Log.hpp>
#include <core/Overloaded.hpp>

#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>

namespace toolgate
{

namespace
{
    struct ListToolsMessage
    {
        std::promise<Result<std::vector<ToolDefinition>>> reply;
    };

    struct CallToolMessage
    {
        ToolCallRequest request;
        std::promise<Result<ToolCallResponse>> reply;
    };

    struct StopMessage
    {
        std::promise<VoidResult> reply;
    };

    using Message = std::variant<ListToolsMessage, CallToolMessage, StopMessage>;
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    auto makeDeadline(std::chrono::milliseconds timeout) -> Deadline
    {
        if (timeout == SessionActor::WaitForever)
            return std::nullopt;
        return std::chrono::steady_clock::now() + timeout;
    }

    auto timeoutError(std::string_view name, std::string_view what, std::chrono::milliseconds timeout)
    {
        return makeError(ErrorCode::Timeout,
                         std::format("MCP request '{}' to '{}' timed out after {} ms", what, name, timeout.count()));
    }

    /// Waits for a reply; an expired wait leaves the reply to be discarded by the worker.
    template <typename T>
    auto awaitReply(std::future<T>& future,
                    Deadline deadline,
                    std::chrono::milliseconds timeout,
                    std::string_view name,
                    std::string_view what) -> T
    {
        if (deadline && future.wait_until(*deadline) == std::future_status::timeout)
            return timeoutError(name, what, timeout);

        try
        {
            return future.get();
        }
        catch (const std::future_error& e)
        {
            return makeError(ErrorCode::RuntimeFailed,
                             std::format("MCP request '{}' to '{}' was cancelled: {}", what, name, e.what()));
        }
    }
} // namespace

struct SessionActor::Impl
{
    std::unique_ptr<McpClient> client;
    std::string name;

    mutable std::mutex stateMutex;
    ActorState state;

    std::mutex queueMutex;
    std::condition_variable notEmpty;
    std::condition_variable notFull;
    std::deque<Message> queue;
    bool closed = false;

    std::mutex joinMutex;
    std::jthread worker;

    void setState(RuntimeState next, std::string reason = {})
    {
        auto lock = std::lock_guard(stateMutex);
        state = ActorState { .state = next, .reason = std::move(reason) };
    }

    [[nodiscard]] auto currentState() const -> ActorState
    {
        auto lock = std::lock_guard(stateMutex);
        return state;
    }

    [[nodiscard]] auto ensureRunning() const -> VoidResult
    {
        auto const current = currentState();
        switch (current.state)
        {
            case RuntimeState::Running: return {};
            case RuntimeState::Stopped:
                return makeError(ErrorCode::NotRunning, std::format("Endpoint '{}' is not running", name));
            case RuntimeState::Failed:
                return makeError(ErrorCode::RuntimeFailed,
                                 std::format("MCP runtime for '{}' failed: {}", name, current.reason));
        }
        return {};
    }

    [[nodiscard]] auto enqueue(Message message, Deadline deadline, std::chrono::milliseconds timeout)
        -> VoidResult
    {
        auto lock = std::unique_lock(queueMutex);
        auto const hasRoom = [this] { return queue.size() < QueueCapacity || closed; };

        if (!deadline)
            notFull.wait(lock, hasRoom);
        else if (!notFull.wait_until(lock, *deadline, hasRoom))
            return timeoutError(name, "enqueue", timeout);

        if (closed)
            return makeError(ErrorCode::RuntimeFailed, std::format("MCP runtime for '{}': worker channel closed", name));

        queue.push_back(std::move(message));
        notEmpty.notify_one();
        return {};
    }

    [[nodiscard]] auto pop() -> std::optional<Message>
    {
        auto lock = std::unique_lock(queueMutex);
        notEmpty.wait(lock, [this] { return !queue.empty() || closed; });
        if (queue.empty())
            return std::nullopt;

        auto message = std::move(queue.front());
        queue.pop_front();
        notFull.notify_one();
        return message;
    }

    void closeQueue()
    {
        auto lock = std::lock_guard(queueMutex);
        closed = true;
        notEmpty.notify_all();
        notFull.notify_all();
    }

    /// Answers every message still queued after a stop.
    void drain()
    {
        auto leftovers = std::deque<Message> {};
        {
            auto lock = std::lock_guard(queueMutex);
            leftovers.swap(queue);
            notFull.notify_all();
        }

        auto const stopped = [this] {
            return makeError(ErrorCode::NotRunning, std::format("Endpoint '{}' is not running", name));
        };
        for (auto& message: leftovers)
        {
            std::visit(Overloaded {
                           [&](ListToolsMessage& m) { m.reply.set_value(stopped()); },
                           [&](CallToolMessage& m) { m.reply.set_value(stopped()); },
                           [&](StopMessage& m) { m.reply.set_value(stopped()); },
                       },
                       message);
        }
    }

    [[nodiscard]] auto closeSession() -> VoidResult
    {
        auto result = client->close();
        if (result)
        {
            setState(RuntimeState::Stopped);
            log::debug("MCP runtime for '{}' stopped", name);
            return result;
        }

        setState(RuntimeState::Failed, result.error().message);
        return makeError(ErrorCode::ProtocolError,
                         std::format("Failed to stop MCP client '{}': {}", name, result.error().message));
    }

    void fail(std::string_view reason)
    {
        log::error("MCP runtime for '{}' failed: {}", name, reason);
        setState(RuntimeState::Failed, std::format("worker exception: {}", reason));
    }

    [[nodiscard]] auto failedError() const
    {
        return makeError(ErrorCode::RuntimeFailed,
                         std::format("MCP runtime for '{}' failed: {}", name, currentState().reason));
    }

    void process(Message& message)
    {
        std::visit(Overloaded {
                       [this](ListToolsMessage& m) {
                           try
                           {
                               m.reply.set_value(client->listTools());
                           }
                           catch (const std::exception& e)
                           {
                               fail(e.what());
                               m.reply.set_value(failedError());
                           }
                       },
                       [this](CallToolMessage& m) {
                           try
                           {
                               m.reply.set_value(client->callTool(m.request));
                           }
                           catch (const std::exception& e)
                           {
                               fail(e.what());
                               m.reply.set_value(failedError());
                           }
                       },
                       [this](StopMessage& m) {
                           try
                           {
                               m.reply.set_value(closeSession());
                           }
                           catch (const std::exception& e)
                           {
                               fail(e.what());
                               m.reply.set_value(failedError());
                           }
                       },
                   },
                   message);
    }

    void run()
    {
        while (auto message = pop())
        {
            auto const isStop = std::holds_alternative<StopMessage>(*message);
            process(*message);
            if (isStop)
            {
                closeQueue();
                drain();
                return;
            }
        }

        // The owner went away without an explicit stop.
        try
        {
            if (auto result = closeSession(); !result)
                log::warning("{}", result.error().message);
        }
        catch (const std::exception& e)
        {
            fail(e.what());
        }
    }

    void join()
    {
        auto lock = std::lock_guard(joinMutex);
        if (worker.joinable())
            worker.join();
    }
};

SessionActor::SessionActor(std::unique_ptr<McpClient> client): _impl(std::make_unique<Impl>())
{
    _impl->name = client->name();
    _impl->client = std::move(client);
    _impl->worker = std::jthread([this] { _impl->run(); });
    log::debug("MCP runtime for '{}' started", _impl->name);
}

SessionActor::~SessionActor()
{
    _impl->closeQueue();
    _impl->join();
}

auto SessionActor::name() const -> const std::string&
{
    return _impl->name;
}

auto SessionActor::state() const -> ActorState
{
    return _impl->currentState();
}

auto SessionActor::listTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>
{
    if (auto running = _impl->ensureRunning(); !running)
        return std::unexpected(running.error());

    auto const deadline = makeDeadline(timeout);
    auto message = ListToolsMessage {};
    auto future = message.reply.get_future();
    if (auto queued = _impl->enqueue(std::move(message), deadline, timeout); !queued)
        return std::unexpected(queued.error());

    return awaitReply(future, deadline, timeout, _impl->name, "tools/list");
}

auto SessionActor::callTool(ToolCallRequest request, std::chrono::milliseconds timeout)
    -> Result<ToolCallResponse>
{
    if (auto running = _impl->ensureRunning(); !running)
        return std::unexpected(running.error());

    auto const deadline = makeDeadline(timeout);
    auto message = CallToolMessage { .request = std::move(request), .reply = {} };
    auto future = message.reply.get_future();
    if (auto queued = _impl->enqueue(std::move(message), deadline, timeout); !queued)
        return std::unexpected(queued.error());

    return awaitReply(future, deadline, timeout, _impl->name, "tools/call");
}

auto SessionActor::stop() -> VoidResult
{
    if (auto running = _impl->ensureRunning(); !running)
        return running;

    auto message = StopMessage {};
    auto future = message.reply.get_future();
    if (auto queued = _impl->enqueue(std::move(message), std::nullopt, WaitForever); !queued)
        return queued;

    auto result = awaitReply(future, std::nullopt, WaitForever, _impl->name, "stop");
    _impl->join();
    return result;
}

} // namespace toolgate
