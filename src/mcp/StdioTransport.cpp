// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolgate
{

namespace
{
    constexpr auto TerminateGracePeriod = std::chrono::seconds(2);

    /// A dead child must surface as a write error, not as a process-wide SIGPIPE.
    void ignoreSigpipeOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::array<int, 2> wakePipe { -1, -1 };
    std::atomic<bool> connected = false;
    std::atomic<bool> interrupted = false;
    std::string command;
    std::string readBuffer;

    /// Waits until @p fd is ready for @p events or the transport got interrupted.
    auto waitFor(int fd, short events) -> VoidResult
    {
        while (true)
        {
            if (interrupted)
                return makeError(ErrorCode::Timeout, std::format("Transport to '{}' interrupted", command));

            auto fds = std::array<pollfd, 2> {
                pollfd { .fd = fd, .events = events, .revents = 0 },
                pollfd { .fd = wakePipe[0], .events = POLLIN, .revents = 0 },
            };

            auto const rv = ::poll(fds.data(), fds.size(), -1);
            if (rv < 0)
            {
                if (errno == EINTR)
                    continue;
                return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", strerror(errno)));
            }

            if (fds[1].revents != 0)
                return makeError(ErrorCode::Timeout, std::format("Transport to '{}' interrupted", command));

            if (fds[0].revents != 0)
                return {};
        }
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    if (auto result = close(); !result)
        log::warning("Closing stdio transport failed: {}", result.error());

    closeFd(_impl->wakePipe[0]);
    closeFd(_impl->wakePipe[1]);
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    ignoreSigpipeOnce();
    _impl->command = config.command;

    if (_impl->wakePipe[0] < 0 && ::pipe2(_impl->wakePipe.data(), O_CLOEXEC) != 0)
        return makeError(ErrorCode::StartFailed, "Failed to create wake-up pipe");

    // Pipes are close-on-exec so that sibling backends never inherit each other's ends.
    int stdinPipe[2];
    int stdoutPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::StartFailed, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::StartFailed, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Inherited environment, with configured variables taking precedence.
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::StartFailed,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    // Writes go through poll() so that interrupt() can abort a stuck write.
    ::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK);

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->readBuffer.clear();
    _impl->connected = true;
    log::debug("Spawned MCP server '{}' (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto offset = size_t { 0 };

    while (offset < data.size())
    {
        if (auto ready = _impl->waitFor(_impl->stdinWrite, POLLOUT); !ready)
            return std::unexpected(ready.error());

        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EAGAIN || errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));
        }
        offset += static_cast<size_t>(written);
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    // Read until we get a complete line
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            return json::parse(line);
        }

        if (auto ready = _impl->waitFor(_impl->stdoutRead, POLLIN); !ready)
            return std::unexpected(ready.error());

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Process '{}' closed its stdout", _impl->command));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

auto StdioTransport::close() -> VoidResult
{
    _impl->connected = false;

    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);

    if (_impl->childPid <= 0)
        return {};

    auto const pid = std::exchange(_impl->childPid, -1);
    ::kill(pid, SIGTERM);

    // Give the server a grace period before it is killed for good.
    int status = 0;
    auto const deadline = std::chrono::steady_clock::now() + TerminateGracePeriod;
    while (true)
    {
        auto const rv = ::waitpid(pid, &status, WNOHANG);
        if (rv == pid)
            break;
        if (rv < 0 && errno != EINTR)
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to reap process {}: {}", pid, strerror(errno)));
        if (std::chrono::steady_clock::now() >= deadline)
        {
            log::warning("MCP server '{}' (pid {}) ignored SIGTERM, killing it", _impl->command, pid);
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                    return makeError(ErrorCode::TransportError,
                                     std::format("Failed to reap process {}: {}", pid, strerror(errno)));
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    log::debug("MCP server '{}' (pid {}) terminated", _impl->command, pid);
    return {};
}

void StdioTransport::interrupt()
{
    _impl->interrupted = true;
    if (_impl->wakePipe[1] >= 0)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const rv = ::write(_impl->wakePipe[1], &byte, 1);
    }
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::pid() const -> int
{
    return _impl->childPid;
}

} // namespace toolgate
