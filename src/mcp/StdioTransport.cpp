// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace netmcp
{

namespace
{
    /// @brief Granularity at which a blocked reader notices close().
    constexpr auto ReadPollTimeoutMs = 100;

    /// @brief Interval between reap attempts while the child shuts down.
    constexpr auto ReapInterval = std::chrono::milliseconds(10);

    auto makePipe(std::array<int, 2>& fds) -> bool
    {
        if (::pipe(fds.data()) != 0)
            return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// @brief Inherited environment with overrides replacing entries of the same name.
    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto merged = std::map<std::string, std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const eq = entry.find('=');
                if (eq == std::string_view::npos)
                    continue;
                merged.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
            }
        }
        for (const auto& [key, value]: overrides)
            merged[key] = value;

        auto envStrings = std::vector<std::string> {};
        envStrings.reserve(merged.size());
        for (const auto& [key, value]: merged)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }
} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;
    std::chrono::milliseconds terminateGrace { 2000 };
    std::string command;
    std::string readBuffer;
    std::mutex writeMutex;
    std::mutex lifecycleMutex;

    /// @brief Sends SIGTERM, waits up to the grace period, then SIGKILLs.
    void terminateChild()
    {
        if (childPid <= 0)
            return;

        ::kill(childPid, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + terminateGrace;
        while (true)
        {
            auto status = 0;
            auto const rc = ::waitpid(childPid, &status, WNOHANG);
            if (rc == childPid || (rc < 0 && errno != EINTR))
                break;
            if (std::chrono::steady_clock::now() >= deadline)
            {
                log::warning("MCP server '{}' ignored SIGTERM, killing it", command);
                ::kill(childPid, SIGKILL);
                while (::waitpid(childPid, &status, 0) < 0 && errno == EINTR)
                    ;
                break;
            }
            std::this_thread::sleep_for(ReapInterval);
        }
        childPid = -1;
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
    closeFd(_impl->stdoutRead);
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->connected || _impl->childPid > 0)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    if (config.command.empty())
        return makeError(ErrorCode::LaunchError, "No server command configured");

    ignoreSigpipe();

    // The read end of a previous session stays open after close() so that a
    // reader blocked in receiveLine() never polls a recycled descriptor.
    closeFd(_impl->stdoutRead);

    auto stdinPipe = std::array<int, 2> { -1, -1 };
    auto stdoutPipe = std::array<int, 2> { -1, -1 };

    if (!makePipe(stdinPipe))
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to create stdin pipe: {}", std::strerror(errno)));
    if (!makePipe(stdoutPipe))
    {
        closeFd(stdinPipe[0]);
        closeFd(stdinPipe[1]);
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to create stdout pipe: {}", std::strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    if (config.mergeStderr)
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDERR_FILENO);
    if (!config.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.workingDirectory.c_str());

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);

    if (status != 0)
    {
        closeFd(stdinPipe[1]);
        closeFd(stdoutPipe[0]);
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->terminateGrace = config.terminateGrace;
    _impl->command = config.command;
    _impl->readBuffer.clear();
    _impl->closing = false;
    _impl->connected = true;

    log::info("MCP server started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->writeMutex);

    if (!_impl->connected || _impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = json::dump(message) + "\n";

    auto offset = std::size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        offset += static_cast<std::size_t>(written);
    }

    log::trace("-> {}", data.substr(0, data.size() - 1));
    return {};
}

auto StdioTransport::receiveLine() -> Result<std::string>
{
    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    // Read until we get a complete line
    while (true)
    {
        if (_impl->closing)
            return makeError(ErrorCode::TransportError, "Transport closed");

        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            log::trace("<- {}", line);
            return line;
        }

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, ReadPollTimeoutMs);
        if (ready == 0)
            continue;
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to poll process stdout: {}", std::strerror(errno)));
        }

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    auto const lock = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->childPid <= 0 && _impl->stdinWrite < 0)
        return;

    _impl->closing = true;
    _impl->connected = false;

    {
        auto const writeLock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    _impl->terminateChild();

    log::debug("MCP transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::pid() const -> int
{
    auto const lock = std::lock_guard(_impl->lifecycleMutex);
    return _impl->childPid;
}

} // namespace netmcp
