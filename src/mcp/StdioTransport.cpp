// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
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

namespace mcpgate
{

namespace
{
    constexpr auto ReadPollIntervalMs = 100;
    constexpr auto WritePollIntervalMs = 100;

    void ignoreSigpipeOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto envStrings = std::vector<std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto entry = std::string_view(*e);
                auto const eq = entry.find('=');
                auto const key = std::string(entry.substr(0, eq));
                if (!overrides.contains(key))
                    envStrings.emplace_back(entry);
            }
        }
        for (const auto& [key, value]: overrides)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }
} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::atomic<bool> connected = false;
    std::atomic<bool> interrupted = false;
    std::timed_mutex writeMutex;
    std::string unflushed; ///< tail of a message whose write timed out, sent before the next one
    std::string readBuffer;
    std::string command;
    std::chrono::milliseconds gracePeriod { 2000 };
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::SpawnError, "Transport already connected");

    ignoreSigpipeOnce();

    int stdinPipe[2];
    int stdoutPipe[2];

    // Parent ends must not leak into other backends, or EOF is never observed.
    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::SpawnError, std::format("Failed to create stdin pipe: {}", strerror(errno)));
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::SpawnError, std::format("Failed to create stdout pipe: {}", strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    // Children start with default signal dispositions and an empty mask.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t signals;
    sigemptyset(&signals);
    posix_spawnattr_setsigmask(&attributes, &signals);
    sigaddset(&signals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attributes, &signals);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    // Writes wait for buffer space with poll() so a stalled backend cannot block past a deadline.
    if (::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK) == -1)
        log::warning("Failed to make stdin of '{}' non-blocking: {}", config.command, strerror(errno));

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->unflushed.clear();
    _impl->stdoutRead = stdoutPipe[0];
    _impl->readBuffer.clear();
    _impl->command = config.command;
    _impl->gracePeriod = config.terminateGracePeriod;
    _impl->interrupted = false;
    _impl->connected = true;

    log::debug("Backend process started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message, Deadline deadline) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::BackendUnavailable, "Transport not connected");

    auto const lock = std::unique_lock { _impl->writeMutex, deadline };
    if (!lock.owns_lock())
        return makeError(ErrorCode::CallTimeout,
                         std::format("Timed out waiting to write to '{}': input is not being drained", _impl->command));

    auto data = std::move(_impl->unflushed);
    _impl->unflushed.clear();
    auto const messageStart = data.size();
    data += message.dump();
    data += '\n';

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written >= 0)
        {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            return makeError(ErrorCode::BackendUnavailable,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));

        if (_impl->interrupted)
            return makeError(ErrorCode::BackendUnavailable, "Transport interrupted");

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            // Keep the stream framed: a started message is finished by the next send,
            // a message that was not started is dropped.
            _impl->unflushed = offset <= messageStart ? data.substr(offset, messageStart - offset)
                                                     : data.substr(offset);
            return makeError(ErrorCode::CallTimeout,
                             std::format("Timed out writing to '{}': input is not being drained", _impl->command));
        }

        auto pfd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
        auto const waitMs = static_cast<int>(std::min<int64_t>(remaining.count(), WritePollIntervalMs));
        if (::poll(&pfd, 1, waitMs) < 0 && errno != EINTR)
            return makeError(ErrorCode::BackendUnavailable, std::format("poll failed: {}", strerror(errno)));
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::BackendUnavailable, "Transport not connected");

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

            return json::parse(line, ErrorCode::MalformedUpstreamMessage);
        }

        if (_impl->interrupted)
            return makeError(ErrorCode::BackendUnavailable, "Transport interrupted");

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, ReadPollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::BackendUnavailable, std::format("poll failed: {}", strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::BackendUnavailable, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::interrupt()
{
    _impl->interrupted = true;
}

void StdioTransport::close()
{
    _impl->interrupted = true;
    _impl->connected = false;

    {
        auto const lock = std::lock_guard { _impl->writeMutex };
        if (_impl->stdinWrite >= 0)
        {
            ::close(_impl->stdinWrite);
            _impl->stdinWrite = -1;
        }
    }

    if (_impl->stdoutRead >= 0)
    {
        ::close(_impl->stdoutRead);
        _impl->stdoutRead = -1;
    }

    if (_impl->childPid > 0)
    {
        auto status = 0;
        auto reaped = ::waitpid(_impl->childPid, &status, WNOHANG) == _impl->childPid;
        if (!reaped)
        {
            ::kill(_impl->childPid, SIGTERM);
            auto const deadline = std::chrono::steady_clock::now() + _impl->gracePeriod;
            while (!reaped && std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                reaped = ::waitpid(_impl->childPid, &status, WNOHANG) == _impl->childPid;
            }
        }
        if (!reaped)
        {
            log::warning("Process '{}' (pid {}) did not terminate, sending SIGKILL", _impl->command, _impl->childPid);
            ::kill(_impl->childPid, SIGKILL);
            ::waitpid(_impl->childPid, &status, 0);
        }

        if (WIFEXITED(status))
            log::debug("Backend process {} exited with status {}", _impl->childPid, WEXITSTATUS(status));
        else if (WIFSIGNALED(status))
            log::debug("Backend process {} killed by signal {}", _impl->childPid, WTERMSIG(status));

        _impl->childPid = -1;
    }
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::processId() const -> int
{
    return _impl->childPid;
}

} // namespace mcpgate
