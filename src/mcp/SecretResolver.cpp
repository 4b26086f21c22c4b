// SPDX-License-Identifier: Apache-2.0
#include "SecretResolver.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

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
    auto trim(std::string value) -> std::string
    {
        auto const isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        while (!value.empty() && isSpace(value.back()))
            value.pop_back();
        auto start = size_t { 0 };
        while (start < value.size() && isSpace(value[start]))
            ++start;
        return value.substr(start);
    }

    auto secretError(const std::vector<std::string>& argv, std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::SecretResolutionError, std::format("Secret command '{}' {}", argv.front(), what));
    }
} // namespace

auto runSecretCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)
    -> Result<std::string>
{
    if (argv.empty() || argv.front().empty())
        return makeError(ErrorCode::SecretResolutionError, "Secret command is empty");

    int outPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0)
        return secretError(argv, std::format("failed: cannot create pipe: {}", strerror(errno)));

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outPipe[1], STDOUT_FILENO);

    // Children start with default signal dispositions and an empty mask.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t signals;
    sigemptyset(&signals);
    posix_spawnattr_setsigmask(&attributes, &signals);
    sigaddset(&signals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attributes, &signals);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    auto argCopies = std::vector<std::string>(argv);
    auto cargv = std::vector<char*> {};
    for (auto& arg: argCopies)
        cargv.push_back(arg.data());
    cargv.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, cargv[0], &actions, &attributes, cargv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);
    ::close(outPipe[1]);

    if (status != 0)
    {
        ::close(outPipe[0]);
        return secretError(argv, std::format("could not be started: {}", strerror(status)));
    }

    auto output = std::string {};
    auto timedOut = false;
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            timedOut = true;
            break;
        }

        auto pfd = pollfd { .fd = outPipe[0], .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0 && errno == EINTR)
            continue;
        if (ready == 0)
            continue;
        if (ready < 0)
            break;

        auto buf = std::array<char, 1024> {};
        auto const n = ::read(outPipe[0], buf.data(), buf.size());
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        output.append(buf.data(), static_cast<size_t>(n));
    }
    ::close(outPipe[0]);

    if (timedOut)
        ::kill(pid, SIGKILL);

    auto waitStatus = 0;
    while (::waitpid(pid, &waitStatus, 0) < 0 && errno == EINTR)
        ;

    if (timedOut)
        return secretError(argv, std::format("timed out after {} ms", timeout.count()));
    if (!WIFEXITED(waitStatus))
        return secretError(argv, "terminated abnormally");
    if (WEXITSTATUS(waitStatus) != 0)
        return secretError(argv, std::format("exited with status {}", WEXITSTATUS(waitStatus)));

    return trim(std::move(output));
}

auto resolveSecrets(const std::map<std::string, std::vector<std::string>>& secretCommands,
                    std::chrono::milliseconds timeout) -> Result<std::map<std::string, std::string>>
{
    auto secrets = std::map<std::string, std::string> {};
    for (const auto& [variable, command]: secretCommands)
    {
        auto value = runSecretCommand(command, timeout);
        if (!value)
        {
            return makeError(ErrorCode::SecretResolutionError,
                             std::format("Cannot resolve {}: {}", variable, value.error().message));
        }

        log::debug("Resolved secret for {}", variable);
        secrets[variable] = std::move(*value);
    }
    return secrets;
}

} // namespace mcpgate
