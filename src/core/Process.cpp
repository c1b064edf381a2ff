// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <ranges>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

namespace apkforge
{

namespace
{
    constexpr auto PollSlice = std::chrono::milliseconds { 50 };

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto decodeWaitStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }
} // namespace

struct Process::Impl
{
    pid_t childPid = -1;
    int outputRead = -1;
    bool eof = false;
    std::optional<int> exitCode;

    ~Impl() { closeFd(outputRead); }
};

Process::Process(): _impl(std::make_unique<Impl>())
{
}

Process::~Process()
{
    if (isRunning())
        terminate(std::chrono::milliseconds { 500 });
}

auto Process::start(const ProcessSpec& spec) -> VoidResult
{
    if (_impl->childPid > 0)
        return makeError(ErrorCode::ProcessError, "Process already started");
    if (!spec.executable.is_absolute())
        return makeError(ErrorCode::ProcessError,
                         std::format("Executable path must be absolute: {}", spec.executable.string()));

    int stdinPipe[2];
    int outputPipe[2];

    if (pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::ProcessError, "Failed to create stdin pipe");
    if (pipe2(outputPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::ProcessError, "Failed to create output pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDERR_FILENO);
    if (!spec.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, spec.workingDirectory.c_str());

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(&attributes, 0);

    // The child starts with no blocked signals and default handlers, whatever this process changed.
    sigset_t noSignals;
    sigemptyset(&noSignals);
    posix_spawnattr_setsigmask(&attributes, &noSignals);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    sigaddset(&defaultSignals, SIGINT);
    sigaddset(&defaultSignals, SIGTERM);
    posix_spawnattr_setsigdefault(&attributes, &defaultSignals);

    // Build argv
    auto argStrings = std::vector<std::string> {};
    argStrings.push_back(spec.executable.string());
    argStrings.insert(argStrings.end(), spec.args.begin(), spec.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment: exactly the listed variables
    auto envStrings = std::vector<std::string> {};
    for (const auto& [key, value]: spec.env)
        envStrings.push_back(std::format("{}={}", key, value));
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawn(&pid, spec.executable.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    ::close(stdinPipe[0]);
    ::close(outputPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(outputPipe[0]);
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", spec.executable.string(), strerror(status)));
    }

    if (!spec.stdinData.empty())
    {
        // A child that exits before reading its stdin must not take us down with SIGPIPE.
        static auto const sigpipeIgnored = [] { return ::signal(SIGPIPE, SIG_IGN) != SIG_ERR; }();
        (void) sigpipeIgnored;

        auto const written = ::write(stdinPipe[1], spec.stdinData.data(), spec.stdinData.size());
        if (written < 0)
            log::warning("Failed to write stdin of '{}': {}", spec.executable.string(), strerror(errno));
    }
    ::close(stdinPipe[1]);

    _impl->childPid = pid;
    _impl->outputRead = outputPipe[0];
    _impl->eof = false;
    _impl->exitCode.reset();

    log::debug("Process started: {} (pid {})", spec.executable.string(), pid);
    return {};
}

auto Process::readOutput(std::chrono::milliseconds timeout) -> Result<std::string>
{
    if (_impl->outputRead < 0 || _impl->eof)
        return std::string {};

    auto pfd = pollfd { .fd = _impl->outputRead, .events = POLLIN, .revents = 0 };
    auto const ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0)
    {
        if (errno == EINTR)
            return std::string {};
        return makeError(ErrorCode::ProcessError, std::format("poll failed: {}", strerror(errno)));
    }
    if (ready == 0)
        return std::string {};

    auto buf = std::array<char, 4096> {};
    auto const bytesRead = ::read(_impl->outputRead, buf.data(), buf.size());
    if (bytesRead < 0)
    {
        if (errno == EINTR || errno == EAGAIN)
            return std::string {};
        return makeError(ErrorCode::ProcessError, std::format("read failed: {}", strerror(errno)));
    }
    if (bytesRead == 0)
    {
        _impl->eof = true;
        closeFd(_impl->outputRead);
        return std::string {};
    }
    return std::string(buf.data(), static_cast<size_t>(bytesRead));
}

auto Process::outputClosed() const -> bool
{
    return _impl->eof;
}

auto Process::tryWait() -> std::optional<int>
{
    if (_impl->exitCode)
        return _impl->exitCode;
    if (_impl->childPid <= 0)
        return std::nullopt;

    int status = 0;
    auto const reaped = waitpid(_impl->childPid, &status, WNOHANG);
    if (reaped == _impl->childPid)
    {
        _impl->exitCode = decodeWaitStatus(status);
        _impl->childPid = -1;
    }
    else if (reaped < 0 && errno == ECHILD)
    {
        _impl->exitCode = -1;
        _impl->childPid = -1;
    }
    return _impl->exitCode;
}

auto Process::terminate(std::chrono::milliseconds grace) -> int
{
    if (auto code = tryWait())
        return *code;
    if (_impl->childPid <= 0)
        return -1;

    auto const pid = _impl->childPid;
    kill(-pid, SIGTERM);

    auto const deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (auto code = tryWait())
        {
            closeFd(_impl->outputRead);
            return *code;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds { 10 });
    }

    log::debug("Process {} ignored SIGTERM, sending SIGKILL", pid);
    kill(-pid, SIGKILL);

    int status = 0;
    if (waitpid(pid, &status, 0) == pid)
        _impl->exitCode = decodeWaitStatus(status);
    else
        _impl->exitCode = -1;
    _impl->childPid = -1;
    closeFd(_impl->outputRead);
    return *_impl->exitCode;
}

auto Process::isRunning() const -> bool
{
    return _impl->childPid > 0;
}

auto runProcess(const ProcessSpec& spec,
                const RunOptions& options,
                const OutputCallback& onOutput,
                std::stop_token stopToken) -> Result<ProcessOutcome>
{
    auto const startedAt = std::chrono::steady_clock::now();
    auto const hasDeadline = options.timeout.count() > 0;
    auto const deadline = startedAt + options.timeout;

    auto process = Process {};
    if (auto startResult = process.start(spec); !startResult)
        return std::unexpected(startResult.error());

    auto outcome = ProcessOutcome {};
    auto forward = [&](const std::string& chunk) {
        if (!chunk.empty() && onOutput)
            onOutput(chunk);
    };

    while (true)
    {
        if (stopToken.stop_requested())
        {
            outcome.cancelled = true;
            outcome.exitCode = process.terminate(options.gracePeriod);
            break;
        }
        if (hasDeadline && std::chrono::steady_clock::now() >= deadline)
        {
            outcome.timedOut = true;
            outcome.exitCode = process.terminate(options.gracePeriod);
            break;
        }

        auto chunk = process.readOutput(PollSlice);
        if (!chunk)
        {
            process.terminate(options.gracePeriod);
            return std::unexpected(chunk.error());
        }
        forward(*chunk);

        if (process.outputClosed() && process.isRunning())
            std::this_thread::sleep_for(PollSlice);

        if (auto exitCode = process.tryWait())
        {
            // Drain what the child left in the pipe; a lingering grandchild must not block us.
            while (!process.outputClosed())
            {
                auto rest = process.readOutput(std::chrono::milliseconds { 0 });
                if (!rest || rest->empty())
                    break;
                forward(*rest);
            }
            outcome.exitCode = *exitCode;
            break;
        }
    }

    outcome.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt);
    return outcome;
}

auto systemSearchPath() -> std::string_view
{
    return "/usr/local/bin:/usr/bin:/bin";
}

auto findInSearchPath(std::string_view name, std::string_view searchPath) -> std::optional<std::filesystem::path>
{
    for (auto const dirRange: std::views::split(searchPath, ':'))
    {
        auto const dir = std::string_view(dirRange.begin(), dirRange.end());
        if (dir.empty())
            continue;

        auto const candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0 && std::filesystem::is_regular_file(candidate))
            return candidate;
    }
    return std::nullopt;
}

} // namespace apkforge
