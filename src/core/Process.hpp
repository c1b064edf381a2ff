// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace apkforge
{

/// @brief Describes an external process invocation.
///
/// The executable is never resolved through PATH and the environment is not inherited:
/// the child sees exactly the variables listed in @c env.
struct ProcessSpec
{
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::filesystem::path workingDirectory;

    /// Written to the child's stdin, which is then closed.
    std::string stdinData;
};

/// @brief How a process run ended.
struct ProcessOutcome
{
    int exitCode = -1;
    bool timedOut = false;
    bool cancelled = false;
    std::chrono::milliseconds duration { 0 };

    [[nodiscard]] auto succeeded() const -> bool { return exitCode == 0 && !timedOut && !cancelled; }
};

/// @brief Receives combined stdout/stderr output as it arrives.
using OutputCallback = std::function<void(std::string_view chunk)>;

/// @brief Limits applied by runProcess().
struct RunOptions
{
    /// Zero disables the timeout.
    std::chrono::milliseconds timeout { 0 };

    /// Time between SIGTERM and SIGKILL when the process has to be stopped.
    std::chrono::milliseconds gracePeriod { 2000 };
};

/// @brief A child process whose stdout and stderr share one pipe.
///
/// The child runs in its own process group so that terminate() also reaches
/// any processes it spawned.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// @brief Spawns the process.
    /// @param spec The process description.
    /// @return Success or a ProcessError.
    [[nodiscard]] auto start(const ProcessSpec& spec) -> VoidResult;

    /// @brief Waits up to @p timeout for output.
    /// @return The bytes read (empty if none arrived in time) or a ProcessError.
    [[nodiscard]] auto readOutput(std::chrono::milliseconds timeout) -> Result<std::string>;

    /// @brief Returns true once the output pipe reached end-of-file.
    [[nodiscard]] auto outputClosed() const -> bool;

    /// @brief Reaps the child if it has exited.
    /// @return The exit code (128 + signal for signalled children), or std::nullopt while running.
    [[nodiscard]] auto tryWait() -> std::optional<int>;

    /// @brief Sends SIGTERM to the process group, then SIGKILL after @p grace, and reaps the child.
    /// @return The exit code observed after termination.
    auto terminate(std::chrono::milliseconds grace) -> int;

    /// @brief Returns true between a successful start() and the child being reaped.
    [[nodiscard]] auto isRunning() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Runs a process to completion, forwarding its output.
///
/// Returns normally (with the flags set) on timeout or cancellation; the process is
/// terminated in both cases. Errors are reserved for failures to launch or read.
/// @param spec The process description.
/// @param options Timeout and termination grace period.
/// @param onOutput Receives output chunks; may be empty.
/// @param stopToken Requests early termination.
[[nodiscard]] auto runProcess(const ProcessSpec& spec,
                              const RunOptions& options,
                              const OutputCallback& onOutput,
                              std::stop_token stopToken) -> Result<ProcessOutcome>;

/// @brief Search path used for child processes that need basic system utilities.
[[nodiscard]] auto systemSearchPath() -> std::string_view;

/// @brief Looks up an executable in a colon-separated search path.
/// @return The absolute path of the first executable match, or std::nullopt.
[[nodiscard]] auto findInSearchPath(std::string_view name, std::string_view searchPath)
    -> std::optional<std::filesystem::path>;

} // namespace apkforge
