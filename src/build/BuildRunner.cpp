// SPDX-License-Identifier: Apache-2.0
#include "BuildRunner.hpp"

#include <core/Log.hpp>
#include <core/LogTail.hpp>
#include <core/Process.hpp>
#include <toolchain/AndroidCatalog.hpp>

#include <format>
#include <fstream>
#include <map>

namespace apkforge
{

namespace
{
    /// Allowance for file systems with coarse modification times.
    constexpr auto ArtifactClockSlack = std::chrono::seconds { 2 };

    /// True if Gradle skipped work because its outputs were current.
    auto reportsUpToDate(std::string_view output) -> bool
    {
        return output.contains("UP-TO-DATE") || output.contains(" up-to-date");
    }

    auto logFileName(const std::filesystem::path& projectRoot) -> std::string
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        return std::format("{}-{:%Y%m%d-%H%M%S}.log", projectRoot.filename().string(), now);
    }

    auto buildEnvironment(const ToolchainState& toolchain,
                          const InstalledComponent& jdk,
                          const InstalledComponent& gradle) -> std::map<std::string, std::string>
    {
        auto const sdk = toolchain.sdkRoot().string();
        auto path = std::format("{}:{}", (jdk.path / "bin").string(), (gradle.path / "bin").string());
        if (auto const* platformTools = toolchain.latest("platform-tools"))
            path += std::format(":{}", (platformTools->path).string());
        path += std::format(":{}", systemSearchPath());

        return {
            { "JAVA_HOME", jdk.path.string() },
            { "ANDROID_SDK_ROOT", sdk },
            { "ANDROID_HOME", sdk },
            { "GRADLE_USER_HOME", (toolchain.root / "gradle-home").string() },
            { "HOME", (toolchain.root / "home").string() },
            { "PATH", std::move(path) },
        };
    }
} // namespace

auto failureReasonToString(BuildFailureReason reason) -> std::string_view
{
    switch (reason)
    {
        case BuildFailureReason::None: return "none";
        case BuildFailureReason::NonZeroExit: return "non-zero exit";
        case BuildFailureReason::ArtifactMissing: return "artifact missing";
        case BuildFailureReason::Timeout: return "timeout";
    }
    return "unknown";
}

auto BuildResult::summary() const -> std::string
{
    if (success)
        return std::format("Build succeeded in {:.1f}s: {}",
                           static_cast<double>(duration.count()) / 1000.0,
                           artifactPath ? artifactPath->string() : std::string {});
    if (failureReason == BuildFailureReason::NonZeroExit)
        return std::format("Build failed with exit code {} (log: {})", exitCode, logFile.string());
    return std::format("Build failed: {} (log: {})", failureReasonToString(failureReason), logFile.string());
}

auto debugArtifactDirectory() -> std::filesystem::path
{
    return std::filesystem::path("app") / "build" / "outputs" / "apk" / "debug";
}

auto findNewestArtifact(const std::filesystem::path& directory,
                        std::optional<std::filesystem::file_time_type> notBefore)
    -> std::optional<std::filesystem::path>
{
    auto ec = std::error_code {};
    auto newest = std::optional<std::filesystem::path> {};
    auto newestTime = std::filesystem::file_time_type::min();

    for (auto it = std::filesystem::directory_iterator(directory, ec); !ec && it != std::filesystem::directory_iterator {};
         it.increment(ec))
    {
        if (!it->is_regular_file(ec) || it->path().extension() != ".apk")
            continue;
        auto const time = it->last_write_time(ec);
        if (ec || (notBefore && time < *notBefore))
            continue;
        if (!newest || time > newestTime)
        {
            newest = std::filesystem::absolute(it->path(), ec).lexically_normal();
            newestTime = time;
        }
    }
    return newest;
}

BuildRunner::BuildRunner(BuildRunnerConfig config): _config(std::move(config))
{
}

auto BuildRunner::build(const std::filesystem::path& projectRoot,
                        const ToolchainState& toolchain,
                        std::chrono::milliseconds timeout,
                        std::stop_token stopToken) const -> Result<BuildResult>
{
    auto ec = std::error_code {};
    auto const root = std::filesystem::absolute(projectRoot, ec).lexically_normal();
    if (ec || !std::filesystem::is_directory(root, ec))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Project directory does not exist: {}", projectRoot.string()));

    auto const* jdk = toolchain.latest(JdkComponentId);
    auto const* gradle = toolchain.latest(GradleComponentId);
    if (!jdk || !gradle)
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("The toolchain at {} lacks {}; run 'provision' first",
                                     toolchain.root.string(),
                                     !jdk ? JdkComponentId : GradleComponentId));

    auto const gradleBinary = gradle->path / "bin" / "gradle";
    if (!std::filesystem::is_regular_file(gradleBinary, ec))
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("Gradle executable is missing: {}", gradleBinary.string()));

    auto const logDir = _config.logDirectory.empty() ? root / "build-logs" : _config.logDirectory;
    std::filesystem::create_directories(logDir, ec);
    if (ec)
        return makeError(ErrorCode::FileSystemError,
                         std::format("Cannot create log directory {}: {}", logDir.string(), ec.message()));

    auto result = BuildResult {};
    result.logFile = std::filesystem::absolute(logDir / logFileName(root), ec).lexically_normal();

    auto logStream = std::ofstream(result.logFile, std::ios::binary | std::ios::trunc);
    if (!logStream.is_open())
        return makeError(ErrorCode::FileSystemError, std::format("Cannot open build log {}", result.logFile.string()));

    auto const spec = ProcessSpec {
        .executable = gradleBinary,
        .args = _config.gradleArgs,
        .env = buildEnvironment(toolchain, *jdk, *gradle),
        .workingDirectory = root,
    };

    log::info("Building {} with Gradle {} (log: {})", root.string(), gradle->version, result.logFile.string());

    auto const startedAt = std::filesystem::file_time_type::clock::now() - ArtifactClockSlack;
    auto tail = LogTail { _config.logTailBytes };
    auto outcome = runProcess(spec,
                              RunOptions { .timeout = timeout, .gracePeriod = _config.gracePeriod },
                              [&](std::string_view chunk) {
                                  tail.append(chunk);
                                  logStream.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                              },
                              stopToken);
    logStream.close();

    if (!outcome)
        return std::unexpected(outcome.error());

    result.exitCode = outcome->exitCode;
    result.duration = outcome->duration;
    result.logExcerpt = tail.text();

    if (outcome->cancelled)
    {
        log::info("Build of {} cancelled", root.string());
        return makeError(ErrorCode::Cancelled, std::format("Build of {} cancelled", root.string()));
    }

    if (outcome->timedOut)
    {
        result.failureReason = BuildFailureReason::Timeout;
        log::error("Build of {} timed out after {} ms", root.string(), timeout.count());
        return result;
    }

    if (outcome->exitCode != 0)
    {
        result.failureReason = BuildFailureReason::NonZeroExit;
        log::error("Build of {} failed with exit code {}", root.string(), outcome->exitCode);
        return result;
    }

    result.artifactPath = findNewestArtifact(root / debugArtifactDirectory(), startedAt);
    if (!result.artifactPath && reportsUpToDate(result.logExcerpt))
    {
        log::debug("Gradle reported up-to-date outputs for {}, accepting an earlier APK", root.string());
        result.artifactPath = findNewestArtifact(root / debugArtifactDirectory());
    }
    if (!result.artifactPath)
    {
        result.failureReason = BuildFailureReason::ArtifactMissing;
        log::error("Build of {} exited cleanly but produced no APK in {}",
                   root.string(),
                   (root / debugArtifactDirectory()).string());
        return result;
    }

    result.success = true;
    log::info("{}", result.summary());
    return result;
}

} // namespace apkforge
