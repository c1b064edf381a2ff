// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolchain/ToolchainState.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace apkforge
{

/// @brief Why a build did not produce an artifact.
enum class BuildFailureReason
{
    None,
    NonZeroExit,
    ArtifactMissing,
    Timeout,
};

[[nodiscard]] auto failureReasonToString(BuildFailureReason reason) -> std::string_view;

/// @brief Result of one build tool run.
struct BuildResult
{
    bool success = false;
    BuildFailureReason failureReason = BuildFailureReason::None;
    int exitCode = -1;

    /// Absolute path of the produced APK; set on success only.
    std::optional<std::filesystem::path> artifactPath;

    /// The last lines of the combined build output.
    std::string logExcerpt;

    /// Full build output.
    std::filesystem::path logFile;

    std::chrono::milliseconds duration { 0 };

    /// @brief One-line description for the user.
    [[nodiscard]] auto summary() const -> std::string;
};

struct BuildRunnerConfig
{
    /// Arguments passed to Gradle.
    std::vector<std::string> gradleArgs { "--no-daemon", "assembleDebug" };

    /// Directory for full build logs. Empty means `<projectRoot>/build-logs`.
    std::filesystem::path logDirectory;

    /// Size of the retained output excerpt.
    std::size_t logTailBytes = 16 * 1024;

    /// Time between SIGTERM and SIGKILL when a build is stopped.
    std::chrono::milliseconds gracePeriod { 5000 };
};

/// @brief Runs the Gradle build of a scaffolded project with a provisioned toolchain.
///
/// The build environment is derived from the ToolchainState alone; neither PATH nor
/// JAVA_HOME of the calling process leak into it. A failed build is never retried.
/// An APK older than the build only counts when Gradle reported its tasks as up-to-date.
/// The runner keeps no per-build state, so concurrent builds of distinct projects are fine.
class BuildRunner
{
  public:
    explicit BuildRunner(BuildRunnerConfig config = {});

    /// @brief Builds the debug APK of a project.
    /// @param projectRoot Directory containing settings.gradle.
    /// @param toolchain Must contain the jdk and gradle components.
    /// @param timeout Zero disables the timeout.
    /// @param stopToken Terminates the build when requested.
    /// @return The build result, which also describes failed builds. Errors are returned only
    ///         when the build could not be started, and Cancelled when it was stopped.
    [[nodiscard]] auto build(const std::filesystem::path& projectRoot,
                             const ToolchainState& toolchain,
                             std::chrono::milliseconds timeout,
                             std::stop_token stopToken) const -> Result<BuildResult>;

    [[nodiscard]] auto config() const noexcept -> const BuildRunnerConfig& { return _config; }

  private:
    BuildRunnerConfig _config;
};

/// @brief Directory Gradle writes debug APKs to, relative to the project root.
[[nodiscard]] auto debugArtifactDirectory() -> std::filesystem::path;

/// @brief Returns the most recently written APK in @p directory, if any.
/// @param notBefore When set, APKs last written before this time are ignored.
[[nodiscard]] auto findNewestArtifact(const std::filesystem::path& directory,
                                      std::optional<std::filesystem::file_time_type> notBefore = std::nullopt)
    -> std::optional<std::filesystem::path>;

} // namespace apkforge
