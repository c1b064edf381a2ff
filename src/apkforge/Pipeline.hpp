// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Events.hpp>
#include <agent/Orchestrator.hpp>
#include <apkforge/Config.hpp>
#include <build/BuildRunner.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <scaffold/ProjectDescriptor.hpp>
#include <scaffold/Template.hpp>
#include <toolchain/ToolchainState.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>

namespace apkforge
{

class Fetcher;
class InferenceClient;

/// @brief One end-to-end request: from a prompt to an APK.
struct PipelineRequest
{
    std::string prompt;

    /// Sanitized before use; empty falls back to the default project name.
    std::string projectName;

    /// Empty derives an id from the project name and the current time.
    std::string taskId;

    /// Overrides project.language of the configuration.
    std::optional<SourceLanguage> language;

    /// Stop after scaffolding when false.
    bool build = true;
};

/// @brief What a pipeline run produced. Every step that ran leaves its output here.
struct PipelineResult
{
    std::string taskId;
    TaskOutcome task;
    std::optional<std::filesystem::path> projectRoot;
    std::optional<BuildResult> build;

    /// The error that stopped the run, if any.
    std::optional<Error> error;

    [[nodiscard]] auto succeeded() const -> bool { return !error.has_value(); }
};

/// @brief Serializes a result as written to summary.json.
[[nodiscard]] auto toJson(const PipelineResult& result, std::string_view prompt) -> nlohmann::json;

/// @brief Wires orchestrator, scaffolder, provisioner and build queue together.
///
/// The pipeline owns the provisioner and the build queue, so one instance serves any number
/// of concurrent runs with a single toolchain root.
class Pipeline
{
  public:
    /// @param config Application configuration; empty paths get their default locations.
    /// @param client Inference backend; must outlive the pipeline.
    /// @param fetcher Downloads toolchain components; must outlive the pipeline.
    /// @param templates Templates available to the scaffolder.
    /// @param prompts Role prompts of the agents.
    Pipeline(AppConfig config,
             InferenceClient& client,
             Fetcher& fetcher,
             TemplateRegistry templates,
             RolePrompts prompts = defaultRolePrompts());
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /// @brief Runs generation, scaffolding and optionally provisioning and the build.
    ///
    /// The agent's events go to @p sink. The outcome is also written to
    /// `<generatedRoot>/<taskId>/summary.json`.
    [[nodiscard]] auto run(const PipelineRequest& request, const EventSink& sink, std::stop_token stopToken)
        -> PipelineResult;

    /// @brief Builds the descriptor for a project with the configured defaults.
    [[nodiscard]] auto describeProject(std::string_view name,
                                       std::string_view description,
                                       std::optional<SourceLanguage> language) const -> ProjectDescriptor;

    /// @brief Scaffolds a project below the configured output root.
    [[nodiscard]] auto scaffold(const ProjectDescriptor& descriptor, std::span<const GeneratedFile> generatedFiles)
        -> Result<std::filesystem::path>;

    /// @brief Installs everything the configured Android build needs.
    [[nodiscard]] auto provision(std::stop_token stopToken) -> Result<ToolchainState>;

    /// @brief Records acceptance of every license the configured toolchain requires.
    [[nodiscard]] auto acceptLicenses() -> Result<ToolchainState>;

    /// @brief Builds a scaffolded project with the provisioned toolchain.
    [[nodiscard]] auto buildProject(const std::filesystem::path& projectRoot, std::stop_token stopToken)
        -> Result<BuildResult>;

    /// @brief The components required for the configured SDK levels.
    [[nodiscard]] auto requiredComponents() const -> std::vector<ComponentSpec>;

    [[nodiscard]] auto config() const noexcept -> const AppConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace apkforge
