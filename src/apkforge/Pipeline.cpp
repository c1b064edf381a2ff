// SPDX-License-Identifier: Apache-2.0
#include "Pipeline.hpp"

#include <agent/OutputWriter.hpp>
#include <build/BuildQueue.hpp>
#include <core/Log.hpp>
#include <llm/InferenceClient.hpp>
#include <scaffold/Scaffolder.hpp>
#include <toolchain/AndroidCatalog.hpp>
#include <toolchain/Fetcher.hpp>
#include <toolchain/ToolchainProvisioner.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <set>

namespace apkforge
{

namespace
{
    auto makeTaskId(std::string_view projectName) -> std::string
    {
        auto const now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        return std::format("{}-{:%Y%m%d-%H%M%S}", projectName, now);
    }

    auto withResolvedPaths(AppConfig config) -> AppConfig
    {
        config.paths = resolvePaths(config.paths);
        return config;
    }

    auto toOrchestratorConfig(const AppConfig& config, RolePrompts prompts) -> OrchestratorConfig
    {
        return OrchestratorConfig {
            .maxDebugIterations = config.agent.maxDebugIterations,
            .maxInferenceRetries = config.agent.maxInferenceRetries,
            .retryBackoff = std::chrono::milliseconds { config.agent.retryBackoffMs },
            .reviewPolicy = config.agent.review,
            .prompts = std::move(prompts),
        };
    }

    auto toBuildRunnerConfig(const AppConfig& config) -> BuildRunnerConfig
    {
        auto runner = BuildRunnerConfig {};
        runner.gradleArgs = { "--no-daemon", config.build.task };
        runner.logTailBytes = config.build.logTailBytes;
        return runner;
    }

    auto errorJson(const Error& error) -> nlohmann::json
    {
        return { { "code", std::string(errorCodeName(error.code)) }, { "message", error.message } };
    }

    /// Scaffolder notices are informational once the agent's task has finished.
    void logEvent(const AgentEvent& event)
    {
        log::info("{}", describe(event));
    }
} // namespace

auto toJson(const PipelineResult& result, std::string_view prompt) -> nlohmann::json
{
    auto memory = nlohmann::json::array();
    if (result.task.memory)
    {
        for (const auto& entry: *result.task.memory)
            memory.push_back({ { "sequence", entry.sequence },
                               { "role", std::string(roleToString(entry.role)) },
                               { "text", entry.text } });
    }

    auto written = nlohmann::json::array();
    for (const auto& path: result.task.writtenFiles)
        written.push_back(path.string());

    auto root = nlohmann::json {
        { "taskId", result.taskId },
        { "prompt", std::string(prompt) },
        { "status", std::string(statusToString(result.task.status)) },
        { "summary", result.task.summary },
        { "codingRounds", result.task.codingRounds },
        { "debugIterations", result.task.debugIterations },
        { "debugLimitReached", result.task.debugLimitReached },
        { "writtenFiles", std::move(written) },
        { "memory", std::move(memory) },
    };

    if (result.projectRoot)
        root["projectRoot"] = result.projectRoot->string();

    if (result.build)
    {
        auto const& build = *result.build;
        root["build"] = {
            { "success", build.success },
            { "failureReason", std::string(failureReasonToString(build.failureReason)) },
            { "exitCode", build.exitCode },
            { "logFile", build.logFile.string() },
            { "durationMs", build.duration.count() },
        };
        if (build.artifactPath)
            root["build"]["artifactPath"] = build.artifactPath->string();
    }

    if (result.error)
        root["error"] = errorJson(*result.error);

    return root;
}

struct Pipeline::Impl
{
    AppConfig config;
    TemplateRegistry templates;
    FileOutputWriter writer;
    Orchestrator orchestrator;
    Scaffolder scaffolder;
    ToolchainProvisioner provisioner;
    BuildRunner runner;
    BuildQueue queue;

    Impl(AppConfig cfg, InferenceClient& client, Fetcher& fetcher, TemplateRegistry registry, RolePrompts prompts):
        config(withResolvedPaths(std::move(cfg))),
        templates(std::move(registry)),
        writer(config.paths.generatedRoot),
        orchestrator(client, writer, toOrchestratorConfig(config, std::move(prompts))),
        scaffolder(templates),
        provisioner(
            ProvisionerConfig {
                .root = config.paths.toolchainRoot,
                .acceptLicenses = config.toolchain.acceptLicenses,
                .downloadAttempts = config.toolchain.downloadAttempts,
            },
            fetcher),
        runner(toBuildRunnerConfig(config)),
        queue(runner, static_cast<std::size_t>(std::max(0, config.build.maxConcurrentBuilds)))
    {
    }

    void writeSummary(const PipelineResult& result, std::string_view prompt)
    {
        auto const file = GeneratedFile { .relativePath = "summary.json", .contents = toJson(result, prompt).dump(2) + "\n" };
        if (auto written = writer.write(result.taskId, file); !written)
            log::warning("[{}] Cannot write summary: {}", result.taskId, written.error().message);
        else
            log::debug("[{}] Summary written to {}", result.taskId, written->string());
    }
};

Pipeline::Pipeline(AppConfig config,
                   InferenceClient& client,
                   Fetcher& fetcher,
                   TemplateRegistry templates,
                   RolePrompts prompts):
    _impl(std::make_unique<Impl>(std::move(config), client, fetcher, std::move(templates), std::move(prompts)))
{
}

Pipeline::~Pipeline() = default;

auto Pipeline::config() const noexcept -> const AppConfig&
{
    return _impl->config;
}

auto Pipeline::describeProject(std::string_view name,
                               std::string_view description,
                               std::optional<SourceLanguage> language) const -> ProjectDescriptor
{
    auto const& project = _impl->config.project;
    auto const sanitized = sanitizeProjectName(name);
    return ProjectDescriptor {
        .name = sanitized,
        .templateId = project.templateId,
        .packageName = derivePackageName(project.packagePrefix, sanitized),
        .appLabel = name.empty() ? sanitized : std::string(name),
        .description = std::string(description),
        .minSdk = project.minSdk,
        .targetSdk = project.targetSdk,
        .compileSdk = project.compileSdk,
        .language = language.value_or(project.language),
    };
}

auto Pipeline::scaffold(const ProjectDescriptor& descriptor, std::span<const GeneratedFile> generatedFiles)
    -> Result<std::filesystem::path>
{
    return _impl->scaffolder.scaffold(descriptor, generatedFiles, _impl->config.paths.outputRoot, logEvent);
}

auto Pipeline::requiredComponents() const -> std::vector<ComponentSpec>
{
    return androidToolchainComponents(_impl->config.project.compileSdk, _impl->config.toolchain.buildToolsVersion);
}

auto Pipeline::provision(std::stop_token stopToken) -> Result<ToolchainState>
{
    auto const components = requiredComponents();
    return _impl->provisioner.ensureReady(components, std::move(stopToken));
}

auto Pipeline::acceptLicenses() -> Result<ToolchainState>
{
    auto licenses = std::set<std::string> {};
    for (const auto& component: requiredComponents())
    {
        if (!component.license.empty())
            licenses.insert(component.license);
    }

    for (const auto& license: licenses)
    {
        if (auto accepted = _impl->provisioner.acceptLicense(license); !accepted)
            return accepted;
    }
    return _impl->provisioner.state();
}

auto Pipeline::buildProject(const std::filesystem::path& projectRoot, std::stop_token stopToken)
    -> Result<BuildResult>
{
    auto state = _impl->provisioner.state();
    if (!state)
        return std::unexpected(state.error());

    auto future = _impl->queue.submit(BuildJob {
        .projectRoot = projectRoot,
        .toolchain = std::move(*state),
        .timeout = buildTimeout(_impl->config.build),
        .stopToken = std::move(stopToken),
    });
    return future.get();
}

auto Pipeline::run(const PipelineRequest& request, const EventSink& sink, std::stop_token stopToken) -> PipelineResult
{
    auto descriptor = describeProject(request.projectName, request.prompt, request.language);

    auto result = PipelineResult {};
    result.taskId = request.taskId.empty() ? makeTaskId(descriptor.name) : request.taskId;
    log::info("[{}] Generating '{}' ({})", result.taskId, descriptor.name, languageToString(descriptor.language));

    auto const generation = GenerationRequest {
        .taskId = result.taskId,
        .prompt = request.prompt,
        .language = descriptor.language,
        .packageName = descriptor.packageName,
    };
    result.task = _impl->orchestrator.run(generation, sink, stopToken);

    auto const finish = [&](std::optional<Error> error) -> PipelineResult {
        result.error = std::move(error);
        _impl->writeSummary(result, request.prompt);
        return std::move(result);
    };

    if (result.task.status != TaskStatus::Done)
        return finish(result.task.error.value_or(Error { ErrorCode::Unknown, result.task.summary }));

    auto projectRoot = scaffold(descriptor, result.task.generatedFiles);
    if (!projectRoot)
        return finish(projectRoot.error());
    result.projectRoot = *projectRoot;
    log::info("[{}] Project ready at {}", result.taskId, projectRoot->string());

    if (!request.build)
        return finish(std::nullopt);

    if (auto toolchain = provision(stopToken); !toolchain)
        return finish(toolchain.error());

    auto build = buildProject(*projectRoot, stopToken);
    if (!build)
        return finish(build.error());
    result.build = *build;
    if (!build->success)
        return finish(Error { ErrorCode::BuildFailure, std::format("{}\n{}", build->summary(), build->logExcerpt) });

    return finish(std::nullopt);
}

} // namespace apkforge
