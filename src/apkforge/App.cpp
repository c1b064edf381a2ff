// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/Prompts.hpp>
#include <core/Log.hpp>
#include <llm/LlmEngine.hpp>
#include <scaffold/Template.hpp>
#include <toolchain/Fetcher.hpp>

#include <cstdlib>
#include <format>
#include <print>
#include <stop_token>
#include <thread>
#include <variant>

#include <signal.h>
#include <time.h>

namespace apkforge
{

namespace
{
    template <class... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };

    /// @brief Turns SIGINT and SIGTERM into a stop request.
    ///
    /// The signals are blocked for every thread (children of this thread inherit the mask)
    /// and collected by a dedicated thread. A second signal after a stop request exits at once.
    class SignalWatcher
    {
      public:
        explicit SignalWatcher(std::stop_source source): _source(std::move(source))
        {
            sigemptyset(&_signals);
            sigaddset(&_signals, SIGINT);
            sigaddset(&_signals, SIGTERM);
            if (auto const rc = pthread_sigmask(SIG_BLOCK, &_signals, nullptr); rc != 0)
                log::warning("Cannot block termination signals ({}); Ctrl+C will not cancel cleanly", rc);

            _thread = std::jthread([this](const std::stop_token& token) { watch(token); });
        }

      private:
        void watch(const std::stop_token& token)
        {
            while (!token.stop_requested())
            {
                auto timeout = timespec { .tv_sec = 0, .tv_nsec = 200'000'000 };
                auto const signal = ::sigtimedwait(&_signals, nullptr, &timeout);
                if (signal != SIGINT && signal != SIGTERM)
                    continue;

                if (_source.stop_requested())
                    std::_Exit(static_cast<int>(ExitCode::Cancelled));
                log::warning("Received signal {}, cancelling (repeat to exit immediately)", signal);
                _source.request_stop();
            }
        }

        std::stop_source _source;
        sigset_t _signals {};
        std::jthread _thread;
    };

    /// @brief Prints agent events as they arrive.
    void printEvent(const AgentEvent& event)
    {
        std::visit(Overloaded {
                       [](const event::Progress& e) { std::println("{}", e.message); },
                       [](const event::OutputFile& e) { std::println("  wrote {}", e.path.string()); },
                       [](const event::Done& e) { std::println("Done: {}", e.summary); },
                       [](const event::Error& e) { std::println(stderr, "Error: {}", e.message); },
                       [](const event::Cancelled& e) { std::println(stderr, "{}", e.message); },
                   },
                   event);
    }

    auto exitCodeFor(const Error& error) -> ExitCode
    {
        return error.isCancellation() ? ExitCode::Cancelled : ExitCode::Failure;
    }

    void printBuildResult(const BuildResult& result)
    {
        if (result.success)
        {
            std::println("{}", result.summary());
            std::println("APK: {}", result.artifactPath ? result.artifactPath->string() : std::string {});
            return;
        }
        std::println(stderr, "{}", result.summary());
        if (!result.logExcerpt.empty())
            std::println(stderr, "--- last build output ---\n{}", result.logExcerpt);
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::stop_source stopSource;
    SignalWatcher signalWatcher { stopSource };

    LlmEngine engine;
    CurlFetcher fetcher;
    std::unique_ptr<Pipeline> pipeline;

    explicit Impl(AppConfig cfg): config(std::move(cfg)), engine(config.llm.sampler) {}

    auto loadModel() -> VoidResult
    {
        if (engine.isLoaded())
            return {};

        auto modelPath = ensureModelAvailable(config.llm, fetcher, stopSource.get_token());
        if (!modelPath)
            return std::unexpected(modelPath.error());

        return engine.load(LlmEngineConfig {
            .modelPath = *modelPath,
            .contextSize = config.llm.contextSize,
            .gpuLayers = config.llm.gpuLayers,
            .threads = config.llm.threads,
        });
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
    _impl->config.paths = resolvePaths(_impl->config.paths);
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const& paths = _impl->config.paths;

    if (auto opened = log::setLogFile((std::filesystem::path(paths.logDir) / "apkforge.log").string()); !opened)
        log::warning("Logging to stderr only: {}", opened.error().message);

    auto templates = TemplateRegistry::withBuiltins();
    if (auto loaded = templates.loadDirectory(paths.templatesDir); !loaded)
        return loaded;

    auto prompts = loadRolePromptOverrides(paths.promptsDir, defaultRolePrompts());

    _impl->pipeline =
        std::make_unique<Pipeline>(_impl->config, _impl->engine, _impl->fetcher, std::move(templates), std::move(prompts));

    log::debug("Output root {}, toolchain root {}", paths.outputRoot, paths.toolchainRoot);
    return {};
}

auto App::generate(const PipelineRequest& request) -> ExitCode
{
    if (auto loaded = _impl->loadModel(); !loaded)
    {
        log::error("Cannot load the model: {}", loaded.error().message);
        return exitCodeFor(loaded.error());
    }

    auto result = _impl->pipeline->run(request, printEvent, _impl->stopSource.get_token());
    std::println("Task {}: {}", result.taskId, (std::filesystem::path(_impl->config.paths.generatedRoot) / result.taskId).string());

    if (result.projectRoot)
        std::println("Project: {}", result.projectRoot->string());
    if (result.build)
        printBuildResult(*result.build);

    if (result.error)
    {
        if (!result.build)
            std::println(stderr, "Failed: {}", result.error->message);
        return exitCodeFor(*result.error);
    }
    return ExitCode::Success;
}

auto App::scaffold(std::string_view name, std::string_view description, std::optional<SourceLanguage> language)
    -> ExitCode
{
    auto const descriptor = _impl->pipeline->describeProject(name, description, language);
    auto root = _impl->pipeline->scaffold(descriptor, {});
    if (!root)
    {
        std::println(stderr, "Cannot scaffold '{}': {}", descriptor.name, root.error().message);
        return exitCodeFor(root.error());
    }
    std::println("Project: {}", root->string());
    return ExitCode::Success;
}

auto App::provision(bool acceptLicenses) -> ExitCode
{
    if (acceptLicenses)
    {
        if (auto accepted = _impl->pipeline->acceptLicenses(); !accepted)
        {
            std::println(stderr, "Cannot record license acceptance: {}", accepted.error().message);
            return exitCodeFor(accepted.error());
        }
    }

    auto state = _impl->pipeline->provision(_impl->stopSource.get_token());
    if (!state)
    {
        std::println(stderr, "Provisioning failed: {}", state.error().message);
        return exitCodeFor(state.error());
    }

    for (const auto& component: state->installed)
        std::println("{:<32} {:<16} {}", component.id, component.version, component.path.string());
    return ExitCode::Success;
}

auto App::build(const std::filesystem::path& projectRoot) -> ExitCode
{
    auto result = _impl->pipeline->buildProject(projectRoot, _impl->stopSource.get_token());
    if (!result)
    {
        std::println(stderr, "Cannot build {}: {}", projectRoot.string(), result.error().message);
        return exitCodeFor(result.error());
    }

    printBuildResult(*result);
    return result->success ? ExitCode::Success : ExitCode::Failure;
}

} // namespace apkforge
