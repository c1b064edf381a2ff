// SPDX-License-Identifier: Apache-2.0
#include <apkforge/App.hpp>
#include <apkforge/Config.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    auto cli = CLI::App { "apkforge - generate, scaffold and build Android apps with a local LLM" };
    cli.require_subcommand(1);

    auto configPath = std::string {};
    auto modelPath = std::string {};
    auto outputRoot = std::string {};
    auto toolchainRoot = std::string {};
    auto contextSize = 0;
    auto gpuLayers = -1;
    auto maxDebugIterations = -1;
    auto buildTimeoutSeconds = -1;
    auto verbose = false;
    auto trace = false;

    cli.add_option("-c,--config", configPath, "Path to config file");
    cli.add_option("-m,--model", modelPath, "Path to GGUF model file");
    cli.add_option("--output-root", outputRoot, "Directory for scaffolded projects");
    cli.add_option("--toolchain-root", toolchainRoot, "Directory of the managed build toolchain");
    cli.add_option("--context-size", contextSize, "Context window size");
    cli.add_option("--gpu-layers", gpuLayers, "Number of GPU layers (-1 = auto)");
    cli.add_option("--max-debug-iterations", maxDebugIterations, "Review/debug cycles before accepting the code");
    cli.add_option("--build-timeout", buildTimeoutSeconds, "Build timeout in seconds (0 = none)");
    cli.add_flag("-v,--verbose", verbose, "Enable debug logging");
    cli.add_flag("--trace", trace, "Enable trace logging, including every agent event");

    auto const languages = std::vector<std::string> { "kotlin", "java" };
    auto const toLanguage = [](const std::string& name) -> std::optional<apkforge::SourceLanguage> {
        if (name.empty())
            return std::nullopt;
        return apkforge::languageFromString(name);
    };

    // generate
    auto* generate = cli.add_subcommand("generate", "Generate code for a prompt, scaffold the project and build it");
    auto request = apkforge::PipelineRequest {};
    auto generateLanguage = std::string {};
    auto noBuild = false;
    auto generateAcceptLicenses = false;
    generate->add_option("prompt", request.prompt, "What the app should do")->required();
    generate->add_option("-n,--name", request.projectName, "Project name");
    generate->add_option("--task-id", request.taskId, "Task id (default: derived from name and time)");
    generate->add_option("-l,--language", generateLanguage, "Source language")
        ->check(CLI::IsMember(languages, CLI::ignore_case));
    generate->add_flag("--no-build", noBuild, "Stop after scaffolding");
    generate->add_flag("--accept-licenses", generateAcceptLicenses, "Accept the Android SDK licenses");

    // scaffold
    auto* scaffold = cli.add_subcommand("scaffold", "Create a project from a template without generated code");
    auto scaffoldName = std::string {};
    auto scaffoldDescription = std::string {};
    auto scaffoldLanguage = std::string {};
    scaffold->add_option("-n,--name", scaffoldName, "Project name")->required();
    scaffold->add_option("-d,--description", scaffoldDescription, "Project description");
    scaffold->add_option("-l,--language", scaffoldLanguage, "Source language")
        ->check(CLI::IsMember(languages, CLI::ignore_case));

    // provision
    auto* provision = cli.add_subcommand("provision", "Install the JDK, Gradle and the Android SDK packages");
    auto provisionAcceptLicenses = false;
    provision->add_flag("--accept-licenses", provisionAcceptLicenses, "Accept the Android SDK licenses");

    // build
    auto* build = cli.add_subcommand("build", "Build the debug APK of a project");
    auto projectDir = std::string {};
    build->add_option("project", projectDir, "Project directory")->required()->check(CLI::ExistingDirectory);

    // init-config
    auto* initConfig = cli.add_subcommand("init-config", "Write a config file with the default settings");
    auto force = false;
    initConfig->add_flag("-f,--force", force, "Overwrite an existing config file");

    CLI11_PARSE(cli, argc, argv);

    if (trace)
        apkforge::log::setLevel(apkforge::log::Level::Trace);
    else if (verbose)
        apkforge::log::setLevel(apkforge::log::Level::Debug);

    if (initConfig->parsed())
    {
        auto const path = configPath.empty() ? apkforge::defaultConfigPath() : configPath;
        auto ec = std::error_code {};
        if (!force && std::filesystem::exists(path, ec))
        {
            std::println(stderr, "{} already exists (use --force to overwrite)", path);
            return 1;
        }
        if (auto saved = apkforge::saveConfigToFile(path, apkforge::AppConfig {}); !saved)
        {
            std::println(stderr, "{}", saved.error().message);
            return 1;
        }
        std::println("Config written to {}", path);
        return 0;
    }

    auto configResult = configPath.empty() ? apkforge::loadConfig() : apkforge::loadConfigFromFile(configPath);
    if (!configResult)
    {
        apkforge::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!modelPath.empty())
        config.llm.modelPath = modelPath;
    if (contextSize > 0)
        config.llm.contextSize = contextSize;
    if (gpuLayers != -1)
        config.llm.gpuLayers = gpuLayers;
    if (maxDebugIterations >= 0)
        config.agent.maxDebugIterations = maxDebugIterations;
    if (buildTimeoutSeconds >= 0)
        config.build.timeoutSeconds = buildTimeoutSeconds;
    if (!outputRoot.empty())
        config.paths.outputRoot = outputRoot;
    if (!toolchainRoot.empty())
        config.paths.toolchainRoot = toolchainRoot;
    if (generateAcceptLicenses || provisionAcceptLicenses)
        config.toolchain.acceptLicenses = true;

    auto application = apkforge::App(std::move(config));
    if (auto initResult = application.initialize(); !initResult)
    {
        apkforge::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    auto exitCode = apkforge::ExitCode::Success;
    if (generate->parsed())
    {
        request.language = toLanguage(generateLanguage);
        request.build = !noBuild;
        exitCode = application.generate(request);
    }
    else if (scaffold->parsed())
        exitCode = application.scaffold(scaffoldName, scaffoldDescription, toLanguage(scaffoldLanguage));
    else if (provision->parsed())
        exitCode = application.provision(provisionAcceptLicenses);
    else if (build->parsed())
        exitCode = application.build(projectDir);

    return static_cast<int>(exitCode);
}
