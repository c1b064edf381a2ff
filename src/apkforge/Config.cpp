// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/FileUtils.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <toolchain/Fetcher.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>

namespace apkforge
{

namespace
{
    constexpr auto AppDirName = std::string_view { "apkforge" };

    constexpr auto DefaultModelFilename = std::string_view { "mistral-7b-instruct-v0.1.Q4_0.gguf" };

    constexpr auto DefaultModelDownloadUrl =
        std::string_view { "https://huggingface.co/TheBloke/Mistral-7B-Instruct-v0.1-GGUF/resolve/main/"
                           "mistral-7b-instruct-v0.1.Q4_0.gguf" };

    auto homeRelative(const char* xdgVariable, std::string_view fallback) -> std::string
    {
        if (auto const* const xdg = std::getenv(xdgVariable); xdg && *xdg)
            return std::format("{}/{}", xdg, AppDirName);
        if (auto const* const home = std::getenv("HOME"); home && *home)
            return std::format("{}/{}/{}", home, fallback, AppDirName);
        return std::string(".");
    }

    auto parseLanguage(std::string_view value) -> Result<SourceLanguage>
    {
        if (value == "kotlin" || value == "Kotlin")
            return SourceLanguage::Kotlin;
        if (value == "java" || value == "Java")
            return SourceLanguage::Java;
        return makeError(ErrorCode::ConfigError, std::format("Unknown project language '{}'", value));
    }

    auto section(const nlohmann::json& root, std::string_view name) -> Result<nlohmann::json>
    {
        auto const key = std::string(name);
        if (!root.contains(key))
            return nlohmann::json::object();
        if (!root[key].is_object())
            return makeError(ErrorCode::ConfigError, std::format("Config section '{}' must be an object", name));
        return root[key];
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    return homeRelative("XDG_CONFIG_HOME", ".config");
}

auto defaultDataDir() -> std::string
{
    return homeRelative("XDG_DATA_HOME", ".local/share");
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultModelDir() -> std::string
{
    return defaultDataDir() + "/models";
}

auto defaultModelPath() -> std::string
{
    return defaultModelDir() + "/" + std::string(DefaultModelFilename);
}

auto defaultModelUrl() -> std::string_view
{
    return DefaultModelDownloadUrl;
}

auto defaultModelFilename() -> std::string_view
{
    return DefaultModelFilename;
}

auto resolvePaths(const PathsConfig& paths) -> PathsConfig
{
    auto resolved = paths;
    auto const data = defaultDataDir();
    auto const config = defaultConfigDir();

    if (resolved.outputRoot.empty())
        resolved.outputRoot = data + "/projects";
    if (resolved.generatedRoot.empty())
        resolved.generatedRoot = data + "/generated";
    if (resolved.toolchainRoot.empty())
        resolved.toolchainRoot = data + "/toolchain";
    if (resolved.templatesDir.empty())
        resolved.templatesDir = config + "/templates";
    if (resolved.promptsDir.empty())
        resolved.promptsDir = config + "/prompts";
    if (resolved.logDir.empty())
        resolved.logDir = data + "/logs";
    return resolved;
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config document must be a JSON object");

    auto config = AppConfig {};

    // LLM section
    auto llm = section(root, "llm");
    if (!llm)
        return std::unexpected(llm.error());
    config.llm.modelPath = json::getStringOr(*llm, "modelPath", "");
    config.llm.contextSize = json::getIntOr(*llm, "contextSize", config.llm.contextSize);
    config.llm.gpuLayers = json::getIntOr(*llm, "gpuLayers", config.llm.gpuLayers);
    config.llm.threads = json::getIntOr(*llm, "threads", config.llm.threads);
    auto& sampler = config.llm.sampler;
    sampler.temperature = json::getFloatOr(*llm, "temperature", sampler.temperature);
    sampler.topP = json::getFloatOr(*llm, "topP", sampler.topP);
    sampler.topK = json::getIntOr(*llm, "topK", sampler.topK);
    sampler.repeatPenalty = json::getFloatOr(*llm, "repeatPenalty", sampler.repeatPenalty);
    sampler.repeatLastN = json::getIntOr(*llm, "repeatLastN", sampler.repeatLastN);
    sampler.maxTokens = json::getIntOr(*llm, "maxTokens", sampler.maxTokens);
    sampler.seed = json::getIntOr(*llm, "seed", sampler.seed);
    if (config.llm.contextSize <= 0 || sampler.maxTokens <= 0 || sampler.maxTokens >= config.llm.contextSize)
        return makeError(ErrorCode::ConfigError,
                         std::format("llm.maxTokens ({}) must be positive and below llm.contextSize ({})",
                                     sampler.maxTokens,
                                     config.llm.contextSize));

    // Agent section
    auto agent = section(root, "agent");
    if (!agent)
        return std::unexpected(agent.error());
    config.agent.maxDebugIterations = json::getIntOr(*agent, "maxDebugIterations", config.agent.maxDebugIterations);
    config.agent.maxInferenceRetries = json::getIntOr(*agent, "maxInferenceRetries", config.agent.maxInferenceRetries);
    config.agent.retryBackoffMs = json::getIntOr(*agent, "retryBackoffMs", config.agent.retryBackoffMs);
    auto& review = config.agent.review;
    review.verdictPrefix = json::getStringOr(*agent, "verdictPrefix", review.verdictPrefix);
    review.defectMarkers = json::getStringArrayOr(*agent, "defectMarkers", review.defectMarkers);
    review.cleanMarkers = json::getStringArrayOr(*agent, "cleanMarkers", review.cleanMarkers);
    if (config.agent.maxDebugIterations < 0 || config.agent.maxInferenceRetries < 0 || config.agent.retryBackoffMs < 0)
        return makeError(ErrorCode::ConfigError, "agent limits must not be negative");

    // Project section
    auto project = section(root, "project");
    if (!project)
        return std::unexpected(project.error());
    config.project.templateId = json::getStringOr(*project, "templateId", config.project.templateId);
    auto language = parseLanguage(json::getStringOr(*project, "language", "kotlin"));
    if (!language)
        return std::unexpected(language.error());
    config.project.language = *language;
    config.project.minSdk = json::getIntOr(*project, "minSdk", config.project.minSdk);
    config.project.targetSdk = json::getIntOr(*project, "targetSdk", config.project.targetSdk);
    config.project.compileSdk = json::getIntOr(*project, "compileSdk", config.project.compileSdk);
    config.project.packagePrefix = json::getStringOr(*project, "packagePrefix", config.project.packagePrefix);

    // Paths section
    auto paths = section(root, "paths");
    if (!paths)
        return std::unexpected(paths.error());
    config.paths.outputRoot = json::getStringOr(*paths, "outputRoot", "");
    config.paths.generatedRoot = json::getStringOr(*paths, "generatedRoot", "");
    config.paths.toolchainRoot = json::getStringOr(*paths, "toolchainRoot", "");
    config.paths.templatesDir = json::getStringOr(*paths, "templatesDir", "");
    config.paths.promptsDir = json::getStringOr(*paths, "promptsDir", "");
    config.paths.logDir = json::getStringOr(*paths, "logDir", "");

    // Toolchain section
    auto toolchain = section(root, "toolchain");
    if (!toolchain)
        return std::unexpected(toolchain.error());
    config.toolchain.acceptLicenses = json::getBoolOr(*toolchain, "acceptLicenses", config.toolchain.acceptLicenses);
    config.toolchain.downloadAttempts =
        json::getIntOr(*toolchain, "downloadAttempts", config.toolchain.downloadAttempts);
    config.toolchain.buildToolsVersion =
        json::getStringOr(*toolchain, "buildToolsVersion", config.toolchain.buildToolsVersion);
    if (config.toolchain.downloadAttempts < 1)
        return makeError(ErrorCode::ConfigError, "toolchain.downloadAttempts must be at least 1");

    // Build section
    auto build = section(root, "build");
    if (!build)
        return std::unexpected(build.error());
    config.build.timeoutSeconds = json::getIntOr(*build, "timeoutSeconds", config.build.timeoutSeconds);
    config.build.maxConcurrentBuilds = json::getIntOr(*build, "maxConcurrentBuilds", config.build.maxConcurrentBuilds);
    config.build.task = json::getStringOr(*build, "task", config.build.task);
    config.build.logTailBytes =
        static_cast<std::size_t>(json::getUInt64Or(*build, "logTailBytes", config.build.logTailBytes));
    if (config.build.maxConcurrentBuilds < 0)
        return makeError(ErrorCode::ConfigError, "build.maxConcurrentBuilds must not be negative");

    return config;
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();

    auto llm = nlohmann::json::object();
    if (!config.llm.modelPath.empty())
        llm["modelPath"] = config.llm.modelPath;
    llm["contextSize"] = config.llm.contextSize;
    llm["gpuLayers"] = config.llm.gpuLayers;
    llm["threads"] = config.llm.threads;
    llm["temperature"] = config.llm.sampler.temperature;
    llm["topP"] = config.llm.sampler.topP;
    llm["topK"] = config.llm.sampler.topK;
    llm["repeatPenalty"] = config.llm.sampler.repeatPenalty;
    llm["repeatLastN"] = config.llm.sampler.repeatLastN;
    llm["maxTokens"] = config.llm.sampler.maxTokens;
    llm["seed"] = config.llm.sampler.seed;
    root["llm"] = std::move(llm);

    root["agent"] = {
        { "maxDebugIterations", config.agent.maxDebugIterations },
        { "maxInferenceRetries", config.agent.maxInferenceRetries },
        { "retryBackoffMs", config.agent.retryBackoffMs },
        { "verdictPrefix", config.agent.review.verdictPrefix },
        { "defectMarkers", config.agent.review.defectMarkers },
        { "cleanMarkers", config.agent.review.cleanMarkers },
    };

    root["project"] = {
        { "templateId", config.project.templateId },
        { "language", std::string(languageToString(config.project.language)) },
        { "minSdk", config.project.minSdk },
        { "targetSdk", config.project.targetSdk },
        { "compileSdk", config.project.compileSdk },
        { "packagePrefix", config.project.packagePrefix },
    };

    // Only explicit paths are saved so that defaults keep following the environment.
    auto paths = nlohmann::json::object();
    auto const setPath = [&](std::string_view key, const std::string& value) {
        if (!value.empty())
            paths[std::string(key)] = value;
    };
    setPath("outputRoot", config.paths.outputRoot);
    setPath("generatedRoot", config.paths.generatedRoot);
    setPath("toolchainRoot", config.paths.toolchainRoot);
    setPath("templatesDir", config.paths.templatesDir);
    setPath("promptsDir", config.paths.promptsDir);
    setPath("logDir", config.paths.logDir);
    root["paths"] = std::move(paths);

    root["toolchain"] = {
        { "acceptLicenses", config.toolchain.acceptLicenses },
        { "downloadAttempts", config.toolchain.downloadAttempts },
        { "buildToolsVersion", config.toolchain.buildToolsVersion },
    };

    root["build"] = {
        { "timeoutSeconds", config.build.timeoutSeconds },
        { "maxConcurrentBuilds", config.build.maxConcurrentBuilds },
        { "task", config.build.task },
        { "logTailBytes", config.build.logTailBytes },
    };

    return root;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto content = fsutil::readTextFile(std::filesystem::path(path));
    if (!content)
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto parsed = json::parse(*content);
    if (!parsed)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parsed.error().message));

    auto config = configFromJson(*parsed);
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    if (auto written = fsutil::writeFileAtomically(std::filesystem::path(path), configToJson(config).dump(4) + "\n");
        !written)
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file {}: {}", path, written.error().message));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto ensureModelAvailable(const LlmConfig& config, Fetcher& fetcher, std::stop_token stopToken)
    -> Result<std::string>
{
    auto ec = std::error_code {};
    if (!config.modelPath.empty())
    {
        if (!std::filesystem::is_regular_file(config.modelPath, ec))
            return makeError(ErrorCode::ModelLoadError, std::format("Model file not found: {}", config.modelPath));
        return config.modelPath;
    }

    auto const modelPath = defaultModelPath();
    if (std::filesystem::is_regular_file(modelPath, ec))
        return modelPath;

    log::info("Default model {} not found, downloading it to {}", DefaultModelFilename, defaultModelDir());
    auto const partial = std::filesystem::path(modelPath + ".part");
    if (auto fetched = fetcher.fetch(DefaultModelDownloadUrl, partial, stopToken); !fetched)
    {
        std::filesystem::remove(partial, ec);
        return std::unexpected(fetched.error());
    }

    std::filesystem::rename(partial, modelPath, ec);
    if (ec)
    {
        std::filesystem::remove(partial, ec);
        return makeError(ErrorCode::DownloadError, std::format("Cannot move the downloaded model into place: {}", modelPath));
    }

    log::info("Default model downloaded successfully");
    return modelPath;
}

} // namespace apkforge
