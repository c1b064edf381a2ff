// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/ReviewPolicy.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/Sampler.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>

namespace apkforge
{

class Fetcher;

/// @brief LLM configuration section.
struct LlmConfig
{
    /// Empty selects the default model, which is downloaded on first use.
    std::string modelPath;
    int contextSize = 4096;
    int gpuLayers = -1;
    int threads = 0;
    SamplerConfig sampler;
};

/// @brief Agent pipeline configuration section.
struct AgentConfig
{
    int maxDebugIterations = 3;
    int maxInferenceRetries = 3;
    int retryBackoffMs = 500;
    ReviewPolicyConfig review;
};

/// @brief Defaults for scaffolded projects.
struct ProjectConfig
{
    std::string templateId = "empty-activity";
    SourceLanguage language = SourceLanguage::Kotlin;
    int minSdk = 24;
    int targetSdk = 34;
    int compileSdk = 34;
    std::string packagePrefix = "com.example";
};

/// @brief Directory layout. Empty entries are filled in by resolvePaths().
struct PathsConfig
{
    std::string outputRoot;
    std::string generatedRoot;
    std::string toolchainRoot;
    std::string templatesDir;
    std::string promptsDir;
    std::string logDir;
};

/// @brief Toolchain provisioning section.
struct ToolchainConfig
{
    bool acceptLicenses = false;
    int downloadAttempts = 3;
    std::string buildToolsVersion = "34.0.0";
};

/// @brief Build section.
struct BuildConfig
{
    int timeoutSeconds = 1800;

    /// 0 means half the hardware threads.
    int maxConcurrentBuilds = 0;

    std::string task = "assembleDebug";
    std::size_t logTailBytes = 16 * 1024;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LlmConfig llm;
    AgentConfig agent;
    ProjectConfig project;
    PathsConfig paths;
    ToolchainConfig toolchain;
    BuildConfig build;
};

/// @brief Loads the configuration from the default config path, or defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file. Missing keys keep their defaults.
/// @return The configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Serializes a configuration; configFromJson() restores it.
[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Saves the configuration, creating the parent directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory: $XDG_CONFIG_HOME/apkforge or ~/.config/apkforge.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory: $XDG_DATA_HOME/apkforge or ~/.local/share/apkforge.
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns a copy of @p paths with every empty entry set to its default location.
[[nodiscard]] auto resolvePaths(const PathsConfig& paths) -> PathsConfig;

[[nodiscard]] auto defaultModelDir() -> std::string;
[[nodiscard]] auto defaultModelPath() -> std::string;
[[nodiscard]] auto defaultModelUrl() -> std::string_view;
[[nodiscard]] auto defaultModelFilename() -> std::string_view;

/// @brief Returns the model file to load, downloading the default model if necessary.
///
/// A configured path must exist. Without one, the default model is used and fetched
/// into the default model directory when it is not there yet.
/// @return The model path, a ModelLoadError, a DownloadError or Cancelled.
[[nodiscard]] auto ensureModelAvailable(const LlmConfig& config, Fetcher& fetcher, std::stop_token stopToken)
    -> Result<std::string>;

/// @brief Converts the build timeout to a duration; zero or less disables it.
[[nodiscard]] inline auto buildTimeout(const BuildConfig& config) -> std::chrono::milliseconds
{
    return config.timeoutSeconds > 0 ? std::chrono::milliseconds(std::chrono::seconds(config.timeoutSeconds))
                                     : std::chrono::milliseconds { 0 };
}

} // namespace apkforge
