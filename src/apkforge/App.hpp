// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <apkforge/Config.hpp>
#include <apkforge/Pipeline.hpp>
#include <core/Error.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace apkforge
{

/// @brief Process exit codes of the command line tool.
enum class ExitCode : int
{
    Success = 0,
    Failure = 1,
    Cancelled = 130,
};

/// @brief Command line front end: wires the llama.cpp engine and the pipeline to the console.
///
/// SIGINT and SIGTERM cancel the running command instead of killing the process, so
/// builds and downloads get to clean up after themselves.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the log file and loads template and prompt overrides.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the whole pipeline for a prompt and prints the artifact path.
    [[nodiscard]] auto generate(const PipelineRequest& request) -> ExitCode;

    /// @brief Scaffolds a project from the configured template without generated code.
    [[nodiscard]] auto scaffold(std::string_view name,
                                std::string_view description,
                                std::optional<SourceLanguage> language) -> ExitCode;

    /// @brief Installs the toolchain, recording license consent first when asked to.
    [[nodiscard]] auto provision(bool acceptLicenses) -> ExitCode;

    /// @brief Builds an existing project directory.
    [[nodiscard]] auto build(const std::filesystem::path& projectRoot) -> ExitCode;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace apkforge
