// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Events.hpp>
#include <agent/OutputWriter.hpp>
#include <agent/Prompts.hpp>
#include <agent/ReviewPolicy.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/InferenceClient.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace apkforge
{

/// @brief Policy knobs of the generation pipeline.
struct OrchestratorConfig
{
    /// Review/debug cycles allowed before the most recent code is accepted as is.
    int maxDebugIterations = 3;

    /// Retries of a stage whose inference call failed transiently.
    int maxInferenceRetries = 3;

    /// Delay before the first retry; doubles with each further attempt.
    std::chrono::milliseconds retryBackoff { 500 };

    ReviewPolicyConfig reviewPolicy;
    RolePrompts prompts = defaultRolePrompts();
};

/// @brief One generation request.
struct GenerationRequest
{
    /// Caller-chosen id; names the task's output directory.
    std::string taskId;
    std::string prompt;
    SourceLanguage language = SourceLanguage::Kotlin;

    /// Package the generated sources should declare. Empty leaves the choice to the model.
    std::string packageName;
};

/// @brief What a finished task leaves behind.
struct TaskOutcome
{
    TaskStatus status = TaskStatus::Idle;

    /// Every stage output, including those of a failed or cancelled task.
    MemorySnapshot memory;

    /// Absolute paths of every file written, in write order, without duplicates.
    std::vector<std::filesystem::path> writtenFiles;

    /// Files of the most recent Coding stage.
    std::vector<GeneratedFile> generatedFiles;

    int codingRounds = 0;
    int debugIterations = 0;

    /// True when the task finished because the debug loop hit its bound.
    bool debugLimitReached = false;

    /// Done summary, or the message of the terminal Error/Cancelled event.
    std::string summary;

    std::optional<Error> error;
};

/// @brief Drives one task through Planning, Coding, Reviewing and the bounded Debugging loop.
///
/// Every stage issues one inference call with the role's system prompt, the task prompt
/// and a snapshot of the task's memory log, and appends the completion before moving on.
/// Each transition emits exactly one event. Tasks share nothing but the collaborators,
/// so several tasks may run at once when the inference client and writer allow it.
class Orchestrator
{
  public:
    /// @brief Constructs an Orchestrator.
    /// @param client The inference backend.
    /// @param writer Destination of generated files.
    /// @param config Loop bounds, retry policy, review policy and prompts.
    Orchestrator(InferenceClient& client, OutputWriter& writer, OrchestratorConfig config = {});

    /// @brief Runs a task to a terminal status.
    /// @param request The task to run.
    /// @param sink Receives the task's events; may be empty.
    /// @param stopToken Cancels the task, including its in-flight inference call.
    /// @return The terminal status with everything the task produced.
    [[nodiscard]] auto run(const GenerationRequest& request, const EventSink& sink, std::stop_token stopToken)
        -> TaskOutcome;

    [[nodiscard]] auto config() const -> const OrchestratorConfig&;

  private:
    InferenceClient& _client;
    OutputWriter& _writer;
    OrchestratorConfig _config;
    ReviewPolicy _reviewPolicy;
};

} // namespace apkforge
