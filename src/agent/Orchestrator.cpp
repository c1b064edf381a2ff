// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <agent/CodeExtractor.hpp>
#include <agent/MemoryLog.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <format>
#include <mutex>
#include <utility>

namespace apkforge
{

namespace
{
    auto languageName(SourceLanguage language) -> std::string_view
    {
        return language == SourceLanguage::Java ? "Java" : "Kotlin";
    }

    /// @brief Sleeps for @p delay unless a stop is requested first.
    /// @return false if the wait was cut short by a stop request.
    auto cancelableSleep(std::chrono::milliseconds delay, std::stop_token stopToken) -> bool
    {
        auto mutex = std::mutex {};
        auto cv = std::condition_variable_any {};
        auto lock = std::unique_lock { mutex };
        cv.wait_for(lock, stopToken, delay, [] { return false; });
        return !stopToken.stop_requested();
    }

    /// @brief State of one running task. Lives only for the duration of Orchestrator::run().
    class TaskRun
    {
      public:
        TaskRun(InferenceClient& client,
                OutputWriter& writer,
                const OrchestratorConfig& config,
                const ReviewPolicy& reviewPolicy,
                const GenerationRequest& request,
                const EventSink& sink,
                std::stop_token stopToken):
            _client(client),
            _writer(writer),
            _config(config),
            _reviewPolicy(reviewPolicy),
            _request(request),
            _sink(sink),
            _stopToken(std::move(stopToken))
        {
        }

        auto execute() -> TaskOutcome;

      private:
        InferenceClient& _client;
        OutputWriter& _writer;
        const OrchestratorConfig& _config;
        const ReviewPolicy& _reviewPolicy;
        const GenerationRequest& _request;
        const EventSink& _sink;
        std::stop_token _stopToken;

        MemoryLog _memory;
        TaskOutcome _outcome;

        void emit(AgentEvent event) const
        {
            log::trace("[{}] {}", _request.taskId, describe(event));
            if (_sink)
                _sink(event);
        }

        void enter(TaskStatus status)
        {
            _outcome.status = status;
            log::info("[{}] {}", _request.taskId, statusToString(status));
            emit(event::Progress { std::string(statusToString(status)) });
        }

        [[nodiscard]] auto runStage(AgentRole role, std::string userPrompt) -> Result<std::string>;
        [[nodiscard]] auto writeCode(std::string_view completion) -> VoidResult;

        [[nodiscard]] auto plannerPrompt() const -> std::string;
        [[nodiscard]] auto coderPrompt(std::string_view review, std::string_view analysis) const -> std::string;
        [[nodiscard]] auto reviewerPrompt() const -> std::string;
        [[nodiscard]] auto debuggerPrompt(std::string_view review) const -> std::string;

        auto finishDone() -> TaskOutcome;
        auto finishFailed(const Error& error) -> TaskOutcome;
    };

    auto TaskRun::execute() -> TaskOutcome
    {
        enter(TaskStatus::Planning);
        if (auto plan = runStage(AgentRole::Planner, plannerPrompt()); !plan)
            return finishFailed(plan.error());

        auto review = std::string {};
        auto analysis = std::string {};
        while (true)
        {
            enter(TaskStatus::Coding);
            auto code = runStage(AgentRole::Coder, coderPrompt(review, analysis));
            if (!code)
                return finishFailed(code.error());
            ++_outcome.codingRounds;

            _outcome.status = TaskStatus::Writing;
            if (auto written = writeCode(*code); !written)
                return finishFailed(written.error());

            enter(TaskStatus::Reviewing);
            auto reviewText = runStage(AgentRole::Reviewer, reviewerPrompt());
            if (!reviewText)
                return finishFailed(reviewText.error());
            review = std::move(*reviewText);

            if (_reviewPolicy.classify(review) == ReviewVerdict::Clean)
                break;

            if (_outcome.debugIterations >= _config.maxDebugIterations)
            {
                _outcome.debugLimitReached = true;
                log::warning("[{}] Review still reports defects after {} debug iteration(s), keeping the latest code",
                             _request.taskId,
                             _outcome.debugIterations);
                emit(event::Progress { std::format(
                    "Debug iteration limit ({}) reached; keeping the most recent code", _config.maxDebugIterations) });
                break;
            }

            ++_outcome.debugIterations;
            enter(TaskStatus::Debugging);
            auto debugText = runStage(AgentRole::Debugger, debuggerPrompt(review));
            if (!debugText)
                return finishFailed(debugText.error());
            analysis = std::move(*debugText);
        }

        return finishDone();
    }

    auto TaskRun::runStage(AgentRole role, std::string userPrompt) -> Result<std::string>
    {
        auto const request = InferenceRequest {
            .role = role,
            .systemPrompt = _config.prompts.forRole(role),
            .userPrompt = std::move(userPrompt),
            .memory = _memory.snapshot(),
        };

        auto const maxRetries = std::max(0, _config.maxInferenceRetries);
        for (auto attempt = 0;; ++attempt)
        {
            if (_stopToken.stop_requested())
                return makeError(ErrorCode::Cancelled, "Cancelled");

            auto completion = _client.complete(request, _stopToken, {});
            if (completion)
            {
                _memory.append(role, *completion);
                return completion;
            }

            auto const& error = completion.error();
            if (_stopToken.stop_requested() || error.isCancellation())
                return makeError(ErrorCode::Cancelled, "Cancelled");
            if (!error.isTransient())
                return std::unexpected(error);
            if (attempt >= maxRetries)
                return makeError(ErrorCode::TransientInferenceError,
                                 std::format("{} stage failed after {} retries: {}",
                                             roleToString(role),
                                             maxRetries,
                                             error.message));

            auto const delay = _config.retryBackoff * (1 << std::min(attempt, 16));
            log::warning("[{}] {} inference failed ({}), retrying in {} ms",
                         _request.taskId,
                         roleToString(role),
                         error.message,
                         delay.count());
            if (!cancelableSleep(delay, _stopToken))
                return makeError(ErrorCode::Cancelled, "Cancelled");
        }
    }

    auto TaskRun::writeCode(std::string_view completion) -> VoidResult
    {
        auto files = extractCodeFiles(completion, _request.language);
        for (const auto& file: files)
        {
            auto path = _writer.write(_request.taskId, file);
            if (!path)
                return std::unexpected(path.error());

            if (std::ranges::find(_outcome.writtenFiles, *path) == _outcome.writtenFiles.end())
                _outcome.writtenFiles.push_back(*path);
            emit(event::OutputFile { *path });
        }
        _outcome.generatedFiles = std::move(files);
        return {};
    }

    auto TaskRun::plannerPrompt() const -> std::string
    {
        return std::format("Create a detailed task breakdown for this Android app:\n{}", _request.prompt);
    }

    auto TaskRun::coderPrompt(std::string_view review, std::string_view analysis) const -> std::string
    {
        auto prompt = std::format("Write the {} source code for this Android app:\n{}",
                                  languageName(_request.language),
                                  _request.prompt);
        if (!_request.packageName.empty())
            prompt += std::format("\n\nUse the package name {}.", _request.packageName);
        if (!review.empty())
            prompt += std::format("\n\nREVIEW_FEEDBACK:\n{}", review);
        if (!analysis.empty())
            prompt += std::format("\n\nDEBUG_ANALYSIS:\n{}", analysis);
        return prompt;
    }

    auto TaskRun::reviewerPrompt() const -> std::string
    {
        return std::format("Review the most recent {} code generated for this request:\n{}",
                           languageName(_request.language),
                           _request.prompt);
    }

    auto TaskRun::debuggerPrompt(std::string_view review) const -> std::string
    {
        return std::format("The reviewer reported these problems:\n{}\n\nOriginal request:\n{}", review, _request.prompt);
    }

    auto TaskRun::finishDone() -> TaskOutcome
    {
        _outcome.summary = std::format("Generated {} file(s) in {} coding round(s)",
                                       _outcome.generatedFiles.size(),
                                       _outcome.codingRounds);
        if (_outcome.debugLimitReached)
            _outcome.summary += "; the review still reports defects";

        _outcome.status = TaskStatus::Done;
        _outcome.memory = _memory.snapshot();
        log::info("[{}] Done: {}", _request.taskId, _outcome.summary);
        emit(event::Done { _outcome.summary });
        return std::move(_outcome);
    }

    auto TaskRun::finishFailed(const Error& error) -> TaskOutcome
    {
        auto const stage = statusToString(_outcome.status);
        _outcome.memory = _memory.snapshot();
        _outcome.error = error;

        if (error.isCancellation())
        {
            _outcome.status = TaskStatus::Cancelled;
            _outcome.summary = std::format("Cancelled during {}", stage);
            log::info("[{}] {}", _request.taskId, _outcome.summary);
            emit(event::Cancelled { _outcome.summary });
        }
        else
        {
            _outcome.status = TaskStatus::Error;
            _outcome.summary = std::format("{} failed: {}", stage, error.message);
            log::error("[{}] {}", _request.taskId, _outcome.summary);
            emit(event::Error { _outcome.summary });
        }
        return std::move(_outcome);
    }

} // namespace

Orchestrator::Orchestrator(InferenceClient& client, OutputWriter& writer, OrchestratorConfig config):
    _client(client), _writer(writer), _config(std::move(config)), _reviewPolicy(_config.reviewPolicy)
{
}

auto Orchestrator::run(const GenerationRequest& request, const EventSink& sink, std::stop_token stopToken)
    -> TaskOutcome
{
    auto task = TaskRun(_client, _writer, _config, _reviewPolicy, request, sink, std::move(stopToken));
    return task.execute();
}

auto Orchestrator::config() const -> const OrchestratorConfig&
{
    return _config;
}

} // namespace apkforge
