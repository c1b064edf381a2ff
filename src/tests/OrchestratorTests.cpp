// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <agent/Orchestrator.hpp>
#include <agent/OutputWriter.hpp>
#include <core/FileUtils.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace apkforge;
using namespace std::chrono_literals;

namespace
{

auto fastConfig() -> OrchestratorConfig
{
    auto config = OrchestratorConfig {};
    config.retryBackoff = 1ms;
    return config;
}

auto request(std::string taskId) -> GenerationRequest
{
    return GenerationRequest {
        .taskId = std::move(taskId),
        .prompt = "A counter app with a plus button",
        .language = SourceLanguage::Kotlin,
        .packageName = "com.example.counter",
    };
}

struct EventRecorder
{
    std::vector<AgentEvent> events;

    [[nodiscard]] auto sink() -> EventSink
    {
        return [this](const AgentEvent& event) { events.push_back(event); };
    }

    [[nodiscard]] auto progressMessages() const -> std::vector<std::string>
    {
        auto messages = std::vector<std::string> {};
        for (const auto& event: events)
        {
            if (auto const* progress = std::get_if<event::Progress>(&event))
                messages.push_back(progress->message);
        }
        return messages;
    }

    [[nodiscard]] auto terminalCount() const -> int
    {
        return static_cast<int>(std::ranges::count_if(events, [](const AgentEvent& e) { return isTerminalEvent(e); }));
    }
};

/// @brief Client whose Coder call blocks until the caller stops it; other roles answer at once.
class BlockingCoderClient final: public InferenceClient
{
  public:
    auto complete(const InferenceRequest& request, std::stop_token stopToken, const StreamCallback& onPiece)
        -> Result<std::string> override
    {
        if (request.role != AgentRole::Coder)
        {
            auto response = test::ScriptedInferenceClient::defaultResponse(request.role);
            if (onPiece)
                onPiece(response);
            return response;
        }

        auto lock = std::unique_lock(_mutex);
        _blocked = true;
        _blockedChanged.notify_all();
        _released.wait(lock, stopToken, [] { return false; });
        return makeError(ErrorCode::Cancelled, "Inference cancelled");
    }

    /// @brief Waits until the Coder call is blocked, for at most five seconds.
    [[nodiscard]] auto waitUntilBlocked() -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _blockedChanged.wait_for(lock, 5s, [this] { return _blocked; });
    }

  private:
    std::mutex _mutex;
    std::condition_variable_any _released;
    std::condition_variable _blockedChanged;
    bool _blocked = false;
};

/// @brief Writer that rejects every file.
class FailingWriter final: public OutputWriter
{
  public:
    auto write(std::string_view, const GeneratedFile& file) -> Result<std::filesystem::path> override
    {
        return makeError(ErrorCode::FileSystemError, std::format("disk full while writing {}", file.relativePath));
    }
};

} // namespace

TEST_CASE("Orchestrator finishes after a clean review", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, fastConfig());
    auto recorder = EventRecorder {};

    auto const outcome = orchestrator.run(request("clean"), recorder.sink(), std::stop_token {});

    REQUIRE(outcome.status == TaskStatus::Done);
    CHECK(!outcome.error.has_value());
    CHECK(outcome.codingRounds == 1);
    CHECK(outcome.debugIterations == 0);
    CHECK(!outcome.debugLimitReached);

    auto const file = writer.taskDirectory("clean") / "MainActivity.kt";
    auto const expected = std::vector<AgentEvent> {
        event::Progress { "Planning" },
        event::Progress { "Coding" },
        event::OutputFile { file },
        event::Progress { "Reviewing" },
        event::Done { outcome.summary },
    };
    CHECK(recorder.events == expected);

    REQUIRE(outcome.memory);
    REQUIRE(outcome.memory->size() == 3);
    CHECK((*outcome.memory)[0].role == AgentRole::Planner);
    CHECK((*outcome.memory)[1].role == AgentRole::Coder);
    CHECK((*outcome.memory)[2].role == AgentRole::Reviewer);

    REQUIRE(outcome.writtenFiles == std::vector<std::filesystem::path> { file });
    auto const contents = fsutil::readTextFile(file);
    REQUIRE(contents.has_value());
    CHECK(*contents == "package com.example.app\n\nclass MainActivity\n");
}

TEST_CASE("Orchestrator debugs and re-codes after a review with defects", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    client.respond(AgentRole::Reviewer, "[DEFECT] The button has no click listener\nVERDICT: FAIL");
    client.respond(AgentRole::Debugger, "Attach an OnClickListener to the plus button");

    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, fastConfig());
    auto recorder = EventRecorder {};

    auto const outcome = orchestrator.run(request("debug"), recorder.sink(), std::stop_token {});

    REQUIRE(outcome.status == TaskStatus::Done);
    CHECK(outcome.codingRounds == 2);
    CHECK(outcome.debugIterations == 1);
    CHECK(!outcome.debugLimitReached);
    CHECK(recorder.progressMessages()
          == std::vector<std::string> { "Planning", "Coding", "Reviewing", "Debugging", "Coding", "Reviewing" });
    CHECK(recorder.terminalCount() == 1);
    CHECK(std::holds_alternative<event::Done>(recorder.events.back()));

    REQUIRE(outcome.memory->size() == 6);
    CHECK((*outcome.memory)[3].role == AgentRole::Debugger);
    CHECK((*outcome.memory)[3].text == "Attach an OnClickListener to the plus button");

    // The same file was written twice but is reported once.
    CHECK(outcome.writtenFiles.size() == 1);

    auto coderPrompts = std::vector<std::string> {};
    for (const auto& r: client.requests())
    {
        if (r.role == AgentRole::Coder)
            coderPrompts.push_back(r.userPrompt);
    }
    REQUIRE(coderPrompts.size() == 2);
    CHECK(!coderPrompts[0].contains("REVIEW_FEEDBACK"));
    CHECK(coderPrompts[1].contains("REVIEW_FEEDBACK"));
    CHECK(coderPrompts[1].contains("no click listener"));
    CHECK(coderPrompts[1].contains("DEBUG_ANALYSIS"));
    CHECK(coderPrompts[1].contains("OnClickListener"));
}

TEST_CASE("Orchestrator stops debugging at the iteration bound", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    for (auto i = 0; i < 5; ++i)
        client.respond(AgentRole::Reviewer, "VERDICT: FAIL");

    auto config = fastConfig();
    config.maxDebugIterations = 2;
    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, config);
    auto recorder = EventRecorder {};

    auto const outcome = orchestrator.run(request("bounded"), recorder.sink(), std::stop_token {});

    REQUIRE(outcome.status == TaskStatus::Done);
    CHECK(outcome.debugLimitReached);
    CHECK(outcome.debugIterations == 2);
    CHECK(outcome.codingRounds == 3);
    CHECK(client.callCount(AgentRole::Debugger) == 2);
    CHECK(client.callCount(AgentRole::Reviewer) == 3);
    CHECK(outcome.summary.contains("still reports defects"));
    CHECK(recorder.terminalCount() == 1);
}

TEST_CASE("Orchestrator with no debug iterations accepts the first code", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    client.respond(AgentRole::Reviewer, "BUG: crashes on rotation");

    auto config = fastConfig();
    config.maxDebugIterations = 0;
    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, config);

    auto const outcome = orchestrator.run(request("no-debug"), {}, std::stop_token {});

    CHECK(outcome.status == TaskStatus::Done);
    CHECK(outcome.debugLimitReached);
    CHECK(outcome.codingRounds == 1);
    CHECK(client.callCount(AgentRole::Debugger) == 0);
}

TEST_CASE("Orchestrator retries transient inference failures", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    client.fail(AgentRole::Planner, ErrorCode::TransientInferenceError, "decode busy");
    client.fail(AgentRole::Planner, ErrorCode::TransientInferenceError, "decode busy");

    auto config = fastConfig();
    config.maxInferenceRetries = 2;
    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, config);

    auto const outcome = orchestrator.run(request("retry"), {}, std::stop_token {});

    CHECK(outcome.status == TaskStatus::Done);
    CHECK(client.callCount(AgentRole::Planner) == 3);
    // Failed attempts leave nothing in memory.
    CHECK(outcome.memory->size() == 3);
}

TEST_CASE("Orchestrator gives up after the retry budget", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    for (auto i = 0; i < 3; ++i)
        client.fail(AgentRole::Coder, ErrorCode::TransientInferenceError, "decode busy");

    auto config = fastConfig();
    config.maxInferenceRetries = 2;
    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, config);
    auto recorder = EventRecorder {};

    auto const outcome = orchestrator.run(request("exhausted"), recorder.sink(), std::stop_token {});

    REQUIRE(outcome.status == TaskStatus::Error);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code == ErrorCode::TransientInferenceError);
    CHECK(client.callCount(AgentRole::Coder) == 3);
    CHECK(client.callCount(AgentRole::Reviewer) == 0);
    CHECK(outcome.summary.starts_with("Coding failed"));
    REQUIRE(std::holds_alternative<event::Error>(recorder.events.back()));
    CHECK(std::get<event::Error>(recorder.events.back()).message == outcome.summary);
}

TEST_CASE("Orchestrator does not retry fatal inference failures", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    client.fail(AgentRole::Reviewer, ErrorCode::FatalInferenceError, "prompt does not fit the context");

    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, fastConfig());

    auto const outcome = orchestrator.run(request("fatal"), {}, std::stop_token {});

    REQUIRE(outcome.status == TaskStatus::Error);
    CHECK(outcome.error->code == ErrorCode::FatalInferenceError);
    CHECK(client.callCount(AgentRole::Reviewer) == 1);
    // Planner and Coder outputs survive the failure.
    CHECK(outcome.memory->size() == 2);
    CHECK(outcome.writtenFiles.size() == 1);
}

TEST_CASE("Orchestrator reports write failures as errors", "[orchestrator]")
{
    auto client = test::ScriptedInferenceClient {};
    auto writer = FailingWriter {};
    auto orchestrator = Orchestrator(client, writer, fastConfig());
    auto recorder = EventRecorder {};

    auto const outcome = orchestrator.run(request("unwritable"), recorder.sink(), std::stop_token {});

    REQUIRE(outcome.status == TaskStatus::Error);
    CHECK(outcome.error->code == ErrorCode::FileSystemError);
    CHECK(client.callCount(AgentRole::Reviewer) == 0);
    CHECK(outcome.writtenFiles.empty());
    CHECK(recorder.terminalCount() == 1);
}

TEST_CASE("Orchestrator cancels an in-flight stage", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto stopSource = std::stop_source {};
    client.onCall = [&](const InferenceRequest& r) {
        if (r.role == AgentRole::Coder)
            stopSource.request_stop();
    };

    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, fastConfig());
    auto recorder = EventRecorder {};

    auto const outcome = orchestrator.run(request("cancel"), recorder.sink(), stopSource.get_token());

    REQUIRE(outcome.status == TaskStatus::Cancelled);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->isCancellation());
    CHECK(outcome.summary == "Cancelled during Coding");
    CHECK(outcome.memory->size() == 1);
    CHECK(outcome.writtenFiles.empty());
    CHECK(client.callCount(AgentRole::Reviewer) == 0);
    CHECK(recorder.terminalCount() == 1);
    CHECK(std::holds_alternative<event::Cancelled>(recorder.events.back()));
    CHECK(!std::filesystem::exists(writer.taskDirectory("cancel")));
}

TEST_CASE("Orchestrator interrupts a blocked inference call from another thread", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = BlockingCoderClient {};
    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, fastConfig());
    auto recorder = EventRecorder {};
    auto cancelledAt = std::optional<std::chrono::steady_clock::time_point> {};
    auto const sink = [&](const AgentEvent& event) {
        if (std::holds_alternative<event::Cancelled>(event))
            cancelledAt = std::chrono::steady_clock::now();
        recorder.events.push_back(event);
    };

    auto outcome = std::optional<TaskOutcome> {};
    auto worker = std::jthread([&](std::stop_token stopToken) {
        outcome = orchestrator.run(request("blocked"), sink, std::move(stopToken));
    });
    REQUIRE(client.waitUntilBlocked());

    auto const stopRequestedAt = std::chrono::steady_clock::now();
    worker.request_stop();
    worker.join();

    REQUIRE(outcome.has_value());
    CHECK(outcome->status == TaskStatus::Cancelled);
    CHECK(outcome->summary == "Cancelled during Coding");
    REQUIRE(!recorder.events.empty());
    CHECK(std::holds_alternative<event::Cancelled>(recorder.events.back()));
    CHECK(recorder.terminalCount() == 1);
    REQUIRE(cancelledAt.has_value());
    CHECK(*cancelledAt - stopRequestedAt < 500ms);
    CHECK(!std::filesystem::exists(writer.taskDirectory("blocked")));
}

TEST_CASE("Orchestrator does not start a stage once stopped", "[orchestrator]")
{
    auto client = test::ScriptedInferenceClient {};
    auto writer = FailingWriter {};
    auto orchestrator = Orchestrator(client, writer, fastConfig());
    auto recorder = EventRecorder {};

    auto stopSource = std::stop_source {};
    stopSource.request_stop();
    auto const outcome = orchestrator.run(request("stopped"), recorder.sink(), stopSource.get_token());

    CHECK(outcome.status == TaskStatus::Cancelled);
    CHECK(client.requests().empty());
    CHECK(recorder.events.size() == 2);
}

TEST_CASE("Orchestrator hands each stage the memory of the stages before it", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, fastConfig());

    auto const outcome = orchestrator.run(request("memory"), {}, std::stop_token {});
    REQUIRE(outcome.status == TaskStatus::Done);

    auto const requests = client.requests();
    REQUIRE(requests.size() == 3);
    REQUIRE(requests[0].memory);
    CHECK(requests[0].memory->empty());
    CHECK(requests[1].memory->size() == 1);
    CHECK(requests[2].memory->size() == 2);
    CHECK((*requests[2].memory)[0].text == test::ScriptedInferenceClient::defaultResponse(AgentRole::Planner));

    // Snapshots handed out earlier are not affected by later appends.
    CHECK(requests[0].memory->empty());
    CHECK(requests[0].systemPrompt == orchestrator.config().prompts.planner);
    CHECK(requests[0].userPrompt.contains("A counter app with a plus button"));
    CHECK(requests[1].userPrompt.contains("com.example.counter"));
}

TEST_CASE("Orchestrator runs independent tasks concurrently", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto writer = FileOutputWriter(dir.path());
    auto orchestrator = Orchestrator(client, writer, fastConfig());

    auto outcomes = std::vector<TaskOutcome>(4);
    {
        auto threads = std::vector<std::jthread> {};
        for (auto i = std::size_t { 0 }; i < outcomes.size(); ++i)
            threads.emplace_back([&, i] {
                outcomes[i] = orchestrator.run(request(std::format("task-{}", i)), {}, std::stop_token {});
            });
    }

    for (auto i = std::size_t { 0 }; i < outcomes.size(); ++i)
    {
        CHECK(outcomes[i].status == TaskStatus::Done);
        REQUIRE(outcomes[i].memory->size() == 3);
        REQUIRE(outcomes[i].writtenFiles.size() == 1);
        CHECK(outcomes[i].writtenFiles[0].parent_path() == writer.taskDirectory(std::format("task-{}", i)));
    }
}

TEST_CASE("Orchestrator output depends only on the completions", "[orchestrator]")
{
    auto const dir = test::TempDir {};
    auto runOnce = [&](std::string taskId) {
        auto client = test::ScriptedInferenceClient {};
        client.respond(AgentRole::Reviewer, "VERDICT: FAIL");
        auto writer = FileOutputWriter(dir.path());
        auto orchestrator = Orchestrator(client, writer, fastConfig());
        return orchestrator.run(request(std::move(taskId)), {}, std::stop_token {});
    };

    auto const first = runOnce("first");
    auto const second = runOnce("second");

    REQUIRE(first.status == TaskStatus::Done);
    REQUIRE(second.status == TaskStatus::Done);
    CHECK(*first.memory == *second.memory);
    CHECK(first.generatedFiles == second.generatedFiles);
    CHECK(first.summary == second.summary);
}
