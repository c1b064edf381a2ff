// SPDX-License-Identifier: Apache-2.0
#include <llm/PromptComposer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace apkforge;

TEST_CASE("truncateMiddle leaves short text alone", "[prompt]")
{
    CHECK(PromptComposer::truncateMiddle("hello", 5) == "hello");
    CHECK(PromptComposer::truncateMiddle("", 0).empty());
}

TEST_CASE("truncateMiddle keeps head and tail", "[prompt]")
{
    auto const text = std::string(50, 'a') + std::string(100, 'm') + std::string(50, 'z');

    auto const result = PromptComposer::truncateMiddle(text, 100);

    CHECK(result.starts_with(std::string(50, 'a')));
    CHECK(result.ends_with(std::string(50, 'z')));
    CHECK(result.contains(TruncationMarker));
    CHECK(!result.contains('m'));
}

TEST_CASE("truncateMiddle never splits a UTF-8 sequence", "[prompt]")
{
    // Every character is the two byte sequence for U+00E4.
    auto text = std::string {};
    for (auto i = 0; i < 100; ++i)
        text += "\xC3\xA4";

    auto const result = PromptComposer::truncateMiddle(text, 51);
    auto const marker = result.find(TruncationMarker);
    REQUIRE(marker != std::string::npos);

    auto const head = result.substr(0, result.find("\n\n..."));
    auto const tail = result.substr(result.rfind("...\n\n") + 5);
    CHECK(head.size() % 2 == 0);
    CHECK(tail.size() % 2 == 0);
    CHECK(!head.empty());
    CHECK(!tail.empty());
}

TEST_CASE("compose renders system prompt, memory and task", "[prompt]")
{
    auto const memory = std::make_shared<const std::vector<MemoryEntry>>(std::vector<MemoryEntry> {
        MemoryEntry { .role = AgentRole::Planner, .text = "1. Add a button", .sequence = 0 },
        MemoryEntry { .role = AgentRole::Coder, .text = "class MainActivity", .sequence = 1 },
    });
    auto const request = InferenceRequest {
        .role = AgentRole::Reviewer,
        .systemPrompt = "You review Android code.",
        .userPrompt = "Review the code",
        .memory = memory,
    };

    auto const messages = PromptComposer(4096).compose(request);

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == PromptMessage { .role = "system", .content = "You review Android code." });
    CHECK(messages[1].role == "user");
    CHECK(messages[1].content.starts_with("RELEVANT_MEMORY:\n[PLANNER #0]\n1. Add a button"));
    CHECK(messages[1].content.contains("[CODER #1]\nclass MainActivity"));
    CHECK(messages[1].content.ends_with("TASK: Review the code"));
}

TEST_CASE("compose omits empty system prompt and memory", "[prompt]")
{
    auto const request = InferenceRequest { .role = AgentRole::Planner, .systemPrompt = std::nullopt, .userPrompt = "Plan", .memory = nullptr };

    auto const messages = PromptComposer(4096).compose(request);

    REQUIRE(messages.size() == 1);
    CHECK(messages[0] == PromptMessage { .role = "user", .content = "TASK: Plan" });
}

TEST_CASE("compose truncates the user message to the budget", "[prompt]")
{
    auto const request = InferenceRequest {
        .role = AgentRole::Coder,
        .systemPrompt = std::nullopt,
        .userPrompt = std::string(5000, 'x') + "END",
        .memory = nullptr,
    };

    auto const messages = PromptComposer(1000).compose(request);

    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content.starts_with("TASK: "));
    CHECK(messages[0].content.ends_with("END"));
    CHECK(messages[0].content.contains(TruncationMarker));
    CHECK(messages[0].content.size() < 1100);
}
