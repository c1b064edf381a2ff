// SPDX-License-Identifier: Apache-2.0
#include "Prompts.hpp"

#include <core/FileUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace apkforge
{

namespace
{
    constexpr auto PlannerPrompt = R"(You are a Planning Agent for Android applications. Your role is to:
1. BREAK DOWN the requested app into concrete implementation tasks
2. PRIORITIZE tasks based on dependencies
3. KEEP the plan small enough for a single-activity app

Use this format for your responses:
ANALYSIS: [Brief analysis of the request]
TASKS:
- Task 1: [description] (Priority: High/Medium/Low)
- Task 2: [description] (Priority: High/Medium/Low)
DEPENDENCIES: [List dependencies between tasks]
NEXT_ACTION: [What should be done first]

Keep responses concise and actionable.)";

    constexpr auto CoderPrompt = R"(You are a Code Generation Agent for Android applications. Your role is to:
1. WRITE complete, compilable source code for the planned tasks
2. USE the requested language and package name
3. KEEP the entry point in a class named MainActivity

Important guidelines:
- Write COMPLETE, WORKING code, no placeholders
- Put every file in its own fenced code block
- Start each code block with a header line of the form: // File: <relative path>
- Use only the Android SDK and AndroidX libraries

Format your response as:
CODE_EXPLANATION: [Brief explanation of what you're implementing]
```language
// File: MainActivity.kt
[Your code here]
```)";

    constexpr auto ReviewerPrompt = R"(You are a Code Review Agent. Your role is to:
1. ANALYZE the most recent code for bugs and compile errors
2. CHECK that it implements the original request
3. IDENTIFY missing imports, wrong package names and API misuse

Review format:
REVIEW_SUMMARY: [Overall assessment]
ISSUES_FOUND:
- [DEFECT] Issue 1: [description and location]
SUGGESTIONS:
- Suggestion 1: [improvement idea]
VERDICT: PASS or FAIL

Answer VERDICT: FAIL only when the code would not compile or does not do what was asked.)";

    constexpr auto DebuggerPrompt = R"(You are a Debug Analysis Agent. Your role is to:
1. ANALYZE the defects reported by the reviewer
2. IDENTIFY root causes
3. SUGGEST specific fixes the coder can apply

Debug format:
ERROR_ANALYSIS: [Analysis of the problem]
ROOT_CAUSE: [What's causing the issue]
SOLUTION: [Step-by-step fix])";

    auto overrideFileName(AgentRole role) -> std::string
    {
        auto name = std::string(roleToString(role));
        std::ranges::transform(name, name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return name + ".txt";
    }

    auto promptSlot(RolePrompts& prompts, AgentRole role) -> std::string&
    {
        switch (role)
        {
            case AgentRole::Planner: return prompts.planner;
            case AgentRole::Coder: return prompts.coder;
            case AgentRole::Reviewer: return prompts.reviewer;
            case AgentRole::Debugger: return prompts.debugger;
        }
        return prompts.planner;
    }
} // namespace

auto RolePrompts::forRole(AgentRole role) const -> const std::string&
{
    switch (role)
    {
        case AgentRole::Planner: return planner;
        case AgentRole::Coder: return coder;
        case AgentRole::Reviewer: return reviewer;
        case AgentRole::Debugger: return debugger;
    }
    return planner;
}

auto defaultRolePrompts() -> RolePrompts
{
    return RolePrompts {
        .planner = PlannerPrompt,
        .coder = CoderPrompt,
        .reviewer = ReviewerPrompt,
        .debugger = DebuggerPrompt,
    };
}

auto loadRolePromptOverrides(const std::filesystem::path& directory, RolePrompts prompts) -> RolePrompts
{
    auto ec = std::error_code {};
    if (directory.empty() || !std::filesystem::is_directory(directory, ec))
        return prompts;

    constexpr auto roles =
        std::array { AgentRole::Planner, AgentRole::Coder, AgentRole::Reviewer, AgentRole::Debugger };
    for (auto const role: roles)
    {
        auto const path = directory / overrideFileName(role);
        if (!std::filesystem::is_regular_file(path, ec))
            continue;

        auto text = fsutil::readTextFile(path);
        if (!text)
        {
            log::warning("Ignoring prompt override {}: {}", path.string(), text.error().message);
            continue;
        }
        if (text->empty())
            continue;

        log::debug("Using {} prompt from {}", roleToString(role), path.string());
        promptSlot(prompts, role) = std::move(*text);
    }
    return prompts;
}

} // namespace apkforge
