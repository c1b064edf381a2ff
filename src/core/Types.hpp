// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace apkforge
{

/// @brief The role an agent stage plays in the generation pipeline.
enum class AgentRole
{
    Planner,
    Coder,
    Reviewer,
    Debugger,
};

/// @brief Converts an AgentRole to the tag passed to inference clients.
/// @param role The role to convert.
/// @return The upper-case role tag.
[[nodiscard]] constexpr auto roleToString(AgentRole role) -> std::string_view
{
    switch (role)
    {
        case AgentRole::Planner: return "PLANNER";
        case AgentRole::Coder: return "CODER";
        case AgentRole::Reviewer: return "REVIEWER";
        case AgentRole::Debugger: return "DEBUGGER";
    }
    return "UNKNOWN";
}

/// @brief Parses a role tag (case-sensitive, as produced by roleToString).
/// @param str The string to parse.
/// @return The corresponding role, or AgentRole::Planner if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> AgentRole
{
    if (str == "CODER")
        return AgentRole::Coder;
    if (str == "REVIEWER")
        return AgentRole::Reviewer;
    if (str == "DEBUGGER")
        return AgentRole::Debugger;
    return AgentRole::Planner;
}

/// @brief One stage's output, as recorded in a task's memory log.
struct MemoryEntry
{
    AgentRole role = AgentRole::Planner;
    std::string text;
    std::size_t sequence = 0;

    auto operator==(const MemoryEntry&) const -> bool = default;
};

/// @brief Immutable view of a memory log at one point in time.
///
/// Snapshots are shared, never mutated; appending to the owning log produces a new snapshot.
using MemorySnapshot = std::shared_ptr<const std::vector<MemoryEntry>>;

/// @brief Lifecycle status of a generation task.
enum class TaskStatus
{
    Idle,
    Planning,
    Coding,
    Reviewing,
    Debugging,
    Writing,
    Done,
    Error,
    Cancelled,
};

/// @brief Returns true for Done, Error and Cancelled.
[[nodiscard]] constexpr auto isTerminal(TaskStatus status) -> bool
{
    return status == TaskStatus::Done || status == TaskStatus::Error || status == TaskStatus::Cancelled;
}

/// @brief Human-readable stage name, used as the Progress event message.
[[nodiscard]] constexpr auto statusToString(TaskStatus status) -> std::string_view
{
    switch (status)
    {
        case TaskStatus::Idle: return "Idle";
        case TaskStatus::Planning: return "Planning";
        case TaskStatus::Coding: return "Coding";
        case TaskStatus::Reviewing: return "Reviewing";
        case TaskStatus::Debugging: return "Debugging";
        case TaskStatus::Writing: return "Writing";
        case TaskStatus::Done: return "Done";
        case TaskStatus::Error: return "Error";
        case TaskStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Target language of generated Android sources.
enum class SourceLanguage
{
    Kotlin,
    Java,
};

/// @brief Returns the file extension (without dot) used for sources of the given language.
[[nodiscard]] constexpr auto sourceExtension(SourceLanguage language) -> std::string_view
{
    return language == SourceLanguage::Java ? "java" : "kt";
}

/// @brief Parses "kotlin" or "java" (case-insensitive first letter); anything else is Kotlin.
[[nodiscard]] constexpr auto languageFromString(std::string_view str) -> SourceLanguage
{
    if (str == "java" || str == "Java")
        return SourceLanguage::Java;
    return SourceLanguage::Kotlin;
}

/// @brief Returns "kotlin" or "java".
[[nodiscard]] constexpr auto languageToString(SourceLanguage language) -> std::string_view
{
    return language == SourceLanguage::Java ? "java" : "kotlin";
}

/// @brief A source file produced by the generation pipeline.
struct GeneratedFile
{
    /// Path relative to the template's source root (e.g. "MainActivity.kt").
    std::string relativePath;
    std::string contents;

    auto operator==(const GeneratedFile&) const -> bool = default;
};

} // namespace apkforge
