// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <variant>

namespace apkforge::event
{

/// @brief A stage started, or an advisory message.
struct Progress
{
    std::string message;

    auto operator==(const Progress&) const -> bool = default;
};

/// @brief A file was written by the pipeline.
struct OutputFile
{
    std::filesystem::path path; ///< Absolute path of the written file.

    auto operator==(const OutputFile&) const -> bool = default;
};

/// @brief The task finished successfully.
struct Done
{
    std::string summary;

    auto operator==(const Done&) const -> bool = default;
};

/// @brief The task failed.
struct Error
{
    std::string message;

    auto operator==(const Error&) const -> bool = default;
};

/// @brief The task was cancelled.
struct Cancelled
{
    std::string message;

    auto operator==(const Cancelled&) const -> bool = default;
};

} // namespace apkforge::event

namespace apkforge
{

/// @brief Discriminated union of everything a task reports to its observer.
using AgentEvent = std::variant<event::Progress, event::OutputFile, event::Done, event::Error, event::Cancelled>;

/// @brief Receives events in the order they occur. Used for display only.
using EventSink = std::function<void(const AgentEvent& event)>;

/// @brief Returns true for the events that end a task.
[[nodiscard]] inline auto isTerminalEvent(const AgentEvent& event) -> bool
{
    return std::holds_alternative<event::Done>(event) || std::holds_alternative<event::Error>(event)
           || std::holds_alternative<event::Cancelled>(event);
}

/// @brief One-line human readable rendering, e.g. "Progress: Planning".
[[nodiscard]] auto describe(const AgentEvent& event) -> std::string;

} // namespace apkforge
