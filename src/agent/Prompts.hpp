// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <filesystem>
#include <string>

namespace apkforge
{

/// @brief System prompts for the pipeline roles.
struct RolePrompts
{
    std::string planner;
    std::string coder;
    std::string reviewer;
    std::string debugger;

    /// @brief Returns the prompt for @p role.
    [[nodiscard]] auto forRole(AgentRole role) const -> const std::string&;
};

/// @brief Returns the built-in role prompts.
[[nodiscard]] auto defaultRolePrompts() -> RolePrompts;

/// @brief Replaces built-in prompts with files found in @p directory.
///
/// Looks for planner.txt, coder.txt, reviewer.txt and debugger.txt. Missing or unreadable
/// files leave the corresponding prompt untouched.
/// @param directory Directory holding the override files; may not exist.
/// @param prompts The prompts to start from.
[[nodiscard]] auto loadRolePromptOverrides(const std::filesystem::path& directory, RolePrompts prompts)
    -> RolePrompts;

} // namespace apkforge
