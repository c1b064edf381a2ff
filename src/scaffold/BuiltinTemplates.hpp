// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <scaffold/Template.hpp>

#include <vector>

namespace apkforge
{

/// @brief Id of the default single-activity template.
inline constexpr auto EmptyActivityTemplateId = std::string_view { "empty-activity" };

/// @brief Returns the templates compiled into the binary.
[[nodiscard]] auto builtinTemplates() -> std::vector<ProjectTemplate>;

} // namespace apkforge
