// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string_view>
#include <vector>

namespace apkforge
{

/// @brief Base name of files whose completion did not name them.
inline constexpr auto UnnamedCodeBaseName = std::string_view { "GeneratedCode" };

/// @brief Splits a Coder completion into source files.
///
/// Each fenced code block becomes one file. A block whose first non-empty line is a file
/// header (`// File: path`, `# File: path` or `<!-- File: path -->`) is stored under that path
/// and the header line is dropped; other blocks are named GeneratedCode.<ext>,
/// GeneratedCode2.<ext>, ... with the extension taken from the fence language or, failing
/// that, from @p language. A completion without any fence becomes a single GeneratedCode file.
/// When two blocks name the same path, the later one wins.
/// @param completion The Coder output.
/// @param language Language preference used for untagged blocks.
/// @return The files in order of first appearance; never empty.
[[nodiscard]] auto extractCodeFiles(std::string_view completion, SourceLanguage language)
    -> std::vector<GeneratedFile>;

} // namespace apkforge
