// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace apkforge::fsutil
{

/// @brief Reads a whole file into a string.
/// @param path The file to read.
/// @return The file contents or a FileSystemError.
[[nodiscard]] auto readTextFile(const std::filesystem::path& path) -> Result<std::string>;

/// @brief Writes a file, creating parent directories and replacing any previous contents.
/// @param path The destination path.
/// @param contents The bytes to write.
/// @return Success or a FileSystemError.
[[nodiscard]] auto writeTextFile(const std::filesystem::path& path, std::string_view contents) -> VoidResult;

/// @brief Writes a file through a sibling temporary file and an atomic rename.
///
/// Readers observe either the previous contents or the new contents, never a mix.
/// @param path The destination path.
/// @param contents The bytes to write.
/// @return Success or a FileSystemError.
[[nodiscard]] auto writeFileAtomically(const std::filesystem::path& path, std::string_view contents)
    -> VoidResult;

/// @brief Returns true if @p path stays inside @p root after lexical normalization.
[[nodiscard]] auto isWithin(const std::filesystem::path& root, const std::filesystem::path& path) -> bool;

/// @brief Marks a file as executable by its owner, group and others.
[[nodiscard]] auto makeExecutable(const std::filesystem::path& path) -> VoidResult;

} // namespace apkforge::fsutil
