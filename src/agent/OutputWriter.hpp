// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <string_view>

namespace apkforge
{

/// @brief Persists generated files under a task-scoped location.
class OutputWriter
{
  public:
    virtual ~OutputWriter() = default;

    /// @brief Writes one file for a task.
    /// @param taskId The owning task; selects the task directory.
    /// @param file The file to write, relative to the task directory.
    /// @return The absolute path written, or a FileSystemError.
    [[nodiscard]] virtual auto write(std::string_view taskId, const GeneratedFile& file)
        -> Result<std::filesystem::path> = 0;
};

/// @brief Writes files to `<generatedRoot>/<taskId>/<relativePath>`.
///
/// Task ids must be a single path component and file paths must stay inside the task
/// directory. Existing files are replaced atomically.
class FileOutputWriter final: public OutputWriter
{
  public:
    explicit FileOutputWriter(std::filesystem::path generatedRoot);

    [[nodiscard]] auto write(std::string_view taskId, const GeneratedFile& file)
        -> Result<std::filesystem::path> override;

    /// @brief Returns the directory files of @p taskId are written to.
    [[nodiscard]] auto taskDirectory(std::string_view taskId) const -> std::filesystem::path;

  private:
    std::filesystem::path _generatedRoot;
};

} // namespace apkforge
