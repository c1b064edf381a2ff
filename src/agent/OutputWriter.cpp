// SPDX-License-Identifier: Apache-2.0
#include "OutputWriter.hpp"

#include <core/FileUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <utility>

namespace apkforge
{

namespace
{
    auto isValidTaskId(std::string_view taskId) -> bool
    {
        return !taskId.empty() && taskId != "." && taskId != ".." && taskId.find('/') == std::string_view::npos
               && taskId.find('\\') == std::string_view::npos;
    }
} // namespace

FileOutputWriter::FileOutputWriter(std::filesystem::path generatedRoot)
{
    auto ec = std::error_code {};
    _generatedRoot = std::filesystem::absolute(generatedRoot, ec);
    if (ec)
        _generatedRoot = std::move(generatedRoot);
}

auto FileOutputWriter::taskDirectory(std::string_view taskId) const -> std::filesystem::path
{
    return _generatedRoot / std::filesystem::path(taskId);
}

auto FileOutputWriter::write(std::string_view taskId, const GeneratedFile& file) -> Result<std::filesystem::path>
{
    if (!isValidTaskId(taskId))
        return makeError(ErrorCode::FileSystemError, std::format("Invalid task id: '{}'", taskId));

    auto const relative = std::filesystem::path(file.relativePath);
    if (file.relativePath.empty() || relative.is_absolute())
        return makeError(ErrorCode::FileSystemError,
                         std::format("Generated file path must be relative: '{}'", file.relativePath));

    auto const taskDir = taskDirectory(taskId);
    auto const target = (taskDir / relative).lexically_normal();
    if (!fsutil::isWithin(taskDir, target) || target == taskDir.lexically_normal())
        return makeError(ErrorCode::FileSystemError,
                         std::format("Generated file escapes the task directory: '{}'", file.relativePath));

    if (auto written = fsutil::writeFileAtomically(target, file.contents); !written)
        return std::unexpected(written.error());

    log::debug("Wrote {} ({} bytes)", target.string(), file.contents.size());
    return target;
}

} // namespace apkforge
