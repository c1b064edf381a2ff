// SPDX-License-Identifier: Apache-2.0
#include "FileUtils.hpp"

#include <atomic>
#include <format>
#include <fstream>
#include <sstream>
#include <thread>

namespace apkforge::fsutil
{

namespace
{
    auto ensureParentDirectory(const std::filesystem::path& path) -> VoidResult
    {
        auto const dir = path.parent_path();
        if (dir.empty())
            return {};

        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::FileSystemError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
        return {};
    }

    auto temporarySiblingOf(const std::filesystem::path& path) -> std::filesystem::path
    {
        static auto counter = std::atomic<unsigned> { 0 };
        auto const threadTag = std::hash<std::thread::id> {}(std::this_thread::get_id());
        auto name = path.filename().string();
        name += std::format(".tmp-{:x}-{}", threadTag, counter.fetch_add(1));
        return path.parent_path() / name;
    }
} // namespace

auto readTextFile(const std::filesystem::path& path) -> Result<std::string>
{
    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::FileSystemError, std::format("Cannot open file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

auto writeTextFile(const std::filesystem::path& path, std::string_view contents) -> VoidResult
{
    if (auto dirResult = ensureParentDirectory(path); !dirResult)
        return dirResult;

    auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        return makeError(ErrorCode::FileSystemError, std::format("Cannot write file: {}", path.string()));

    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.close();
    if (!file)
        return makeError(ErrorCode::FileSystemError, std::format("Failed writing file: {}", path.string()));
    return {};
}

auto writeFileAtomically(const std::filesystem::path& path, std::string_view contents) -> VoidResult
{
    auto const tempPath = temporarySiblingOf(path);
    if (auto writeResult = writeTextFile(tempPath, contents); !writeResult)
        return writeResult;

    auto ec = std::error_code {};
    std::filesystem::rename(tempPath, path, ec);
    if (ec)
    {
        auto ignored = std::error_code {};
        std::filesystem::remove(tempPath, ignored);
        return makeError(ErrorCode::FileSystemError,
                         std::format("Failed to replace '{}': {}", path.string(), ec.message()));
    }
    return {};
}

auto isWithin(const std::filesystem::path& root, const std::filesystem::path& path) -> bool
{
    auto const normalRoot = root.lexically_normal();
    auto const normalPath = (path.is_absolute() ? path : root / path).lexically_normal();
    auto const relative = normalPath.lexically_relative(normalRoot);
    if (relative.empty())
        return false;
    return *relative.begin() != "..";
}

auto makeExecutable(const std::filesystem::path& path) -> VoidResult
{
    using std::filesystem::perms;
    auto ec = std::error_code {};
    std::filesystem::permissions(
        path, perms::owner_exec | perms::group_exec | perms::others_exec, std::filesystem::perm_options::add, ec);
    if (ec)
        return makeError(ErrorCode::FileSystemError,
                         std::format("Failed to mark '{}' executable: {}", path.string(), ec.message()));
    return {};
}

} // namespace apkforge::fsutil
