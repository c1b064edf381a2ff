// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <print>

namespace apkforge::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalMutex = std::mutex {};
    auto globalFile = std::ofstream {};

    constexpr auto levelPrefix(Level l) -> std::string_view
    {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto setLogFile(std::string_view path) -> VoidResult
{
    auto lock = std::lock_guard(globalMutex);

    if (globalFile.is_open())
        globalFile.close();

    if (path.empty())
        return {};

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create log directory '{}': {}", dir.string(), ec.message()));
    }

    globalFile.open(std::string(path), std::ios::app);
    if (!globalFile.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", path));
    return {};
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel.load())
        return;

    auto lock = std::lock_guard(globalMutex);

    if (globalFile.is_open())
    {
        auto const now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        std::println(globalFile, "{:%Y-%m-%d %H:%M:%S} [{}] {}", now, levelPrefix(level), message);
        globalFile.flush();
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace apkforge::log
