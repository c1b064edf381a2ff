// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <format>
#include <string_view>

namespace apkforge::log
{

/// @brief Verbosity of a message; a message is emitted when its level is at most the global level.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Mirrors every emitted message, timestamped, into a log file.
///
/// The file is appended to and its directory created on demand. An empty path closes the
/// current file. Messages keep going to stderr either way.
/// @return Success or an IoError if the file cannot be opened.
[[nodiscard]] auto setLogFile(std::string_view path) -> VoidResult;

/// @brief Emits one message to stderr and the log file. Thread-safe.
void write(Level level, std::string_view message);

namespace detail
{
    template <typename... Args>
    void emit(Level level, std::format_string<Args...> fmt, Args&&... args)
    {
        // Skip formatting entirely for suppressed levels; debug and trace messages are frequent.
        if (level > getLevel())
            return;
        write(level, std::format(fmt, std::forward<Args>(args)...));
    }
} // namespace detail

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Debug, fmt, std::forward<Args>(args)...);
}

/// @brief Logs a trace message. Agent events are traced with their full payload.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace apkforge::log
