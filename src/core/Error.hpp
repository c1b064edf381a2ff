// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace apkforge
{

/// @brief Error codes for categorizing failures across the pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ModelLoadError,
    TransientInferenceError,
    FatalInferenceError,
    TemplateError,
    FileSystemError,
    ToolchainInstallError,
    LicenseGateError,
    BuildFailure,
    ProcessError,
    TimeoutError,
    DownloadError,
    Cancelled,
};

/// @brief Returns a short, stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ModelLoadError: return "ModelLoadError";
        case ErrorCode::TransientInferenceError: return "TransientInferenceError";
        case ErrorCode::FatalInferenceError: return "FatalInferenceError";
        case ErrorCode::TemplateError: return "TemplateError";
        case ErrorCode::FileSystemError: return "FileSystemError";
        case ErrorCode::ToolchainInstallError: return "ToolchainInstallError";
        case ErrorCode::LicenseGateError: return "LicenseGateError";
        case ErrorCode::BuildFailure: return "BuildFailure";
        case ErrorCode::ProcessError: return "ProcessError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::DownloadError: return "DownloadError";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// @brief Returns true if the operation may succeed when retried unchanged.
    [[nodiscard]] auto isTransient() const noexcept -> bool { return code == ErrorCode::TransientInferenceError; }

    /// @brief Returns true if this error represents cooperative cancellation rather than a failure.
    [[nodiscard]] auto isCancellation() const noexcept -> bool { return code == ErrorCode::Cancelled; }
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace apkforge

template <>
struct std::formatter<apkforge::Error>: std::formatter<std::string>
{
    auto format(const apkforge::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", apkforge::errorCodeName(error.code), error.message), ctx);
    }
};
