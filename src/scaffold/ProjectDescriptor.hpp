// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string>
#include <string_view>

namespace apkforge
{

/// @brief Name given to projects whose requested name sanitizes to nothing.
inline constexpr auto FallbackProjectName = std::string_view { "AndroidProject" };

/// @brief Upper bound on sanitized project name length.
inline constexpr auto MaxProjectNameLength = std::size_t { 50 };

/// @brief What to scaffold.
struct ProjectDescriptor
{
    /// Sanitized project name; also the project directory name.
    std::string name;
    std::string templateId = "empty-activity";
    std::string packageName;

    /// Label shown by the launcher; defaults to the project name.
    std::string appLabel;

    /// Free-form description, used for the README.
    std::string description;

    int minSdk = 24;
    int targetSdk = 34;
    int compileSdk = 34;
    SourceLanguage language = SourceLanguage::Kotlin;
};

/// @brief Turns a free-form name into a safe directory name.
///
/// Removes <>:"/\|?*, collapses whitespace runs to '_', trims '.', '_' and ' ' at both ends
/// and limits the result to MaxProjectNameLength characters. An empty result becomes
/// FallbackProjectName.
[[nodiscard]] auto sanitizeProjectName(std::string_view name) -> std::string;

/// @brief Derives `<prefix>.<lower-case alphanumerics of name>`.
///
/// A name without alphanumerics becomes "app"; a leading digit is prefixed with 'a' so
/// that the last segment is a valid Java identifier.
[[nodiscard]] auto derivePackageName(std::string_view prefix, std::string_view projectName) -> std::string;

/// @brief Returns true if @p packageName is a dotted sequence of Java identifiers with at least two segments.
[[nodiscard]] auto isValidPackageName(std::string_view packageName) -> bool;

/// @brief Returns the package as a relative directory path, e.g. "com/example/app".
[[nodiscard]] auto packagePath(std::string_view packageName) -> std::string;

} // namespace apkforge
