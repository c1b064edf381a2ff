// SPDX-License-Identifier: Apache-2.0
#include "ProjectDescriptor.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>

namespace apkforge
{

namespace
{
    constexpr auto ForbiddenNameChars = std::string_view { "<>:\"/\\|?*" };
    constexpr auto TrimmedNameChars = std::string_view { "._ " };

    auto isSpace(char c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    auto isIdentifierStart(char c) -> bool
    {
        return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
    }

    auto isIdentifierPart(char c) -> bool
    {
        return isIdentifierStart(c) || std::isdigit(static_cast<unsigned char>(c)) != 0;
    }
} // namespace

auto sanitizeProjectName(std::string_view name) -> std::string
{
    auto result = std::string {};
    auto inWhitespace = false;
    for (auto const c: name)
    {
        if (ForbiddenNameChars.find(c) != std::string_view::npos)
            continue;
        if (isSpace(c))
        {
            if (!inWhitespace)
                result += '_';
            inWhitespace = true;
            continue;
        }
        inWhitespace = false;
        result += c;
    }

    auto const first = result.find_first_not_of(TrimmedNameChars);
    if (first == std::string::npos)
        return std::string(FallbackProjectName);
    auto const last = result.find_last_not_of(TrimmedNameChars);
    result = result.substr(first, last - first + 1);

    if (result.size() > MaxProjectNameLength)
        result.resize(MaxProjectNameLength);
    return result;
}

auto derivePackageName(std::string_view prefix, std::string_view projectName) -> std::string
{
    auto segment = std::string {};
    for (auto const c: projectName)
    {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0 && static_cast<unsigned char>(c) < 0x80)
            segment += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (segment.empty())
        segment = "app";
    else if (std::isdigit(static_cast<unsigned char>(segment.front())) != 0)
        segment.insert(segment.begin(), 'a');

    if (prefix.empty())
        return std::format("com.example.{}", segment);
    return std::format("{}.{}", prefix, segment);
}

auto isValidPackageName(std::string_view packageName) -> bool
{
    auto segments = 0;
    for (auto const part: std::views::split(packageName, '.'))
    {
        auto const segment = std::string_view(part.begin(), part.end());
        if (segment.empty() || !isIdentifierStart(segment.front()))
            return false;
        if (!std::ranges::all_of(segment, isIdentifierPart))
            return false;
        ++segments;
    }
    return segments >= 2;
}

auto packagePath(std::string_view packageName) -> std::string
{
    auto path = std::string(packageName);
    std::ranges::replace(path, '.', '/');
    return path;
}

} // namespace apkforge
