// SPDX-License-Identifier: Apache-2.0
#include "ReviewPolicy.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <ranges>
#include <utility>

namespace apkforge
{

namespace
{
    auto toUpper(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r*#>-");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r*");
        return text.substr(first, last - first + 1);
    }

    auto containsAny(std::string_view haystack, const std::vector<std::string>& needles) -> bool
    {
        return std::ranges::any_of(needles, [&](const std::string& needle) {
            return !needle.empty() && haystack.find(toUpper(needle)) != std::string_view::npos;
        });
    }

    /// True if a line of @p upperReview consists of nothing but one of @p needles.
    auto hasStandaloneLine(std::string_view upperReview, const std::vector<std::string>& needles) -> bool
    {
        for (auto const lineRange: std::views::split(upperReview, '\n'))
        {
            auto line = trim(std::string_view(lineRange.begin(), lineRange.end()));
            while (!line.empty() && (line.back() == '.' || line.back() == '!'))
                line.remove_suffix(1);
            if (!line.empty() && std::ranges::any_of(needles, [&](const std::string& n) { return line == toUpper(n); }))
                return true;
        }
        return false;
    }

    auto explicitVerdict(std::string_view upperReview, std::string_view upperPrefix) -> std::optional<ReviewVerdict>
    {
        if (upperPrefix.empty())
            return std::nullopt;

        auto verdict = std::optional<ReviewVerdict> {};
        for (auto const lineRange: std::views::split(upperReview, '\n'))
        {
            auto const line = trim(std::string_view(lineRange.begin(), lineRange.end()));
            if (!line.starts_with(upperPrefix))
                continue;

            auto const value = trim(line.substr(upperPrefix.size()));
            if (value.starts_with("PASS"))
                verdict = ReviewVerdict::Clean;
            else if (value.starts_with("FAIL"))
                verdict = ReviewVerdict::Defects;
        }
        return verdict;
    }
} // namespace

ReviewPolicy::ReviewPolicy(ReviewPolicyConfig config): _config(std::move(config))
{
}

auto ReviewPolicy::classify(std::string_view review) const -> ReviewVerdict
{
    auto const upper = toUpper(review);

    if (auto verdict = explicitVerdict(upper, toUpper(_config.verdictPrefix)))
        return *verdict;
    if (hasStandaloneLine(upper, _config.cleanMarkers))
        return ReviewVerdict::Clean;
    if (containsAny(upper, _config.defectMarkers))
        return ReviewVerdict::Defects;
    return ReviewVerdict::Clean;
}

} // namespace apkforge
