// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace apkforge
{

/// @brief Outcome of classifying a review.
enum class ReviewVerdict
{
    Clean,
    Defects,
};

/// @brief Markers that decide whether a review reports defects.
struct ReviewPolicyConfig
{
    /// Start of an explicit verdict line, followed by PASS or FAIL.
    std::string verdictPrefix = "VERDICT:";
    std::vector<std::string> defectMarkers = { "[DEFECT]", "BUG:", "ERROR:" };
    std::vector<std::string> cleanMarkers = { "NO_ISSUES", "LGTM" };
};

/// @brief Classifies reviewer output.
///
/// The last verdict line wins. Without one, a line holding nothing but a clean marker means
/// Clean. Otherwise any defect marker means Defects, also when a clean marker appears inside a
/// sentence ("not LGTM"). Text matching nothing is Clean. All comparisons ignore case.
class ReviewPolicy
{
  public:
    explicit ReviewPolicy(ReviewPolicyConfig config = {});

    [[nodiscard]] auto classify(std::string_view review) const -> ReviewVerdict;

    [[nodiscard]] auto config() const noexcept -> const ReviewPolicyConfig& { return _config; }

  private:
    ReviewPolicyConfig _config;
};

} // namespace apkforge
