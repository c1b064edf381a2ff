// SPDX-License-Identifier: Apache-2.0
#include <agent/ReviewPolicy.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace apkforge;

TEST_CASE("ReviewPolicy honours explicit verdicts", "[review]")
{
    auto const policy = ReviewPolicy {};

    CHECK(policy.classify("Looks fine.\nVERDICT: PASS") == ReviewVerdict::Clean);
    CHECK(policy.classify("Missing import.\nVERDICT: FAIL") == ReviewVerdict::Defects);
    CHECK(policy.classify("**Verdict:** fail") == ReviewVerdict::Defects);

    SECTION("the last verdict wins")
    {
        CHECK(policy.classify("VERDICT: FAIL\nafter a second look\nVERDICT: PASS") == ReviewVerdict::Clean);
        CHECK(policy.classify("VERDICT: PASS\nVERDICT: FAIL") == ReviewVerdict::Defects);
    }

    SECTION("a verdict overrides markers")
    {
        CHECK(policy.classify("[DEFECT] fixed already\nVERDICT: PASS") == ReviewVerdict::Clean);
        CHECK(policy.classify("LGTM overall\nVERDICT: FAIL") == ReviewVerdict::Defects);
    }
}

TEST_CASE("ReviewPolicy falls back to markers", "[review]")
{
    auto const policy = ReviewPolicy {};

    CHECK(policy.classify("[DEFECT] onCreate never calls setContentView") == ReviewVerdict::Defects);
    CHECK(policy.classify("bug: the counter overflows") == ReviewVerdict::Defects);
    CHECK(policy.classify("NO_ISSUES found") == ReviewVerdict::Clean);

    SECTION("a clean marker inside a sentence does not hide a defect")
    {
        CHECK(policy.classify("BUG: crashes on rotation, not LGTM") == ReviewVerdict::Defects);
        CHECK(policy.classify("lgtm, but ERROR: the click listener is never registered") == ReviewVerdict::Defects);
        CHECK(policy.classify("NO_ISSUES apart from\n[DEFECT] missing manifest entry") == ReviewVerdict::Defects);
    }

    SECTION("a clean marker on its own line concludes the review")
    {
        CHECK(policy.classify("ERROR: handling could be nicer, optional.\n\nLGTM.") == ReviewVerdict::Clean);
        CHECK(policy.classify("- **NO_ISSUES**") == ReviewVerdict::Clean);
    }
}

TEST_CASE("ReviewPolicy treats text without markers as clean", "[review]")
{
    auto const policy = ReviewPolicy {};
    CHECK(policy.classify("") == ReviewVerdict::Clean);
    CHECK(policy.classify("The code follows the platform conventions.") == ReviewVerdict::Clean);
}

TEST_CASE("ReviewPolicy uses configured markers", "[review]")
{
    auto const policy = ReviewPolicy(ReviewPolicyConfig {
        .verdictPrefix = "RESULT:",
        .defectMarkers = { "TODO" },
        .cleanMarkers = { "SHIP IT" },
    });

    CHECK(policy.classify("result: fail") == ReviewVerdict::Defects);
    CHECK(policy.classify("VERDICT: FAIL") == ReviewVerdict::Clean);
    CHECK(policy.classify("todo: handle rotation") == ReviewVerdict::Defects);
    CHECK(policy.classify("Ship it") == ReviewVerdict::Clean);
}
