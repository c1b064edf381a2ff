// SPDX-License-Identifier: Apache-2.0
#include <toolchain/AndroidCatalog.hpp>
#include <toolchain/ToolchainState.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace apkforge;

TEST_CASE("compareVersions orders numeric parts numerically", "[toolchain]")
{
    CHECK(compareVersions("8.10", "8.5") > 0);
    CHECK(compareVersions("8.5", "8.10") < 0);
    CHECK(compareVersions("8.5", "8.5.0") == 0);
    CHECK(compareVersions("17.0.10+7", "17.0.9+11") > 0);
    CHECK(compareVersions("34.0.0", "34.0.0") == 0);
    CHECK(compareVersions("1.0-beta", "1.0-alpha") > 0);
    CHECK(compareVersions("11076708", "9477386") > 0);
}

TEST_CASE("ToolchainState finds components by id and version", "[toolchain]")
{
    auto const state = ToolchainState {
        .root = "/opt/apkforge",
        .installed = {
            InstalledComponent { .id = "gradle", .version = "8.5", .path = "/opt/apkforge/components/gradle/8.5", .sha256 = {}, .installedAt = {} },
            InstalledComponent { .id = "gradle", .version = "8.10", .path = "/opt/apkforge/components/gradle/8.10", .sha256 = {}, .installedAt = {} },
            InstalledComponent { .id = "jdk", .version = "17", .path = "/opt/apkforge/components/jdk/17", .sha256 = {}, .installedAt = {} },
        },
        .licenses = { LicenseAcceptance { .id = "android-sdk-license", .acceptedAt = "2026-01-01T00:00:00Z" } },
    };

    REQUIRE(state.find("gradle", "8.5") != nullptr);
    CHECK(state.find("gradle", "8.5")->path == "/opt/apkforge/components/gradle/8.5");
    CHECK(state.find("gradle", "7.0") == nullptr);

    REQUIRE(state.latest("gradle") != nullptr);
    CHECK(state.latest("gradle")->version == "8.10");
    CHECK(state.latest("platform-tools") == nullptr);

    CHECK(state.hasLicense("android-sdk-license"));
    CHECK(!state.hasLicense("android-sdk-preview-license"));
    CHECK(state.sdkRoot() == "/opt/apkforge/sdk");
}

TEST_CASE("ToolchainState survives serialization with root-relative paths", "[toolchain]")
{
    auto const state = ToolchainState {
        .root = "/opt/apkforge",
        .installed = {
            InstalledComponent { .id = "jdk", .version = "17.0.10+7", .path = "/opt/apkforge/components/jdk/17.0.10+7", .sha256 = "abc", .installedAt = "2026-01-01T00:00:00Z" },
        },
        .licenses = { LicenseAcceptance { .id = "android-sdk-license", .acceptedAt = "2026-01-01T00:00:00Z" } },
    };

    auto const document = toJson(state);
    CHECK(document["components"][0]["path"] == "components/jdk/17.0.10+7");

    SECTION("same root")
    {
        auto const restored = toolchainStateFromJson(document, "/opt/apkforge");
        REQUIRE(restored.has_value());
        CHECK(*restored == state);
    }

    SECTION("moved root")
    {
        auto const restored = toolchainStateFromJson(document, "/srv/toolchain");
        REQUIRE(restored.has_value());
        CHECK(restored->installed[0].path == "/srv/toolchain/components/jdk/17.0.10+7");
    }
}

TEST_CASE("toolchainStateFromJson rejects malformed records", "[toolchain]")
{
    CHECK(!toolchainStateFromJson(nlohmann::json::array(), "/opt").has_value());
    CHECK(!toolchainStateFromJson(nlohmann::json::parse(R"({ "components": [ { "id": "jdk" } ] })"), "/opt").has_value());
    CHECK(!toolchainStateFromJson(nlohmann::json::parse(R"({ "licenses": [ { "acceptedAt": "x" } ] })"), "/opt").has_value());

    auto const empty = toolchainStateFromJson(nlohmann::json::object(), "/opt");
    REQUIRE(empty.has_value());
    CHECK(empty->installed.empty());
    CHECK(empty->licenses.empty());
}

TEST_CASE("utcTimestamp uses ISO-8601 UTC", "[toolchain]")
{
    auto const stamp = utcTimestamp();
    CHECK(stamp.size() == 20);
    CHECK(stamp[10] == 'T');
    CHECK(stamp.ends_with('Z'));
}

TEST_CASE("androidToolchainComponents lists archives before SDK packages", "[toolchain]")
{
    auto const components = androidToolchainComponents(34, "34.0.0");

    auto const ids = [&] {
        auto result = std::vector<std::string> {};
        for (const auto& c: components)
            result.push_back(c.id);
        return result;
    }();
    CHECK(std::ranges::find(ids, JdkComponentId) != ids.end());
    CHECK(std::ranges::find(ids, GradleComponentId) != ids.end());
    CHECK(std::ranges::find(ids, "platforms;android-34") != ids.end());
    CHECK(std::ranges::find(ids, "build-tools;34.0.0") != ids.end());

    auto const firstPackage = std::ranges::find(components, InstallKind::SdkPackage, &ComponentSpec::kind);
    CHECK(std::all_of(firstPackage, components.end(), [](const ComponentSpec& c) { return c.kind == InstallKind::SdkPackage; }));
    CHECK(std::all_of(components.begin(), firstPackage, [](const ComponentSpec& c) { return !c.url.empty(); }));
    CHECK(std::ranges::all_of(firstPackage, components.end(), [](const ComponentSpec& c) { return c.license == AndroidSdkLicenseId; }));

    CHECK(!androidLicenseHashes(AndroidSdkLicenseId).empty());
    CHECK(androidLicenseHashes("unknown-license").empty());
}
