// SPDX-License-Identifier: Apache-2.0
#include "AndroidCatalog.hpp"

#include <format>
#include <string>

namespace apkforge
{

namespace
{
#if defined(__aarch64__)
    constexpr auto JdkUrl = "https://github.com/adoptium/temurin17-binaries/releases/download/jdk-17.0.10%2B7/"
                            "OpenJDK17U-jdk_aarch64_linux_hotspot_17.0.10_7.tar.gz";
#else
    constexpr auto JdkUrl = "https://github.com/adoptium/temurin17-binaries/releases/download/jdk-17.0.10%2B7/"
                            "OpenJDK17U-jdk_x64_linux_hotspot_17.0.10_7.tar.gz";
#endif
    constexpr auto JdkVersion = "17.0.10+7";

    constexpr auto CmdlineToolsVersion = "11076708";
    constexpr auto CmdlineToolsUrl =
        "https://dl.google.com/android/repository/commandlinetools-linux-11076708_latest.zip";

    constexpr auto GradleVersion = "8.5";
    constexpr auto GradleUrl = "https://services.gradle.org/distributions/gradle-8.5-bin.zip";
} // namespace

auto androidLicenseHashes(std::string_view licenseId) -> std::vector<std::string_view>
{
    if (licenseId == AndroidSdkLicenseId)
        return {
            "8933bad161af4178b1185d1a37fbf41ea5269c55",
            "d56f5187479451eabf01fb78af6dfcb131a6481e",
            "24333f8a63b6825ea9c5514f83c2829b004d1fee",
        };
    return {};
}

auto androidToolchainComponents(int compileSdk, std::string_view buildToolsVersion) -> std::vector<ComponentSpec>
{
    auto const sdkLicense = std::string(AndroidSdkLicenseId);
    return {
        ComponentSpec {
            .id = std::string(JdkComponentId),
            .version = JdkVersion,
            .kind = InstallKind::Archive,
            .url = JdkUrl,
        },
        ComponentSpec {
            .id = std::string(CmdlineToolsComponentId),
            .version = CmdlineToolsVersion,
            .kind = InstallKind::Archive,
            .url = CmdlineToolsUrl,
            .license = sdkLicense,
        },
        ComponentSpec {
            .id = std::string(GradleComponentId),
            .version = GradleVersion,
            .kind = InstallKind::Archive,
            .url = GradleUrl,
        },
        ComponentSpec {
            .id = "platform-tools",
            .version = "latest",
            .kind = InstallKind::SdkPackage,
            .license = sdkLicense,
        },
        ComponentSpec {
            .id = std::format("platforms;android-{}", compileSdk),
            .version = std::to_string(compileSdk),
            .kind = InstallKind::SdkPackage,
            .license = sdkLicense,
        },
        ComponentSpec {
            .id = std::format("build-tools;{}", buildToolsVersion),
            .version = std::string(buildToolsVersion),
            .kind = InstallKind::SdkPackage,
            .license = sdkLicense,
        },
    };
}

} // namespace apkforge
