// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <toolchain/ToolchainState.hpp>

#include <string_view>
#include <vector>

namespace apkforge
{

inline constexpr auto JdkComponentId = std::string_view { "jdk" };
inline constexpr auto CmdlineToolsComponentId = std::string_view { "cmdline-tools" };
inline constexpr auto GradleComponentId = std::string_view { "gradle" };

/// @brief License every Android SDK download is subject to.
inline constexpr auto AndroidSdkLicenseId = std::string_view { "android-sdk-license" };

inline constexpr auto DefaultBuildToolsVersion = std::string_view { "34.0.0" };

/// @brief Returns the hashes sdkmanager expects in `licenses/<licenseId>` for an accepted license.
[[nodiscard]] auto androidLicenseHashes(std::string_view licenseId) -> std::vector<std::string_view>;

/// @brief Components needed to build a debug APK against @p compileSdk.
///
/// Archives (JDK, command-line tools, Gradle) come first, followed by the SDK packages
/// that sdkmanager installs with them.
[[nodiscard]] auto androidToolchainComponents(int compileSdk,
                                              std::string_view buildToolsVersion = DefaultBuildToolsVersion)
    -> std::vector<ComponentSpec>;

} // namespace apkforge
