// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apkforge
{

/// @brief How a component gets onto disk.
enum class InstallKind
{
    Archive,    ///< A .tar.gz/.tgz/.zip unpacked into the component directory.
    File,       ///< A single file stored as is.
    SdkPackage, ///< An Android SDK package installed through sdkmanager.
};

/// @brief A component the caller needs.
struct ComponentSpec
{
    std::string id;
    std::string version;
    InstallKind kind = InstallKind::Archive;

    /// Download location for Archive and File components.
    std::string url;

    /// Expected download size and digest, when known.
    std::optional<std::uint64_t> size;
    std::optional<std::string> sha256;

    /// License that must be accepted before installing; empty for none.
    std::string license;
};

/// @brief Record of an installed component.
struct InstalledComponent
{
    std::string id;
    std::string version;
    std::filesystem::path path;
    std::string sha256;
    std::string installedAt;

    auto operator==(const InstalledComponent&) const -> bool = default;
};

/// @brief Record of an accepted license.
struct LicenseAcceptance
{
    std::string id;
    std::string acceptedAt;

    auto operator==(const LicenseAcceptance&) const -> bool = default;
};

/// @brief Everything installed below one managed toolchain root.
///
/// Install records are only ever appended. Several versions of one component live side by
/// side; latest() selects the highest.
struct ToolchainState
{
    std::filesystem::path root;
    std::vector<InstalledComponent> installed;
    std::vector<LicenseAcceptance> licenses;

    [[nodiscard]] auto find(std::string_view id, std::string_view version) const -> const InstalledComponent*;
    [[nodiscard]] auto latest(std::string_view id) const -> const InstalledComponent*;
    [[nodiscard]] auto hasLicense(std::string_view id) const -> bool;

    /// @brief Android SDK root inside the managed root.
    [[nodiscard]] auto sdkRoot() const -> std::filesystem::path { return root / "sdk"; }

    auto operator==(const ToolchainState&) const -> bool = default;
};

/// @brief Compares dotted version strings numerically where possible ("8.10" > "8.5").
/// @return Negative, zero or positive like strcmp.
[[nodiscard]] auto compareVersions(std::string_view a, std::string_view b) -> int;

/// @brief Serializes the state; component paths are stored relative to the root.
[[nodiscard]] auto toJson(const ToolchainState& state) -> nlohmann::json;

/// @brief Restores a state persisted by toJson().
/// @param json The persisted document.
/// @param root The managed root the document belongs to.
/// @return The state or a ToolchainInstallError for a malformed document.
[[nodiscard]] auto toolchainStateFromJson(const nlohmann::json& json, const std::filesystem::path& root)
    -> Result<ToolchainState>;

/// @brief Returns the current UTC time as an ISO-8601 string.
[[nodiscard]] auto utcTimestamp() -> std::string;

} // namespace apkforge
