// SPDX-License-Identifier: Apache-2.0
#include "ToolchainState.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <charconv>
#include <format>

namespace apkforge
{

namespace
{
    constexpr auto StateFormatVersion = 1;

    /// Splits "17.0.10+7" into "17", "0", "10", "7".
    auto versionParts(std::string_view version) -> std::vector<std::string_view>
    {
        auto parts = std::vector<std::string_view> {};
        auto start = std::size_t { 0 };
        for (auto i = std::size_t { 0 }; i <= version.size(); ++i)
        {
            if (i == version.size() || version[i] == '.' || version[i] == '+' || version[i] == '-' || version[i] == '_')
            {
                parts.push_back(version.substr(start, i - start));
                start = i + 1;
            }
        }
        return parts;
    }

    auto asNumber(std::string_view part) -> std::optional<unsigned long long>
    {
        if (part.empty() || !std::ranges::all_of(part, [](unsigned char c) { return std::isdigit(c) != 0; }))
            return std::nullopt;
        auto value = 0ull;
        auto const [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc {})
            return std::nullopt;
        return value;
    }
} // namespace

auto ToolchainState::find(std::string_view id, std::string_view version) const -> const InstalledComponent*
{
    auto const it = std::ranges::find_if(installed, [&](const InstalledComponent& c) {
        return c.id == id && c.version == version;
    });
    return it == installed.end() ? nullptr : &*it;
}

auto ToolchainState::latest(std::string_view id) const -> const InstalledComponent*
{
    auto const* best = static_cast<const InstalledComponent*>(nullptr);
    for (const auto& component: installed)
    {
        if (component.id != id)
            continue;
        if (!best || compareVersions(component.version, best->version) > 0)
            best = &component;
    }
    return best;
}

auto ToolchainState::hasLicense(std::string_view id) const -> bool
{
    return std::ranges::any_of(licenses, [&](const LicenseAcceptance& l) { return l.id == id; });
}

auto compareVersions(std::string_view a, std::string_view b) -> int
{
    auto const left = versionParts(a);
    auto const right = versionParts(b);
    for (auto i = std::size_t { 0 }; i < std::max(left.size(), right.size()); ++i)
    {
        auto const l = i < left.size() ? left[i] : std::string_view { "0" };
        auto const r = i < right.size() ? right[i] : std::string_view { "0" };

        auto const ln = asNumber(l);
        auto const rn = asNumber(r);
        if (ln && rn)
        {
            if (*ln != *rn)
                return *ln < *rn ? -1 : 1;
            continue;
        }
        if (auto const cmp = l.compare(r); cmp != 0)
            return cmp < 0 ? -1 : 1;
    }
    return 0;
}

auto toJson(const ToolchainState& state) -> nlohmann::json
{
    auto components = nlohmann::json::array();
    for (const auto& component: state.installed)
    {
        auto const relative = component.path.lexically_relative(state.root);
        components.push_back({
            { "id", component.id },
            { "version", component.version },
            { "path", (relative.empty() ? component.path : relative).generic_string() },
            { "sha256", component.sha256 },
            { "installedAt", component.installedAt },
        });
    }

    auto licenses = nlohmann::json::array();
    for (const auto& license: state.licenses)
        licenses.push_back({ { "id", license.id }, { "acceptedAt", license.acceptedAt } });

    return nlohmann::json {
        { "formatVersion", StateFormatVersion },
        { "components", components },
        { "licenses", licenses },
    };
}

auto toolchainStateFromJson(const nlohmann::json& json, const std::filesystem::path& root) -> Result<ToolchainState>
{
    if (!json.is_object())
        return makeError(ErrorCode::ToolchainInstallError, "Toolchain state must be a JSON object");

    auto state = ToolchainState { .root = root };

    if (json.contains("components") && json["components"].is_array())
    {
        for (const auto& entry: json["components"])
        {
            auto id = json::getString(entry, "id");
            auto version = json::getString(entry, "version");
            auto path = json::getString(entry, "path");
            if (!id || !version || !path)
                return makeError(ErrorCode::ToolchainInstallError, "Malformed component record in toolchain state");

            auto componentPath = std::filesystem::path(*path);
            if (componentPath.is_relative())
                componentPath = root / componentPath;

            state.installed.push_back(InstalledComponent {
                .id = std::move(*id),
                .version = std::move(*version),
                .path = componentPath.lexically_normal(),
                .sha256 = json::getStringOr(entry, "sha256", ""),
                .installedAt = json::getStringOr(entry, "installedAt", ""),
            });
        }
    }

    if (json.contains("licenses") && json["licenses"].is_array())
    {
        for (const auto& entry: json["licenses"])
        {
            auto id = json::getString(entry, "id");
            if (!id)
                return makeError(ErrorCode::ToolchainInstallError, "Malformed license record in toolchain state");
            state.licenses.push_back(
                LicenseAcceptance { .id = std::move(*id), .acceptedAt = json::getStringOr(entry, "acceptedAt", "") });
        }
    }

    return state;
}

auto utcTimestamp() -> std::string
{
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}

} // namespace apkforge
