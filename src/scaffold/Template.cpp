// SPDX-License-Identifier: Apache-2.0
#include "Template.hpp"

#include <core/FileUtils.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <scaffold/BuiltinTemplates.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace apkforge
{

namespace
{
    constexpr auto ManifestFileName = "template.json";

    auto isPlaceholderChar(char c) -> bool
    {
        return std::isupper(static_cast<unsigned char>(c)) != 0 || std::isdigit(static_cast<unsigned char>(c)) != 0
               || c == '_';
    }

    auto parseTemplateFile(const nlohmann::json& entry, const std::filesystem::path& baseDir)
        -> Result<TemplateFile>
    {
        if (!entry.is_object())
            return makeError(ErrorCode::TemplateError, "Template file entry must be an object");

        auto path = json::getString(entry, "path");
        if (!path || path->empty())
            return makeError(ErrorCode::TemplateError, "Template file entry has no 'path'");

        auto file = TemplateFile { .path = std::move(*path) };
        file.executable = json::getBoolOr(entry, "executable", false);

        auto const language = json::getStringOr(entry, "language", "");
        if (language == "kotlin" || language == "java")
            file.language = languageFromString(language);
        else if (!language.empty())
            return makeError(ErrorCode::TemplateError,
                             std::format("Template file '{}' has unknown language '{}'", file.path, language));

        if (entry.contains("contents") && entry["contents"].is_string())
        {
            file.contents = entry["contents"].get<std::string>();
            return file;
        }

        auto const source = json::getStringOr(entry, "source", file.path);
        auto const sourcePath = baseDir / source;
        if (!fsutil::isWithin(baseDir, sourcePath))
            return makeError(ErrorCode::TemplateError,
                             std::format("Template source '{}' lies outside the template directory", source));

        auto contents = fsutil::readTextFile(sourcePath);
        if (!contents)
            return makeError(ErrorCode::TemplateError,
                             std::format("Template file '{}' is unreadable: {}", source, contents.error().message));
        file.contents = std::move(*contents);
        return file;
    }
} // namespace

auto renderPlaceholders(std::string_view text, const Substitutions& substitutions) -> Result<std::string>
{
    auto result = std::string {};
    result.reserve(text.size());

    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto const open = text.find("{{", pos);
        if (open == std::string_view::npos)
        {
            result += text.substr(pos);
            break;
        }

        result += text.substr(pos, open - pos);
        auto const close = text.find("}}", open + 2);
        auto const name = close == std::string_view::npos ? std::string_view {} : text.substr(open + 2, close - open - 2);

        if (name.empty() || !std::ranges::all_of(name, isPlaceholderChar))
        {
            // Not a placeholder (e.g. "{{" inside code); copy it verbatim.
            result += "{{";
            pos = open + 2;
            continue;
        }

        auto const it = substitutions.find(name);
        if (it == substitutions.end())
            return makeError(ErrorCode::TemplateError, std::format("Unresolved placeholder {{{{{}}}}}", name));

        result += it->second;
        pos = close + 2;
    }
    return result;
}

auto TemplateRegistry::withBuiltins() -> TemplateRegistry
{
    auto registry = TemplateRegistry {};
    for (auto& projectTemplate: builtinTemplates())
        registry.add(std::move(projectTemplate));
    return registry;
}

void TemplateRegistry::add(ProjectTemplate projectTemplate)
{
    auto id = projectTemplate.id;
    _templates.insert_or_assign(std::move(id), std::move(projectTemplate));
}

auto TemplateRegistry::loadDirectory(const std::filesystem::path& templatesDir) -> VoidResult
{
    auto ec = std::error_code {};
    if (templatesDir.empty() || !std::filesystem::is_directory(templatesDir, ec))
        return {};

    auto loaded = std::vector<ProjectTemplate> {};
    for (const auto& dirEntry: std::filesystem::directory_iterator(templatesDir, ec))
    {
        auto const manifestPath = dirEntry.path() / ManifestFileName;
        if (!dirEntry.is_directory() || !std::filesystem::is_regular_file(manifestPath))
            continue;

        auto manifest = fsutil::readTextFile(manifestPath);
        if (!manifest)
            return makeError(ErrorCode::TemplateError, manifest.error().message);

        auto projectTemplate = parseTemplateManifest(*manifest, dirEntry.path());
        if (!projectTemplate)
            return makeError(ErrorCode::TemplateError,
                             std::format("{}: {}", manifestPath.string(), projectTemplate.error().message));
        loaded.push_back(std::move(*projectTemplate));
    }
    if (ec)
        return makeError(ErrorCode::TemplateError,
                         std::format("Cannot list templates in {}: {}", templatesDir.string(), ec.message()));

    for (auto& projectTemplate: loaded)
    {
        log::debug("Loaded template '{}' ({} files)", projectTemplate.id, projectTemplate.files.size());
        add(std::move(projectTemplate));
    }
    return {};
}

auto TemplateRegistry::resolve(std::string_view id) const -> Result<ProjectTemplate>
{
    auto const it = _templates.find(id);
    if (it == _templates.end())
        return makeError(ErrorCode::TemplateError, std::format("Unknown template: '{}'", id));
    return it->second;
}

auto TemplateRegistry::ids() const -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    for (const auto& [id, _]: _templates)
        result.push_back(id);
    return result;
}

auto parseTemplateManifest(std::string_view manifest, const std::filesystem::path& baseDir)
    -> Result<ProjectTemplate>
{
    auto parsed = json::parse(manifest, ErrorCode::TemplateError);
    if (!parsed)
        return std::unexpected(parsed.error());
    if (!parsed->is_object())
        return makeError(ErrorCode::TemplateError, "Template manifest must be a JSON object");

    auto projectTemplate = ProjectTemplate {};
    auto id = json::getString(*parsed, "id");
    if (!id || id->empty())
        return makeError(ErrorCode::TemplateError, "Template manifest has no 'id'");
    projectTemplate.id = std::move(*id);
    projectTemplate.description = json::getStringOr(*parsed, "description", "");
    projectTemplate.sourceRoot = json::getStringOr(*parsed, "sourceRoot", "app/src/main/java/{{PACKAGE_PATH}}");

    if (!parsed->contains("files") || !(*parsed)["files"].is_array() || (*parsed)["files"].empty())
        return makeError(ErrorCode::TemplateError,
                         std::format("Template '{}' lists no files", projectTemplate.id));

    for (const auto& entry: (*parsed)["files"])
    {
        auto file = parseTemplateFile(entry, baseDir);
        if (!file)
            return std::unexpected(file.error());
        projectTemplate.files.push_back(std::move(*file));
    }
    return projectTemplate;
}

} // namespace apkforge
