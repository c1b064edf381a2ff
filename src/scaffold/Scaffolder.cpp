// SPDX-License-Identifier: Apache-2.0
#include "Scaffolder.hpp"

#include <core/FileUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <map>
#include <set>
#include <string>

namespace apkforge
{

namespace
{
    struct PlannedFile
    {
        std::string contents;
        bool executable = false;
        bool generated = false;
    };

    /// Relative path (generic format) to the file that ends up there.
    using ProjectPlan = std::map<std::string, PlannedFile>;

    auto validateRelative(std::string_view path, std::string_view what) -> VoidResult
    {
        auto const relative = std::filesystem::path(path);
        if (path.empty() || relative.is_absolute())
            return makeError(ErrorCode::FileSystemError, std::format("{} path must be relative: '{}'", what, path));
        if (!fsutil::isWithin("/project", std::filesystem::path("/project") / relative))
            return makeError(ErrorCode::FileSystemError, std::format("{} path escapes the project: '{}'", what, path));
        return {};
    }

    auto normalized(const std::filesystem::path& path) -> std::string
    {
        return path.lexically_normal().generic_string();
    }

    /// The model cannot be relied on to name its main file; an unnamed source that declares
    /// MainActivity takes the place of the template's activity.
    auto generatedTargetName(const GeneratedFile& file, SourceLanguage language) -> std::string
    {
        auto const ext = sourceExtension(language);
        if (file.relativePath == std::format("GeneratedCode.{}", ext)
            && file.contents.find("class MainActivity") != std::string::npos)
            return std::format("MainActivity.{}", ext);
        return file.relativePath;
    }

    auto isUnchanged(const std::filesystem::path& path, std::string_view contents) -> bool
    {
        auto ec = std::error_code {};
        if (!std::filesystem::is_regular_file(path, ec))
            return false;
        auto existing = fsutil::readTextFile(path);
        return existing && *existing == contents;
    }
} // namespace

auto makeSubstitutions(const ProjectDescriptor& descriptor) -> Substitutions
{
    auto const label = descriptor.appLabel.empty() ? descriptor.name : descriptor.appLabel;
    return Substitutions {
        { "PROJECT_NAME", descriptor.name },
        { "APP_LABEL", label },
        { "PACKAGE_NAME", descriptor.packageName },
        { "PACKAGE_PATH", packagePath(descriptor.packageName) },
        { "MIN_SDK", std::to_string(descriptor.minSdk) },
        { "TARGET_SDK", std::to_string(descriptor.targetSdk) },
        { "COMPILE_SDK", std::to_string(descriptor.compileSdk) },
        { "LANGUAGE", std::string(languageToString(descriptor.language)) },
        { "LANGUAGE_EXT", std::string(sourceExtension(descriptor.language)) },
        { "DESCRIPTION", descriptor.description.empty() ? label : descriptor.description },
    };
}

Scaffolder::Scaffolder(const TemplateRegistry& registry): _registry(registry)
{
}

auto Scaffolder::scaffold(const ProjectDescriptor& descriptor,
                          std::span<const GeneratedFile> generatedFiles,
                          const std::filesystem::path& destinationRoot,
                          const EventSink& sink) const -> Result<std::filesystem::path>
{
    auto projectTemplate = _registry.resolve(descriptor.templateId);
    if (!projectTemplate)
        return std::unexpected(projectTemplate.error());

    if (descriptor.name.empty() || descriptor.name != sanitizeProjectName(descriptor.name))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid project name: '{}'", descriptor.name));
    if (!isValidPackageName(descriptor.packageName))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Invalid package name: '{}'", descriptor.packageName));
    if (descriptor.minSdk > descriptor.targetSdk || descriptor.targetSdk > descriptor.compileSdk)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Inconsistent SDK levels: min {} target {} compile {}",
                                     descriptor.minSdk,
                                     descriptor.targetSdk,
                                     descriptor.compileSdk));

    auto const substitutions = makeSubstitutions(descriptor);

    // Render the skeleton completely before touching the disk.
    auto plan = ProjectPlan {};
    for (const auto& file: projectTemplate->files)
    {
        if (file.language && *file.language != descriptor.language)
            continue;

        auto path = renderPlaceholders(file.path, substitutions);
        if (!path)
            return makeError(ErrorCode::TemplateError,
                             std::format("Template '{}', path '{}': {}", projectTemplate->id, file.path, path.error().message));
        auto contents = renderPlaceholders(file.contents, substitutions);
        if (!contents)
            return makeError(ErrorCode::TemplateError,
                             std::format("Template '{}', file '{}': {}", projectTemplate->id, *path, contents.error().message));
        if (auto valid = validateRelative(*path, "Template file"); !valid)
            return makeError(ErrorCode::TemplateError, valid.error().message);

        plan[normalized(*path)] = PlannedFile { .contents = std::move(*contents), .executable = file.executable };
    }

    auto sourceRoot = renderPlaceholders(projectTemplate->sourceRoot, substitutions);
    if (!sourceRoot)
        return makeError(ErrorCode::TemplateError,
                         std::format("Template '{}', source root: {}", projectTemplate->id, sourceRoot.error().message));

    auto overridden = std::set<std::string> {};
    for (const auto& file: generatedFiles)
    {
        auto const name = generatedTargetName(file, descriptor.language);
        if (auto valid = validateRelative(name, "Generated file"); !valid)
            return std::unexpected(valid.error());

        auto const target = name.starts_with("app/") ? normalized(name)
                                                     : normalized(std::filesystem::path(*sourceRoot) / name);
        if (auto const existing = plan.find(target); existing != plan.end() && !existing->second.generated)
            overridden.insert(target);
        plan[target] = PlannedFile { .contents = file.contents, .executable = false, .generated = true };
    }

    // Write the tree.
    auto ec = std::error_code {};
    auto const root = std::filesystem::absolute(destinationRoot / descriptor.name, ec).lexically_normal();
    if (ec)
        return makeError(ErrorCode::FileSystemError,
                         std::format("Cannot resolve destination '{}': {}", destinationRoot.string(), ec.message()));
    std::filesystem::create_directories(root, ec);
    if (ec)
        return makeError(ErrorCode::FileSystemError,
                         std::format("Cannot create project directory '{}': {}", root.string(), ec.message()));

    for (const auto& [relative, file]: plan)
    {
        if (overridden.contains(relative))
        {
            log::info("Generated file replaces template file {}", relative);
            if (sink)
                sink(event::Progress { std::format("Generated file replaces template file {}", relative) });
        }

        auto const path = root / relative;
        if (!isUnchanged(path, file.contents))
        {
            if (auto written = fsutil::writeFileAtomically(path, file.contents); !written)
                return std::unexpected(written.error());
        }
        if (file.executable)
        {
            if (auto marked = fsutil::makeExecutable(path); !marked)
                return std::unexpected(marked.error());
        }
    }

    log::info("Scaffolded '{}' from template '{}' at {} ({} files, {} generated)",
              descriptor.name,
              projectTemplate->id,
              root.string(),
              plan.size(),
              generatedFiles.size());
    return root;
}

} // namespace apkforge
