// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apkforge
{

/// @brief One skeleton file. Both path and contents may contain {{PLACEHOLDER}}s.
struct TemplateFile
{
    std::string path;
    std::string contents;
    bool executable = false;

    /// Restricts the file to projects of one language.
    std::optional<SourceLanguage> language;
};

/// @brief A project skeleton.
struct ProjectTemplate
{
    std::string id;
    std::string description;

    /// Directory (relative to the project root, placeholders allowed) that receives generated sources.
    std::string sourceRoot;

    std::vector<TemplateFile> files;
};

/// @brief Placeholder name to replacement text.
using Substitutions = std::map<std::string, std::string, std::less<>>;

/// @brief Replaces every {{NAME}} in @p text with its substitution.
/// @return The rendered text, or a TemplateError naming the first unresolved placeholder.
[[nodiscard]] auto renderPlaceholders(std::string_view text, const Substitutions& substitutions)
    -> Result<std::string>;

/// @brief Known templates, by id.
class TemplateRegistry
{
  public:
    /// @brief Returns a registry holding the built-in templates.
    [[nodiscard]] static auto withBuiltins() -> TemplateRegistry;

    /// @brief Adds a template, replacing any template with the same id.
    void add(ProjectTemplate projectTemplate);

    /// @brief Loads every `<dir>/<id>/template.json` below @p templatesDir.
    ///
    /// A missing directory is not an error. A malformed template fails the whole load with a
    /// TemplateError, leaving the registry unchanged.
    [[nodiscard]] auto loadDirectory(const std::filesystem::path& templatesDir) -> VoidResult;

    /// @brief Looks up a template by id.
    /// @return The template or a TemplateError if the id is unknown.
    [[nodiscard]] auto resolve(std::string_view id) const -> Result<ProjectTemplate>;

    /// @brief Returns the known template ids in sorted order.
    [[nodiscard]] auto ids() const -> std::vector<std::string>;

  private:
    std::map<std::string, ProjectTemplate, std::less<>> _templates;
};

/// @brief Parses a template.json document; file contents are read relative to @p baseDir.
[[nodiscard]] auto parseTemplateManifest(std::string_view manifest, const std::filesystem::path& baseDir)
    -> Result<ProjectTemplate>;

} // namespace apkforge
