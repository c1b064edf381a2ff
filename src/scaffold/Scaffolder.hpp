// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Events.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <scaffold/ProjectDescriptor.hpp>
#include <scaffold/Template.hpp>

#include <filesystem>
#include <span>

namespace apkforge
{

/// @brief Returns the placeholder values derived from a descriptor.
[[nodiscard]] auto makeSubstitutions(const ProjectDescriptor& descriptor) -> Substitutions;

/// @brief Expands a template and generated sources into a project directory.
///
/// The project lands in `<destinationRoot>/<descriptor.name>`. Skeleton files are rendered in
/// memory first, so a template problem leaves the disk untouched. Generated files are written
/// below the template's source root, except paths starting with "app/", which are taken
/// relative to the project root. A generated file that replaces a skeleton file wins and the
/// replacement is reported through the event sink. Files whose contents already match are
/// not rewritten, so scaffolding identical inputs twice yields an identical tree.
class Scaffolder
{
  public:
    explicit Scaffolder(const TemplateRegistry& registry);

    /// @brief Materializes the project.
    /// @param descriptor What to build; the template id must be known.
    /// @param generatedFiles Sources produced by the generation pipeline.
    /// @param destinationRoot Directory receiving the project directory.
    /// @param sink Receives conflict notices; may be empty.
    /// @return The absolute project root, or a TemplateError / FileSystemError.
    [[nodiscard]] auto scaffold(const ProjectDescriptor& descriptor,
                                std::span<const GeneratedFile> generatedFiles,
                                const std::filesystem::path& destinationRoot,
                                const EventSink& sink = {}) const -> Result<std::filesystem::path>;

  private:
    const TemplateRegistry& _registry;
};

} // namespace apkforge
