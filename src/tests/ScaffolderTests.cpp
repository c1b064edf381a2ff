// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <core/FileUtils.hpp>
#include <scaffold/BuiltinTemplates.hpp>
#include <scaffold/ProjectDescriptor.hpp>
#include <scaffold/Scaffolder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

using namespace apkforge;

namespace
{

auto counterProject(SourceLanguage language = SourceLanguage::Kotlin) -> ProjectDescriptor
{
    return ProjectDescriptor {
        .name = "Counter",
        .templateId = std::string(EmptyActivityTemplateId),
        .packageName = "com.example.counter",
        .appLabel = "Counter App",
        .description = "Counts button presses",
        .minSdk = 24,
        .targetSdk = 34,
        .compileSdk = 34,
        .language = language,
    };
}

auto readFile(const std::filesystem::path& path) -> std::string
{
    auto contents = fsutil::readTextFile(path);
    return contents ? *contents : std::string {};
}

/// Relative path to contents and modification time of every file below @p root.
auto snapshotTree(const std::filesystem::path& root)
    -> std::map<std::string, std::pair<std::string, std::filesystem::file_time_type>>
{
    auto tree = std::map<std::string, std::pair<std::string, std::filesystem::file_time_type>> {};
    for (const auto& entry: std::filesystem::recursive_directory_iterator(root))
    {
        if (entry.is_regular_file())
            tree[std::filesystem::relative(entry.path(), root).generic_string()] = { readFile(entry.path()),
                                                                                    entry.last_write_time() };
    }
    return tree;
}

} // namespace

TEST_CASE("Scaffolder expands the built-in template", "[scaffold]")
{
    auto const dir = test::TempDir {};
    auto const registry = TemplateRegistry::withBuiltins();
    auto const scaffolder = Scaffolder(registry);

    auto const root = scaffolder.scaffold(counterProject(), {}, dir.path());

    REQUIRE(root.has_value());
    CHECK(*root == dir / "Counter");
    CHECK(readFile(*root / "settings.gradle").contains("rootProject.name = 'Counter'"));
    CHECK(readFile(*root / "app/build.gradle").contains("applicationId 'com.example.counter'"));
    CHECK(readFile(*root / "app/src/main/res/values/strings.xml").contains("Counter App"));
    CHECK(readFile(*root / "README.md").contains("Counts button presses"));

    auto const sources = *root / "app/src/main/java/com/example/counter";
    CHECK(std::filesystem::is_regular_file(sources / "MainActivity.kt"));
    CHECK(!std::filesystem::exists(sources / "MainActivity.java"));
    CHECK(readFile(sources / "MainActivity.kt").starts_with("package com.example.counter"));
}

TEST_CASE("Scaffolder picks the files of the project language", "[scaffold]")
{
    auto const dir = test::TempDir {};
    auto const registry = TemplateRegistry::withBuiltins();

    auto const root = Scaffolder(registry).scaffold(counterProject(SourceLanguage::Java), {}, dir.path());

    REQUIRE(root.has_value());
    auto const sources = *root / "app/src/main/java/com/example/counter";
    CHECK(std::filesystem::is_regular_file(sources / "MainActivity.java"));
    CHECK(!std::filesystem::exists(sources / "MainActivity.kt"));
}

TEST_CASE("Scaffolder places generated files and reports replaced template files", "[scaffold]")
{
    auto const dir = test::TempDir {};
    auto const registry = TemplateRegistry::withBuiltins();
    auto events = std::vector<AgentEvent> {};

    auto const generated = std::vector<GeneratedFile> {
        GeneratedFile { .relativePath = "MainActivity.kt", .contents = "package com.example.counter\n// generated\n" },
        GeneratedFile { .relativePath = "CounterViewModel.kt", .contents = "class CounterViewModel\n" },
        GeneratedFile { .relativePath = "app/src/main/res/layout/activity_main.xml", .contents = "<FrameLayout/>\n" },
    };

    auto const root = Scaffolder(registry).scaffold(
        counterProject(), generated, dir.path(), [&](const AgentEvent& event) { events.push_back(event); });

    REQUIRE(root.has_value());
    auto const sources = *root / "app/src/main/java/com/example/counter";
    CHECK(readFile(sources / "MainActivity.kt") == "package com.example.counter\n// generated\n");
    CHECK(readFile(sources / "CounterViewModel.kt") == "class CounterViewModel\n");
    CHECK(readFile(*root / "app/src/main/res/layout/activity_main.xml") == "<FrameLayout/>\n");

    auto const expected = std::vector<AgentEvent> {
        event::Progress { "Generated file replaces template file app/src/main/java/com/example/counter/MainActivity.kt" },
        event::Progress { "Generated file replaces template file app/src/main/res/layout/activity_main.xml" },
    };
    CHECK(events == expected);
}

TEST_CASE("Scaffolder treats an unnamed MainActivity as the main activity", "[scaffold]")
{
    auto const dir = test::TempDir {};
    auto const registry = TemplateRegistry::withBuiltins();
    auto const generated = std::vector<GeneratedFile> {
        GeneratedFile { .relativePath = "GeneratedCode.kt", .contents = "class MainActivity : AppCompatActivity()\n" },
    };

    auto const root = Scaffolder(registry).scaffold(counterProject(), generated, dir.path());

    REQUIRE(root.has_value());
    auto const sources = *root / "app/src/main/java/com/example/counter";
    CHECK(readFile(sources / "MainActivity.kt") == "class MainActivity : AppCompatActivity()\n");
    CHECK(!std::filesystem::exists(sources / "GeneratedCode.kt"));
}

TEST_CASE("Scaffolding the same inputs twice leaves the tree unchanged", "[scaffold]")
{
    auto const dir = test::TempDir {};
    auto const registry = TemplateRegistry::withBuiltins();
    auto const scaffolder = Scaffolder(registry);
    auto const generated = std::vector<GeneratedFile> {
        GeneratedFile { .relativePath = "MainActivity.kt", .contents = "class MainActivity\n" },
    };

    auto const first = scaffolder.scaffold(counterProject(), generated, dir.path());
    REQUIRE(first.has_value());
    auto const before = snapshotTree(*first);

    auto const second = scaffolder.scaffold(counterProject(), generated, dir.path());
    REQUIRE(second.has_value());
    CHECK(*second == *first);
    CHECK(snapshotTree(*second) == before);
}

TEST_CASE("Scaffolder rejects invalid descriptors without touching the disk", "[scaffold]")
{
    auto const dir = test::TempDir {};
    auto const registry = TemplateRegistry::withBuiltins();
    auto const scaffolder = Scaffolder(registry);
    auto descriptor = counterProject();

    SECTION("unknown template")
    {
        descriptor.templateId = "bottom-navigation";
        auto const result = scaffolder.scaffold(descriptor, {}, dir.path());
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::TemplateError);
    }

    SECTION("invalid package name")
    {
        descriptor.packageName = "counter";
        auto const result = scaffolder.scaffold(descriptor, {}, dir.path());
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("unsanitized project name")
    {
        descriptor.name = "Counter/../../etc";
        auto const result = scaffolder.scaffold(descriptor, {}, dir.path());
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("inconsistent SDK levels")
    {
        descriptor.minSdk = 35;
        auto const result = scaffolder.scaffold(descriptor, {}, dir.path());
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    CHECK(std::filesystem::is_empty(dir.path()));
}

TEST_CASE("Scaffolder fails on unresolved placeholders before writing", "[scaffold]")
{
    auto const dir = test::TempDir {};
    auto registry = TemplateRegistry {};
    registry.add(ProjectTemplate {
        .id = "broken",
        .description = {},
        .sourceRoot = "app/src/main/java/{{PACKAGE_PATH}}",
        .files = {
            TemplateFile { .path = "settings.gradle", .contents = "rootProject.name = '{{PROJECT_NAME}}'\n" },
            TemplateFile { .path = "app/build.gradle", .contents = "versionName '{{VERSION_NAME}}'\n" },
        },
    });
    auto descriptor = counterProject();
    descriptor.templateId = "broken";

    auto const result = Scaffolder(registry).scaffold(descriptor, {}, dir.path());

    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::TemplateError);
    CHECK(result.error().message.contains("VERSION_NAME"));
    CHECK(!std::filesystem::exists(dir / "Counter"));
}

TEST_CASE("Scaffolder keeps generated files inside the project", "[scaffold]")
{
    auto const dir = test::TempDir {};
    auto const registry = TemplateRegistry::withBuiltins();
    auto const generated = std::vector<GeneratedFile> {
        GeneratedFile { .relativePath = "../../../../../../escape.kt", .contents = "x" },
    };

    auto const result = Scaffolder(registry).scaffold(counterProject(), generated, dir.path());

    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::FileSystemError);
}

TEST_CASE("makeSubstitutions derives every placeholder", "[scaffold]")
{
    auto descriptor = counterProject();
    descriptor.appLabel.clear();
    descriptor.description.clear();

    auto const substitutions = makeSubstitutions(descriptor);

    CHECK(substitutions.at("PROJECT_NAME") == "Counter");
    CHECK(substitutions.at("APP_LABEL") == "Counter");
    CHECK(substitutions.at("PACKAGE_PATH") == "com/example/counter");
    CHECK(substitutions.at("MIN_SDK") == "24");
    CHECK(substitutions.at("LANGUAGE") == "kotlin");
    CHECK(substitutions.at("LANGUAGE_EXT") == "kt");
    CHECK(substitutions.at("DESCRIPTION") == "Counter");
}

TEST_CASE("sanitizeProjectName produces safe directory names", "[scaffold]")
{
    CHECK(sanitizeProjectName("My Cool: App?") == "My_Cool_App");
    CHECK(sanitizeProjectName("  Weather \t  Now ") == "Weather_Now");
    CHECK(sanitizeProjectName("..hidden..") == "hidden");
    CHECK(sanitizeProjectName("a/b\\c") == "abc");
    CHECK(sanitizeProjectName("") == FallbackProjectName);
    CHECK(sanitizeProjectName(" ?* ") == FallbackProjectName);
    CHECK(sanitizeProjectName(std::string(80, 'x')).size() == MaxProjectNameLength);
}

TEST_CASE("derivePackageName builds a valid package", "[scaffold]")
{
    CHECK(derivePackageName("com.example", "My Cool App") == "com.example.mycoolapp");
    CHECK(derivePackageName("org.acme", "2048") == "org.acme.a2048");
    CHECK(derivePackageName("com.example", "!!!") == "com.example.app");
    CHECK(derivePackageName("", "Notes") == "com.example.notes");
    CHECK(isValidPackageName(derivePackageName("com.example", "42 Apps")));
}

TEST_CASE("isValidPackageName checks Java identifiers", "[scaffold]")
{
    CHECK(isValidPackageName("com.example.app"));
    CHECK(isValidPackageName("io.github.user_name"));
    CHECK(!isValidPackageName("app"));
    CHECK(!isValidPackageName("com..app"));
    CHECK(!isValidPackageName("com.1app"));
    CHECK(!isValidPackageName("com.example-app"));
    CHECK(!isValidPackageName(""));
    CHECK(packagePath("com.example.app") == "com/example/app");
}
