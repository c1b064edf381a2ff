// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <agent/OutputWriter.hpp>
#include <agent/Prompts.hpp>
#include <core/FileUtils.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace apkforge;

TEST_CASE("FileOutputWriter writes below the task directory", "[output]")
{
    auto const dir = test::TempDir {};
    auto writer = FileOutputWriter(dir.path());

    auto const path = writer.write("task-1", GeneratedFile { .relativePath = "ui/MainActivity.kt", .contents = "class A\n" });

    REQUIRE(path.has_value());
    CHECK(*path == dir / "task-1" / "ui" / "MainActivity.kt");
    CHECK(fsutil::readTextFile(*path).value_or("") == "class A\n");
    CHECK(writer.taskDirectory("task-1") == dir / "task-1");

    SECTION("rewriting replaces the contents")
    {
        auto const again = writer.write("task-1", GeneratedFile { .relativePath = "ui/MainActivity.kt", .contents = "class B\n" });
        REQUIRE(again.has_value());
        CHECK(fsutil::readTextFile(*again).value_or("") == "class B\n");
    }
}

TEST_CASE("FileOutputWriter rejects paths outside the task directory", "[output]")
{
    auto const dir = test::TempDir {};
    auto writer = FileOutputWriter(dir / "generated");

    auto const rejected = [&](std::string_view taskId, std::string relativePath) {
        auto const result = writer.write(taskId, GeneratedFile { .relativePath = std::move(relativePath), .contents = "x" });
        return !result && result.error().code == ErrorCode::FileSystemError;
    };

    CHECK(rejected("task", "../escape.kt"));
    CHECK(rejected("task", "a/../../escape.kt"));
    CHECK(rejected("task", "/etc/passwd"));
    CHECK(rejected("task", ""));
    CHECK(rejected("", "file.kt"));
    CHECK(rejected("..", "file.kt"));
    CHECK(rejected("a/b", "file.kt"));
    CHECK(!std::filesystem::exists(dir / "escape.kt"));
    CHECK(!std::filesystem::exists(dir / "generated" / "escape.kt"));
}

TEST_CASE("Role prompts can be overridden from a directory", "[prompts]")
{
    auto const defaults = defaultRolePrompts();
    CHECK(defaults.forRole(AgentRole::Reviewer).contains("VERDICT"));
    CHECK(defaults.forRole(AgentRole::Coder).contains("// File:"));
    CHECK(!defaults.forRole(AgentRole::Planner).empty());
    CHECK(!defaults.forRole(AgentRole::Debugger).empty());

    auto const dir = test::TempDir {};
    REQUIRE(fsutil::writeTextFile(dir / "coder.txt", "Write Kotlin only."));
    REQUIRE(fsutil::writeTextFile(dir / "reviewer.txt", ""));

    auto const prompts = loadRolePromptOverrides(dir.path(), defaults);
    CHECK(prompts.coder == "Write Kotlin only.");
    CHECK(prompts.reviewer == defaults.reviewer);
    CHECK(prompts.planner == defaults.planner);

    auto const unchanged = loadRolePromptOverrides(dir / "missing", defaults);
    CHECK(unchanged.coder == defaults.coder);
}
