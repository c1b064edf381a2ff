// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <apkforge/Pipeline.hpp>
#include <core/FileUtils.hpp>
#include <core/JsonUtils.hpp>
#include <toolchain/AndroidCatalog.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

using namespace apkforge;

namespace
{

auto testConfig(const test::TempDir& dir) -> AppConfig
{
    auto config = AppConfig {};
    config.paths.outputRoot = (dir / "projects").string();
    config.paths.generatedRoot = (dir / "generated").string();
    config.paths.toolchainRoot = (dir / "toolchain").string();
    config.paths.templatesDir = (dir / "templates").string();
    config.paths.promptsDir = (dir / "prompts").string();
    config.paths.logDir = (dir / "logs").string();
    config.agent.retryBackoffMs = 0;
    config.build.maxConcurrentBuilds = 1;
    return config;
}

auto readSummary(const AppConfig& config, std::string_view taskId) -> nlohmann::json
{
    auto const text = fsutil::readTextFile(std::filesystem::path(config.paths.generatedRoot) / taskId / "summary.json");
    if (!text)
        return nlohmann::json {};
    return json::parse(*text).value_or(nlohmann::json {});
}

/// Records every required component as installed, with a Gradle that runs @p gradleBody.
auto installFakeToolchain(const Pipeline& pipeline, std::string_view gradleBody) -> VoidResult
{
    auto state = ToolchainState { .root = pipeline.config().paths.toolchainRoot, .installed = {}, .licenses = {} };
    for (const auto& spec: pipeline.requiredComponents())
    {
        auto const path = state.root / "components" / std::format("fake-{}", state.installed.size()) / spec.version;
        auto ec = std::error_code {};
        std::filesystem::create_directories(path / "bin", ec);
        if (ec)
            return makeError(ErrorCode::FileSystemError, ec.message());
        if (spec.id == GradleComponentId)
        {
            if (auto written = test::writeScript(path / "bin" / "gradle", gradleBody); !written)
                return written;
        }
        state.installed.push_back(
            InstalledComponent { .id = spec.id, .version = spec.version, .path = path, .sha256 = {}, .installedAt = {} });
    }
    return fsutil::writeTextFile(state.root / "toolchain-state.json", toJson(state).dump(2));
}

} // namespace

TEST_CASE("Pipeline generates and scaffolds a project", "[pipeline]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto fetcher = test::FakeFetcher {};
    auto pipeline = Pipeline(testConfig(dir), client, fetcher, TemplateRegistry::withBuiltins());

    auto events = std::vector<AgentEvent> {};
    auto const request = PipelineRequest {
        .prompt = "A todo list",
        .projectName = "My Todo: App?",
        .taskId = "todo-1",
        .language = std::nullopt,
        .build = false,
    };
    auto const result = pipeline.run(request, [&](const AgentEvent& event) { events.push_back(event); }, std::stop_token {});

    REQUIRE(result.succeeded());
    CHECK(result.taskId == "todo-1");
    CHECK(result.task.status == TaskStatus::Done);
    CHECK(!result.build);
    REQUIRE(!events.empty());
    CHECK(std::holds_alternative<event::Done>(events.back()));

    REQUIRE(result.projectRoot.has_value());
    CHECK(*result.projectRoot == dir / "projects" / "My_Todo_App");
    auto const sources = *result.projectRoot / "app/src/main/java/com/example/mytodoapp";
    CHECK(std::filesystem::is_regular_file(sources / "MainActivity.kt"));
    CHECK(std::filesystem::is_regular_file(*result.projectRoot / "settings.gradle"));

    CHECK(std::filesystem::is_regular_file(dir / "generated" / "todo-1" / "MainActivity.kt"));
    auto const summary = readSummary(pipeline.config(), "todo-1");
    CHECK(summary.value("status", "") == "Done");
    CHECK(summary.value("prompt", "") == "A todo list");
    CHECK(summary.value("projectRoot", "") == result.projectRoot->string());
    CHECK(!summary.contains("error"));
    CHECK(fetcher.totalFetches() == 0);
}

TEST_CASE("Pipeline tells the coder which package to use", "[pipeline]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto fetcher = test::FakeFetcher {};
    auto pipeline = Pipeline(testConfig(dir), client, fetcher, TemplateRegistry::withBuiltins());

    auto const request = PipelineRequest {
        .prompt = "A weather app",
        .projectName = "Weather",
        .taskId = "weather-1",
        .language = SourceLanguage::Java,
        .build = false,
    };
    auto const result = pipeline.run(request, [](const AgentEvent&) {}, std::stop_token {});

    REQUIRE(result.succeeded());
    auto found = false;
    for (const auto& call: client.requests())
        found = found || (call.role == AgentRole::Coder && call.userPrompt.contains("Use the package name com.example.weather."));
    CHECK(found);
}

TEST_CASE("Pipeline stops when generation fails", "[pipeline]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    client.fail(AgentRole::Planner, ErrorCode::FatalInferenceError, "model crashed");
    auto fetcher = test::FakeFetcher {};
    auto pipeline = Pipeline(testConfig(dir), client, fetcher, TemplateRegistry::withBuiltins());

    auto const request = PipelineRequest { .prompt = "A clock", .projectName = "Clock", .taskId = "clock-1", .language = std::nullopt, .build = true };
    auto const result = pipeline.run(request, [](const AgentEvent&) {}, std::stop_token {});

    REQUIRE(!result.succeeded());
    CHECK(result.error->code == ErrorCode::FatalInferenceError);
    CHECK(result.task.status == TaskStatus::Error);
    CHECK(!result.projectRoot);
    CHECK(!std::filesystem::exists(dir / "projects" / "Clock"));

    auto const summary = readSummary(pipeline.config(), "clock-1");
    CHECK(summary.value("status", "") == "Error");
    REQUIRE(summary.contains("error"));
    CHECK(summary["error"].value("message", "").contains("model crashed"));
}

TEST_CASE("Pipeline reports a toolchain that cannot be provisioned", "[pipeline]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto fetcher = test::FakeFetcher {};
    auto pipeline = Pipeline(testConfig(dir), client, fetcher, TemplateRegistry::withBuiltins());

    auto const request = PipelineRequest { .prompt = "A timer", .projectName = "Timer", .taskId = "timer-1", .language = std::nullopt, .build = true };
    auto const result = pipeline.run(request, [](const AgentEvent&) {}, std::stop_token {});

    REQUIRE(!result.succeeded());
    CHECK(result.error->code == ErrorCode::ToolchainInstallError);
    CHECK(result.error->message.contains(JdkComponentId));
    CHECK(result.projectRoot.has_value());
    CHECK(!result.build);
    CHECK(fetcher.totalFetches() == pipeline.config().toolchain.downloadAttempts);
}

TEST_CASE("Pipeline builds the scaffolded project", "[pipeline]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto fetcher = test::FakeFetcher {};
    auto pipeline = Pipeline(testConfig(dir), client, fetcher, TemplateRegistry::withBuiltins());

    SECTION("successful build")
    {
        REQUIRE(installFakeToolchain(pipeline,
                                     "mkdir -p app/build/outputs/apk/debug\n"
                                     "echo apk > app/build/outputs/apk/debug/app-debug.apk\n"));

        auto const request = PipelineRequest { .prompt = "A notes app", .projectName = "Notes", .taskId = "notes-1", .language = std::nullopt, .build = true };
        auto const result = pipeline.run(request, [](const AgentEvent&) {}, std::stop_token {});

        REQUIRE(result.succeeded());
        REQUIRE(result.build.has_value());
        CHECK(result.build->success);
        REQUIRE(result.build->artifactPath.has_value());
        CHECK(result.build->artifactPath->filename() == "app-debug.apk");
        CHECK(fetcher.totalFetches() == 0);

        auto const summary = readSummary(pipeline.config(), "notes-1");
        REQUIRE(summary.contains("build"));
        CHECK(summary["build"].value("success", false));
        CHECK(summary["build"].value("artifactPath", "") == result.build->artifactPath->string());
    }

    SECTION("failing build")
    {
        REQUIRE(installFakeToolchain(pipeline, "echo 'e: Unresolved reference: foo'\nexit 1\n"));

        auto const request = PipelineRequest { .prompt = "A notes app", .projectName = "Notes", .taskId = "notes-2", .language = std::nullopt, .build = true };
        auto const result = pipeline.run(request, [](const AgentEvent&) {}, std::stop_token {});

        REQUIRE(!result.succeeded());
        CHECK(result.error->code == ErrorCode::BuildFailure);
        CHECK(result.error->message.contains("Unresolved reference"));
        REQUIRE(result.build.has_value());
        CHECK(result.build->failureReason == BuildFailureReason::NonZeroExit);
    }
}

TEST_CASE("Pipeline fills in project defaults", "[pipeline]")
{
    auto const dir = test::TempDir {};
    auto client = test::ScriptedInferenceClient {};
    auto fetcher = test::FakeFetcher {};
    auto config = testConfig(dir);
    config.project.packagePrefix = "org.sample";
    config.project.language = SourceLanguage::Java;
    auto const pipeline = Pipeline(config, client, fetcher, TemplateRegistry::withBuiltins());

    auto const descriptor = pipeline.describeProject("Photo Booth", "Takes pictures", std::nullopt);
    CHECK(descriptor.name == "Photo_Booth");
    CHECK(descriptor.appLabel == "Photo Booth");
    CHECK(descriptor.packageName == "org.sample.photobooth");
    CHECK(descriptor.description == "Takes pictures");
    CHECK(descriptor.language == SourceLanguage::Java);
    CHECK(descriptor.minSdk == config.project.minSdk);

    auto const kotlin = pipeline.describeProject("", "", SourceLanguage::Kotlin);
    CHECK(kotlin.name == FallbackProjectName);
    CHECK(kotlin.language == SourceLanguage::Kotlin);

    auto const components = pipeline.requiredComponents();
    CHECK(components.size() == androidToolchainComponents(34).size());
}
