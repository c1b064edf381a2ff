// SPDX-License-Identifier: Apache-2.0
#include <agent/MemoryLog.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace apkforge;

TEST_CASE("MemoryLog starts empty", "[memory]")
{
    auto const memory = MemoryLog {};
    CHECK(memory.size() == 0);
    REQUIRE(memory.snapshot());
    CHECK(memory.snapshot()->empty());
}

TEST_CASE("MemoryLog numbers entries in append order", "[memory]")
{
    auto memory = MemoryLog {};
    auto const first = memory.append(AgentRole::Planner, "plan");
    auto const second = memory.append(AgentRole::Coder, "code");

    CHECK(first.sequence == 0);
    CHECK(second.sequence == 1);
    CHECK(second.role == AgentRole::Coder);
    CHECK(second.text == "code");

    auto const snapshot = memory.snapshot();
    REQUIRE(snapshot->size() == 2);
    CHECK((*snapshot)[0] == first);
    CHECK((*snapshot)[1] == second);
}

TEST_CASE("MemoryLog snapshots are immutable", "[memory]")
{
    auto memory = MemoryLog {};
    memory.append(AgentRole::Planner, "plan");
    auto const before = memory.snapshot();

    memory.append(AgentRole::Coder, "code");
    memory.append(AgentRole::Reviewer, "VERDICT: PASS");

    CHECK(before->size() == 1);
    CHECK(memory.snapshot()->size() == 3);
    CHECK(memory.size() == 3);
}

TEST_CASE("Role conversion round-trips", "[types]")
{
    for (auto const role: { AgentRole::Planner, AgentRole::Coder, AgentRole::Reviewer, AgentRole::Debugger })
        CHECK(roleFromString(roleToString(role)) == role);
    CHECK(roleToString(AgentRole::Debugger) == "DEBUGGER");
}
