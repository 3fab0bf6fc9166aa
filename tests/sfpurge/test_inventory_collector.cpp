#include <catch2/catch_test_macros.hpp>
#include "sfpurge/core/MatchPolicy.hpp"
#include "sfpurge/discovery/InventoryCollector.hpp"
#include "utils/fake_system.hpp"

#include <filesystem>

using namespace sfpurge;
using test_utils::FakeSystem;
using test_utils::TempDir;

namespace fs = std::filesystem;

TEST_CASE("InventoryCollector - Recursive executable collection", "[discovery][inventory]") {
    FakeSystem sys;
    TempDir root;
    root.touch("AgentUI.exe");
    root.touch("bin/AgentWatchdog.EXE");
    root.touch("bin/deep/nested/SfUpdate.exe");
    root.touch("bin/readme.txt");
    root.touch("bin/lib.dll");

    size_t added = InventoryCollector(sys.ctx).Collect({ root.path() });

    REQUIRE(added == 3);
    REQUIRE(sys.ctx.identities.size() == 3);
    REQUIRE(sys.ctx.identities.count("agentui") == 1);
    REQUIRE(sys.ctx.identities.count("sfupdate") == 1);

    SECTION("Watchdog heuristic") {
        REQUIRE(sys.ctx.identities.at("agentwatchdog").is_watchdog);
        REQUIRE_FALSE(sys.ctx.identities.at("agentui").is_watchdog);
    }

    SECTION("Original file name is kept") {
        REQUIRE(sys.ctx.identities.at("agentwatchdog").file_name == "AgentWatchdog.EXE");
    }
}

TEST_CASE("InventoryCollector - First seen wins across directories", "[discovery][inventory]") {
    FakeSystem sys;
    TempDir first;
    TempDir second;
    first.touch("Agent.exe");
    second.touch("agent.exe");
    second.touch("Other.exe");

    InventoryCollector collector(sys.ctx);
    REQUIRE(collector.Collect({ first.path(), second.path() }) == 2);
    REQUIRE(sys.ctx.identities.at("agent").file_name == "Agent.exe");

    // A second pass over the same trees adds nothing
    REQUIRE(collector.Collect({ first.path(), second.path() }) == 0);
}

TEST_CASE("InventoryCollector - Non-ASCII file names", "[discovery][inventory]") {
    FakeSystem sys;
    TempDir root;
    root.touch(PathFromUtf8("深信服/监控服务.exe"));

    REQUIRE(InventoryCollector(sys.ctx).Collect({ root.path() }) == 1);

    // Same text a process snapshot reports for the running executable
    REQUIRE(sys.ctx.identities.count(FoldedStem("监控服务.exe")) == 1);
    REQUIRE(sys.ctx.identities.at("监控服务").file_name == "监控服务.exe");
}

TEST_CASE("InventoryCollector - Extension policy", "[discovery][inventory]") {
    FakeSystem sys;
    InventoryCollector collector(sys.ctx);

    REQUIRE(collector.IsExecutable("a.exe"));
    REQUIRE(collector.IsExecutable("A.ExE"));
    REQUIRE_FALSE(collector.IsExecutable("a.dll"));
    REQUIRE_FALSE(collector.IsExecutable("exe"));

    sys.ctx.settings.executable_extensions = { ".bin", "" };
    REQUIRE(collector.IsExecutable("daemon.BIN"));
    REQUIRE_FALSE(collector.IsExecutable("a.exe"));
}

TEST_CASE("InventoryCollector - Missing directory is reported and skipped", "[discovery][inventory]") {
    FakeSystem sys;
    TempDir root;
    root.touch("Agent.exe");

    size_t added = InventoryCollector(sys.ctx).Collect({ root.path() / "vanished", root.path() });

    REQUIRE(added == 1);
    REQUIRE(sys.ctx.stats.errors == 1);
}
