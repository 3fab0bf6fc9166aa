#include <catch2/catch_test_macros.hpp>
#include "sfpurge/discovery/TaskResolver.hpp"
#include "utils/fake_system.hpp"

using namespace sfpurge;
using test_utils::FakeSystem;

TEST_CASE("TaskResolver - Match priority", "[discovery][task]") {
    FakeSystem sys;
    sys.addIdentity("AgentUI.exe", false);
    TaskResolver resolver(sys.ctx);

    SECTION("Name wins over program") {
        auto match = resolver.Match({ "\\SangforUpdate", "C:\\Program Files\\Sangfor\\AgentUI.exe" });
        REQUIRE(match.has_value());
        REQUIRE(match->matched_by == TaskMatch::Name);
    }

    SECTION("Vendor keyword in the program path") {
        auto match = resolver.Match({ "\\Updater", "C:\\Program Files\\Sangfor\\up.exe" });
        REQUIRE(match.has_value());
        REQUIRE(match->matched_by == TaskMatch::Path);
    }

    SECTION("Program referencing a known executable") {
        auto match = resolver.Match({ "\\Helper", "D:\\tools\\agentui.exe --tray" });
        REQUIRE(match.has_value());
        REQUIRE(match->matched_by == TaskMatch::Program);
        REQUIRE(match->matched_identity == "agentui");
    }

    SECTION("Unrelated") {
        REQUIRE_FALSE(resolver.Match({ "\\Defrag", "defrag.exe" }).has_value());
        REQUIRE_FALSE(resolver.Match({ "\\NoProgram", std::nullopt }).has_value());
    }
}

TEST_CASE("TaskResolver - Each task recorded once", "[discovery][task]") {
    FakeSystem sys;
    sys.addIdentity("AgentUI.exe", false);
    sys.tasks.tasks = {
        { "\\Helper", "C:\\Program Files\\Sangfor\\AgentUI.exe" },
        { "\\HELPER", "C:\\Program Files\\Sangfor\\AgentUI.exe" },
        { "\\Defrag", "defrag.exe" },
    };

    size_t added = TaskResolver(sys.ctx).Resolve();

    REQUIRE(added == 1);
    REQUIRE(sys.ctx.tasks.size() == 1);
    // Path match takes priority over the program cross-reference
    REQUIRE(sys.ctx.tasks.at("\\helper").matched_by == TaskMatch::Path);
}

TEST_CASE("TaskResolver - Scheduler failure", "[discovery][task]") {
    FakeSystem sys;
    sys.tasks.list_failure = ErrorKind::Timeout;

    REQUIRE(TaskResolver(sys.ctx).Resolve() == 0);
    REQUIRE(sys.ctx.stats.errors == 1);
    REQUIRE(sys.console->contains("timed out"));
}
