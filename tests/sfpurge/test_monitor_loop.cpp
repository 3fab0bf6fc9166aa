#include <catch2/catch_test_macros.hpp>
#include "sfpurge/monitor/MonitorLoop.hpp"
#include "utils/fake_system.hpp"

#include <atomic>
#include <filesystem>
#include <stdexcept>

using namespace sfpurge;
using test_utils::FakeSystem;
using test_utils::TempDir;

namespace fs = std::filesystem;

namespace {

// Product installed on one volume with a watchdog and a UI process running
struct InstalledProduct {
    InstalledProduct() {
        volume.touch("Program Files/Sangfor/AgentWatchdog.exe");
        volume.touch("Program Files/Sangfor/bin/AgentUI.exe");
        sys.volumes.volumes = { volume.path() };
        sys.processes.addProcess(100, "AgentWatchdog.exe");
        sys.processes.addProcess(200, "AgentUI.exe", 100);
    }

    TempDir volume;
    FakeSystem sys;
    std::atomic<bool> cancel{ false };
};

}  // namespace

TEST_CASE("MonitorLoop - Nothing installed", "[monitor]") {
    FakeSystem sys;
    TempDir volume;
    sys.volumes.volumes = { volume.path() };
    std::atomic<bool> cancel{ false };

    MonitorLoop loop(sys.ctx, cancel);
    REQUIRE(loop.Run() == MonitorOutcome::NoTargets);

    REQUIRE(sys.console->contains("No Sangfor directories found, nothing to do"));
    REQUIRE_FALSE(sys.console->contains("Monitoring started"));
    REQUIRE(sys.processes.calls.empty());
    REQUIRE(sys.services.calls.empty());
    REQUIRE(sys.ctx.stats.iterations == 0);
}

TEST_CASE("MonitorLoop - Single pass", "[monitor]") {
    InstalledProduct product;
    auto& sys = product.sys;
    sys.ctx.settings.loop = false;
    sys.services.services = { "SangforSP" };
    sys.services.running["SangforSP"] = true;

    MonitorLoop loop(sys.ctx, product.cancel);
    REQUIRE(loop.Run() == MonitorOutcome::Completed);

    REQUIRE(sys.ctx.identities.size() == 2);
    REQUIRE(sys.ctx.identities.at("agentwatchdog").is_watchdog);
    REQUIRE(sys.ctx.stats.iterations == 1);
    REQUIRE(sys.ctx.stats.processes_killed == 2);
    REQUIRE(sys.ctx.stats.services_stopped == 1);
    REQUIRE(sys.ctx.stats.services_disabled == 1);
    REQUIRE(sys.processes.callsStartingWith("kill:") == std::vector<std::string>{ "kill:100", "kill:200" });
    REQUIRE_FALSE(sys.console->contains("Monitoring started"));
    REQUIRE(sys.console->contains("Processes killed:   2"));
}

TEST_CASE("MonitorLoop - Cancellation", "[monitor]") {
    InstalledProduct product;
    auto& sys = product.sys;

    SECTION("Before discovery") {
        product.cancel = true;
        MonitorLoop loop(sys.ctx, product.cancel);
        REQUIRE(loop.Run() == MonitorOutcome::Interrupted);
        REQUIRE(sys.ctx.directories.empty());
        REQUIRE(sys.processes.calls.empty());
    }

    SECTION("During discovery") {
        sys.services.services = { "SangforSP" };
        sys.volumes.on_list = [&] { product.cancel = true; };

        MonitorLoop loop(sys.ctx, product.cancel);
        REQUIRE(loop.Run() == MonitorOutcome::Interrupted);

        // Nothing after the volume scan runs
        REQUIRE(sys.ctx.identities.empty());
        REQUIRE(sys.services.calls.empty());
        REQUIRE(sys.tasks.calls.empty());
        REQUIRE(sys.processes.calls.empty());
        REQUIRE(sys.ctx.stats.iterations == 0);
        REQUIRE_FALSE(sys.console->contains("Monitoring started"));
    }

    SECTION("While waiting between passes") {
        sys.ctx.sleep = [&](std::chrono::milliseconds duration) {
            sys.sleeps.push_back(duration);
            if (duration == std::chrono::milliseconds(100)) {
                product.cancel = true;
            }
        };

        MonitorLoop loop(sys.ctx, product.cancel);
        REQUIRE(loop.Run() == MonitorOutcome::Cancelled);

        REQUIRE(sys.ctx.stats.iterations == 1);
        // Settle pause after the watchdog phase, then one interval slice
        REQUIRE(sys.sleeps.size() == 2);
        REQUIRE(sys.console->contains("Monitoring started"));
        REQUIRE(sys.console->contains("Monitoring stopped by user"));
    }
}

TEST_CASE("MonitorLoop - A failing pass does not stop the loop", "[monitor]") {
    TempDir volume;
    volume.touch("Program Files/Sangfor/AgentUI.exe");
    FakeSystem sys;
    sys.volumes.volumes = { volume.path() };
    sys.processes.addProcess(200, "AgentUI.exe");
    std::atomic<bool> cancel{ false };

    int waits = 0;
    sys.processes.on_wait = [&](ProcessId) {
        if (++waits == 1) {
            throw std::runtime_error("process table unavailable");
        }
    };
    sys.ctx.sleep = [&](std::chrono::milliseconds duration) {
        sys.sleeps.push_back(duration);
        if (sys.ctx.stats.iterations >= 2) {
            cancel = true;
        }
    };

    MonitorLoop loop(sys.ctx, cancel);
    REQUIRE(loop.Run() == MonitorOutcome::Cancelled);

    REQUIRE(sys.ctx.stats.iterations == 2);
    REQUIRE(sys.ctx.stats.errors == 1);
    REQUIRE(sys.ctx.stats.processes_killed == 1);
    REQUIRE(sys.processes.callsStartingWith("kill:") == std::vector<std::string>{ "kill:200", "kill:200" });
    REQUIRE(sys.console->contains("[-] Pass failed: process table unavailable"));
    REQUIRE(sys.console->contains("Monitoring stopped by user"));
}

TEST_CASE("MonitorLoop - Interval is slept in slices", "[monitor]") {
    InstalledProduct product;
    auto& sys = product.sys;
    sys.ctx.settings.timeouts.monitor_interval = std::chrono::milliseconds(250);

    sys.ctx.sleep = [&](std::chrono::milliseconds duration) {
        sys.sleeps.push_back(duration);
        // Second slice of the second wait
        if (sys.sleeps.size() == 6) {
            product.cancel = true;
        }
    };

    MonitorLoop loop(sys.ctx, product.cancel);
    REQUIRE(loop.Run() == MonitorOutcome::Cancelled);

    REQUIRE(sys.ctx.stats.iterations == 2);
    // The first pass sleeps once after the watchdog phase, then 100 + 100 + 50
    REQUIRE(sys.sleeps[1] == std::chrono::milliseconds(100));
    REQUIRE(sys.sleeps[3] == std::chrono::milliseconds(50));
    REQUIRE(sys.sleeps.size() == 6);
}

TEST_CASE("MonitorLoop - State transitions", "[monitor]") {
    InstalledProduct product;
    auto& sys = product.sys;
    MonitorLoop loop(sys.ctx, product.cancel);

    SECTION("Discovery without restart vectors goes straight to monitoring") {
        REQUIRE(loop.Step(MonitorState::Discovering) == MonitorState::Monitoring);
        REQUIRE(loop.Outcome() == MonitorOutcome::Running);
    }

    SECTION("Discovery with a service goes through suppression") {
        sys.services.services = { "SangforSP" };
        REQUIRE(loop.Step(MonitorState::Discovering) == MonitorState::Suppressing);
        REQUIRE(loop.Step(MonitorState::Suppressing) == MonitorState::Monitoring);
        REQUIRE(sys.services.count("disable:SangforSP") == 1);
    }

    SECTION("Stopped stays stopped") {
        REQUIRE(loop.Step(MonitorState::Stopped) == MonitorState::Stopped);
    }
}

TEST_CASE("MonitorLoop - Summary is rendered once", "[monitor]") {
    FakeSystem sys;
    std::atomic<bool> cancel{ false };
    MonitorLoop loop(sys.ctx, cancel);

    loop.RenderSummary();
    loop.RenderSummary();

    REQUIRE(sys.console->countContaining("[*] Summary") == 1);
    REQUIRE_FALSE(sys.console->contains("Errors:"));
}

TEST_CASE("MonitorLoop - Outcome names", "[monitor]") {
    REQUIRE(std::string(MonitorOutcomeToString(MonitorOutcome::NoTargets)) == "no targets");
    REQUIRE(std::string(MonitorStateToString(MonitorState::Monitoring)) == "monitoring");
}
