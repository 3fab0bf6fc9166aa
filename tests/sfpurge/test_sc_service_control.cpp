#include <catch2/catch_test_macros.hpp>
#include "sfpurge/control/ScServiceControl.hpp"
#include "utils/fake_system.hpp"

using namespace sfpurge;
using test_utils::FakeCommandRunner;

namespace {
constexpr std::chrono::milliseconds kTimeout{ 2000 };
}

TEST_CASE("ScServiceControl - Listing", "[sc][service]") {
    FakeCommandRunner runner;
    ScServiceControl sc(runner, MarkerTable{});

    SECTION("All services use state= all") {
        runner.setResponse("sc query state= all",
                           FakeCommandRunner::ok("SERVICE_NAME: A\r\nSERVICE_NAME: SangforSvc\r\n"));
        auto names = sc.QueryAllServices(kTimeout);
        REQUIRE(names.ok());
        REQUIRE(names->size() == 2);
        REQUIRE(runner.lastTimeout() == kTimeout);
    }

    SECTION("Drivers") {
        runner.setResponse("sc query type= driver state= all", FakeCommandRunner::ok("SERVICE_NAME: sfdrv\r\n"));
        auto names = sc.QueryDrivers(kTimeout);
        REQUIRE(names.ok());
        REQUIRE(names->front() == "sfdrv");
    }

    SECTION("Timeout") {
        runner.setResponse("sc query state= all", FakeCommandRunner::timedOut());
        auto names = sc.QueryAllServices(kTimeout);
        REQUIRE_FALSE(names.ok());
        REQUIRE(names.kind == ErrorKind::Timeout);
    }

    SECTION("Partial listing with a failing exit code is still used") {
        runner.setResponse("sc query state= all", FakeCommandRunner::failed(234, "SERVICE_NAME: A\r\n"));
        auto names = sc.QueryAllServices(kTimeout);
        REQUIRE(names.ok());
        REQUIRE(names->size() == 1);
    }
}

TEST_CASE("ScServiceControl - Binary path", "[sc][service]") {
    FakeCommandRunner runner;
    ScServiceControl sc(runner, MarkerTable{});

    SECTION("Path reported") {
        runner.setResponse("sc qc EngineSvc",
                           FakeCommandRunner::ok("        BINARY_PATH_NAME   : C:\\Program Files\\Sangfor\\e.exe\r\n"));
        auto path = sc.QueryBinaryPath("EngineSvc", kTimeout);
        REQUIRE(path.ok());
        REQUIRE(path->has_value());
        REQUIRE(**path == "C:\\Program Files\\Sangfor\\e.exe");
    }

    SECTION("Missing service maps to NotFound") {
        runner.setResponse("sc qc Ghost", FakeCommandRunner::failed(1060, "[SC] OpenService FAILED 1060"));
        auto path = sc.QueryBinaryPath("Ghost", kTimeout);
        REQUIRE_FALSE(path.ok());
        REQUIRE(path.kind == ErrorKind::NotFound);
    }

    SECTION("Access denied maps to Permission") {
        runner.setResponse("sc qc Locked", FakeCommandRunner::failed(5, "[SC] OpenService FAILED 5"));
        REQUIRE(sc.QueryBinaryPath("Locked", kTimeout).kind == ErrorKind::Permission);
    }
}

TEST_CASE("ScServiceControl - Run state", "[sc][service]") {
    FakeCommandRunner runner;
    ScServiceControl sc(runner, MarkerTable{});

    runner.setResponse("sc query Up", FakeCommandRunner::ok("SERVICE_NAME: Up\r\n  STATE : 4  RUNNING\r\n"));
    runner.setResponse("sc query Down", FakeCommandRunner::ok("SERVICE_NAME: Down\r\n  STATE : 1  STOPPED\r\n"));

    auto up = sc.QueryIsRunning("Up", kTimeout);
    REQUIRE(up.ok());
    REQUIRE(*up);

    auto down = sc.QueryIsRunning("Down", kTimeout);
    REQUIRE(down.ok());
    REQUIRE_FALSE(*down);
}

TEST_CASE("ScServiceControl - Stop", "[sc][service]") {
    FakeCommandRunner runner;
    ScServiceControl sc(runner, MarkerTable{});

    SECTION("Stop pending confirms the stop") {
        runner.setResponse("sc stop Svc", FakeCommandRunner::ok("SERVICE_NAME: Svc\r\n  STATE : 3  STOP_PENDING\r\n"));
        REQUIRE(sc.Stop("Svc", kTimeout).ok());
    }

    SECTION("Chinese confirmation") {
        runner.setResponse("sc stop Svc", FakeCommandRunner::ok("已发送停止控制\r\n"));
        REQUIRE(sc.Stop("Svc", kTimeout).ok());
    }

    SECTION("Success exit without a marker is not a confirmed stop") {
        runner.setResponse("sc stop Svc", FakeCommandRunner::ok("\r\n"));
        auto result = sc.Stop("Svc", kTimeout);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.kind == ErrorKind::Unexpected);
    }

    SECTION("Not active maps to NotFound") {
        runner.setResponse("sc stop Svc", FakeCommandRunner::failed(1062, "[SC] ControlService FAILED 1062"));
        REQUIRE(sc.Stop("Svc", kTimeout).kind == ErrorKind::NotFound);
    }

    SECTION("Timeout") {
        runner.setResponse("sc stop Svc", FakeCommandRunner::timedOut());
        REQUIRE(sc.Stop("Svc", kTimeout).kind == ErrorKind::Timeout);
    }
}

TEST_CASE("ScServiceControl - Disable startup", "[sc][service]") {
    FakeCommandRunner runner;
    ScServiceControl sc(runner, MarkerTable{});

    SECTION("Exit status zero") {
        runner.setResponse("sc config Svc start= disabled", FakeCommandRunner::ok("[SC] ChangeServiceConfig SUCCESS"));
        REQUIRE(sc.DisableStartup("Svc", kTimeout).ok());
    }

    SECTION("Localized success marker with odd exit code") {
        runner.setResponse("sc config Svc start= disabled", FakeCommandRunner::failed(1, "[SC] ChangeServiceConfig 成功"));
        REQUIRE(sc.DisableStartup("Svc", kTimeout).ok());
    }

    SECTION("Access denied") {
        runner.setResponse("sc config Svc start= disabled",
                           FakeCommandRunner::failed(5, "[SC] OpenService FAILED 5:\r\n\r\nAccess is denied.\r\n"));
        REQUIRE(sc.DisableStartup("Svc", kTimeout).kind == ErrorKind::Permission);
    }
}
