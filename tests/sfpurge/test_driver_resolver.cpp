#include <catch2/catch_test_macros.hpp>
#include "sfpurge/discovery/DriverResolver.hpp"
#include "utils/fake_system.hpp"

using namespace sfpurge;
using test_utils::FakeSystem;

TEST_CASE("DriverResolver - Name match only", "[discovery][driver]") {
    FakeSystem sys;
    sys.services.drivers = { "ACPI", "SangforVnic", "sfsangforflt", "SANGFORVNIC" };

    size_t added = DriverResolver(sys.ctx).Resolve();

    REQUIRE(added == 2);
    REQUIRE(sys.ctx.drivers.count("sangforvnic") == 1);
    REQUIRE(sys.ctx.drivers.at("sangforvnic").name == "SangforVnic");
    REQUIRE(sys.ctx.drivers.count("sfsangforflt") == 1);
    REQUIRE(sys.console->contains("Found 2 driver services"));
}

TEST_CASE("DriverResolver - Failure and empty results", "[discovery][driver]") {
    FakeSystem sys;

    SECTION("Listing failure") {
        sys.services.driver_list_failure = ErrorKind::Permission;
        REQUIRE(DriverResolver(sys.ctx).Resolve() == 0);
        REQUIRE(sys.ctx.stats.errors == 1);
    }

    SECTION("Nothing related") {
        sys.services.drivers = { "ACPI", "disk" };
        REQUIRE(DriverResolver(sys.ctx).Resolve() == 0);
        REQUIRE(sys.console->contains("No driver services found"));
    }
}
