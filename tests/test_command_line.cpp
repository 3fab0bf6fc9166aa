#include <catch2/catch_test_macros.hpp>
#include "app/CommandLine.hpp"

using namespace std::chrono_literals;

TEST_CASE("CommandLine - Defaults", "[cli]") {
    auto result = CommandLine::parse(std::vector<std::string>{});
    REQUIRE(result.ok());
    REQUIRE(result.options.config_path == "sfpurge.toml");
    REQUIRE_FALSE(result.options.once);
    REQUIRE_FALSE(result.options.interval.has_value());
    REQUIRE_FALSE(result.options.log_level.has_value());
}

TEST_CASE("CommandLine - Flags and values", "[cli]") {
    auto result = CommandLine::parse(std::vector<std::string>{
        "--once", "--keep-startup", "--no-color", "-q", "-c", "custom.toml", "--interval", "500", "--log-level", "6" });

    REQUIRE(result.ok());
    const auto& opts = result.options;
    REQUIRE(opts.once);
    REQUIRE(opts.keep_startup);
    REQUIRE(opts.no_color);
    REQUIRE(opts.quiet);
    REQUIRE(opts.config_path == "custom.toml");
    REQUIRE(opts.interval == 500ms);
    REQUIRE(opts.log_level == 6);
}

TEST_CASE("CommandLine - argv skips the program name", "[cli]") {
    char program[] = "sfpurge";
    char version[] = "--version";
    char* argv[] = { program, version };

    auto result = CommandLine::parse(2, argv);
    REQUIRE(result.ok());
    REQUIRE(result.options.show_version);
    REQUIRE_FALSE(result.options.show_help);
}

TEST_CASE("CommandLine - Errors", "[cli]") {
    SECTION("Unknown argument") {
        auto result = CommandLine::parse(std::vector<std::string>{ "--frobnicate" });
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error == "unknown argument: --frobnicate");
    }

    SECTION("Missing value") {
        auto result = CommandLine::parse(std::vector<std::string>{ "--config" });
        REQUIRE(result.error == "missing value for --config");
    }

    SECTION("Bad interval") {
        REQUIRE(CommandLine::parse(std::vector<std::string>{ "--interval", "-1" }).error ==
                "invalid --interval value: -1");
        REQUIRE_FALSE(CommandLine::parse(std::vector<std::string>{ "--interval", "10s" }).ok());
        REQUIRE(CommandLine::parse(std::vector<std::string>{ "--interval", "0" }).error ==
                "invalid --interval value: 0");
    }

    SECTION("Log level out of range") {
        auto result = CommandLine::parse(std::vector<std::string>{ "--log-level", "7" });
        REQUIRE(result.error == "invalid --log-level value (expected 0-6): 7");
    }
}

TEST_CASE("CommandLine - Usage text", "[cli]") {
    auto text = CommandLine::usage("sfpurge");
    REQUIRE(text.find("Usage: sfpurge [options]") != std::string::npos);
    REQUIRE(text.find("--keep-startup") != std::string::npos);
}
