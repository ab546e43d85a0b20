#include <catch2/catch_test_macros.hpp>

#include "utils/LogManager.hpp"

#include <toml++/toml.h>

using utils::LogManager;

TEST_CASE("Logging settings come from config.toml", "[utils][logging]") {
    SECTION("Defaults without any keys") {
        LogManager::Settings s = LogManager::ParseSettings(toml::table{});
        REQUIRE(s.append);
        REQUIRE(s.level == plog::info);
    }

    SECTION("Explicit values") {
        auto cfg = toml::parse("[global]\nappend_logs = false\n[app.debug]\nlogging_level = 5\n");
        LogManager::Settings s = LogManager::ParseSettings(cfg);
        REQUIRE_FALSE(s.append);
        REQUIRE(s.level == plog::debug);
    }

    SECTION("Out of range level keeps the default") {
        auto cfg = toml::parse("[app.debug]\nlogging_level = 9\n");
        REQUIRE(LogManager::ParseSettings(cfg).level == plog::info);
    }

    SECTION("Wrong type is ignored") {
        auto cfg = toml::parse("[global]\nappend_logs = \"no\"\n");
        REQUIRE(LogManager::ParseSettings(cfg).append);
    }
}
