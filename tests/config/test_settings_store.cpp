#include <catch2/catch_test_macros.hpp>

#include "config/SettingsStore.hpp"
#include "../utils/temp_dir.hpp"

#include <filesystem>
#include <string>

#include <toml++/toml.h>

using test_utils::TempDir;

namespace fs = std::filesystem;

TEST_CASE("SettingsStore - defaults and persistence", "[config][settings]")
{
    TempDir dir("settings");
    fs::path configPath = dir / "config.toml";

    SECTION("Missing file loads defaults")
    {
        SettingsStore store(configPath);
        REQUIRE(store.load());
        AppSettings s = store.snapshot();
        REQUIRE_FALSE(s.autostart);
        REQUIRE_FALSE(s.autoCheckUpdates);
        REQUIRE_FALSE(s.requireChecksum);
        REQUIRE(s.lastRunVersion.empty());
        REQUIRE(s.updateStats.totalChecks == 0);
    }

    SECTION("Modifications survive a reload")
    {
        {
            SettingsStore store(configPath);
            REQUIRE(store.load());
            REQUIRE(store.modify([](AppSettings& s) {
                s.autostart = true;
                s.autoCheckUpdates = true;
                s.lastRunVersion = "1.2.0";
            }));
        }

        SettingsStore reloaded(configPath);
        REQUIRE(reloaded.load());
        AppSettings s = reloaded.snapshot();
        REQUIRE(s.autostart);
        REQUIRE(s.autoCheckUpdates);
        REQUIRE(s.lastRunVersion == "1.2.0");
    }

    SECTION("Keys outside the app table are preserved")
    {
        test_utils::writeFile(configPath, "[app]\nauto_check_updates = true\n\n[user]\ntheme = \"dark\"\n");
        SettingsStore store(configPath);
        REQUIRE(store.load());
        REQUIRE(store.snapshot().autoCheckUpdates);
        REQUIRE(store.modify([](AppSettings& s) { s.requireChecksum = true; }));

        toml::table saved = toml::parse_file(configPath.string());
        REQUIRE(saved["user"]["theme"].value_or(std::string{}) == "dark");
        REQUIRE(saved["app"]["require_checksum"].value_or(false));
    }

    SECTION("Malformed file falls back to defaults")
    {
        test_utils::writeFile(configPath, "[app\nautostart = ");
        SettingsStore store(configPath);
        REQUIRE_FALSE(store.load());
        REQUIRE_FALSE(store.snapshot().autostart);
    }

    SECTION("Failed save rolls the change back")
    {
        fs::create_directories(configPath);
        fs::create_directories(configPath.string() + ".tmp");
        SettingsStore store(configPath);
        REQUIRE_FALSE(store.modify([](AppSettings& s) { s.autostart = true; }));
        REQUIRE_FALSE(store.snapshot().autostart);
        REQUIRE(std::string(store.lastError()).size() > 0);
    }
}

TEST_CASE("SettingsStore - update statistics", "[config][settings]")
{
    TempDir dir("stats");
    fs::path configPath = dir / "config.toml";
    SettingsStore store(configPath);
    REQUIRE(store.load());

    REQUIRE(store.recordCheck(true));
    REQUIRE(store.recordCheck(false, "rate_limit"));
    REQUIRE(store.recordCheck(false, "rate_limit"));
    REQUIRE(store.recordCheck(false));
    REQUIRE(store.recordInstall(true));
    REQUIRE(store.recordInstall(false));

    SettingsStore reloaded(configPath);
    REQUIRE(reloaded.load());
    UpdateStats stats = reloaded.snapshot().updateStats;
    REQUIRE(stats.totalChecks == 4);
    REQUIRE(stats.successfulChecks == 1);
    REQUIRE(stats.failedChecks == 3);
    REQUIRE(stats.errorCounts["rate_limit"] == 2);
    REQUIRE(stats.errorCounts["other"] == 1);
    REQUIRE(stats.installsSucceeded == 1);
    REQUIRE(stats.installsFailed == 1);
    REQUIRE_FALSE(stats.lastCheck.empty());
    REQUIRE(stats.lastSuccess.size() == std::string("2026-01-01T00:00:00Z").size());
}
