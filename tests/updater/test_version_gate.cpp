#include <catch2/catch_test_macros.hpp>

#include "config/SettingsStore.hpp"
#include "updater/VersionGate.hpp"
#include "../utils/temp_dir.hpp"

#include <filesystem>

using namespace updater;
using test_utils::TempDir;

namespace fs = std::filesystem;

namespace {

struct GateFixture {
    TempDir dir{ "gate" };
    fs::path configCache = dir / "config/cache";
    fs::path exeCache = dir / "app/cache";
    SettingsStore settings{ dir / "config/config.toml" };

    GateFixture() {
        test_utils::writeFile(configCache / "compiled.bin", "cached");
        test_utils::writeFile(exeCache / "nested/artifact.bin", "cached");
        settings.load();
    }

    VersionGate gate() { return VersionGate(settings, { configCache, exeCache }); }

    // What the next process would read from disk
    std::string persistedVersion() const {
        SettingsStore reloaded(settings.configPath());
        reloaded.load();
        return reloaded.snapshot().lastRunVersion;
    }
};

}  // namespace

TEST_CASE("Version gate restarts once per version change", "[updater][gate]") {
    GateFixture f;

    SECTION("First run records the version without restarting") {
        REQUIRE(f.gate().checkAndMaybeRestart(Version("1.0.0"), "") == GateOutcome::Continue);
        REQUIRE(f.persistedVersion() == "1.0.0");
        REQUIRE(fs::exists(f.configCache));
    }

    SECTION("Unchanged version never restarts") {
        REQUIRE(f.gate().checkAndMaybeRestart(Version("1.0.0"), "1.0.0") == GateOutcome::Continue);
        REQUIRE(f.gate().checkAndMaybeRestart(Version("1.0.0"), "1.0") == GateOutcome::Continue);
        REQUIRE(fs::exists(f.configCache));
        REQUIRE(fs::exists(f.exeCache));
    }

    SECTION("Upgrade clears caches, persists and restarts exactly once") {
        REQUIRE(f.gate().checkAndMaybeRestart(Version("1.0.1"), "1.0.0") == GateOutcome::Restart);
        REQUIRE_FALSE(fs::exists(f.configCache));
        REQUIRE_FALSE(fs::exists(f.exeCache));
        REQUIRE(f.persistedVersion() == "1.0.1");

        // the restarted process reads the persisted value
        std::string persisted = f.persistedVersion();
        REQUIRE(f.gate().checkAndMaybeRestart(Version("1.0.1"), persisted) == GateOutcome::Continue);
    }

    SECTION("Downgrade is also a transition") {
        REQUIRE(f.gate().checkAndMaybeRestart(Version("1.0.0"), "2.0.0") == GateOutcome::Restart);
        REQUIRE(f.persistedVersion() == "1.0.0");
    }

    SECTION("Unparsable persisted value compares as text") {
        REQUIRE(f.gate().checkAndMaybeRestart(Version("1.0.0"), "dev-build") == GateOutcome::Restart);
    }
}

TEST_CASE("Version gate without a writable config keeps running", "[updater][gate]") {
    TempDir dir("gate_ro");
    // a directory where the config file should be makes every save fail
    fs::path configPath = dir / "config.toml";
    fs::create_directories(configPath);
    fs::create_directories(configPath.string() + ".tmp");

    SettingsStore settings(configPath);
    VersionGate gate(settings, {});
    REQUIRE(gate.checkAndMaybeRestart(Version("1.0.1"), "1.0.0") == GateOutcome::Continue);
    REQUIRE(settings.snapshot().lastRunVersion.empty());
}

TEST_CASE("Cache clearing", "[updater][gate]") {
    TempDir dir("caches");
    test_utils::writeFile(dir / "a/file", "x");
    test_utils::writeFile(dir / "b/deep/file", "x");

    REQUIRE(VersionGate::ClearCaches({ dir / "a", dir / "b", dir / "missing", fs::path() }) == 2);
    REQUIRE_FALSE(fs::exists(dir / "a"));
    REQUIRE_FALSE(fs::exists(dir / "b"));
}
