#include <catch2/catch_test_macros.hpp>

#include "updater/StatusMarkers.hpp"
#include "../utils/temp_dir.hpp"

#include <filesystem>
#include <string>

using namespace updater;
using test_utils::TempDir;

namespace fs = std::filesystem;

TEST_CASE("Status markers are read exactly once", "[updater][markers]") {
    TempDir dir("markers");
    StatusMarkers markers(dir.path());
    std::string error;

    REQUIRE(markers.consumeAll().empty());
    REQUIRE_FALSE(markers.hasAny());

    SECTION("Success marker") {
        REQUIRE(markers.writeSuccess(Version("2.0.0"), error));
        REQUIRE(markers.hasAny());
        REQUIRE(test_utils::readFile(dir / StatusMarkers::kSuccessFile) == "2.0.0\n");

        MarkerSnapshot first = markers.consumeAll();
        REQUIRE(first.success == Version(2, 0, 0));
        REQUIRE_FALSE(first.error.has_value());

        MarkerSnapshot second = markers.consumeAll();
        REQUIRE(second.empty());
        REQUIRE_FALSE(fs::exists(dir / StatusMarkers::kSuccessFile));
    }

    SECTION("Error marker keeps code and multi-line message") {
        REQUIRE(markers.writeError("Copy failed\nafter 5 attempts", 3, error));
        MarkerSnapshot snapshot = markers.consumeAll();
        REQUIRE(snapshot.error.has_value());
        REQUIRE(snapshot.error->code == 3);
        REQUIRE(snapshot.error->message == "Copy failed\nafter 5 attempts");
    }

    SECTION("All kinds together") {
        REQUIRE(markers.writeExpectedVersion(Version("1.5.0"), error));
        REQUIRE(markers.writePendingInstaller("/tmp/crosstrans_update_ab/CrossTrans.AppImage", error));
        REQUIRE(markers.writeError("boom", 1, error));

        MarkerSnapshot snapshot = markers.consumeAll();
        REQUIRE(snapshot.expectedVersion == Version(1, 5, 0));
        REQUIRE(snapshot.pendingInstallerPath == "/tmp/crosstrans_update_ab/CrossTrans.AppImage");
        REQUIRE(snapshot.error->message == "boom");
        REQUIRE_FALSE(markers.hasAny());
    }

    SECTION("Malformed markers are deleted and ignored") {
        test_utils::writeFile(dir / StatusMarkers::kSuccessFile, "not a version");
        test_utils::writeFile(dir / StatusMarkers::kErrorFile, "x1\nmessage");
        test_utils::writeFile(dir / StatusMarkers::kPendingFile, "  \n");

        MarkerSnapshot snapshot = markers.consumeAll();
        REQUIRE(snapshot.empty());
        REQUIRE_FALSE(markers.hasAny());
    }

    SECTION("Rewriting replaces the previous content") {
        REQUIRE(markers.writeSuccess(Version("1.0.0"), error));
        REQUIRE(markers.writeSuccess(Version("1.0.1"), error));
        REQUIRE(markers.consumeAll().success == Version(1, 0, 1));
        REQUIRE_FALSE(fs::exists(dir / (std::string(StatusMarkers::kSuccessFile) + ".tmp")));
    }

    SECTION("Clear removes without reading") {
        REQUIRE(markers.writeSuccess(Version("1.0.0"), error));
        REQUIRE(markers.writeExpectedVersion(Version("1.0.0"), error));
        markers.clear();
        REQUIRE_FALSE(markers.hasAny());
    }
}
