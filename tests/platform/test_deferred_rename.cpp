#include <catch2/catch_test_macros.hpp>

#include "platform/DeferredRename.hpp"
#include "../utils/temp_dir.hpp"

#include <filesystem>

using test_utils::TempDir;
using utils::DeferredRename;

namespace fs = std::filesystem;

TEST_CASE("Deferred rename journal", "[platform][rename]") {
    if (DeferredRename::IsNativelySupported()) {
        SKIP("Deferred rename goes through the OS on this platform");
    }

    TempDir dir("rename");
    fs::path journal = dir / "config" / DeferredRename::kJournalFileName;
    DeferredRename deferred(journal);
    std::string error;

    REQUIRE_FALSE(deferred.hasPending());
    REQUIRE(deferred.applyPending() == 0);

    SECTION("Scheduled rename is applied once") {
        test_utils::writeFile(dir / "new.bin", "new");
        test_utils::writeFile(dir / "app.bin", "old");

        REQUIRE(deferred.schedule(dir / "new.bin", dir / "app.bin", error));
        REQUIRE(deferred.hasPending());
        REQUIRE(test_utils::readFile(dir / "app.bin") == "old");

        REQUIRE(deferred.applyPending() == 1);
        REQUIRE(test_utils::readFile(dir / "app.bin") == "new");
        REQUIRE_FALSE(fs::exists(dir / "new.bin"));
        REQUIRE_FALSE(fs::exists(journal));
        REQUIRE(deferred.applyPending() == 0);
    }

    SECTION("Missing source cannot be scheduled") {
        REQUIRE_FALSE(deferred.schedule(dir / "absent.bin", dir / "app.bin", error));
        REQUIRE_FALSE(deferred.hasPending());
    }

    SECTION("Entries whose source vanished are dropped") {
        test_utils::writeFile(dir / "new.bin", "new");
        REQUIRE(deferred.schedule(dir / "new.bin", dir / "app.bin", error));
        fs::remove(dir / "new.bin");
        REQUIRE(deferred.applyPending() == 0);
        REQUIRE_FALSE(deferred.hasPending());
    }

    SECTION("Scheduled sources hold their directory") {
        fs::path package = dir / "crosstrans_update_1" / "CrossTrans.bin";
        test_utils::writeFile(package, "new");
        REQUIRE_FALSE(deferred.hasPendingFrom(package.parent_path()));

        REQUIRE(deferred.schedule(package, dir / "app.bin", error));
        REQUIRE(deferred.hasPendingFrom(package.parent_path()));
        REQUIRE_FALSE(deferred.hasPendingFrom(dir / "crosstrans_update_2"));
        REQUIRE_FALSE(deferred.hasPendingFrom(dir / "crosstrans_update"));

        REQUIRE(deferred.applyPending() == 1);
        REQUIRE_FALSE(deferred.hasPendingFrom(package.parent_path()));
    }

    SECTION("Corrupt journal is ignored") {
        test_utils::writeFile(journal, "{ not json");
        REQUIRE_FALSE(deferred.hasPending());
        REQUIRE(deferred.applyPending() == 0);
    }
}
