#include <catch2/catch_test_macros.hpp>

#include "platform/AutostartRegistrar.hpp"
#include "../utils/temp_dir.hpp"

#include <filesystem>
#include <string>

using test_utils::TempDir;

namespace fs = std::filesystem;

#ifndef _WIN32

TEST_CASE("Autostart registration through an XDG desktop entry", "[platform][autostart]") {
    TempDir dir("autostart");
    AutostartRegistrar registrar("CrossTransTest");
    registrar.setAutostartDir(dir / "autostart");
    std::string error;

    REQUIRE(registrar.entryPath() == dir / "autostart/crosstranstest.desktop");
    REQUIRE_FALSE(registrar.isEnabled());

    SECTION("Enable registers the running executable") {
        REQUIRE(registrar.setEnabled(true, error));
        REQUIRE(registrar.isEnabled());
        REQUIRE(registrar.registeredCommand() ==
                AutostartRegistrar::BuildCommand(AutostartRegistrar::ResolveLaunchTarget()));

        std::string entry = test_utils::readFile(registrar.entryPath());
        REQUIRE(entry.rfind("[Desktop Entry]\n", 0) == 0);
        REQUIRE(entry.find("Type=Application") != std::string::npos);
    }

    SECTION("Disable removes the entry") {
        REQUIRE(registrar.setEnabled(true, error));
        REQUIRE(registrar.setEnabled(false, error));
        REQUIRE_FALSE(registrar.isEnabled());
        REQUIRE_FALSE(fs::exists(registrar.entryPath()));
    }

    SECTION("Disabling an absent entry is a no-op") {
        REQUIRE(registrar.setEnabled(false, error));
        REQUIRE(error.empty());
        REQUIRE_FALSE(registrar.isEnabled());
    }

    SECTION("Re-registering points at the new executable") {
        REQUIRE(registrar.registerExecutable("/opt/old/CrossTrans", error));
        REQUIRE(registrar.registerExecutable("/opt/new/CrossTrans", error));
        REQUIRE(registrar.registeredCommand() == "\"/opt/new/CrossTrans\"");
    }

    SECTION("Entry switched off in the session settings reads as disabled") {
        test_utils::writeFile(registrar.entryPath(),
                              "[Desktop Entry]\nExec=\"/opt/CrossTrans\"\nHidden=true\n");
        REQUIRE_FALSE(registrar.isEnabled());
    }
}

TEST_CASE("Autostart command quoting", "[platform][autostart]") {
    REQUIRE(AutostartRegistrar::BuildCommand("/home/user/My Apps/CrossTrans") == "\"/home/user/My Apps/CrossTrans\"");
    REQUIRE(AutostartRegistrar::BuildCommand("/tmp/a$b") == "\"/tmp/a\\$b\"");
}

#endif
