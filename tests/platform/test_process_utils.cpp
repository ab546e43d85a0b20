#include <catch2/catch_test_macros.hpp>

#include "platform/AutostartRegistrar.hpp"
#include "platform/ProcessUtils.hpp"
#include "../utils/scoped_env.hpp"

#include <filesystem>

using utils::LaunchMode;
using utils::ProcessUtils;

TEST_CASE("Process creation flags", "[platform][process]") {
    SECTION("Hidden launches never combine DETACHED_PROCESS with CREATE_NO_WINDOW") {
        auto flags = ProcessUtils::CreationFlagsFor(LaunchMode::Hidden);
        REQUIRE((flags & ProcessUtils::kDetachedProcess) == 0);
        REQUIRE((flags & ProcessUtils::kCreateNoWindow) != 0);
        REQUIRE((flags & ProcessUtils::kCreateNewProcessGroup) != 0);
    }

    SECTION("Detached launches get their own process group") {
        auto flags = ProcessUtils::CreationFlagsFor(LaunchMode::Detached);
        REQUIRE((flags & ProcessUtils::kDetachedProcess) != 0);
        REQUIRE((flags & ProcessUtils::kCreateNoWindow) == 0);
    }

    SECTION("Normal launches inherit everything") {
        REQUIRE(ProcessUtils::CreationFlagsFor(LaunchMode::Normal) == 0);
    }
}

TEST_CASE("Process queries", "[platform][process]") {
    auto exe = ProcessUtils::GetExecutablePath();
    REQUIRE_FALSE(exe.empty());
    REQUIRE(std::filesystem::exists(exe));

    REQUIRE(ProcessUtils::IsProcessAlive(ProcessUtils::GetCurrentProcessId()));

    REQUIRE_FALSE(ProcessUtils::LaunchProcess("/nonexistent/crosstrans-installer", {}));
}

TEST_CASE("Installed path", "[platform][process]") {
    SECTION("Plain executables are their own installed file") {
        test_utils::ScopedEnv appImage("APPIMAGE", std::nullopt);
        REQUIRE(ProcessUtils::GetInstalledPath() == ProcessUtils::GetExecutablePath());
    }

#ifndef _WIN32
    SECTION("An AppImage is installed as the image file, not its mounted executable") {
        test_utils::ScopedEnv appImage("APPIMAGE", "/home/user/Apps/CrossTrans.AppImage");
        REQUIRE(ProcessUtils::GetInstalledPath() == std::filesystem::path("/home/user/Apps/CrossTrans.AppImage"));
        REQUIRE(AutostartRegistrar::ResolveLaunchTarget() == ProcessUtils::GetInstalledPath());
    }

    SECTION("An empty APPIMAGE is ignored") {
        test_utils::ScopedEnv appImage("APPIMAGE", "");
        REQUIRE(ProcessUtils::GetInstalledPath() == ProcessUtils::GetExecutablePath());
    }
#endif
}
