#include <catch2/catch_test_macros.hpp>

#include "updater/InstallRoutine.hpp"
#include "updater/StatusMarkers.hpp"
#include "../utils/temp_dir.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <string>
#include <vector>

using namespace updater;
using test_utils::TempDir;

namespace fs = std::filesystem;

namespace {

const std::string kOldBinary = "old-binary-v1";
const std::string kNewBinary = "new-binary-v2-with-more-bytes";

struct Launch {
    fs::path exe;
    std::vector<std::string> args;
};

// Install directory, download directory and marker directory inside one temp tree
struct InstallFixture {
    TempDir root{ "install" };
    fs::path installPath = root / "app/CrossTrans";
    fs::path downloadDir = root / "crosstrans_update_1234";
    fs::path sourcePath = downloadDir / "CrossTrans_2.0.0";
    fs::path markerDir = root / "markers";

    std::vector<Launch> launches;
    std::vector<std::string> autostartRegistrations;
    int aliveChecks = 0;
    bool parentAlive = false;

    InstallFixture() {
        test_utils::writeFile(installPath, kOldBinary);
        test_utils::writeFile(sourcePath, kNewBinary);
        fs::create_directories(markerDir);
    }

    InstallPlan plan() const {
        InstallPlan p;
        p.parentPid = 4242;
        p.installPath = installPath.string();
        p.sourcePath = sourcePath.string();
        p.backupPath = installPath.string() + ".bak";
        p.newVersion = Version(2, 0, 0);
        p.markerDir = markerDir.string();
        p.tempDir = downloadDir.string();
        p.relaunchArgs = { "--no-update-check" };
        p.waitTimeoutMs = 2000;
        p.pollIntervalMs = 500;
        p.copyAttempts = 3;
        p.retryDelayMs = 0;
        return p;
    }

    InstallEnvironment env() {
        InstallEnvironment e;
        e.isProcessAlive = [this](std::uint32_t) {
            ++aliveChecks;
            return parentAlive;
        };
        e.copyFile = &BackupManager::CopyReplacing;
        e.launch = [this](const fs::path& exe, const std::vector<std::string>& args) {
            launches.push_back({ exe, args });
            return true;
        };
        e.sleep = [](std::chrono::milliseconds) {};
        e.registerAutostart = [this](const std::string& name, const fs::path& exe, std::string&) {
            autostartRegistrations.push_back(name + "=" + exe.string());
            return true;
        };
        return e;
    }
};

}  // namespace

TEST_CASE("Install routine replaces the executable", "[updater][install]") {
    InstallFixture f;

    SECTION("Successful install") {
        InstallPlan plan = f.plan();
        plan.autostartEnabled = true;
        InstallOutcome outcome = InstallRoutine(plan, f.env()).run();

        REQUIRE(outcome.success);
        REQUIRE(outcome.errorKind == InstallErrorKind::None);
        REQUIRE(outcome.relaunched);
        REQUIRE(test_utils::readFile(f.installPath) == kNewBinary);
        REQUIRE_FALSE(fs::exists(plan.backupPath));
        REQUIRE_FALSE(fs::exists(f.downloadDir));

        REQUIRE(f.launches.size() == 1);
        REQUIRE(f.launches[0].exe == f.installPath);
        REQUIRE(f.launches[0].args == std::vector<std::string>{ "--no-update-check" });
        REQUIRE(f.autostartRegistrations == std::vector<std::string>{ "CrossTrans=" + f.installPath.string() });

        MarkerSnapshot markers = StatusMarkers(f.markerDir).consumeAll();
        REQUIRE(markers.success == Version(2, 0, 0));
        REQUIRE_FALSE(markers.error.has_value());
    }

    SECTION("Autostart is left alone when disabled") {
        InstallOutcome outcome = InstallRoutine(f.plan(), f.env()).run();
        REQUIRE(outcome.success);
        REQUIRE(f.autostartRegistrations.empty());
    }

    SECTION("Waits for the parent process to exit") {
        f.parentAlive = true;
        InstallEnvironment env = f.env();
        env.isProcessAlive = [&f](std::uint32_t pid) {
            REQUIRE(pid == 4242);
            return ++f.aliveChecks < 3;
        };
        InstallOutcome outcome = InstallRoutine(f.plan(), env).run();
        REQUIRE(outcome.success);
        REQUIRE(f.aliveChecks == 3);
    }
}

TEST_CASE("Install routine failure paths", "[updater][install]") {
    InstallFixture f;

    SECTION("Copy that always fails restores the previous executable") {
        InstallEnvironment env = f.env();
        int failedCopies = 0;
        env.copyFile = [&](const fs::path& from, const fs::path& to, std::string& outError) {
            if (from == f.sourcePath) {
                // leaves a truncated target behind like an interrupted copy would
                test_utils::writeFile(to, "");
                ++failedCopies;
                outError = "Device or resource busy";
                return false;
            }
            return BackupManager::CopyReplacing(from, to, outError);
        };

        InstallOutcome outcome = InstallRoutine(f.plan(), env).run();

        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.errorKind == InstallErrorKind::CopyFailed);
        REQUIRE(outcome.rolledBack);
        REQUIRE(failedCopies == 3);
        REQUIRE(fs::file_size(f.installPath) > 0);
        REQUIRE(test_utils::readFile(f.installPath) == kOldBinary);
        REQUIRE_FALSE(fs::exists(f.installPath.string() + ".bak"));

        REQUIRE(outcome.relaunched);
        REQUIRE(f.launches.size() == 1);
        REQUIRE(f.launches[0].exe == f.installPath);

        MarkerSnapshot markers = StatusMarkers(f.markerDir).consumeAll();
        REQUIRE_FALSE(markers.success.has_value());
        REQUIRE(markers.error.has_value());
        REQUIRE(markers.error->code == toCode(InstallErrorKind::CopyFailed));
        REQUIRE(markers.error->message.find("Device or resource busy") != std::string::npos);
        // verified package kept for the reboot fallback
        REQUIRE(markers.pendingInstallerPath == f.sourcePath.string());
        REQUIRE(fs::exists(f.sourcePath));
    }

    SECTION("Permission errors are classified") {
        InstallEnvironment env = f.env();
        env.copyFile = [&](const fs::path& from, const fs::path& to, std::string& outError) {
            if (from == f.sourcePath) {
                outError = "Permission denied";
                return false;
            }
            return BackupManager::CopyReplacing(from, to, outError);
        };

        InstallOutcome outcome = InstallRoutine(f.plan(), env).run();
        REQUIRE(outcome.errorKind == InstallErrorKind::PermissionDenied);
        REQUIRE(test_utils::readFile(f.installPath) == kOldBinary);
    }

    SECTION("Short copy is a size mismatch and is rolled back") {
        InstallEnvironment env = f.env();
        env.copyFile = [&](const fs::path& from, const fs::path& to, std::string& outError) {
            if (from == f.sourcePath) {
                test_utils::writeFile(to, kNewBinary.substr(0, 5));
                return true;
            }
            return BackupManager::CopyReplacing(from, to, outError);
        };

        InstallOutcome outcome = InstallRoutine(f.plan(), env).run();
        REQUIRE(outcome.errorKind == InstallErrorKind::SizeMismatch);
        REQUIRE(outcome.rolledBack);
        REQUIRE(test_utils::readFile(f.installPath) == kOldBinary);
    }

    SECTION("Parent that never exits times out and relaunches the old executable") {
        f.parentAlive = true;
        InstallOutcome outcome = InstallRoutine(f.plan(), f.env()).run();

        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.errorKind == InstallErrorKind::LockTimeout);
        REQUIRE_FALSE(outcome.rolledBack);
        REQUIRE(outcome.relaunched);
        REQUIRE(test_utils::readFile(f.installPath) == kOldBinary);
        // 2000 ms budget polled every 500 ms
        REQUIRE(f.aliveChecks == 5);

        MarkerSnapshot markers = StatusMarkers(f.markerDir).consumeAll();
        REQUIRE(markers.error->code == toCode(InstallErrorKind::LockTimeout));
    }

    SECTION("Missing package is an invalid plan") {
        fs::remove(f.sourcePath);
        InstallOutcome outcome = InstallRoutine(f.plan(), f.env()).run();

        REQUIRE(outcome.errorKind == InstallErrorKind::InvalidPlan);
        REQUIRE(f.aliveChecks == 0);
        REQUIRE(test_utils::readFile(f.installPath) == kOldBinary);

        MarkerSnapshot markers = StatusMarkers(f.markerDir).consumeAll();
        REQUIRE(markers.error.has_value());
        REQUIRE_FALSE(markers.pendingInstallerPath.has_value());
    }

    SECTION("Filesystem exception mid-copy still restores, records and relaunches") {
        InstallEnvironment env = f.env();
        env.copyFile = [&](const fs::path& from, const fs::path& to, std::string& outError) {
            if (from == f.sourcePath) {
                test_utils::writeFile(to, "");
                throw fs::filesystem_error("copy_file", from, to, std::make_error_code(std::errc::io_error));
            }
            return BackupManager::CopyReplacing(from, to, outError);
        };

        InstallOutcome outcome;
        REQUIRE_NOTHROW(outcome = InstallRoutine(f.plan(), env).run());

        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.errorKind == InstallErrorKind::Unexpected);
        REQUIRE(outcome.rolledBack);
        REQUIRE(outcome.relaunched);
        REQUIRE(test_utils::readFile(f.installPath) == kOldBinary);
        REQUIRE_FALSE(fs::exists(f.installPath.string() + ".bak"));

        MarkerSnapshot markers = StatusMarkers(f.markerDir).consumeAll();
        REQUIRE(markers.error.has_value());
        REQUIRE(markers.error->code == toCode(InstallErrorKind::Unexpected));
        REQUIRE(markers.pendingInstallerPath == f.sourcePath.string());
    }

    SECTION("Exception while waiting for the parent leaves the old executable running") {
        InstallEnvironment env = f.env();
        env.isProcessAlive = [](std::uint32_t) -> bool {
            throw std::runtime_error("process table unavailable");
        };

        InstallOutcome outcome = InstallRoutine(f.plan(), env).run();
        REQUIRE(outcome.errorKind == InstallErrorKind::Unexpected);
        REQUIRE_FALSE(outcome.rolledBack);
        REQUIRE(outcome.relaunched);
        REQUIRE(test_utils::readFile(f.installPath) == kOldBinary);
        REQUIRE(outcome.message.find("process table unavailable") != std::string::npos);
    }

#ifndef _WIN32
    SECTION("Unresolvable package path is reported instead of thrown") {
        fs::path loop = f.downloadDir / "loop";
        fs::create_symlink(loop, loop);
        InstallPlan plan = f.plan();
        plan.sourcePath = loop.string();

        InstallOutcome outcome = InstallRoutine(plan, f.env()).run();
        REQUIRE(outcome.errorKind == InstallErrorKind::InvalidPlan);
        REQUIRE(outcome.relaunched);
        REQUIRE(test_utils::readFile(f.installPath) == kOldBinary);
    }
#endif

    SECTION("Missing installed executable fails the backup") {
        fs::remove(f.installPath);
        InstallOutcome outcome = InstallRoutine(f.plan(), f.env()).run();

        REQUIRE(outcome.errorKind == InstallErrorKind::BackupFailed);
        REQUIRE_FALSE(outcome.relaunched);
        REQUIRE(f.launches.empty());
    }
}

TEST_CASE("Permission error detection", "[updater][install]") {
    REQUIRE(InstallRoutine::IsPermissionError("filesystem error: Permission denied"));
    REQUIRE(InstallRoutine::IsPermissionError("Access is denied."));
    REQUIRE(InstallRoutine::IsPermissionError("Operation not permitted"));
    REQUIRE_FALSE(InstallRoutine::IsPermissionError("No space left on device"));
}
