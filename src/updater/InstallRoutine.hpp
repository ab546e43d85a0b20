#pragma once

#include "BackupManager.hpp"
#include "InstallPlan.hpp"
#include "UpdateTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace updater
{

// OS operations the routine depends on; System() binds the real ones
struct InstallEnvironment
{
    std::function<bool(std::uint32_t pid)> isProcessAlive;
    CopyFunction copyFile;
    std::function<bool(const std::filesystem::path& exe, const std::vector<std::string>& args)> launch;
    SleepFunction sleep;
    std::function<bool(const std::string& entryName, const std::filesystem::path& exe, std::string& outError)>
        registerAutostart;

    static InstallEnvironment System();
};

struct InstallOutcome
{
    bool success = false;
    InstallErrorKind errorKind = InstallErrorKind::None;
    std::string message;
    bool rolledBack = false; // executable restored from the .bak copy
    bool relaunched = false; // some executable was started before returning
};

// Replaces the installed executable once the application has exited.
// Runs inside crosstrans-installer, a separate process that outlives the application.
// Every abort path leaves a launchable executable at the install path and an error marker.
class InstallRoutine
{
public:
    explicit InstallRoutine(InstallPlan plan, InstallEnvironment env = InstallEnvironment::System());

    InstallOutcome run();

    static bool IsPermissionError(const std::string& message);

private:
    InstallOutcome runSteps();
    InstallOutcome recoverFromException(const std::string& what);
    bool waitForParentExit();
    InstallOutcome abort(InstallErrorKind kind, const std::string& message);
    void relaunchInstalled(InstallOutcome& outcome);
    void cleanupTempDir();

    InstallPlan plan_;
    InstallEnvironment env_;
    BackupManager backup_;
};

} // namespace updater
