#include "InstallRoutine.hpp"
#include "StatusMarkers.hpp"
#include "../platform/AutostartRegistrar.hpp"
#include "../platform/ProcessUtils.hpp"

#include <plog/Log.h>

#include <thread>

namespace fs = std::filesystem;

namespace updater
{

InstallEnvironment InstallEnvironment::System()
{
    InstallEnvironment env;
    env.isProcessAlive = [](std::uint32_t pid) { return utils::ProcessUtils::IsProcessAlive(pid); };
    env.copyFile = &BackupManager::CopyReplacing;
    env.launch = [](const fs::path& exe, const std::vector<std::string>& args)
    { return utils::ProcessUtils::LaunchProcess(exe, args, utils::LaunchMode::Detached, exe.parent_path()); };
    env.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    env.registerAutostart = [](const std::string& entryName, const fs::path& exe, std::string& outError)
    {
        AutostartRegistrar registrar(entryName);
        return registrar.registerExecutable(exe, outError);
    };
    return env;
}

InstallRoutine::InstallRoutine(InstallPlan plan, InstallEnvironment env)
    : plan_(std::move(plan))
    , env_(std::move(env))
    , backup_(plan_.installPath, plan_.backupPath)
{
    backup_.setCopyFunction(env_.copyFile);
    backup_.setSleepFunction(env_.sleep);
    backup_.setRetryPolicy(RetryPolicy{ plan_.copyAttempts, std::chrono::milliseconds(plan_.retryDelayMs) });
}

bool InstallRoutine::IsPermissionError(const std::string& message)
{
    return message.find("ermission denied") != std::string::npos ||
           message.find("ccess is denied") != std::string::npos ||
           message.find("Operation not permitted") != std::string::npos;
}

InstallOutcome InstallRoutine::run()
{
    try
    {
        return runSteps();
    }
    catch (const std::exception& e)
    {
        return recoverFromException(e.what());
    }
}

// The parent is usually gone by now, so a failure here must still end with a marker
// and a running application
InstallOutcome InstallRoutine::recoverFromException(const std::string& what)
{
    PLOG_ERROR << "Install routine failed: " << what;
    std::string message = "Installer stopped unexpectedly: " + what;

    bool restored = false;
    try
    {
        if (backup_.hasBackup())
        {
            std::string restoreError;
            restored = backup_.restoreFromBackup(restoreError);
            if (restored)
                backup_.cleanupBackup();
            else
                message += ". Restoring the previous version also failed (" + restoreError + ")";
        }
        InstallOutcome outcome = abort(InstallErrorKind::Unexpected, message);
        outcome.rolledBack = restored;
        return outcome;
    }
    catch (const std::exception& e)
    {
        PLOG_FATAL << "Recovery failed as well: " << e.what();
        InstallOutcome outcome;
        outcome.errorKind = InstallErrorKind::Unexpected;
        outcome.message = message + "; recovery failed: " + e.what();
        outcome.rolledBack = restored;
        return outcome;
    }
}

InstallOutcome InstallRoutine::runSteps()
{
    PLOG_INFO << "Installing CrossTrans " << plan_.newVersion.toString() << " over " << plan_.installPath
              << " (parent pid " << plan_.parentPid << ")";

    std::error_code ec;
    if (!fs::is_regular_file(plan_.sourcePath, ec))
    {
        return abort(InstallErrorKind::InvalidPlan, "Downloaded package not found: " + plan_.sourcePath);
    }

    // Step 1: the executable must not be touched while the application still runs
    if (!waitForParentExit())
    {
        return abort(InstallErrorKind::LockTimeout, "Application did not exit within " +
                                                        std::to_string(plan_.waitTimeoutMs / 1000) + " seconds");
    }

    // Step 2
    std::string error;
    if (!backup_.createBackup(error))
    {
        backup_.cleanupBackup();
        return abort(IsPermissionError(error) ? InstallErrorKind::PermissionDenied : InstallErrorKind::BackupFailed,
                     error);
    }

    // Step 3
    InstallErrorKind failure = InstallErrorKind::None;
    std::string failureMessage;

    PLOG_INFO << "Copying " << plan_.sourcePath << " -> " << plan_.installPath;
    if (!backup_.copyWithRetries(plan_.sourcePath, plan_.installPath, error))
    {
        failure = IsPermissionError(error) ? InstallErrorKind::PermissionDenied : InstallErrorKind::CopyFailed;
        failureMessage = "Failed to replace the executable: " + error;
    }
    else
    {
        std::error_code srcEc;
        std::error_code dstEc;
        auto expected = fs::file_size(plan_.sourcePath, srcEc);
        auto actual = fs::file_size(plan_.installPath, dstEc);
        if (srcEc || dstEc || expected != actual)
        {
            failure = InstallErrorKind::SizeMismatch;
            failureMessage = "Installed file size " + std::to_string(dstEc ? 0 : actual) + " does not match package size " +
                             std::to_string(srcEc ? 0 : expected);
        }
    }

    if (failure != InstallErrorKind::None)
    {
        PLOG_ERROR << failureMessage << "; rolling back";
        std::string restoreError;
        bool restored = backup_.restoreFromBackup(restoreError);
        if (!restored)
        {
            failureMessage += ". Restoring the previous version also failed (" + restoreError +
                              "); a copy is kept at " + backup_.getBackupPath().string();
        }
        InstallOutcome outcome = abort(failure, failureMessage);
        outcome.rolledBack = restored;
        if (restored)
        {
            backup_.cleanupBackup();
        }
        return outcome;
    }

    // Step 4
    InstallOutcome outcome;
    outcome.success = true;

    StatusMarkers markers(plan_.markerDir);
    if (!markers.writeSuccess(plan_.newVersion, error))
    {
        PLOG_ERROR << "Installed but could not record success: " << error;
    }

    if (plan_.autostartEnabled && env_.registerAutostart)
    {
        if (!env_.registerAutostart(plan_.autostartName, plan_.installPath, error))
        {
            PLOG_WARNING << "Failed to update autostart entry: " << error;
        }
    }

    relaunchInstalled(outcome);

    backup_.cleanupBackup();
    cleanupTempDir();

    PLOG_INFO << "Update to " << plan_.newVersion.toString() << " completed";
    return outcome;
}

bool InstallRoutine::waitForParentExit()
{
    if (plan_.parentPid == 0)
        return true;

    const auto interval = std::chrono::milliseconds(plan_.pollIntervalMs);
    const auto timeout = std::chrono::milliseconds(plan_.waitTimeoutMs);
    std::chrono::milliseconds waited{ 0 };

    PLOG_INFO << "Waiting for process " << plan_.parentPid << " to exit";
    while (env_.isProcessAlive(plan_.parentPid))
    {
        if (waited >= timeout)
        {
            PLOG_ERROR << "Timed out waiting for process " << plan_.parentPid;
            return false;
        }
        env_.sleep(interval);
        waited += interval;
    }

    PLOG_INFO << "Process " << plan_.parentPid << " exited after ~" << waited.count() << " ms";
    return true;
}

// Step 5
InstallOutcome InstallRoutine::abort(InstallErrorKind kind, const std::string& message)
{
    PLOG_ERROR << "Install aborted (" << toString(kind) << "): " << message;

    InstallOutcome outcome;
    outcome.errorKind = kind;
    outcome.message = message;

    StatusMarkers markers(plan_.markerDir);
    std::string error;
    if (!markers.writeError(message, toCode(kind), error))
    {
        PLOG_ERROR << "Could not record install failure: " << error;
    }

    // Keep the verified package so the next start can offer the reboot fallback
    std::error_code ec;
    if (fs::is_regular_file(plan_.sourcePath, ec))
    {
        if (!markers.writePendingInstaller(plan_.sourcePath, error))
        {
            PLOG_ERROR << "Could not record pending installer: " << error;
        }
    }

    relaunchInstalled(outcome);
    return outcome;
}

void InstallRoutine::relaunchInstalled(InstallOutcome& outcome)
{
    std::error_code ec;
    if (!fs::is_regular_file(plan_.installPath, ec) || fs::file_size(plan_.installPath, ec) == 0)
    {
        PLOG_ERROR << "No launchable executable at " << plan_.installPath;
        return;
    }

    if (env_.launch && env_.launch(plan_.installPath, plan_.relaunchArgs))
    {
        outcome.relaunched = true;
        PLOG_INFO << "Relaunched " << plan_.installPath;
    }
    else
    {
        PLOG_ERROR << "Failed to relaunch " << plan_.installPath;
    }
}

void InstallRoutine::cleanupTempDir()
{
    std::error_code ec;
    fs::remove(plan_.sourcePath, ec);

    if (plan_.tempDir.empty())
        return;

    // On Windows this process' own image inside the directory stays locked until exit;
    // the next application start sweeps what is left
    fs::remove_all(plan_.tempDir, ec);
    if (ec)
    {
        PLOG_INFO << "Temporary directory left for later cleanup: " << plan_.tempDir << " (" << ec.message() << ")";
    }
}

} // namespace updater
