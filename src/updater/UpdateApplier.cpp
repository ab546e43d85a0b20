#include "UpdateApplier.hpp"
#include "BackupManager.hpp"
#include "../platform/DeferredRename.hpp"
#include "../platform/ProcessUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace updater
{

UpdateApplier::UpdateApplier(const fs::path& installPath, const fs::path& installerPath, const StatusMarkers& markers)
    : installPath_(installPath)
    , installerPath_(installerPath)
    , markers_(markers)
    , launcher_([](const fs::path& exe, const std::vector<std::string>& args, const fs::path& workingDir)
                { return utils::ProcessUtils::LaunchProcess(exe, args, utils::LaunchMode::Hidden, workingDir); })
{
}

fs::path UpdateApplier::DefaultInstallerPath()
{
    fs::path exe = utils::ProcessUtils::GetExecutablePath();
#ifdef _WIN32
    return exe.parent_path() / "crosstrans-installer.exe";
#else
    return exe.parent_path() / "crosstrans-installer";
#endif
}

void UpdateApplier::setLauncher(InstallerLauncher launcher)
{
    if (launcher)
        launcher_ = std::move(launcher);
}

UpdateState UpdateApplier::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool UpdateApplier::fail(const std::string& message, std::string& outError)
{
    outError = message;
    PLOG_ERROR << "Install hand-off failed: " << message;
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Installation, "Could not start the update installer",
                                      message);
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = UpdateState::Failed;
    return false;
}

InstallPlan UpdateApplier::buildPlan(const FetchResult& package, const Version& newVersion,
                                     bool autostartEnabled) const
{
    InstallPlan plan;
    plan.parentPid = utils::ProcessUtils::GetCurrentProcessId();
    plan.installPath = installPath_.string();
    plan.sourcePath = package.filePath;
    plan.backupPath = installPath_.string() + ".bak";
    plan.newVersion = newVersion;
    plan.markerDir = markers_.directory().string();
    plan.tempDir = package.tempDir;
    plan.logDir = logDir_.string();
    plan.autostartEnabled = autostartEnabled;
    plan.relaunchArgs = relaunchArgs_;
    return plan;
}

bool UpdateApplier::applyUpdate(const FetchResult& package, const Version& newVersion, bool autostartEnabled,
                                std::string& outError)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == UpdateState::Requested || state_ == UpdateState::ExternalRoutineLaunched)
        {
            outError = "An install is already in progress";
            return false;
        }
        state_ = UpdateState::Requested;
    }

    std::error_code ec;
    if (!package.success || package.filePath.empty() || !fs::is_regular_file(package.filePath, ec))
    {
        return fail("No verified package to install", outError);
    }
    if (!fs::is_regular_file(installerPath_, ec))
    {
        return fail("Installer not found: " + installerPath_.string(), outError);
    }

    fs::path workDir = package.tempDir.empty() ? fs::path(package.filePath).parent_path() : fs::path(package.tempDir);

    // Outcomes left by an earlier attempt would be misattributed to this one
    markers_.clear();

    std::string error;
    if (!markers_.writeExpectedVersion(newVersion, error))
    {
        return fail(error, outError);
    }

    InstallPlan plan = buildPlan(package, newVersion, autostartEnabled);
    fs::path planPath = workDir / InstallPlan::kFileName;
    if (!plan.saveToFile(planPath, error))
    {
        markers_.clear();
        return fail(error, outError);
    }

    // The installer runs from the temporary directory so it never holds the install directory open
    fs::path stagedInstaller = workDir / installerPath_.filename();
    if (!BackupManager::CopyReplacing(installerPath_, stagedInstaller, error))
    {
        markers_.clear();
        return fail("Failed to stage installer: " + error, outError);
    }

    PLOG_INFO << "Launching installer " << stagedInstaller.string() << " for version " << newVersion.toString();
    if (!launcher_(stagedInstaller, { "--plan", planPath.string() }, workDir))
    {
        markers_.clear();
        return fail("Failed to launch installer " + stagedInstaller.string(), outError);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = UpdateState::ExternalRoutineLaunched;
    PLOG_INFO << "Installer launched; application must exit now";
    return true;
}

bool UpdateApplier::scheduleReplaceOnReboot(const fs::path& packagePath, utils::DeferredRename& deferred,
                                            std::string& outError)
{
    if (!deferred.schedule(packagePath, installPath_, outError))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Installation,
                                          "Could not schedule the update for the next restart", outError);
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = UpdateState::Failed;
        return false;
    }

    std::string error;
    if (!markers_.writePendingInstaller(packagePath.string(), error))
    {
        PLOG_WARNING << "Deferred replacement scheduled but not recorded: " << error;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = UpdateState::AwaitingReboot;
    PLOG_INFO << "Update will be applied on next restart";
    return true;
}

} // namespace updater
