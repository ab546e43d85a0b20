#pragma once

#include "InstallPlan.hpp"
#include "StatusMarkers.hpp"
#include "UpdateTypes.hpp"
#include "Version.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{
class DeferredRename;
}

namespace updater
{

using InstallerLauncher = std::function<bool(const std::filesystem::path& exe, const std::vector<std::string>& args,
                                             const std::filesystem::path& workingDir)>;

// Application side of an install: prepares the hand-off and starts crosstrans-installer.
// State: Idle -> Requested -> ExternalRoutineLaunched, or Failed / AwaitingReboot.
class UpdateApplier
{
public:
    UpdateApplier(const std::filesystem::path& installPath, const std::filesystem::path& installerPath,
                  const StatusMarkers& markers);
    ~UpdateApplier() = default;

    // On success the installer is running and the application must exit promptly
    bool applyUpdate(const FetchResult& package, const Version& newVersion, bool autostartEnabled,
                     std::string& outError);

    // Replace the executable at next boot instead, recording the pending package
    bool scheduleReplaceOnReboot(const std::filesystem::path& packagePath, utils::DeferredRename& deferred,
                                 std::string& outError);

    UpdateState state() const;

    // Arguments given to the relaunched application
    void setRelaunchArgs(std::vector<std::string> args) { relaunchArgs_ = std::move(args); }

    void setLauncher(InstallerLauncher launcher);

    // Where the installer writes update.log
    void setLogDirectory(const std::filesystem::path& dir) { logDir_ = dir; }

    const std::filesystem::path& installPath() const { return installPath_; }

    // crosstrans-installer next to the running executable
    static std::filesystem::path DefaultInstallerPath();

private:
    InstallPlan buildPlan(const FetchResult& package, const Version& newVersion, bool autostartEnabled) const;
    bool fail(const std::string& message, std::string& outError);

    std::filesystem::path installPath_;
    std::filesystem::path installerPath_;
    StatusMarkers markers_;
    std::vector<std::string> relaunchArgs_;
    std::filesystem::path logDir_;
    InstallerLauncher launcher_;

    mutable std::mutex mutex_;
    UpdateState state_ = UpdateState::Idle;
};

} // namespace updater
