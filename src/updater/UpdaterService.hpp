#pragma once

#include "UpdateApplier.hpp"
#include "UpdateTypes.hpp"
#include "Version.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class SettingsStore;

namespace utils
{
class IHttpClient;
}

namespace updater
{

// Callback types, invoked on worker threads
using UpdateCheckCallback = std::function<void(const CheckResult& result)>;
using DownloadProgressCallback = std::function<void(const DownloadProgress&)>;
using DownloadCompleteCallback = std::function<void(const FetchResult& result)>;

// Collaborators, defaulted to the real ones when left empty
struct UpdaterOptions
{
    std::shared_ptr<utils::IHttpClient> http;
    std::filesystem::path installPath; // ProcessUtils::GetInstalledPath()
    std::filesystem::path installerPath; // UpdateApplier::DefaultInstallerPath()
    std::filesystem::path markerDir; // StatusMarkers::DefaultDirectory()
    std::filesystem::path downloadRoot; // system temp
    std::filesystem::path renameJournal; // DeferredRename journal beside config.toml
    SleepFunction sleep; // retry backoff
    InstallerLauncher launcher;
    std::vector<std::string> relaunchArgs;
    std::filesystem::path logDir; // passed on to the installer
    std::string assetSuffix; // GitHubReleaseChecker::defaultAssetSuffix()
};

// Main updater service: check, download and hand-off for one update attempt.
// Network work runs on worker threads; results are recorded in the update statistics.
class UpdaterService
{
public:
    static constexpr const char* kPackagedMarker = ".crosstrans_packaged";

    explicit UpdaterService(SettingsStore& settings, UpdaterOptions options = {});
    ~UpdaterService();

    // Disable copy
    UpdaterService(const UpdaterService&) = delete;
    UpdaterService& operator=(const UpdaterService&) = delete;

    void initialize(const std::string& githubOwner, const std::string& githubRepo, const Version& currentVersion);

    // Cancel pending operations and join workers
    void shutdown();

    // Check for updates (async, non-blocking)
    void checkForUpdatesAsync(UpdateCheckCallback callback = nullptr);

    CheckResult checkForUpdates();

    // Start download of the available package (async, non-blocking)
    // False when nothing can be downloaded; completeCallback is then never called
    bool startDownload(DownloadProgressCallback progressCallback = nullptr,
                       DownloadCompleteCallback completeCallback = nullptr);

    FetchResult downloadUpdate(DownloadProgressCallback progressCallback = nullptr);

    // Cancel ongoing download
    void cancelDownload();

    // Hand the downloaded package to crosstrans-installer. On success the caller must exit.
    bool applyUpdate(std::string& outError);

    // Deferred fallback for a package that could not be installed directly
    bool scheduleReplaceOnReboot(const std::filesystem::path& packagePath, std::string& outError);

    // State queries (thread-safe)
    UpdateState getState() const;
    UpdatePackage getUpdatePackage() const;
    DownloadProgress getDownloadProgress() const;

    bool isUpdateAvailable() const;
    bool isInitialized() const;

    // Installed from a release package and therefore able to replace itself
    bool canSelfUpdate() const;

    std::string releasesPageUrl() const;

    static bool IsPackagedBuild(const std::filesystem::path& exeDir);

private:
    bool beginCheck();
    void recordCheck(const CheckResult& result);
    void finishCheck(const CheckResult& result);
    void finishDownload(const FetchResult& result);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
