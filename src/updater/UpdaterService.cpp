#include "UpdaterService.hpp"
#include "GitHubReleaseChecker.hpp"
#include "PackageDownloader.hpp"
#include "StatusMarkers.hpp"
#include "../config/SettingsStore.hpp"
#include "../platform/DeferredRename.hpp"
#include "../platform/ProcessUtils.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/HttpClient.hpp"

#include <plog/Log.h>

#include <atomic>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace updater
{

struct UpdaterService::Impl
{
    SettingsStore& settings;
    UpdaterOptions options;

    // Configuration
    std::string githubOwner;
    std::string githubRepo;
    Version currentVersion;

    // State (atomic for thread-safety)
    std::atomic<UpdateState> state{ UpdateState::Idle };

    // Update information
    mutable std::mutex infoMutex;
    UpdatePackage updatePackage;
    DownloadProgress downloadProgress;
    FetchResult fetched;

    std::unique_ptr<GitHubReleaseChecker> releaseChecker;
    std::unique_ptr<PackageDownloader> downloader;
    std::unique_ptr<UpdateApplier> applier;
    std::unique_ptr<utils::DeferredRename> deferred;

    bool packaged = false;

    // Initialized flag
    bool initialized = false;

    Impl(SettingsStore& s, UpdaterOptions opts)
        : settings(s)
        , options(std::move(opts))
    {
    }
};

UpdaterService::UpdaterService(SettingsStore& settings, UpdaterOptions options)
    : impl_(std::make_unique<Impl>(settings, std::move(options)))
{
}

UpdaterService::~UpdaterService() { shutdown(); }

bool UpdaterService::IsPackagedBuild(const fs::path& exeDir)
{
    std::error_code ec;
    return fs::exists(exeDir / kPackagedMarker, ec);
}

void UpdaterService::initialize(const std::string& githubOwner, const std::string& githubRepo,
                                const Version& currentVersion)
{
    UpdaterOptions& opts = impl_->options;
    if (!opts.http)
        opts.http = std::make_shared<utils::CprHttpClient>();
    if (opts.installPath.empty())
        opts.installPath = utils::ProcessUtils::GetInstalledPath();
    if (opts.installerPath.empty())
        opts.installerPath = UpdateApplier::DefaultInstallerPath();
    if (opts.markerDir.empty())
        opts.markerDir = StatusMarkers::DefaultDirectory();
    if (opts.renameJournal.empty())
        opts.renameJournal = fs::path(impl_->settings.configPath()).parent_path() / utils::DeferredRename::kJournalFileName;

    impl_->githubOwner = githubOwner;
    impl_->githubRepo = githubRepo;
    impl_->currentVersion = currentVersion;

    impl_->releaseChecker = std::make_unique<GitHubReleaseChecker>(githubOwner, githubRepo, opts.http);
    if (opts.sleep)
        impl_->releaseChecker->setSleepFunction(opts.sleep);
    if (!opts.assetSuffix.empty())
        impl_->releaseChecker->setAssetSuffix(opts.assetSuffix);

    impl_->downloader = std::make_unique<PackageDownloader>(opts.http);
    impl_->downloader->setRequireChecksum(impl_->settings.snapshot().requireChecksum);
    if (!opts.downloadRoot.empty())
        impl_->downloader->setTempRoot(opts.downloadRoot);

    impl_->applier = std::make_unique<UpdateApplier>(opts.installPath, opts.installerPath,
                                                     StatusMarkers(opts.markerDir));
    if (opts.launcher)
        impl_->applier->setLauncher(opts.launcher);
    impl_->applier->setRelaunchArgs(opts.relaunchArgs);
    impl_->applier->setLogDirectory(opts.logDir);

    impl_->deferred = std::make_unique<utils::DeferredRename>(opts.renameJournal);

    // An AppImage carries the marker inside its mount, next to the running executable
    impl_->packaged = IsPackagedBuild(opts.installPath.parent_path()) ||
                      IsPackagedBuild(utils::ProcessUtils::GetExecutablePath().parent_path());
    impl_->initialized = true;

    PLOG_INFO << "UpdaterService initialized for " << githubOwner << "/" << githubRepo
              << " (current version: " << currentVersion.toString() << ", "
              << (impl_->packaged ? "packaged build" : "source build, self-update disabled") << ")";
}

void UpdaterService::shutdown()
{
    if (!impl_->initialized)
    {
        return;
    }

    PLOG_INFO << "UpdaterService shutting down";

    // Destroying the workers cancels and joins them
    impl_->releaseChecker->cancel();
    impl_->downloader->cancel();
    impl_->releaseChecker.reset();
    impl_->downloader.reset();

    impl_->initialized = false;
}

bool UpdaterService::beginCheck()
{
    // A check may follow a finished one, never an attempt still in flight
    for (UpdateState state : { UpdateState::Idle, UpdateState::Available, UpdateState::Failed })
    {
        UpdateState expected = state;
        if (impl_->state.compare_exchange_strong(expected, UpdateState::Checking))
            return true;
    }
    PLOG_WARNING << "Update check skipped in state " << toString(impl_->state.load());
    return false;
}

void UpdaterService::recordCheck(const CheckResult& result)
{
    bool ok = result.status != CheckResult::Status::CheckFailed;
    if (!impl_->settings.recordCheck(ok, ok ? std::string{} : toString(result.category)))
    {
        PLOG_WARNING << "Could not persist update statistics";
    }
}

void UpdaterService::finishCheck(const CheckResult& result)
{
    recordCheck(result);

    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    switch (result.status)
    {
    case CheckResult::Status::Available:
        impl_->updatePackage = result.package;
        impl_->state = UpdateState::Available;
        PLOG_INFO << "Update available: " << result.package.version.toString();
        break;
    case CheckResult::Status::NoUpdate:
        impl_->state = UpdateState::Idle;
        PLOG_INFO << "No update available (latest " << result.latestVersion.toString() << ")";
        break;
    case CheckResult::Status::CheckFailed:
        impl_->state = UpdateState::Idle;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Network, "Could not check for updates",
                                            result.error.message + " (" + toString(result.category) + ", " +
                                                std::to_string(result.attempts) + " attempts)");
        break;
    }
}

void UpdaterService::checkForUpdatesAsync(UpdateCheckCallback callback)
{
    if (!impl_->initialized)
    {
        PLOG_ERROR << "UpdaterService not initialized";
        return;
    }

    if (!beginCheck())
    {
        return;
    }

    impl_->releaseChecker->checkLatestReleaseAsync(impl_->currentVersion,
                                                   [this, callback](const CheckResult& result)
                                                   {
                                                       finishCheck(result);
                                                       if (callback)
                                                       {
                                                           callback(result);
                                                       }
                                                   });
}

CheckResult UpdaterService::checkForUpdates()
{
    CheckResult result;
    if (!impl_->initialized)
    {
        result.status = CheckResult::Status::CheckFailed;
        result.error = UpdateError("Updater not initialized");
        return result;
    }

    if (!beginCheck())
    {
        result.status = CheckResult::Status::CheckFailed;
        result.error = UpdateError(std::string("Updater busy: ") + toString(getState()));
        return result;
    }

    result = impl_->releaseChecker->checkLatestRelease(impl_->currentVersion);
    finishCheck(result);
    return result;
}

void UpdaterService::finishDownload(const FetchResult& result)
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    if (result.success)
    {
        PLOG_INFO << "Package downloaded: " << result.filePath << (result.verified ? " (verified)" : " (unverified)");
        impl_->fetched = result;
        impl_->state = UpdateState::Downloaded;
    }
    else if (result.errorKind == FetchErrorKind::Cancelled)
    {
        PLOG_INFO << "Download cancelled";
        impl_->state = UpdateState::Available;
    }
    else
    {
        PLOG_ERROR << "Download failed (" << toString(result.errorKind) << "): " << result.error.message;
        impl_->state = UpdateState::Failed;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Network, "The update could not be downloaded",
                                          result.error.message);
    }
}

bool UpdaterService::startDownload(DownloadProgressCallback progressCallback,
                                   DownloadCompleteCallback completeCallback)
{
    if (!impl_->initialized)
    {
        PLOG_ERROR << "UpdaterService not initialized";
        return false;
    }
    if (!impl_->packaged)
    {
        PLOG_WARNING << "Source build cannot install updates; use the release page";
        return false;
    }

    UpdateState expected = UpdateState::Available;
    if (!impl_->state.compare_exchange_strong(expected, UpdateState::Downloading))
    {
        PLOG_WARNING << "No update available to download";
        return false;
    }

    UpdatePackage pkg = getUpdatePackage();
    impl_->downloader->downloadAsync(
        pkg,
        [this, progressCallback](const DownloadProgress& progress)
        {
            {
                std::lock_guard<std::mutex> lock(impl_->infoMutex);
                impl_->downloadProgress = progress;
            }
            if (progressCallback)
            {
                progressCallback(progress);
            }
        },
        [this, completeCallback](const FetchResult& result)
        {
            finishDownload(result);
            if (completeCallback)
            {
                completeCallback(result);
            }
        });
    return true;
}

FetchResult UpdaterService::downloadUpdate(DownloadProgressCallback progressCallback)
{
    FetchResult result;
    if (!impl_->initialized || !impl_->packaged)
    {
        result.errorKind = FetchErrorKind::IoError;
        result.error = UpdateError(impl_->initialized ? "Source build cannot install updates"
                                                      : "Updater not initialized");
        return result;
    }

    UpdateState expected = UpdateState::Available;
    if (!impl_->state.compare_exchange_strong(expected, UpdateState::Downloading))
    {
        result.errorKind = FetchErrorKind::IoError;
        result.error = UpdateError("No update available to download");
        return result;
    }

    result = impl_->downloader->fetch(getUpdatePackage(),
                                      [this, &progressCallback](const DownloadProgress& progress)
                                      {
                                          {
                                              std::lock_guard<std::mutex> lock(impl_->infoMutex);
                                              impl_->downloadProgress = progress;
                                          }
                                          if (progressCallback)
                                          {
                                              progressCallback(progress);
                                          }
                                      });
    finishDownload(result);
    return result;
}

void UpdaterService::cancelDownload()
{
    if (impl_->initialized && impl_->state == UpdateState::Downloading)
    {
        PLOG_INFO << "Cancelling download...";
        impl_->downloader->cancel();
    }
}

bool UpdaterService::applyUpdate(std::string& outError)
{
    if (!impl_->initialized)
    {
        outError = "Updater not initialized";
        return false;
    }
    if (impl_->state != UpdateState::Downloaded)
    {
        outError = "No update ready to apply";
        PLOG_WARNING << outError;
        return false;
    }

    FetchResult fetched;
    Version version;
    {
        std::lock_guard<std::mutex> lock(impl_->infoMutex);
        fetched = impl_->fetched;
        version = impl_->updatePackage.version;
    }

    impl_->state = UpdateState::Requested;
    bool autostart = impl_->settings.snapshot().autostart;
    if (!impl_->applier->applyUpdate(fetched, version, autostart, outError))
    {
        std::lock_guard<std::mutex> lock(impl_->infoMutex);
        impl_->state = UpdateState::Failed;
        return false;
    }

    impl_->state = UpdateState::ExternalRoutineLaunched;
    return true;
}

bool UpdaterService::scheduleReplaceOnReboot(const fs::path& packagePath, std::string& outError)
{
    if (!impl_->initialized)
    {
        outError = "Updater not initialized";
        return false;
    }
    if (!impl_->applier->scheduleReplaceOnReboot(packagePath, *impl_->deferred, outError))
    {
        return false;
    }
    impl_->state = UpdateState::AwaitingReboot;
    return true;
}

UpdateState UpdaterService::getState() const { return impl_->state.load(); }

UpdatePackage UpdaterService::getUpdatePackage() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->updatePackage;
}

DownloadProgress UpdaterService::getDownloadProgress() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->downloadProgress;
}

bool UpdaterService::isUpdateAvailable() const
{
    return impl_->state == UpdateState::Available || impl_->state == UpdateState::Downloaded;
}

bool UpdaterService::isInitialized() const { return impl_ && impl_->initialized; }

bool UpdaterService::canSelfUpdate() const { return impl_->initialized && impl_->packaged; }

std::string UpdaterService::releasesPageUrl() const
{
    if (impl_->releaseChecker)
        return impl_->releaseChecker->releasesPageUrl();
    return "https://github.com/" + impl_->githubOwner + "/" + impl_->githubRepo + "/releases/latest";
}

} // namespace updater
