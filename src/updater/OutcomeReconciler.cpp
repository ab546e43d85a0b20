#include "OutcomeReconciler.hpp"
#include "PackageDownloader.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace updater
{

const char* toString(ReconcileOutcome outcome)
{
    switch (outcome)
    {
    case ReconcileOutcome::Nothing:
        return "nothing";
    case ReconcileOutcome::Succeeded:
        return "succeeded";
    case ReconcileOutcome::Failed:
        return "failed";
    case ReconcileOutcome::PendingOffered:
        return "pending offered";
    case ReconcileOutcome::PendingApplied:
        return "pending applied";
    }
    return "unknown";
}

OutcomeReconciler::OutcomeReconciler(StatusMarkers markers, ui::UserNotifier& notifier, ReconcileActions actions)
    : markers_(std::move(markers))
    , notifier_(notifier)
    , actions_(std::move(actions))
    , downloadRoot_(markers_.directory())
{
}

ReconcileReport OutcomeReconciler::reconcile(const Version& currentVersion)
{
    ReconcileReport report;
    report.markers = markers_.consumeAll();
    const MarkerSnapshot& m = report.markers;

    if (m.empty())
    {
        PLOG_DEBUG << "No update markers found";
    }
    else
    {
        PLOG_INFO << "Update markers: success=" << (m.success ? m.success->toString() : "-")
                  << " error=" << (m.error ? std::to_string(m.error->code) : "-")
                  << " expected=" << (m.expectedVersion ? m.expectedVersion->toString() : "-")
                  << " pending=" << m.pendingInstallerPath.value_or("-");
    }

    if (m.error)
    {
        handleError(*m.error, report);
    }
    else if (m.success)
    {
        handleSuccess(*m.success, currentVersion, report);
    }
    else if (m.pendingInstallerPath)
    {
        handlePending(*m.pendingInstallerPath, report);
    }
    else if (m.expectedVersion)
    {
        // Hand-off happened but the installer never reported back
        PLOG_WARNING << "Update to " << m.expectedVersion->toString()
                     << " left no outcome; running version is " << currentVersion.toString();
    }

    std::optional<fs::path> keep;
    if (m.pendingInstallerPath && (report.rebootScheduled || report.outcome == ReconcileOutcome::Failed))
        keep = fs::path(*m.pendingInstallerPath);
    // A replacement declined now may still have been scheduled by an earlier run
    SweepDownloadDirs(downloadRoot_, keep, actions_.isRenamePending);

    return report;
}

void OutcomeReconciler::handleSuccess(const Version& installed, const Version& currentVersion,
                                      ReconcileReport& report)
{
    report.outcome = ReconcileOutcome::Succeeded;
    PLOG_INFO << "Update to " << installed.toString() << " succeeded";

    const auto& expected = report.markers.expectedVersion;
    if (expected && *expected != currentVersion)
    {
        report.versionMismatch = true;
        PLOG_WARNING << "Expected to be running " << expected->toString() << " after the update but this is "
                     << currentVersion.toString();
    }
    else if (installed != currentVersion)
    {
        report.versionMismatch = true;
        PLOG_WARNING << "Installer reported " << installed.toString() << " but this is " << currentVersion.toString();
    }

    if (actions_.recordInstall)
        actions_.recordInstall(true);

    auto notify = [this, installed]() { notifier_.showUpdateSucceeded(installed); };
    if (actions_.postDelayed)
        actions_.postDelayed(kSuccessNotifyDelay, notify);
    else
        notify();
}

void OutcomeReconciler::handleError(const ErrorMarker& error, ReconcileReport& report)
{
    report.outcome = ReconcileOutcome::Failed;
    PLOG_ERROR << "Previous update failed (code " << error.code << ", "
               << toString(installErrorFromCode(error.code)) << "): " << error.message;
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Installation, "The last update could not be installed",
                                      error.message + " (code " + std::to_string(error.code) + ")");

    if (actions_.recordInstall)
        actions_.recordInstall(false);

    const auto& pending = report.markers.pendingInstallerPath;
    std::error_code ec;
    bool canRetry = pending && fs::is_regular_file(*pending, ec) && actions_.scheduleOnReboot;

    auto choice = notifier_.askUpdateFailed(error.message, error.code, canRetry);
    report.failureChoice = choice;
    switch (choice)
    {
    case ui::UserNotifier::FailureChoice::RetryOnReboot:
        if (canRetry)
            report.rebootScheduled = scheduleReboot(*pending);
        break;
    case ui::UserNotifier::FailureChoice::OpenReleasePage:
        if (actions_.openReleasePage)
            actions_.openReleasePage();
        break;
    case ui::UserNotifier::FailureChoice::Dismiss:
        PLOG_INFO << "Update failure dismissed";
        break;
    }
}

void OutcomeReconciler::handlePending(const std::string& packagePath, ReconcileReport& report)
{
    std::error_code ec;
    if (!fs::is_regular_file(packagePath, ec))
    {
        report.outcome = ReconcileOutcome::PendingApplied;
        PLOG_INFO << "Deferred replacement already applied (" << packagePath << " is gone)";
        return;
    }

    report.outcome = ReconcileOutcome::PendingOffered;
    if (!actions_.scheduleOnReboot)
    {
        PLOG_WARNING << "Pending update " << packagePath << " cannot be finalized here";
        return;
    }
    if (notifier_.askFinalizePending(packagePath))
    {
        report.rebootScheduled = scheduleReboot(packagePath);
    }
    else
    {
        PLOG_INFO << "Pending update declined: " << packagePath;
    }
}

bool OutcomeReconciler::scheduleReboot(const std::string& packagePath)
{
    std::string error;
    if (!actions_.scheduleOnReboot(packagePath, error))
    {
        PLOG_ERROR << "Could not schedule replacement on reboot: " << error;
        notifier_.showError("CrossTrans Update", "The update could not be scheduled: " + error);
        return false;
    }
    PLOG_INFO << "Replacement with " << packagePath << " scheduled for next restart";
    return true;
}

int OutcomeReconciler::SweepDownloadDirs(const fs::path& root, const std::optional<fs::path>& keep,
                                         const std::function<bool(const fs::path&)>& inUse)
{
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec))
        return 0;

    const std::string prefix = PackageDownloader::kTempDirPrefix;
    const auto now = fs::file_time_type::clock::now();
    int removed = 0;

    fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        PLOG_WARNING << "Cannot scan " << root.string() << " for old downloads: " << ec.message();
        return 0;
    }

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        const fs::directory_entry& entry = *it;
        std::error_code entryEc;
        if (!entry.is_directory(entryEc))
            continue;
        std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) != 0)
            continue;
        if (keep && keep->parent_path().lexically_normal() == entry.path().lexically_normal())
            continue;

        auto mtime = fs::last_write_time(entry.path(), entryEc);
        if (entryEc || now - mtime < kStaleDownloadAge)
            continue;
        if (inUse && inUse(entry.path()))
        {
            PLOG_INFO << "Keeping " << entry.path().string() << ", a scheduled replacement still reads from it";
            continue;
        }

        fs::remove_all(entry.path(), entryEc);
        if (entryEc)
        {
            PLOG_DEBUG << "Could not remove " << entry.path().string() << ": " << entryEc.message();
            continue;
        }
        PLOG_INFO << "Removed leftover download directory " << entry.path().string();
        ++removed;
    }
    return removed;
}

} // namespace updater
