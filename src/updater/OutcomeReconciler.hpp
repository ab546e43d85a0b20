#pragma once

#include "StatusMarkers.hpp"
#include "UpdateTypes.hpp"
#include "Version.hpp"
#include "../ui/UserNotifier.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace updater
{

// Side effects the reconciler may trigger, bound by the application
struct ReconcileActions
{
    // Register the package for replacement at next boot (UpdateApplier::scheduleReplaceOnReboot)
    std::function<bool(const std::filesystem::path& packagePath, std::string& outError)> scheduleOnReboot;
    // Whether a replacement scheduled earlier still reads from this directory (DeferredRename::hasPendingFrom)
    std::function<bool(const std::filesystem::path& directory)> isRenamePending;
    std::function<void()> openReleasePage;
    std::function<void(bool success)> recordInstall;
    // Run a task on the UI thread after a delay; invoked inline when unset
    std::function<void(std::chrono::milliseconds delay, std::function<void()> task)> postDelayed;
};

enum class ReconcileOutcome
{
    Nothing, // no markers, normal startup
    Succeeded,
    Failed,
    PendingOffered, // a pending package was found and offered again
    PendingApplied // the pending package is gone, the deferred replacement ran
};

const char* toString(ReconcileOutcome outcome);

struct ReconcileReport
{
    ReconcileOutcome outcome = ReconcileOutcome::Nothing;
    MarkerSnapshot markers;
    bool versionMismatch = false;
    std::optional<ui::UserNotifier::FailureChoice> failureChoice;
    bool rebootScheduled = false;
};

// Closes the loop of an install on the first startup after it: reads every status
// marker exactly once and surfaces the outcome. Runs before any update check.
class OutcomeReconciler
{
public:
    static constexpr auto kSuccessNotifyDelay = std::chrono::milliseconds(2000);
    static constexpr auto kStaleDownloadAge = std::chrono::minutes(10);

    OutcomeReconciler(StatusMarkers markers, ui::UserNotifier& notifier, ReconcileActions actions);

    ReconcileReport reconcile(const Version& currentVersion);

    // Remove leftover download directories under root, except the one holding keep and any inUse claims.
    // Directories younger than kStaleDownloadAge may still be in use by an installer.
    static int SweepDownloadDirs(const std::filesystem::path& root, const std::optional<std::filesystem::path>& keep,
                                 const std::function<bool(const std::filesystem::path&)>& inUse = {});

    void setDownloadRoot(const std::filesystem::path& root) { downloadRoot_ = root; }

private:
    void handleSuccess(const Version& installed, const Version& currentVersion, ReconcileReport& report);
    void handleError(const ErrorMarker& error, ReconcileReport& report);
    void handlePending(const std::string& packagePath, ReconcileReport& report);
    bool scheduleReboot(const std::string& packagePath);

    StatusMarkers markers_;
    ui::UserNotifier& notifier_;
    ReconcileActions actions_;
    std::filesystem::path downloadRoot_;
};

} // namespace updater
