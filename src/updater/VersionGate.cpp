#include "VersionGate.hpp"
#include "../config/SettingsStore.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace updater
{

VersionGate::VersionGate(SettingsStore& settings, std::vector<fs::path> cacheDirs)
    : settings_(settings)
    , cacheDirs_(std::move(cacheDirs))
{
}

GateOutcome VersionGate::checkAndMaybeRestart(const Version& currentVersion, const std::string& persisted)
{
    const std::string current = currentVersion.toString();

    if (persisted.empty())
    {
        PLOG_INFO << "First run of " << current;
        if (!settings_.modify([&](AppSettings& s) { s.lastRunVersion = current; }))
        {
            PLOG_WARNING << "Could not record last run version";
        }
        return GateOutcome::Continue;
    }

    Version previous;
    bool changed = Version::tryParse(persisted, previous) ? previous != currentVersion : persisted != current;
    if (!changed)
    {
        return GateOutcome::Continue;
    }

    PLOG_INFO << "Version changed from " << persisted << " to " << current << "; clearing caches";
    int cleared = ClearCaches(cacheDirs_);
    PLOG_INFO << "Cleared " << cleared << " cache director" << (cleared == 1 ? "y" : "ies");

    // Restarting without a persisted version would restart again on every launch
    if (!settings_.modify([&](AppSettings& s) { s.lastRunVersion = current; }))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "Could not save the application version",
                                            std::string("Skipping restart after version change: ") +
                                                settings_.lastError());
        return GateOutcome::Continue;
    }

    return GateOutcome::Restart;
}

int VersionGate::ClearCaches(const std::vector<fs::path>& dirs)
{
    int removed = 0;
    for (const auto& dir : dirs)
    {
        std::error_code ec;
        if (dir.empty() || !fs::exists(dir, ec))
            continue;

        fs::remove_all(dir, ec);
        if (ec)
        {
            PLOG_WARNING << "Failed to clear cache " << dir.string() << ": " << ec.message();
            continue;
        }
        PLOG_DEBUG << "Removed cache " << dir.string();
        ++removed;
    }
    return removed;
}

} // namespace updater
