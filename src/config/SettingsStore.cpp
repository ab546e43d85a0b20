#include "SettingsStore.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

SettingsStore::SettingsStore(const std::filesystem::path& configPath)
    : config_(configPath)
{
    registerHandlers();
}

void SettingsStore::registerHandlers()
{
    // Callbacks run inside load()/save(), which are only called with mutex_ held
    bool registered = true;
    registered &= config_.registerTable(
        "app",
        TableCallbacks{
            [this](const toml::table& t)
            {
                AppSettings defaults;
                settings_.autostart = t["autostart"].value_or(defaults.autostart);
                settings_.autoCheckUpdates = t["auto_check_updates"].value_or(defaults.autoCheckUpdates);
                settings_.requireChecksum = t["require_checksum"].value_or(defaults.requireChecksum);
                settings_.lastRunVersion = t["last_run_version"].value_or(std::string{});
            },
            [this]()
            {
                toml::table t;
                t.insert("autostart", settings_.autostart);
                t.insert("auto_check_updates", settings_.autoCheckUpdates);
                t.insert("require_checksum", settings_.requireChecksum);
                t.insert("last_run_version", settings_.lastRunVersion);
                return t;
            } },
        { "autostart", "auto_check_updates", "require_checksum", "last_run_version" });

    std::vector<std::string> statsKeys = { "total_checks",       "successful_checks", "failed_checks",
                                           "installs_succeeded", "installs_failed",   "last_check",
                                           "last_success" };
    for (const char* category : kStatsCategories)
    {
        statsKeys.push_back(std::string("errors_") + category);
    }

    registered &= config_.registerTable(
        "app.update_stats",
        TableCallbacks{
            [this](const toml::table& t)
            {
                UpdateStats& s = settings_.updateStats;
                s = UpdateStats{};
                s.totalChecks = t["total_checks"].value_or(std::int64_t{ 0 });
                s.successfulChecks = t["successful_checks"].value_or(std::int64_t{ 0 });
                s.failedChecks = t["failed_checks"].value_or(std::int64_t{ 0 });
                s.installsSucceeded = t["installs_succeeded"].value_or(std::int64_t{ 0 });
                s.installsFailed = t["installs_failed"].value_or(std::int64_t{ 0 });
                s.lastCheck = t["last_check"].value_or(std::string{});
                s.lastSuccess = t["last_success"].value_or(std::string{});
                for (const char* category : kStatsCategories)
                {
                    auto count = t[std::string("errors_") + category].value_or(std::int64_t{ 0 });
                    if (count > 0)
                        s.errorCounts[category] = count;
                }
            },
            [this]()
            {
                const UpdateStats& s = settings_.updateStats;
                toml::table t;
                t.insert("total_checks", s.totalChecks);
                t.insert("successful_checks", s.successfulChecks);
                t.insert("failed_checks", s.failedChecks);
                t.insert("installs_succeeded", s.installsSucceeded);
                t.insert("installs_failed", s.installsFailed);
                if (!s.lastCheck.empty())
                    t.insert("last_check", s.lastCheck);
                if (!s.lastSuccess.empty())
                    t.insert("last_success", s.lastSuccess);
                for (const auto& [category, count] : s.errorCounts)
                {
                    t.insert("errors_" + category, count);
                }
                return t;
            } },
        statsKeys);

    if (!registered)
        PLOG_ERROR << "Settings sections could not be registered: " << config_.lastError();
}

bool SettingsStore::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    bool ok = config_.load();
    PLOG_INFO << "Settings loaded from " << config_.configPath() << " (last run version '"
              << settings_.lastRunVersion << "')";
    return ok;
}

AppSettings SettingsStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool SettingsStore::modify(const std::function<void(AppSettings&)>& fn)
{
    std::lock_guard<std::mutex> lock(mutex_);
    AppSettings previous = settings_;
    fn(settings_);
    if (!config_.save())
    {
        PLOG_ERROR << "Failed to persist settings: " << config_.lastError();
        settings_ = previous;
        return false;
    }
    return true;
}

bool SettingsStore::recordCheck(bool success, const std::string& errorCategory)
{
    return modify(
        [&](AppSettings& s)
        {
            UpdateStats& stats = s.updateStats;
            std::string now = CurrentTimestamp();
            ++stats.totalChecks;
            stats.lastCheck = now;
            if (success)
            {
                ++stats.successfulChecks;
                stats.lastSuccess = now;
            }
            else
            {
                ++stats.failedChecks;
                ++stats.errorCounts[errorCategory.empty() ? "other" : errorCategory];
            }
        });
}

bool SettingsStore::recordInstall(bool success)
{
    return modify(
        [success](AppSettings& s)
        {
            if (success)
                ++s.updateStats.installsSucceeded;
            else
                ++s.updateStats.installsFailed;
        });
}

std::string SettingsStore::CurrentTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &now);
#else
    gmtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}
