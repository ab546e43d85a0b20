#pragma once

#include "ConfigManager.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>

struct UpdateStats
{
    std::int64_t totalChecks = 0;
    std::int64_t successfulChecks = 0;
    std::int64_t failedChecks = 0;
    std::int64_t installsSucceeded = 0;
    std::int64_t installsFailed = 0;
    std::map<std::string, std::int64_t> errorCounts; // keyed by error category ("network", "rate_limit", ...)
    std::string lastCheck; // ISO 8601, UTC
    std::string lastSuccess;
};

// [app] and [app.update_stats] in config.toml
struct AppSettings
{
    bool autostart = false;
    bool autoCheckUpdates = false;
    bool requireChecksum = false;
    std::string lastRunVersion; // empty on first run
    UpdateStats updateStats;
};

// Owns the persisted application settings. Every change is a read-modify-write
// under one lock followed by an atomic save of config.toml.
class SettingsStore
{
public:
    static constexpr const char* kStatsCategories[] = { "network", "timeout", "rate_limit",
                                                        "not_found", "parse", "other" };

    explicit SettingsStore(const std::filesystem::path& configPath);

    bool load();

    AppSettings snapshot() const;

    bool modify(const std::function<void(AppSettings&)>& fn);

    bool recordCheck(bool success, const std::string& errorCategory = {});
    bool recordInstall(bool success);

    const char* lastError() const { return config_.lastError(); }
    const std::string& configPath() const { return config_.configPath(); }

    static std::string CurrentTimestamp();

private:
    void registerHandlers();

    mutable std::mutex mutex_;
    AppSettings settings_;
    ConfigManager config_;
};
