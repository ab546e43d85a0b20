#include "InstallPlan.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace updater
{

std::string InstallPlan::toJson() const
{
    json planJson = {
        { "parent_pid", parentPid },
        { "install_path", installPath },
        { "source_path", sourcePath },
        { "backup_path", backupPath },
        { "new_version", newVersion.toString() },
        { "marker_dir", markerDir },
        { "temp_dir", tempDir },
        { "log_dir", logDir },
        { "autostart_enabled", autostartEnabled },
        { "autostart_name", autostartName },
        { "relaunch_args", relaunchArgs },
        { "wait_timeout_ms", waitTimeoutMs },
        { "poll_interval_ms", pollIntervalMs },
        { "copy_attempts", copyAttempts },
        { "retry_delay_ms", retryDelayMs },
    };
    return planJson.dump(2);
}

bool InstallPlan::fromJson(const std::string& content, InstallPlan& outPlan, std::string& outError)
{
    try
    {
        json planJson = json::parse(content);

        for (const char* required : { "parent_pid", "install_path", "source_path", "new_version", "marker_dir" })
        {
            if (!planJson.contains(required))
            {
                outError = std::string("Install plan missing '") + required + "' field";
                return false;
            }
        }

        InstallPlan plan;
        plan.parentPid = planJson["parent_pid"].get<std::uint32_t>();
        plan.installPath = planJson["install_path"].get<std::string>();
        plan.sourcePath = planJson["source_path"].get<std::string>();
        plan.markerDir = planJson["marker_dir"].get<std::string>();
        plan.tempDir = planJson.value("temp_dir", "");
        plan.logDir = planJson.value("log_dir", "");
        plan.autostartEnabled = planJson.value("autostart_enabled", false);
        plan.autostartName = planJson.value("autostart_name", plan.autostartName);
        plan.relaunchArgs = planJson.value("relaunch_args", std::vector<std::string>{});
        plan.waitTimeoutMs = planJson.value("wait_timeout_ms", plan.waitTimeoutMs);
        plan.pollIntervalMs = planJson.value("poll_interval_ms", plan.pollIntervalMs);
        plan.copyAttempts = planJson.value("copy_attempts", plan.copyAttempts);
        plan.retryDelayMs = planJson.value("retry_delay_ms", plan.retryDelayMs);

        plan.backupPath = planJson.value("backup_path", "");
        if (plan.backupPath.empty())
            plan.backupPath = plan.installPath + ".bak";

        std::string version = planJson["new_version"].get<std::string>();
        if (!Version::tryParse(version, plan.newVersion))
        {
            outError = "Install plan has invalid version: " + version;
            return false;
        }

        if (plan.installPath.empty() || plan.sourcePath.empty())
        {
            outError = "Install plan has empty install or source path";
            return false;
        }

        if (plan.pollIntervalMs <= 0 || plan.waitTimeoutMs <= 0 || plan.copyAttempts <= 0 || plan.retryDelayMs < 0)
        {
            outError = "Install plan has invalid timing values";
            return false;
        }

        outPlan = std::move(plan);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("Install plan parse error: ") + e.what();
        return false;
    }
}

bool InstallPlan::saveToFile(const std::filesystem::path& path, std::string& outError) const
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
    {
        outError = "Failed to create install plan: " + path.string();
        return false;
    }

    out << toJson();
    if (!out)
    {
        outError = "Failed to write install plan: " + path.string();
        return false;
    }

    PLOG_INFO << "Install plan written: " << path.string();
    return true;
}

bool InstallPlan::loadFromFile(const std::filesystem::path& path, InstallPlan& outPlan, std::string& outError)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        outError = "Failed to open install plan: " + path.string();
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return fromJson(buffer.str(), outPlan, outError);
}

} // namespace updater
