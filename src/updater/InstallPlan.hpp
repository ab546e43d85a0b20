#pragma once

#include "Version.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace updater
{

// Hand-off document between the application and crosstrans-installer (install_plan.json)
struct InstallPlan
{
    static constexpr const char* kFileName = "install_plan.json";

    std::uint32_t parentPid = 0;
    std::string installPath; // executable being replaced
    std::string sourcePath; // verified download
    std::string backupPath; // "<installPath>.bak"
    Version newVersion;
    std::string markerDir;
    std::string tempDir; // download directory, removed after success
    std::string logDir; // application logs/ directory; update.log goes to tempDir when empty
    bool autostartEnabled = false;
    std::string autostartName = "CrossTrans";
    std::vector<std::string> relaunchArgs;
    int waitTimeoutMs = 30000;
    int pollIntervalMs = 500;
    int copyAttempts = 5;
    int retryDelayMs = 2000;

    std::string toJson() const;

    static bool fromJson(const std::string& content, InstallPlan& outPlan, std::string& outError);

    bool saveToFile(const std::filesystem::path& path, std::string& outError) const;

    static bool loadFromFile(const std::filesystem::path& path, InstallPlan& outPlan, std::string& outError);
};

} // namespace updater
