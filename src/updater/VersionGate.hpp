#pragma once

#include "Version.hpp"

#include <filesystem>
#include <string>
#include <vector>

class SettingsStore;

namespace updater
{

enum class GateOutcome
{
    Continue,
    Restart // caller must re-exec the process before doing anything else
};

// Detects a version transition between runs. On a transition the compiled-artifact
// caches are cleared and the new version is persisted; the restart itself is left
// to the entry point so no library call replaces the process image.
class VersionGate
{
public:
    VersionGate(SettingsStore& settings, std::vector<std::filesystem::path> cacheDirs);

    GateOutcome checkAndMaybeRestart(const Version& currentVersion, const std::string& persistedLastRunVersion);

    // Recursively removes each directory; missing directories are skipped. Returns the number removed.
    static int ClearCaches(const std::vector<std::filesystem::path>& dirs);

private:
    SettingsStore& settings_;
    std::vector<std::filesystem::path> cacheDirs_;
};

} // namespace updater
