#pragma once

#include "UpdateTypes.hpp"
#include "Version.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace updater
{

struct ErrorMarker
{
    std::string message;
    int code = 0;
};

// Everything one startup found, each marker already deleted
struct MarkerSnapshot
{
    std::optional<Version> success;
    std::optional<ErrorMarker> error;
    std::optional<Version> expectedVersion;
    std::optional<std::string> pendingInstallerPath;

    bool empty() const { return !success && !error && !expectedVersion && !pendingInstallerPath; }
};

// Fixed-name files in a shared directory (system temp by default), one per status kind.
// Writes go to a temporary sibling first and are renamed into place, so a reader
// never sees a half-written marker even if the writer is killed.
class StatusMarkers
{
public:
    static constexpr const char* kSuccessFile = "crosstrans_update_success.txt";
    static constexpr const char* kErrorFile = "crosstrans_update_error.txt";
    static constexpr const char* kExpectedFile = "crosstrans_update_expected.txt";
    static constexpr const char* kPendingFile = "crosstrans_update_pending.txt";

    explicit StatusMarkers(std::filesystem::path directory = DefaultDirectory());

    bool writeSuccess(const Version& version, std::string& outError);
    bool writeError(const std::string& message, int code, std::string& outError);
    bool writeExpectedVersion(const Version& version, std::string& outError);
    bool writePendingInstaller(const std::string& installerPath, std::string& outError);

    // Read and delete every marker. Unparsable markers are deleted and reported as absent.
    MarkerSnapshot consumeAll();

    bool hasAny() const;

    // Remove all markers without reading them
    void clear();

    const std::filesystem::path& directory() const { return directory_; }

    static std::filesystem::path DefaultDirectory();

private:
    bool writeAtomic(const char* name, const std::string& content, std::string& outError);
    std::optional<std::string> take(const char* name);

    std::filesystem::path directory_;
};

} // namespace updater
