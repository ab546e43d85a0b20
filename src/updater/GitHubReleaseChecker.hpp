#pragma once

#include "UpdateTypes.hpp"
#include "Version.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace utils
{
class IHttpClient;
}

namespace updater
{

// Callback for release check results, invoked on the checker's worker thread
using ReleaseCheckCallback = std::function<void(const CheckResult& result)>;

// GitHub Releases API client
class GitHubReleaseChecker
{
public:
    static constexpr int kRequestTimeoutMs = 30000;
    static constexpr int kMaxRetries = 3;
    static constexpr auto kInitialBackoff = std::chrono::milliseconds(1000);
    static constexpr size_t kNotesMaxLength = 500;

    GitHubReleaseChecker(const std::string& owner, const std::string& repo,
                         std::shared_ptr<utils::IHttpClient> http = nullptr);
    ~GitHubReleaseChecker();

    GitHubReleaseChecker(const GitHubReleaseChecker&) = delete;
    GitHubReleaseChecker& operator=(const GitHubReleaseChecker&) = delete;

    // Check for latest release (async, non-blocking)
    void checkLatestReleaseAsync(const Version& currentVersion, ReleaseCheckCallback callback);

    // Check for latest release (blocking)
    CheckResult checkLatestRelease(const Version& currentVersion);

    // Cancel ongoing check; pending retries are abandoned
    void cancel();

    void setSleepFunction(SleepFunction sleeper);

    // Asset name suffix identifying the installable package (case-insensitive)
    void setAssetSuffix(const std::string& suffix);

    std::string apiUrl() const;
    std::string releasesPageUrl() const;

    // Interpret a release JSON document against the running version
    static CheckResult parseRelease(const std::string& body, const Version& currentVersion,
                                    const std::string& assetSuffix);

    // Find "SHA256: <64 hex>" style checksum in release notes
    static std::optional<std::string> extractChecksum(const std::string& notes);

    static std::string truncateNotes(const std::string& notes, size_t maxLength = kNotesMaxLength);

    static std::string defaultAssetSuffix();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
