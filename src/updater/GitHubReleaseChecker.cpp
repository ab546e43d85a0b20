#include "GitHubReleaseChecker.hpp"
#include "../utils/HttpClient.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <regex>
#include <thread>

using json = nlohmann::json;

namespace updater
{

namespace
{

bool endsWithIgnoreCase(const std::string& value, const std::string& suffix)
{
    if (suffix.size() > value.size())
        return false;

    return std::equal(suffix.rbegin(), suffix.rend(), value.rbegin(),
                      [](char a, char b)
                      {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

bool isTransientStatus(int status, const std::string& body)
{
    if (status == 429 || (status >= 500 && status <= 599))
        return true;

    // GitHub reports exhausted API quota as 403 with a rate limit message
    if (status == 403)
    {
        std::string lowered = body;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered.find("rate limit") != std::string::npos;
    }
    return false;
}

} // namespace

struct GitHubReleaseChecker::Impl
{
    std::string owner;
    std::string repo;
    std::shared_ptr<utils::IHttpClient> http;
    std::string assetSuffix = GitHubReleaseChecker::defaultAssetSuffix();
    SleepFunction sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    std::atomic<bool> cancelled{ false };
    std::thread checkThread;

    Impl(const std::string& o, const std::string& r, std::shared_ptr<utils::IHttpClient> client)
        : owner(o)
        , repo(r)
        , http(client ? std::move(client) : std::make_shared<utils::CprHttpClient>())
    {
    }

    ~Impl()
    {
        cancelled = true;
        if (checkThread.joinable())
        {
            checkThread.join();
        }
    }

    std::string getApiUrl() const
    {
        return "https://api.github.com/repos/" + owner + "/" + repo + "/releases/latest";
    }
};

GitHubReleaseChecker::GitHubReleaseChecker(const std::string& owner, const std::string& repo,
                                           std::shared_ptr<utils::IHttpClient> http)
    : impl_(std::make_unique<Impl>(owner, repo, std::move(http)))
{
}

GitHubReleaseChecker::~GitHubReleaseChecker() = default;

void GitHubReleaseChecker::checkLatestReleaseAsync(const Version& currentVersion, ReleaseCheckCallback callback)
{
    if (!callback)
    {
        PLOG_ERROR << "GitHubReleaseChecker: callback is null";
        return;
    }

    if (impl_->checkThread.joinable())
    {
        impl_->checkThread.join();
    }

    impl_->cancelled = false;

    impl_->checkThread = std::thread(
        [this, currentVersion, callback]()
        {
            CheckResult result = checkLatestRelease(currentVersion);

            if (!impl_->cancelled)
            {
                callback(result);
            }
        });
}

CheckResult GitHubReleaseChecker::checkLatestRelease(const Version& currentVersion)
{
    PLOG_INFO << "Checking GitHub for updates: " << impl_->owner << "/" << impl_->repo
              << " (current version: " << currentVersion.toString() << ")";

    const std::vector<utils::HttpHeader> headers = {
        { "Accept", "application/vnd.github.v3+json" },
        { "User-Agent", "CrossTrans-Updater" },
    };
    utils::HttpRequestConfig cfg;
    cfg.timeout_ms = kRequestTimeoutMs;

    CheckResult failure;
    failure.status = CheckResult::Status::CheckFailed;

    auto backoff = kInitialBackoff;
    for (int attempt = 0; attempt <= kMaxRetries; ++attempt)
    {
        if (impl_->cancelled)
        {
            failure.failureKind = CheckFailureKind::Terminal;
            failure.category = CheckErrorCategory::Other;
            failure.error = UpdateError("Check cancelled");
            return failure;
        }

        if (attempt > 0)
        {
            PLOG_INFO << "Retrying update check in " << backoff.count() << " ms (retry " << attempt << "/"
                      << kMaxRetries << ")";
            impl_->sleeper(backoff);
            backoff *= 2;
        }

        failure.attempts = attempt + 1;
        utils::HttpResponse response = impl_->http->get(impl_->getApiUrl(), headers, cfg);

        if (!response.error.empty())
        {
            failure.failureKind = CheckFailureKind::Transient;
            failure.category = response.timed_out ? CheckErrorCategory::Timeout : CheckErrorCategory::Network;
            failure.error = UpdateError("Network error: " + response.error, response.error, 0);
            PLOG_WARNING << "Update check attempt " << failure.attempts << " failed: " << response.error;
            continue;
        }

        if (response.status_code == 200)
        {
            CheckResult result = parseRelease(response.text, currentVersion, impl_->assetSuffix);
            result.attempts = failure.attempts;
            if (result.status == CheckResult::Status::CheckFailed)
            {
                PLOG_ERROR << "Update check failed: " << result.error.message;
            }
            return result;
        }

        failure.error = UpdateError("Update check returned status " + std::to_string(response.status_code),
                                    response.text.substr(0, 200), response.status_code);

        if (response.status_code == 404)
        {
            failure.failureKind = CheckFailureKind::Terminal;
            failure.category = CheckErrorCategory::NotFound;
            failure.error.message += " (no published release)";
            PLOG_ERROR << failure.error.message;
            return failure;
        }

        if (!isTransientStatus(response.status_code, response.text))
        {
            failure.failureKind = CheckFailureKind::Terminal;
            failure.category = CheckErrorCategory::Other;
            PLOG_ERROR << failure.error.message;
            return failure;
        }

        failure.failureKind = CheckFailureKind::Transient;
        failure.category = (response.status_code == 429 || response.status_code == 403)
            ? CheckErrorCategory::RateLimit
            : CheckErrorCategory::Network;
        PLOG_WARNING << failure.error.message << " (attempt " << failure.attempts << ")";
    }

    PLOG_ERROR << "Update check gave up after " << failure.attempts << " attempts: " << failure.error.message;
    return failure;
}

void GitHubReleaseChecker::cancel() { impl_->cancelled = true; }

void GitHubReleaseChecker::setSleepFunction(SleepFunction sleeper)
{
    if (sleeper)
    {
        impl_->sleeper = std::move(sleeper);
    }
}

void GitHubReleaseChecker::setAssetSuffix(const std::string& suffix) { impl_->assetSuffix = suffix; }

std::string GitHubReleaseChecker::apiUrl() const { return impl_->getApiUrl(); }

std::string GitHubReleaseChecker::releasesPageUrl() const
{
    return "https://github.com/" + impl_->owner + "/" + impl_->repo + "/releases/latest";
}

CheckResult GitHubReleaseChecker::parseRelease(const std::string& body, const Version& currentVersion,
                                               const std::string& assetSuffix)
{
    CheckResult result;

    try
    {
        json releaseJson = json::parse(body);

        if (!releaseJson.contains("tag_name") || !releaseJson["tag_name"].is_string())
        {
            result.status = CheckResult::Status::CheckFailed;
            result.category = CheckErrorCategory::Parse;
            result.error = UpdateError("Release metadata missing 'tag_name'");
            return result;
        }

        std::string tag = releaseJson["tag_name"].get<std::string>();
        Version releaseVersion;
        if (!Version::tryParse(tag, releaseVersion))
        {
            result.status = CheckResult::Status::CheckFailed;
            result.category = CheckErrorCategory::Parse;
            result.error = UpdateError("Unrecognised release tag: " + tag);
            return result;
        }

        result.latestVersion = releaseVersion;

        if (releaseVersion <= currentVersion)
        {
            PLOG_INFO << "Current version " << currentVersion.toString()
                      << " is up to date (latest: " << releaseVersion.toString() << ")";
            result.status = CheckResult::Status::NoUpdate;
            return result;
        }

        UpdatePackage& pkg = result.package;
        pkg.version = releaseVersion;

        std::string notes;
        if (releaseJson.contains("body") && releaseJson["body"].is_string())
        {
            notes = releaseJson["body"].get<std::string>();
        }
        // checksum is looked up in the full text before truncation
        pkg.sha256 = extractChecksum(notes);
        pkg.notes = truncateNotes(notes);

        if (releaseJson.contains("assets") && releaseJson["assets"].is_array())
        {
            for (const auto& asset : releaseJson["assets"])
            {
                std::string name = asset.value("name", "");
                if (!endsWithIgnoreCase(name, assetSuffix))
                    continue;

                pkg.assetName = name;
                pkg.downloadUrl = asset.value("browser_download_url", "");
                pkg.packageSize = asset.value("size", static_cast<size_t>(0));
                break;
            }
        }

        if (pkg.downloadUrl.empty())
        {
            PLOG_WARNING << "Release " << releaseVersion.toString() << " has no '" << assetSuffix
                         << "' asset; only a manual download is possible";
        }

        result.status = CheckResult::Status::Available;
        PLOG_INFO << "New version available: " << releaseVersion.toString()
                  << " (current: " << currentVersion.toString() << ")";
        PLOG_INFO << "Download URL: " << pkg.downloadUrl
                  << (pkg.sha256 ? " (checksum published)" : " (no checksum published)");
        return result;
    }
    catch (const json::exception& e)
    {
        result.status = CheckResult::Status::CheckFailed;
        result.category = CheckErrorCategory::Parse;
        result.error = UpdateError(std::string("JSON parse error: ") + e.what());
        return result;
    }
}

std::optional<std::string> GitHubReleaseChecker::extractChecksum(const std::string& notes)
{
    static const std::regex checksumRegex(R"(sha-?256(?:sum)?\s*[:=]?\s*`?([0-9a-f]{64})\b)",
                                          std::regex::icase);
    std::smatch match;
    if (!std::regex_search(notes, match, checksumRegex))
    {
        return std::nullopt;
    }

    std::string digest = match[1].str();
    std::transform(digest.begin(), digest.end(), digest.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return digest;
}

std::string GitHubReleaseChecker::truncateNotes(const std::string& notes, size_t maxLength)
{
    if (notes.size() <= maxLength)
    {
        return notes;
    }
    return notes.substr(0, maxLength) + "...";
}

std::string GitHubReleaseChecker::defaultAssetSuffix()
{
#ifdef _WIN32
    return ".exe";
#else
    return ".AppImage";
#endif
}

} // namespace updater
