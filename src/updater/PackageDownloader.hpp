#pragma once

#include "UpdateTypes.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace utils
{
class IHttpClient;
}

namespace updater
{

using PackageDownloadCallback = std::function<void(const FetchResult& result)>;
using PackageProgressCallback = std::function<void(const DownloadProgress&)>;

class PackageDownloader
{
public:
    static constexpr size_t kChunkSize = 8192;
    static constexpr auto kHardTimeout = std::chrono::seconds(180);
    static constexpr const char* kTempDirPrefix = "crosstrans_update_";

    explicit PackageDownloader(std::shared_ptr<utils::IHttpClient> http = nullptr);
    ~PackageDownloader();

    PackageDownloader(const PackageDownloader&) = delete;
    PackageDownloader& operator=(const PackageDownloader&) = delete;

    // Download into a fresh temporary directory and verify the checksum when one is published.
    // cancelToken is polled between chunks; the partial file is removed on every failure.
    // A cancel() issued before this call does not carry over into it.
    FetchResult fetch(const UpdatePackage& pkg, const PackageProgressCallback& onProgress,
                      const std::atomic<bool>* cancelToken = nullptr);

    void downloadAsync(const UpdatePackage& pkg, PackageProgressCallback progressCallback,
                       PackageDownloadCallback completeCallback);

    void cancel();

    // Reject packages whose release publishes no checksum
    void setRequireChecksum(bool require);

    // Parent of the per-download temporary directories (system temp by default)
    void setTempRoot(const std::filesystem::path& root);

    void setHardTimeout(std::chrono::milliseconds timeout);

    static bool verifyChecksum(const std::string& filePath, const std::string& expectedSha256, std::string& outError);

    static std::string computeSha256(const std::string& filePath, std::string& outError);

private:
    FetchResult runFetch(const UpdatePackage& pkg, const PackageProgressCallback& onProgress,
                         const std::atomic<bool>* cancelToken);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
