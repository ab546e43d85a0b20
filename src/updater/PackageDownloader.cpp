#include "PackageDownloader.hpp"
#include "../utils/HttpClient.hpp"

#include <plog/Log.h>

#include <picosha2.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace updater
{

struct PackageDownloader::Impl
{
    std::shared_ptr<utils::IHttpClient> http;
    std::atomic<bool> downloading{ false };
    std::atomic<bool> cancelled{ false };
    std::thread downloadThread;
    bool requireChecksum = false;
    fs::path tempRoot;
    std::chrono::milliseconds hardTimeout = kHardTimeout;

    explicit Impl(std::shared_ptr<utils::IHttpClient> client)
        : http(client ? std::move(client) : std::make_shared<utils::CprHttpClient>())
    {
    }

    ~Impl()
    {
        cancelled = true;
        if (downloadThread.joinable())
        {
            downloadThread.join();
        }
    }

    fs::path createTempDir(std::string& outError) const
    {
        std::error_code ec;
        fs::path root = tempRoot.empty() ? fs::temp_directory_path(ec) : tempRoot;
        if (ec)
        {
            outError = "No temporary directory available: " + ec.message();
            return {};
        }

        std::random_device rd;
        std::mt19937_64 gen(rd());
        for (int i = 0; i < 8; ++i)
        {
            std::ostringstream name;
            name << kTempDirPrefix << std::hex << gen();
            fs::path candidate = root / name.str();
            if (fs::create_directories(candidate, ec))
            {
                return candidate;
            }
        }

        outError = "Failed to create temporary download directory under " + root.string();
        return {};
    }

    static void removeDir(const fs::path& dir)
    {
        if (dir.empty())
            return;

        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec)
        {
            PLOG_WARNING << "Failed to remove download directory " << dir.string() << ": " << ec.message();
        }
    }
};

PackageDownloader::PackageDownloader(std::shared_ptr<utils::IHttpClient> http)
    : impl_(std::make_unique<Impl>(std::move(http)))
{
}

PackageDownloader::~PackageDownloader() = default;

FetchResult PackageDownloader::fetch(const UpdatePackage& pkg, const PackageProgressCallback& onProgress,
                                     const std::atomic<bool>* cancelToken)
{
    // cancel() only applies to the attempt in flight when it was called
    impl_->cancelled = false;
    return runFetch(pkg, onProgress, cancelToken);
}

FetchResult PackageDownloader::runFetch(const UpdatePackage& pkg, const PackageProgressCallback& onProgress,
                                        const std::atomic<bool>* cancelToken)
{
    FetchResult result;

    auto fail = [&result](FetchErrorKind kind, const std::string& message, const fs::path& dir)
    {
        PLOG_ERROR << "Package download failed (" << toString(kind) << "): " << message;
        Impl::removeDir(dir);
        result.success = false;
        result.errorKind = kind;
        result.error = UpdateError(message);
        result.filePath.clear();
        result.tempDir.clear();
        return result;
    };

    if (pkg.downloadUrl.empty())
    {
        return fail(FetchErrorKind::Http, "No download URL for version " + pkg.version.toString(), {});
    }

    if (!pkg.sha256)
    {
        if (impl_->requireChecksum)
        {
            return fail(FetchErrorKind::ChecksumMissing,
                        "Release " + pkg.version.toString() + " publishes no checksum", {});
        }
        PLOG_WARNING << "Release " << pkg.version.toString() << " publishes no checksum; download is unverified";
    }

    std::string error;
    fs::path dir = impl_->createTempDir(error);
    if (dir.empty())
    {
        return fail(FetchErrorKind::IoError, error, {});
    }

    std::string fileName = pkg.assetName.empty() ? "CrossTrans_v" + pkg.version.toString() + ".bin" : pkg.assetName;
    fs::path finalPath = dir / fileName;
    fs::path partPath = dir / (fileName + ".part");

    std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        return fail(FetchErrorKind::IoError, "Failed to create output file: " + partPath.string(), dir);
    }

    PLOG_INFO << "Starting download: " << pkg.downloadUrl << " -> " << finalPath.string();

    const auto deadline = std::chrono::steady_clock::now() + impl_->hardTimeout;
    std::string pending;
    pending.reserve(kChunkSize);
    DownloadProgress progress;
    FetchErrorKind abortKind = FetchErrorKind::None;
    bool writeFailed = false;

    auto isCancelled = [&]() { return impl_->cancelled.load() || (cancelToken && cancelToken->load()); };

    auto flushChunk = [&](size_t count, size_t totalBytes) -> bool
    {
        out.write(pending.data(), static_cast<std::streamsize>(count));
        if (!out)
        {
            writeFailed = true;
            return false;
        }
        pending.erase(0, count);

        progress.bytesDownloaded += count;
        progress.totalBytes = totalBytes > 0 ? totalBytes : pkg.packageSize;
        if (progress.totalBytes > 0)
        {
            progress.percentage = static_cast<int>(
                std::min<size_t>(100, progress.bytesDownloaded * 100 / progress.totalBytes));
        }
        if (onProgress)
        {
            onProgress(progress);
        }
        return true;
    };

    utils::HttpRequestConfig cfg;
    cfg.timeout_ms = static_cast<int>(impl_->hardTimeout.count());

    utils::HttpResponse response = impl_->http->stream(
        pkg.downloadUrl, { { "User-Agent", "CrossTrans-Updater" } }, cfg,
        [&](std::string_view chunk, size_t totalBytes) -> bool
        {
            if (isCancelled())
            {
                abortKind = FetchErrorKind::Cancelled;
                return false;
            }
            if (std::chrono::steady_clock::now() > deadline)
            {
                abortKind = FetchErrorKind::Timeout;
                return false;
            }

            pending.append(chunk.data(), chunk.size());
            while (pending.size() >= kChunkSize)
            {
                if (!flushChunk(kChunkSize, totalBytes))
                {
                    abortKind = FetchErrorKind::IoError;
                    return false;
                }
                if (isCancelled())
                {
                    abortKind = FetchErrorKind::Cancelled;
                    return false;
                }
            }
            return true;
        });

    if (abortKind == FetchErrorKind::None && response.ok() && !pending.empty())
    {
        if (!flushChunk(pending.size(), progress.bytesDownloaded + pending.size()))
        {
            abortKind = FetchErrorKind::IoError;
        }
    }

    out.close();

    if (abortKind == FetchErrorKind::Cancelled || (abortKind == FetchErrorKind::None && isCancelled()))
    {
        PLOG_INFO << "Download cancelled";
        return fail(FetchErrorKind::Cancelled, "Download cancelled", dir);
    }
    if (abortKind == FetchErrorKind::Timeout || response.timed_out)
    {
        return fail(FetchErrorKind::Timeout,
                    "Download exceeded " + std::to_string(impl_->hardTimeout.count() / 1000) + " s", dir);
    }
    if (abortKind == FetchErrorKind::IoError || writeFailed || out.fail())
    {
        return fail(FetchErrorKind::IoError, "Failed to write " + partPath.string(), dir);
    }
    if (!response.error.empty())
    {
        return fail(FetchErrorKind::Http, "Network error: " + response.error, dir);
    }
    if (response.status_code != 200)
    {
        FetchResult r = fail(FetchErrorKind::Http, "HTTP error " + std::to_string(response.status_code), dir);
        r.error.errorCode = response.status_code;
        return r;
    }

    if (pkg.sha256)
    {
        if (!verifyChecksum(partPath.string(), *pkg.sha256, error))
        {
            return fail(FetchErrorKind::ChecksumMismatch, error, dir);
        }
        result.verified = true;
        PLOG_INFO << "Checksum verified: " << *pkg.sha256;
    }

    std::error_code ec;
    fs::rename(partPath, finalPath, ec);
    if (ec)
    {
        return fail(FetchErrorKind::IoError, "Failed to finalise download: " + ec.message(), dir);
    }

    result.success = true;
    result.filePath = finalPath.string();
    result.tempDir = dir.string();
    PLOG_INFO << "Download completed: " << result.filePath << " (" << progress.bytesDownloaded << " bytes)";
    return result;
}

void PackageDownloader::downloadAsync(const UpdatePackage& pkg, PackageProgressCallback progressCallback,
                                      PackageDownloadCallback completeCallback)
{
    if (impl_->downloading)
    {
        PLOG_WARNING << "Download already in progress";
        if (completeCallback)
        {
            FetchResult busy;
            busy.errorKind = FetchErrorKind::IoError;
            busy.error = UpdateError("Download already in progress");
            completeCallback(busy);
        }
        return;
    }

    if (impl_->downloadThread.joinable())
    {
        impl_->downloadThread.join();
    }

    impl_->downloading = true;
    impl_->cancelled = false;

    impl_->downloadThread = std::thread(
        [this, pkg, progressCallback, completeCallback]()
        {
            FetchResult result = runFetch(pkg, progressCallback, nullptr);
            impl_->downloading = false;
            if (completeCallback)
            {
                completeCallback(result);
            }
        });
}

void PackageDownloader::cancel() { impl_->cancelled = true; }

void PackageDownloader::setRequireChecksum(bool require) { impl_->requireChecksum = require; }

void PackageDownloader::setTempRoot(const fs::path& root) { impl_->tempRoot = root; }

void PackageDownloader::setHardTimeout(std::chrono::milliseconds timeout) { impl_->hardTimeout = timeout; }

std::string PackageDownloader::computeSha256(const std::string& filePath, std::string& outError)
{
    try
    {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open())
        {
            outError = "Failed to open file for checksum verification";
            return {};
        }

        std::vector<unsigned char> hash(picosha2::k_digest_size);
        picosha2::hash256(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>(), hash.begin(),
                          hash.end());

        return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
    }
    catch (const std::exception& e)
    {
        outError = std::string("Checksum computation error: ") + e.what();
        return {};
    }
}

bool PackageDownloader::verifyChecksum(const std::string& filePath, const std::string& expectedSha256,
                                       std::string& outError)
{
    std::string actualSha256 = computeSha256(filePath, outError);
    if (actualSha256.empty())
    {
        return false;
    }

    std::string expected = expectedSha256;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (actualSha256 != expected)
    {
        outError = "Checksum mismatch: expected " + expected + ", got " + actualSha256;
        return false;
    }

    return true;
}

} // namespace updater
