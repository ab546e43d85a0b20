#pragma once

#include "Version.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace updater
{

// Update attempt state machine
enum class UpdateState
{
    Idle, // No update activity
    Checking, // Querying the release endpoint
    Available, // Update available, not downloaded
    Downloading, // Download in progress
    Downloaded, // Verified package ready to install
    Requested, // Install requested, hand-off being prepared
    ExternalRoutineLaunched, // Installer running, application must exit
    Succeeded, // Terminal: installed (known to the next generation only)
    Failed, // Terminal: attempt failed
    AwaitingReboot // Terminal: replacement deferred to next boot
};

const char* toString(UpdateState state);

// Blocking sleep used between retries and polls; replaced in tests
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// Information about an available update
struct UpdatePackage
{
    Version version;
    std::string downloadUrl; // release asset URL
    std::optional<std::string> sha256; // lowercase hex, absent when the release carries none
    std::string notes; // truncated release notes
    std::string assetName;
    size_t packageSize; // Size in bytes, 0 when unknown

    UpdatePackage()
        : packageSize(0)
    {
    }
};

// Download progress information
struct DownloadProgress
{
    size_t bytesDownloaded; // Bytes downloaded so far
    size_t totalBytes; // Total package size
    int percentage; // Download percentage (0-100)

    DownloadProgress()
        : bytesDownloaded(0)
        , totalBytes(0)
        , percentage(0)
    {
    }
};

// Error information for failed updates
struct UpdateError
{
    std::string message; // Human-readable error message
    std::string technicalInfo; // Technical details for logging
    int errorCode; // Platform-specific or HTTP error code

    UpdateError()
        : errorCode(0)
    {
    }

    UpdateError(const std::string& msg)
        : message(msg)
        , errorCode(0)
    {
    }

    UpdateError(const std::string& msg, const std::string& tech, int code)
        : message(msg)
        , technicalInfo(tech)
        , errorCode(code)
    {
    }
};

enum class CheckFailureKind
{
    Transient, // network, rate limiting, 5xx; retried
    Terminal // not found, malformed metadata
};

// Statistics bucket of a failed check
enum class CheckErrorCategory
{
    None,
    Network,
    Timeout,
    RateLimit,
    NotFound,
    Parse,
    Other
};

const char* toString(CheckErrorCategory category);

struct CheckResult
{
    enum class Status
    {
        NoUpdate,
        Available,
        CheckFailed
    };

    Status status = Status::NoUpdate;
    Version latestVersion;
    UpdatePackage package; // valid when status == Available
    CheckFailureKind failureKind = CheckFailureKind::Terminal;
    CheckErrorCategory category = CheckErrorCategory::None;
    UpdateError error; // valid when status == CheckFailed
    int attempts = 0;
};

enum class FetchErrorKind
{
    None,
    Timeout,
    Cancelled,
    ChecksumMismatch,
    ChecksumMissing,
    IoError,
    Http
};

const char* toString(FetchErrorKind kind);

struct FetchResult
{
    bool success = false;
    std::string filePath; // verified package, valid on success
    std::string tempDir; // directory created for this download
    bool verified = false; // checksum compared and matched
    FetchErrorKind errorKind = FetchErrorKind::None;
    UpdateError error;
};

enum class InstallErrorKind
{
    None,
    LockTimeout, // parent process did not exit in time
    BackupFailed,
    CopyFailed,
    SizeMismatch,
    LaunchFailed,
    PermissionDenied,
    InvalidPlan,
    Unexpected // the routine itself failed (filesystem or runtime exception)
};

const char* toString(InstallErrorKind kind);

// Stable numeric code written to the error marker
int toCode(InstallErrorKind kind);
InstallErrorKind installErrorFromCode(int code);

} // namespace updater
