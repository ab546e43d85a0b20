#include "UpdateTypes.hpp"

namespace updater
{

const char* toString(UpdateState state)
{
    switch (state)
    {
    case UpdateState::Idle:
        return "Idle";
    case UpdateState::Checking:
        return "Checking";
    case UpdateState::Available:
        return "Available";
    case UpdateState::Downloading:
        return "Downloading";
    case UpdateState::Downloaded:
        return "Downloaded";
    case UpdateState::Requested:
        return "Requested";
    case UpdateState::ExternalRoutineLaunched:
        return "ExternalRoutineLaunched";
    case UpdateState::Succeeded:
        return "Succeeded";
    case UpdateState::Failed:
        return "Failed";
    case UpdateState::AwaitingReboot:
        return "AwaitingReboot";
    }
    return "Unknown";
}

const char* toString(CheckErrorCategory category)
{
    switch (category)
    {
    case CheckErrorCategory::None:
        return "none";
    case CheckErrorCategory::Network:
        return "network";
    case CheckErrorCategory::Timeout:
        return "timeout";
    case CheckErrorCategory::RateLimit:
        return "rate_limit";
    case CheckErrorCategory::NotFound:
        return "not_found";
    case CheckErrorCategory::Parse:
        return "parse";
    case CheckErrorCategory::Other:
        return "other";
    }
    return "other";
}

const char* toString(FetchErrorKind kind)
{
    switch (kind)
    {
    case FetchErrorKind::None:
        return "none";
    case FetchErrorKind::Timeout:
        return "timeout";
    case FetchErrorKind::Cancelled:
        return "cancelled";
    case FetchErrorKind::ChecksumMismatch:
        return "checksum_mismatch";
    case FetchErrorKind::ChecksumMissing:
        return "checksum_missing";
    case FetchErrorKind::IoError:
        return "io_error";
    case FetchErrorKind::Http:
        return "http";
    }
    return "unknown";
}

const char* toString(InstallErrorKind kind)
{
    switch (kind)
    {
    case InstallErrorKind::None:
        return "none";
    case InstallErrorKind::LockTimeout:
        return "lock_timeout";
    case InstallErrorKind::BackupFailed:
        return "backup_failed";
    case InstallErrorKind::CopyFailed:
        return "copy_failed";
    case InstallErrorKind::SizeMismatch:
        return "size_mismatch";
    case InstallErrorKind::LaunchFailed:
        return "launch_failed";
    case InstallErrorKind::PermissionDenied:
        return "permission_denied";
    case InstallErrorKind::InvalidPlan:
        return "invalid_plan";
    case InstallErrorKind::Unexpected:
        return "unexpected";
    }
    return "unknown";
}

int toCode(InstallErrorKind kind)
{
    switch (kind)
    {
    case InstallErrorKind::None:
        return 0;
    case InstallErrorKind::LockTimeout:
        return 10;
    case InstallErrorKind::BackupFailed:
        return 20;
    case InstallErrorKind::CopyFailed:
        return 30;
    case InstallErrorKind::SizeMismatch:
        return 31;
    case InstallErrorKind::LaunchFailed:
        return 40;
    case InstallErrorKind::PermissionDenied:
        return 50;
    case InstallErrorKind::InvalidPlan:
        return 60;
    case InstallErrorKind::Unexpected:
        return 70;
    }
    return 99;
}

InstallErrorKind installErrorFromCode(int code)
{
    switch (code)
    {
    case 0:
        return InstallErrorKind::None;
    case 10:
        return InstallErrorKind::LockTimeout;
    case 20:
        return InstallErrorKind::BackupFailed;
    case 30:
        return InstallErrorKind::CopyFailed;
    case 31:
        return InstallErrorKind::SizeMismatch;
    case 40:
        return InstallErrorKind::LaunchFailed;
    case 50:
        return InstallErrorKind::PermissionDenied;
    case 60:
        return InstallErrorKind::InvalidPlan;
    case 70:
        return InstallErrorKind::Unexpected;
    default:
        return InstallErrorKind::CopyFailed;
    }
}

} // namespace updater
