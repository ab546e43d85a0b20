#pragma once

#include "UpdateTypes.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace updater
{

using CopyFunction =
    std::function<bool(const std::filesystem::path& from, const std::filesystem::path& to, std::string& outError)>;

struct RetryPolicy
{
    int attempts = 5;
    std::chrono::milliseconds delay{ 2000 };
};

// Keeps a sibling "<exe>.bak" copy of the installed executable while it is being replaced
class BackupManager
{
public:
    explicit BackupManager(const std::filesystem::path& targetPath, const std::filesystem::path& backupPath = {});
    ~BackupManager() = default;

    bool createBackup(std::string& outError);
    bool restoreFromBackup(std::string& outError);
    bool hasBackup() const;
    void cleanupBackup();

    const std::filesystem::path& getBackupPath() const { return backupPath_; }

    void setCopyFunction(CopyFunction copy);
    void setSleepFunction(SleepFunction sleeper);
    void setRetryPolicy(const RetryPolicy& policy) { policy_ = policy; }

    // Copy, retrying on failure (antivirus and handle release lag keep files locked briefly)
    bool copyWithRetries(const std::filesystem::path& from, const std::filesystem::path& to, std::string& outError);

    static bool CopyReplacing(const std::filesystem::path& from, const std::filesystem::path& to, std::string& outError);

private:
    std::filesystem::path targetPath_;
    std::filesystem::path backupPath_;
    CopyFunction copy_;
    SleepFunction sleep_;
    RetryPolicy policy_;
};

} // namespace updater
