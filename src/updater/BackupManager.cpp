#include "BackupManager.hpp"

#include <plog/Log.h>

#include <thread>

namespace fs = std::filesystem;

namespace updater
{

BackupManager::BackupManager(const fs::path& targetPath, const fs::path& backupPath)
    : targetPath_(targetPath)
    , backupPath_(backupPath)
    , copy_(&BackupManager::CopyReplacing)
    , sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
{
    if (backupPath_.empty())
    {
        backupPath_ = targetPath_;
        backupPath_ += ".bak";
    }
}

void BackupManager::setCopyFunction(CopyFunction copy)
{
    if (copy)
        copy_ = std::move(copy);
}

void BackupManager::setSleepFunction(SleepFunction sleeper)
{
    if (sleeper)
        sleep_ = std::move(sleeper);
}

bool BackupManager::CopyReplacing(const fs::path& from, const fs::path& to, std::string& outError)
{
    try
    {
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
#ifndef _WIN32
        fs::permissions(to, fs::status(from).permissions() | fs::perms::owner_exec, fs::perm_options::replace);
#endif
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Filesystem error: ") + e.what();
        return false;
    }
}

bool BackupManager::copyWithRetries(const fs::path& from, const fs::path& to, std::string& outError)
{
    const int attempts = policy_.attempts > 0 ? policy_.attempts : 1;
    for (int attempt = 1; attempt <= attempts; ++attempt)
    {
        std::string error;
        if (copy_(from, to, error))
        {
            if (attempt > 1)
                PLOG_INFO << "Copy succeeded on attempt " << attempt;
            return true;
        }

        outError = error;
        PLOG_WARNING << "Copy " << from.string() << " -> " << to.string() << " failed (attempt " << attempt << "/"
                     << attempts << "): " << error;

        if (attempt < attempts)
            sleep_(policy_.delay);
    }
    return false;
}

bool BackupManager::createBackup(std::string& outError)
{
    std::error_code ec;
    if (!fs::is_regular_file(targetPath_, ec))
    {
        outError = "Installed executable not found: " + targetPath_.string() + (ec ? " (" + ec.message() + ")" : "");
        PLOG_ERROR << outError;
        return false;
    }

    PLOG_INFO << "Creating backup: " << backupPath_.string();
    if (!copyWithRetries(targetPath_, backupPath_, outError))
    {
        outError = "Backup failed: " + outError;
        PLOG_ERROR << outError;
        return false;
    }

    std::error_code targetEc;
    std::error_code backupEc;
    auto targetSize = fs::file_size(targetPath_, targetEc);
    auto backupSize = fs::file_size(backupPath_, backupEc);
    if (targetEc || backupEc || targetSize != backupSize)
    {
        outError = "Backup is incomplete: " + backupPath_.string();
        PLOG_ERROR << outError;
        return false;
    }

    PLOG_INFO << "Backup created successfully: " << backupPath_.string();
    return true;
}

bool BackupManager::restoreFromBackup(std::string& outError)
{
    if (!hasBackup())
    {
        outError = "Backup file does not exist: " + backupPath_.string();
        PLOG_ERROR << outError;
        return false;
    }

    PLOG_INFO << "Restoring from backup: " << backupPath_.string();
    if (!copyWithRetries(backupPath_, targetPath_, outError))
    {
        outError = "Restore failed: " + outError;
        PLOG_ERROR << outError;
        return false;
    }

    PLOG_INFO << "Restore completed successfully";
    return true;
}

bool BackupManager::hasBackup() const
{
    std::error_code ec;
    return fs::is_regular_file(backupPath_, ec) && fs::file_size(backupPath_, ec) > 0;
}

void BackupManager::cleanupBackup()
{
    std::error_code ec;
    if (fs::remove(backupPath_, ec))
    {
        PLOG_INFO << "Backup cleaned up: " << backupPath_.string();
    }
    else if (ec)
    {
        PLOG_WARNING << "Failed to cleanup backup: " << ec.message();
    }
}

} // namespace updater
