#include "DeferredRename.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>

#ifdef _WIN32
#include <windows.h>

#include <cwctype>
#include <vector>
#endif

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace utils
{

namespace
{

json ReadJournal(const fs::path& path)
{
    std::ifstream in(path);
    if (!in.is_open())
        return json::array();

    try
    {
        json doc = json::parse(in);
        if (doc.is_array())
            return doc;
        PLOG_WARNING << "Ignoring malformed rename journal: " << path.string();
    }
    catch (const json::exception& e)
    {
        PLOG_WARNING << "Ignoring unreadable rename journal " << path.string() << ": " << e.what();
    }
    return json::array();
}

bool WriteJournal(const fs::path& path, const json& entries, std::string& outError)
{
    std::error_code ec;
    if (entries.empty())
    {
        fs::remove(path, ec);
        return true;
    }

    fs::create_directories(path.parent_path(), ec);
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
        {
            outError = "Failed to open " + tmp.string();
            return false;
        }
        out << entries.dump(2);
        if (!out)
        {
            outError = "Failed to write " + tmp.string();
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec)
    {
        outError = "Failed to replace " + path.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool MoveReplacing(const fs::path& source, const fs::path& target, std::string& outError)
{
    std::error_code ec;
    fs::rename(source, target, ec);
    if (ec)
    {
        // Across file systems rename is not possible; fall back to copy then delete
        ec.clear();
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            outError = ec.message();
            return false;
        }
        fs::remove(source, ec);
    }

    fs::permissions(target, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    return true;
}

bool IsUnder(const fs::path& file, const fs::path& directory)
{
    fs::path dir = directory.lexically_normal();
    fs::path rel = file.lexically_normal().lexically_relative(dir);
    return !rel.empty() && *rel.begin() != "..";
}

#ifdef _WIN32
std::vector<std::wstring> PendingRenameSources()
{
    static const wchar_t* kSessionManager = L"SYSTEM\\CurrentControlSet\\Control\\Session Manager";
    static const wchar_t* kValue = L"PendingFileRenameOperations";

    std::vector<std::wstring> sources;
    DWORD size = 0;
    if (RegGetValueW(HKEY_LOCAL_MACHINE, kSessionManager, kValue, RRF_RT_REG_MULTI_SZ, nullptr, nullptr, &size) !=
            ERROR_SUCCESS ||
        size == 0)
        return sources;

    std::vector<wchar_t> buffer(size / sizeof(wchar_t) + 1, L'\0');
    if (RegGetValueW(HKEY_LOCAL_MACHINE, kSessionManager, kValue, RRF_RT_REG_MULTI_SZ, nullptr, buffer.data(),
                     &size) != ERROR_SUCCESS)
        return sources;

    // Pairs of source and target; an empty target means delete. Paths carry the \??\ prefix.
    bool isSource = true;
    for (const wchar_t* p = buffer.data(); p < buffer.data() + buffer.size();)
    {
        std::wstring entry(p);
        p += entry.size() + 1;
        if (entry.empty() && isSource)
            break;
        if (isSource)
        {
            if (entry.rfind(L"\\??\\", 0) == 0)
                entry.erase(0, 4);
            sources.push_back(std::move(entry));
        }
        isSource = !isSource;
    }
    return sources;
}

std::wstring Lowered(std::wstring text)
{
    for (auto& c : text)
        c = static_cast<wchar_t>(std::towlower(c));
    return text;
}
#endif

} // namespace

DeferredRename::DeferredRename(fs::path journalPath)
    : journalPath_(std::move(journalPath))
{
}

bool DeferredRename::IsNativelySupported()
{
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

bool DeferredRename::schedule(const fs::path& source, const fs::path& target, std::string& outError)
{
    std::error_code ec;
    if (!fs::exists(source, ec))
    {
        outError = "Replacement file no longer exists: " + source.string();
        return false;
    }

#ifdef _WIN32
    if (!MoveFileExW(source.wstring().c_str(), target.wstring().c_str(),
                     MOVEFILE_DELAY_UNTIL_REBOOT | MOVEFILE_REPLACE_EXISTING))
    {
        DWORD err = GetLastError();
        outError = "MoveFileExW failed with error " + std::to_string(err);
        if (err == ERROR_ACCESS_DENIED)
            outError += " (administrator rights are required)";
        PLOG_ERROR << outError;
        return false;
    }
#else
    json entries = ReadJournal(journalPath_);
    entries.push_back({ { "source", source.string() }, { "target", target.string() } });
    if (!WriteJournal(journalPath_, entries, outError))
    {
        PLOG_ERROR << "Failed to schedule deferred rename: " << outError;
        return false;
    }
#endif

    PLOG_INFO << "Scheduled replacement of " << target.string() << " with " << source.string() << " on next boot";
    return true;
}

int DeferredRename::applyPending()
{
    std::error_code ec;
    if (IsNativelySupported() || !fs::exists(journalPath_, ec))
        return 0;

    json entries = ReadJournal(journalPath_);
    json remaining = json::array();
    int applied = 0;

    for (const auto& entry : entries)
    {
        if (!entry.is_object())
            continue;

        std::string source = entry.value("source", "");
        std::string target = entry.value("target", "");
        if (source.empty() || target.empty() || !fs::exists(source, ec))
        {
            PLOG_WARNING << "Dropping stale deferred rename: " << source << " -> " << target;
            continue;
        }

        std::string error;
        if (MoveReplacing(source, target, error))
        {
            PLOG_INFO << "Applied deferred rename: " << source << " -> " << target;
            ++applied;
        }
        else
        {
            PLOG_ERROR << "Deferred rename failed (" << source << " -> " << target << "): " << error;
            remaining.push_back(entry);
        }
    }

    std::string error;
    if (!WriteJournal(journalPath_, remaining, error))
    {
        PLOG_ERROR << "Failed to update rename journal: " << error;
    }
    return applied;
}

bool DeferredRename::hasPending() const
{
    if (IsNativelySupported())
        return false;
    return !ReadJournal(journalPath_).empty();
}

bool DeferredRename::hasPendingFrom(const fs::path& directory) const
{
    if (directory.empty())
        return false;

#ifdef _WIN32
    fs::path dir(Lowered(directory.lexically_normal().wstring()));
    for (const auto& source : PendingRenameSources())
    {
        if (IsUnder(fs::path(Lowered(source)), dir))
            return true;
    }
    return false;
#else
    for (const auto& entry : ReadJournal(journalPath_))
    {
        if (!entry.is_object())
            continue;
        std::string source = entry.value("source", "");
        if (!source.empty() && IsUnder(source, directory))
            return true;
    }
    return false;
#endif
}

} // namespace utils
