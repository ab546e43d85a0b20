#include "ProcessUtils.hpp"

#include <plog/Log.h>

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace utils
{

namespace
{

#ifdef _WIN32
static_assert(ProcessUtils::kDetachedProcess == DETACHED_PROCESS);
static_assert(ProcessUtils::kCreateNewProcessGroup == CREATE_NEW_PROCESS_GROUP);
static_assert(ProcessUtils::kCreateNoWindow == CREATE_NO_WINDOW);

std::wstring Utf8ToWide(const std::string& value)
{
    if (value.empty())
        return {};

    int size = MultiByteToWideChar(CP_UTF8, 0, value.c_str(), static_cast<int>(value.size()), nullptr, 0);
    if (size <= 0)
        return {};

    std::wstring result(static_cast<std::size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, value.c_str(), static_cast<int>(value.size()), result.data(), size);
    return result;
}

std::wstring BuildCommandLine(const std::filesystem::path& exePath, const std::vector<std::string>& args)
{
    std::wstring cmdLine = L"\"" + exePath.wstring() + L"\"";
    for (const auto& arg : args)
    {
        cmdLine += L" \"" + Utf8ToWide(arg) + L"\"";
    }
    return cmdLine;
}
#else
std::vector<char*> BuildArgv(const std::filesystem::path& exePath, const std::vector<std::string>& args)
{
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exePath.c_str()));
    for (const auto& arg : args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

void RedirectStdioToNull()
{
    int fd = open("/dev/null", O_RDWR);
    if (fd < 0)
        return;

    dup2(fd, STDIN_FILENO);
    dup2(fd, STDOUT_FILENO);
    dup2(fd, STDERR_FILENO);
    if (fd > STDERR_FILENO)
        close(fd);
}
#endif

} // namespace

std::filesystem::path ProcessUtils::GetExecutablePath()
{
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    DWORD size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (size == 0)
    {
        PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
        return {};
    }

    while (size == buffer.size())
    {
        buffer.resize(buffer.size() * 2, L'\0');
        size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (size == 0)
        {
            PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
            return {};
        }
    }
    buffer.resize(size);

    return std::filesystem::path(buffer);
#else
    std::error_code ec;
    auto exePath = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to read /proc/self/exe: " << ec.message();
        return {};
    }
    // The kernel appends this once the file was replaced underneath the running image
    const std::string deletedSuffix = " (deleted)";
    std::string pathStr = exePath.string();
    if (pathStr.size() > deletedSuffix.size() &&
        pathStr.compare(pathStr.size() - deletedSuffix.size(), deletedSuffix.size(), deletedSuffix) == 0)
    {
        return std::filesystem::path(pathStr.substr(0, pathStr.size() - deletedSuffix.size()));
    }
    return exePath;
#endif
}

std::filesystem::path ProcessUtils::GetInstalledPath()
{
#ifndef _WIN32
    // The AppImage runtime exports the image's own path; the executable lives in a
    // read-only mount that disappears with the process
    if (const char* appImage = std::getenv("APPIMAGE"); appImage && *appImage)
        return std::filesystem::path(appImage);
#endif
    return GetExecutablePath();
}

std::uint32_t ProcessUtils::GetCurrentProcessId()
{
#ifdef _WIN32
    return static_cast<std::uint32_t>(::GetCurrentProcessId());
#else
    return static_cast<std::uint32_t>(getpid());
#endif
}

bool ProcessUtils::IsProcessAlive(std::uint32_t pid)
{
    if (pid == 0)
        return false;

#ifdef _WIN32
    HANDLE process = OpenProcess(SYNCHRONIZE | PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (!process)
    {
        // Access denied still means the process exists
        return GetLastError() == ERROR_ACCESS_DENIED;
    }

    DWORD wait = WaitForSingleObject(process, 0);
    CloseHandle(process);
    return wait == WAIT_TIMEOUT;
#else
    if (kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno == EPERM;
#endif
}

std::uint32_t ProcessUtils::CreationFlagsFor(LaunchMode mode)
{
    switch (mode)
    {
    case LaunchMode::Normal:
        return 0;
    case LaunchMode::Detached:
        return kDetachedProcess | kCreateNewProcessGroup;
    case LaunchMode::Hidden:
        return kCreateNoWindow | kCreateNewProcessGroup;
    }
    return 0;
}

bool ProcessUtils::LaunchProcess(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                                 LaunchMode mode, const std::filesystem::path& workingDir)
{
    if (exePath.empty() || !std::filesystem::exists(exePath))
    {
        PLOG_ERROR << "Invalid executable path: " << exePath.string();
        return false;
    }

#ifdef _WIN32
    std::wstring cmdLine = BuildCommandLine(exePath, args);

    STARTUPINFOW si = { sizeof(si) };
    PROCESS_INFORMATION pi = {};
    si.dwFlags = STARTF_USESHOWWINDOW;
    si.wShowWindow = mode == LaunchMode::Hidden ? SW_HIDE : SW_SHOW;

    DWORD creationFlags = CreationFlagsFor(mode);
    std::wstring cwd = workingDir.empty() ? std::wstring() : workingDir.wstring();

    if (!CreateProcessW(nullptr, cmdLine.data(), nullptr, nullptr, FALSE, creationFlags, nullptr,
                        cwd.empty() ? nullptr : cwd.c_str(), &si, &pi))
    {
        PLOG_ERROR << "CreateProcessW failed: " << GetLastError();
        return false;
    }

    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    PLOG_INFO << "Launched process: " << exePath.string() << " (flags 0x" << std::hex << creationFlags << std::dec
              << ")";
    return true;
#else
    std::vector<char*> argv = BuildArgv(exePath, args);

    pid_t pid = fork();
    if (pid < 0)
    {
        PLOG_ERROR << "fork() failed: " << strerror(errno);
        return false;
    }

    if (pid == 0)
    {
        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0)
        {
            _exit(127);
        }

        if (mode == LaunchMode::Normal)
        {
            execv(exePath.c_str(), argv.data());
            _exit(127);
        }

        // Double fork so the launched process is reparented and never left as our zombie
        if (setsid() < 0)
        {
            _exit(127);
        }
        pid_t grandchild = fork();
        if (grandchild != 0)
        {
            _exit(grandchild < 0 ? 127 : 0);
        }

        if (mode == LaunchMode::Hidden)
        {
            RedirectStdioToNull();
        }
        execv(exePath.c_str(), argv.data());
        _exit(127);
    }

    if (mode != LaunchMode::Normal)
    {
        int status = 0;
        if (waitpid(pid, &status, 0) < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
        {
            PLOG_ERROR << "Failed to detach process: " << exePath.string();
            return false;
        }
    }

    PLOG_INFO << "Launched process: " << exePath.string();
    return true;
#endif
}

bool ProcessUtils::ReExec(const std::filesystem::path& exePath, const std::vector<std::string>& args)
{
#ifdef _WIN32
    // No in-place image replacement on Windows; start the successor and let the caller exit
    return LaunchProcess(exePath, args, LaunchMode::Normal);
#else
    std::vector<char*> argv = BuildArgv(exePath, args);
    PLOG_INFO << "Re-executing: " << exePath.string();
    execv(exePath.c_str(), argv.data());
    PLOG_ERROR << "execv() failed: " << strerror(errno);
    return false;
#endif
}

bool ProcessUtils::OpenUrl(const std::string& url)
{
#ifdef _WIN32
    std::wstring wideUrl = Utf8ToWide(url);
    auto result = reinterpret_cast<INT_PTR>(ShellExecuteW(nullptr, L"open", wideUrl.c_str(), nullptr, nullptr,
                                                          SW_SHOWNORMAL));
    if (result <= 32)
    {
        PLOG_ERROR << "ShellExecuteW failed for " << url << ": " << result;
        return false;
    }
    return true;
#else
    return LaunchProcess("/usr/bin/xdg-open", { url }, LaunchMode::Hidden);
#endif
}

} // namespace utils
