#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

enum class LaunchMode
{
    Normal, // inherits the console, parent waits for nothing
    Detached, // own session/process group, outlives the parent
    Hidden // detached with no window and no console of its own
};

// Cross-platform utilities for process management
class ProcessUtils
{
public:
    // Win32 process creation flags, mirrored so the flag policy is testable everywhere
    static constexpr std::uint32_t kDetachedProcess = 0x00000008;
    static constexpr std::uint32_t kCreateNewProcessGroup = 0x00000200;
    static constexpr std::uint32_t kCreateNoWindow = 0x08000000;

    // Get the absolute path to the current executable
    static std::filesystem::path GetExecutablePath();

    // File the user installed: $APPIMAGE when running from an AppImage, otherwise the executable.
    // This is what an update replaces and what autostart and relaunches point at.
    static std::filesystem::path GetInstalledPath();

    static std::uint32_t GetCurrentProcessId();

    // True while a process with this id exists
    static bool IsProcessAlive(std::uint32_t pid);

    // Creation flags used for a launch mode. DETACHED_PROCESS and CREATE_NO_WINDOW are
    // mutually exclusive (the former wins and a console window flashes), so Hidden never sets both.
    static std::uint32_t CreationFlagsFor(LaunchMode mode);

    // Launch a process with optional arguments
    // Returns true on success, false on failure
    static bool LaunchProcess(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                              LaunchMode mode = LaunchMode::Detached,
                              const std::filesystem::path& workingDir = {});

    // Replace the current process image with exePath. On POSIX this only returns on failure;
    // on Windows a successor is started and the caller must exit immediately.
    static bool ReExec(const std::filesystem::path& exePath, const std::vector<std::string>& args);

    // Open a URL with the desktop's default handler
    static bool OpenUrl(const std::string& url);
};

} // namespace utils
