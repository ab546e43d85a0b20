#pragma once

#include <filesystem>
#include <optional>
#include <string>

// Per-user "launch at login" registration.
// Windows: HKCU\Software\Microsoft\Windows\CurrentVersion\Run\<name>
// Elsewhere: $XDG_CONFIG_HOME/autostart/<name lowercase>.desktop
class AutostartRegistrar
{
public:
    static constexpr const char* kDefaultEntryName = "CrossTrans";

    explicit AutostartRegistrar(std::string entryName = kDefaultEntryName);

    // Registers the running application (command recomputed on every call) or removes the entry.
    // Removing an absent entry succeeds.
    bool setEnabled(bool enabled, std::string& outError);

    // Registers an explicit executable, used by the installer to point at the replaced binary
    bool registerExecutable(const std::filesystem::path& exePath, std::string& outError);

    // Queries the OS registration, never a cached setting
    bool isEnabled() const;

    // Command stored in the live entry, if any
    std::optional<std::string> registeredCommand() const;

    // Overrides the XDG autostart directory (no effect on Windows)
    void setAutostartDir(const std::filesystem::path& dir) { autostartDir_ = dir; }

    std::filesystem::path entryPath() const;

    // $APPIMAGE when running from an AppImage, otherwise the executable itself
    static std::filesystem::path ResolveLaunchTarget();

    static std::string BuildCommand(const std::filesystem::path& target);

private:
    bool writeEntry(const std::string& command, std::string& outError);
    bool removeEntry(std::string& outError);

    std::string entryName_;
    std::filesystem::path autostartDir_;
};
