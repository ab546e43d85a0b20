#include "AutostartRegistrar.hpp"

#include "ProcessUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace
{

#ifdef _WIN32
constexpr wchar_t kRunKey[] = L"Software\\Microsoft\\Windows\\CurrentVersion\\Run";

std::wstring Widen(const std::string& value)
{
    if (value.empty())
        return {};

    int size = MultiByteToWideChar(CP_UTF8, 0, value.c_str(), static_cast<int>(value.size()), nullptr, 0);
    std::wstring result(static_cast<std::size_t>(std::max(size, 0)), L'\0');
    if (size > 0)
        MultiByteToWideChar(CP_UTF8, 0, value.c_str(), static_cast<int>(value.size()), result.data(), size);
    return result;
}

std::string Narrow(const std::wstring& value)
{
    if (value.empty())
        return {};

    int size = WideCharToMultiByte(CP_UTF8, 0, value.c_str(), static_cast<int>(value.size()), nullptr, 0, nullptr,
                                   nullptr);
    std::string result(static_cast<std::size_t>(std::max(size, 0)), '\0');
    if (size > 0)
        WideCharToMultiByte(CP_UTF8, 0, value.c_str(), static_cast<int>(value.size()), result.data(), size, nullptr,
                            nullptr);
    return result;
}
#else
// Desktop Entry Exec quoting: reserved characters are backslash-escaped inside double quotes
std::string QuoteExecArg(const std::string& arg)
{
    std::string quoted = "\"";
    for (char c : arg)
    {
        if (c == '"' || c == '`' || c == '$' || c == '\\')
            quoted += '\\';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

fs::path DefaultAutostartDir()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return fs::path(xdg) / "autostart";
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".config" / "autostart";
    return {};
}
#endif

} // namespace

AutostartRegistrar::AutostartRegistrar(std::string entryName)
    : entryName_(std::move(entryName))
{
}

fs::path AutostartRegistrar::ResolveLaunchTarget() { return utils::ProcessUtils::GetInstalledPath(); }

std::string AutostartRegistrar::BuildCommand(const fs::path& target)
{
#ifdef _WIN32
    return "\"" + Narrow(target.wstring()) + "\"";
#else
    return QuoteExecArg(target.string());
#endif
}

fs::path AutostartRegistrar::entryPath() const
{
#ifdef _WIN32
    return fs::path(kRunKey) / Widen(entryName_);
#else
    fs::path dir = autostartDir_.empty() ? DefaultAutostartDir() : autostartDir_;
    std::string fileName = entryName_;
    std::transform(fileName.begin(), fileName.end(), fileName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return dir / (fileName + ".desktop");
#endif
}

bool AutostartRegistrar::setEnabled(bool enabled, std::string& outError)
{
    if (!enabled)
    {
        return removeEntry(outError);
    }

    fs::path target = ResolveLaunchTarget();
    if (target.empty())
    {
        outError = "Could not determine the application path";
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Autostart, "Could not enable start at login",
                                            outError);
        return false;
    }
    return registerExecutable(target, outError);
}

bool AutostartRegistrar::registerExecutable(const fs::path& exePath, std::string& outError)
{
    std::string command = BuildCommand(exePath);
    if (!writeEntry(command, outError))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Autostart, "Could not enable start at login",
                                            outError);
        return false;
    }
    PLOG_INFO << "Autostart registered: " << command;
    return true;
}

bool AutostartRegistrar::isEnabled() const { return registeredCommand().has_value(); }

#ifdef _WIN32

std::optional<std::string> AutostartRegistrar::registeredCommand() const
{
    HKEY key = nullptr;
    if (RegOpenKeyExW(HKEY_CURRENT_USER, kRunKey, 0, KEY_READ, &key) != ERROR_SUCCESS)
        return std::nullopt;

    std::wstring name = Widen(entryName_);
    DWORD type = 0;
    DWORD size = 0;
    LONG status = RegQueryValueExW(key, name.c_str(), nullptr, &type, nullptr, &size);
    if (status != ERROR_SUCCESS || (type != REG_SZ && type != REG_EXPAND_SZ))
    {
        RegCloseKey(key);
        return std::nullopt;
    }

    std::wstring buffer(size / sizeof(wchar_t) + 1, L'\0');
    status = RegQueryValueExW(key, name.c_str(), nullptr, nullptr, reinterpret_cast<LPBYTE>(buffer.data()), &size);
    RegCloseKey(key);
    if (status != ERROR_SUCCESS)
        return std::nullopt;

    buffer.resize(wcsnlen(buffer.c_str(), buffer.size()));
    return Narrow(buffer);
}

bool AutostartRegistrar::writeEntry(const std::string& command, std::string& outError)
{
    HKEY key = nullptr;
    LONG status = RegCreateKeyExW(HKEY_CURRENT_USER, kRunKey, 0, nullptr, 0, KEY_SET_VALUE, nullptr, &key, nullptr);
    if (status != ERROR_SUCCESS)
    {
        outError = "RegCreateKeyExW failed with error " + std::to_string(status);
        return false;
    }

    std::wstring name = Widen(entryName_);
    std::wstring value = Widen(command);
    status = RegSetValueExW(key, name.c_str(), 0, REG_SZ, reinterpret_cast<const BYTE*>(value.c_str()),
                            static_cast<DWORD>((value.size() + 1) * sizeof(wchar_t)));
    RegCloseKey(key);
    if (status != ERROR_SUCCESS)
    {
        outError = "RegSetValueExW failed with error " + std::to_string(status);
        return false;
    }
    return true;
}

bool AutostartRegistrar::removeEntry(std::string& outError)
{
    HKEY key = nullptr;
    LONG status = RegOpenKeyExW(HKEY_CURRENT_USER, kRunKey, 0, KEY_SET_VALUE, &key);
    if (status == ERROR_FILE_NOT_FOUND)
        return true;
    if (status != ERROR_SUCCESS)
    {
        outError = "RegOpenKeyExW failed with error " + std::to_string(status);
        return false;
    }

    std::wstring name = Widen(entryName_);
    status = RegDeleteValueW(key, name.c_str());
    RegCloseKey(key);
    if (status != ERROR_SUCCESS && status != ERROR_FILE_NOT_FOUND)
    {
        outError = "RegDeleteValueW failed with error " + std::to_string(status);
        return false;
    }

    PLOG_INFO << "Autostart entry removed";
    return true;
}

#else

std::optional<std::string> AutostartRegistrar::registeredCommand() const
{
    std::ifstream in(entryPath());
    if (!in.is_open())
        return std::nullopt;

    std::string line;
    std::optional<std::string> command;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        // A user who switches the entry off in their session settings gets Hidden=true
        if (line == "Hidden=true" || line == "X-GNOME-Autostart-enabled=false")
            return std::nullopt;
        if (line.rfind("Exec=", 0) == 0)
            command = line.substr(5);
    }
    return command;
}

bool AutostartRegistrar::writeEntry(const std::string& command, std::string& outError)
{
    fs::path path = entryPath();
    if (path.empty())
    {
        outError = "No autostart directory (neither XDG_CONFIG_HOME nor HOME is set)";
        return false;
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
    {
        outError = "Failed to create " + path.parent_path().string() + ": " + ec.message();
        return false;
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
        {
            outError = "Failed to write " + tmp.string();
            return false;
        }
        out << "[Desktop Entry]\n"
            << "Type=Application\n"
            << "Name=" << entryName_ << "\n"
            << "Exec=" << command << "\n"
            << "Terminal=false\n"
            << "X-GNOME-Autostart-enabled=true\n";
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
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool AutostartRegistrar::removeEntry(std::string& outError)
{
    std::error_code ec;
    bool removed = fs::remove(entryPath(), ec);
    if (ec)
    {
        outError = "Failed to remove " + entryPath().string() + ": " + ec.message();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Autostart, "Could not disable start at login",
                                            outError);
        return false;
    }
    if (removed)
    {
        PLOG_INFO << "Autostart entry removed";
    }
    return true;
}

#endif
