#include "NativeMessageBox.hpp"
#include "../platform/ProcessUtils.hpp"

#include <plog/Log.h>

#include <array>
#include <cstdio>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <sys/wait.h>
#endif

namespace utils
{

namespace
{

#ifdef _WIN32
std::wstring StringToWString(const std::string& str)
{
    if (str.empty())
        return std::wstring();

    int size = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, NULL, 0);
    std::wstring wstr(size, 0);
    MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, &wstr[0], size);
    return wstr;
}

UINT IconFor(NativeMessageBox::Type type)
{
    switch (type)
    {
    case NativeMessageBox::Type::Error:
        return MB_ICONERROR;
    case NativeMessageBox::Type::Warning:
        return MB_ICONWARNING;
    case NativeMessageBox::Type::Info:
        return MB_ICONINFORMATION;
    }
    return 0;
}

int ShowWin32(const std::string& title, const std::string& message, UINT flags)
{
    std::wstring wtitle = StringToWString(title);
    std::wstring wmessage = StringToWString(message);
    return MessageBoxW(NULL, wmessage.c_str(), wtitle.c_str(), flags | MB_SETFOREGROUND | MB_TOPMOST);
}
#else
std::string ShellQuote(const std::string& value)
{
    std::string quoted = "'";
    for (char c : value)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

const char* ZenityType(NativeMessageBox::Type type)
{
    switch (type)
    {
    case NativeMessageBox::Type::Error:
        return "--error";
    case NativeMessageBox::Type::Warning:
        return "--warning";
    case NativeMessageBox::Type::Info:
        return "--info";
    }
    return "--info";
}

struct CommandResult
{
    bool ran = false;
    int exitCode = -1;
    std::string output;
};

CommandResult RunCapture(const std::string& command)
{
    CommandResult result;
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe)
        return result;

    std::array<char, 256> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe))
    {
        result.output += buffer.data();
    }
    int status = pclose(pipe);
    result.ran = status != -1 && WIFEXITED(status);
    result.exitCode = result.ran ? WEXITSTATUS(status) : -1;
    // 127: shell could not find zenity
    if (result.exitCode == 127)
        result.ran = false;
    while (!result.output.empty() && (result.output.back() == '\n' || result.output.back() == '\r'))
        result.output.pop_back();
    return result;
}

void PrintToConsole(const std::string& title, const std::string& message)
{
    std::cerr << "\n========================================\n";
    std::cerr << title << "\n";
    std::cerr << "========================================\n";
    std::cerr << message << "\n";
    std::cerr << "========================================\n";
}
#endif

} // namespace

void NativeMessageBox::Show(const std::string& title, const std::string& message, Type type)
{
#ifdef _WIN32
    ShowWin32(title, message, MB_OK | IconFor(type));
#else
    std::string cmd = std::string("zenity ") + ZenityType(type) + " --title=" + ShellQuote(title) +
                      " --text=" + ShellQuote(message) + " 2>/dev/null";
    if (!RunCapture(cmd).ran)
    {
        PrintToConsole(title, message);
    }
#endif
}

bool NativeMessageBox::Confirm(const std::string& title, const std::string& message, Type type)
{
#ifdef _WIN32
    return ShowWin32(title, message, MB_YESNO | IconFor(type)) == IDYES;
#else
    std::string cmd = "zenity --question --title=" + ShellQuote(title) + " --text=" + ShellQuote(message) +
                      " 2>/dev/null";
    CommandResult result = RunCapture(cmd);
    if (!result.ran)
    {
        PrintToConsole(title, message);
        PLOG_INFO << "No dialog available for question '" << title << "'; assuming no";
        return false;
    }
    return result.exitCode == 0;
#endif
}

int NativeMessageBox::Choose(const std::string& title, const std::string& message,
                             const std::vector<std::string>& options, Type type)
{
    if (options.empty())
    {
        Show(title, message, type);
        return -1;
    }

#ifdef _WIN32
    std::ostringstream text;
    text << message << "\n\n";
    text << "Yes: " << options[0] << "\n";
    if (options.size() > 1)
        text << "No: " << options[1] << "\n";
    text << "Cancel: close";

    int answer = ShowWin32(title, text.str(), (options.size() > 1 ? MB_YESNOCANCEL : MB_OKCANCEL) | IconFor(type));
    if (answer == IDYES || answer == IDOK)
        return 0;
    if (answer == IDNO)
        return 1;
    return -1;
#else
    std::string cmd = "zenity --question --title=" + ShellQuote(title) + " --text=" + ShellQuote(message) +
                      " --ok-label=" + ShellQuote(options[0]) + " --cancel-label=" + ShellQuote("Close");
    if (options.size() > 1)
        cmd += " --extra-button=" + ShellQuote(options[1]);
    cmd += " 2>/dev/null";

    CommandResult result = RunCapture(cmd);
    if (!result.ran)
    {
        PrintToConsole(title, message);
        return -1;
    }
    if (result.exitCode == 0)
        return 0;
    // zenity prints the extra button's label when it is pressed
    if (options.size() > 1 && result.output == options[1])
        return 1;
    return -1;
#endif
}

void NativeMessageBox::Notify(const std::string& title, const std::string& message)
{
#ifdef _WIN32
    Show(title, message, Type::Info);
#else
    if (!ProcessUtils::LaunchProcess("/usr/bin/notify-send", { "--app-name=CrossTrans", title, message },
                                     LaunchMode::Hidden))
    {
        Show(title, message, Type::Info);
    }
#endif
}

} // namespace utils
