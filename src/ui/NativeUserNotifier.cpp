#include "NativeUserNotifier.hpp"
#include "../utils/NativeMessageBox.hpp"

#include <plog/Log.h>

#include <sstream>

using utils::NativeMessageBox;

namespace ui
{

namespace
{
constexpr const char* kTitle = "CrossTrans Update";
}

void NativeUserNotifier::showUpdateSucceeded(const updater::Version& version)
{
    NativeMessageBox::Notify(kTitle, "CrossTrans was updated to version " + version.toString() + ".");
}

UserNotifier::FailureChoice NativeUserNotifier::askUpdateFailed(const std::string& message, int code,
                                                                bool canRetryOnReboot)
{
    std::ostringstream text;
    text << "The last update could not be installed.\n\n" << message << " (code " << code << ")\n\n";
    text << "Your current version is still installed and working.";

    std::vector<std::string> options;
    if (canRetryOnReboot)
        options.push_back("Install on next restart");
    options.push_back("Download manually");

    int choice = NativeMessageBox::Choose(kTitle, text.str(), options, NativeMessageBox::Type::Warning);
    if (choice < 0)
        return FailureChoice::Dismiss;
    if (canRetryOnReboot && choice == 0)
        return FailureChoice::RetryOnReboot;
    return FailureChoice::OpenReleasePage;
}

bool NativeUserNotifier::askFinalizePending(const std::string& packagePath)
{
    return NativeMessageBox::Confirm(kTitle,
                                     "A downloaded update is waiting to be installed:\n" + packagePath +
                                         "\n\nInstall it on the next system restart?",
                                     NativeMessageBox::Type::Info);
}

void NativeUserNotifier::showUpdateAvailable(const updater::UpdatePackage& pkg, const updater::Version& current)
{
    NativeMessageBox::Notify(kTitle, "Version " + pkg.version.toString() + " is available (you have " +
                                         current.toString() + "). Run crosstrans --check-updates to install.");
}

bool NativeUserNotifier::confirmInstall(const updater::UpdatePackage& pkg, const updater::Version& current)
{
    std::ostringstream text;
    text << "CrossTrans " << pkg.version.toString() << " is available (installed: " << current.toString() << ").";
    if (!pkg.notes.empty())
        text << "\n\n" << pkg.notes;
    if (!pkg.sha256)
        text << "\n\nThis release publishes no checksum; the download cannot be verified.";
    text << "\n\nDownload and install now? CrossTrans will restart.";
    return NativeMessageBox::Confirm(kTitle, text.str(), NativeMessageBox::Type::Info);
}

bool NativeUserNotifier::confirmOpenReleasePage(const updater::UpdatePackage& pkg)
{
    return NativeMessageBox::Confirm(kTitle,
                                     "CrossTrans " + pkg.version.toString() +
                                         " is available.\n\nThis copy was not installed from a release package "
                                         "and cannot update itself. Open the download page?",
                                     NativeMessageBox::Type::Info);
}

void NativeUserNotifier::showAlreadyRunning()
{
    NativeMessageBox::Show("CrossTrans", "CrossTrans is already running.", NativeMessageBox::Type::Info);
}

void NativeUserNotifier::showInfo(const std::string& title, const std::string& message)
{
    NativeMessageBox::Show(title, message, NativeMessageBox::Type::Info);
}

void NativeUserNotifier::showError(const std::string& title, const std::string& message)
{
    PLOG_ERROR << title << ": " << message;
    NativeMessageBox::Show(title, message, NativeMessageBox::Type::Error);
}

} // namespace ui
