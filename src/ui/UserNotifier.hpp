#pragma once

#include "../updater/UpdateTypes.hpp"
#include "../updater/Version.hpp"

#include <string>

namespace ui
{

// Everything the update lifecycle shows to or asks of the user
class UserNotifier
{
public:
    enum class FailureChoice
    {
        RetryOnReboot,
        OpenReleasePage,
        Dismiss
    };

    virtual ~UserNotifier() = default;

    virtual void showUpdateSucceeded(const updater::Version& version) = 0;

    // canRetryOnReboot is false when no verified download survived the failed attempt
    virtual FailureChoice askUpdateFailed(const std::string& message, int code, bool canRetryOnReboot) = 0;

    virtual bool askFinalizePending(const std::string& packagePath) = 0;

    // Non-intrusive notice from the background startup check
    virtual void showUpdateAvailable(const updater::UpdatePackage& pkg, const updater::Version& current) = 0;

    virtual bool confirmInstall(const updater::UpdatePackage& pkg, const updater::Version& current) = 0;

    // Source builds cannot self-update
    virtual bool confirmOpenReleasePage(const updater::UpdatePackage& pkg) = 0;

    virtual void showAlreadyRunning() = 0;

    virtual void showInfo(const std::string& title, const std::string& message) = 0;
    virtual void showError(const std::string& title, const std::string& message) = 0;
};

} // namespace ui
