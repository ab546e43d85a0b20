#pragma once

#include "UserNotifier.hpp"

namespace ui
{

// UserNotifier over the platform's own dialogs (utils::NativeMessageBox)
class NativeUserNotifier : public UserNotifier
{
public:
    void showUpdateSucceeded(const updater::Version& version) override;
    FailureChoice askUpdateFailed(const std::string& message, int code, bool canRetryOnReboot) override;
    bool askFinalizePending(const std::string& packagePath) override;
    void showUpdateAvailable(const updater::UpdatePackage& pkg, const updater::Version& current) override;
    bool confirmInstall(const updater::UpdatePackage& pkg, const updater::Version& current) override;
    bool confirmOpenReleasePage(const updater::UpdatePackage& pkg) override;
    void showAlreadyRunning() override;
    void showInfo(const std::string& title, const std::string& message) override;
    void showError(const std::string& title, const std::string& message) override;
};

} // namespace ui
