#pragma once

#include "ui/UserNotifier.hpp"

#include <string>
#include <vector>

namespace test_utils {

// Records every notification and answers questions with preset choices
class FakeNotifier : public ui::UserNotifier {
public:
    FailureChoice failureChoice = FailureChoice::Dismiss;
    bool finalizePending = false;
    bool installConfirmed = false;
    bool openReleasePage = false;

    std::vector<updater::Version> succeeded;
    struct FailurePrompt {
        std::string message;
        int code = 0;
        bool canRetryOnReboot = false;
    };
    std::vector<FailurePrompt> failures;
    std::vector<std::string> pendingPrompts;
    std::vector<updater::Version> available;
    int installPrompts = 0;
    int alreadyRunning = 0;
    std::vector<std::string> infos;
    std::vector<std::string> errors;

    void showUpdateSucceeded(const updater::Version& version) override { succeeded.push_back(version); }

    FailureChoice askUpdateFailed(const std::string& message, int code, bool canRetryOnReboot) override {
        failures.push_back({ message, code, canRetryOnReboot });
        return failureChoice;
    }

    bool askFinalizePending(const std::string& packagePath) override {
        pendingPrompts.push_back(packagePath);
        return finalizePending;
    }

    void showUpdateAvailable(const updater::UpdatePackage& pkg, const updater::Version&) override {
        available.push_back(pkg.version);
    }

    bool confirmInstall(const updater::UpdatePackage&, const updater::Version&) override {
        ++installPrompts;
        return installConfirmed;
    }

    bool confirmOpenReleasePage(const updater::UpdatePackage&) override { return openReleasePage; }

    void showAlreadyRunning() override { ++alreadyRunning; }

    void showInfo(const std::string& title, const std::string& message) override {
        infos.push_back(title + ": " + message);
    }

    void showError(const std::string& title, const std::string& message) override {
        errors.push_back(title + ": " + message);
    }
};

}  // namespace test_utils
