#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

class AutostartRegistrar;
class SettingsStore;
class SingleInstanceGuard;

namespace ui
{
class UserNotifier;
}

namespace updater
{
class UpdaterService;
struct CheckResult;
struct FetchResult;
} // namespace updater

namespace utils
{
class TaskLoop;
}

struct CommandLineOptions
{
    bool showVersion = false;
    bool checkUpdates = false; // manual check, confirm, download, install
    bool enableAutostart = false;
    bool disableAutostart = false;
    bool noUpdateCheck = false; // skip the startup check for this run
    std::filesystem::path configDir;
    std::vector<std::string> unknown;

    static CommandLineOptions Parse(const std::vector<std::string>& args);
};

class Application
{
public:
    static constexpr int kStartupCheckDelayMs = 3000;

    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

    // Set when the process must be re-executed in place; main() does it after teardown
    bool restartRequested() const { return restart_requested_; }
    const std::vector<std::string>& arguments() const { return args_; }

    static std::filesystem::path DefaultConfigDirectory();

private:
    bool initialize();
    bool initializeLogging();
    bool checkSingleInstance();
    void applyDeferredRenames();
    bool runVersionGate();
    void setupUpdater();
    void reconcileLastUpdate();
    void syncAutostart();
    void scheduleStartupCheck();

    void mainLoop();
    void handleQuitRequests();
    void cleanup();

    void onCheckFinished(const updater::CheckResult& result, bool manual);
    void onDownloadFinished(const updater::FetchResult& result);
    void openReleasePage();

    CommandLineOptions options_;
    std::vector<std::string> args_;
    std::filesystem::path config_dir_;
    int deferred_applied_ = 0;

    std::unique_ptr<SingleInstanceGuard> instance_guard_;
    std::unique_ptr<SettingsStore> settings_;
    std::unique_ptr<AutostartRegistrar> autostart_;
    std::unique_ptr<ui::UserNotifier> notifier_;
    std::unique_ptr<utils::TaskLoop> tasks_;
    std::unique_ptr<updater::UpdaterService> updater_service_;

    bool quit_requested_ = false;
    bool running_ = true;
    bool restart_requested_ = false;
    int exit_code_ = 0; // returned when startup stops early
};
