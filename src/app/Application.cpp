#include "Application.hpp"
#include "app/Version.hpp"
#include "config/SettingsStore.hpp"
#include "platform/AutostartRegistrar.hpp"
#include "platform/DeferredRename.hpp"
#include "platform/ProcessUtils.hpp"
#include "platform/SingleInstanceGuard.hpp"
#include "ui/NativeUserNotifier.hpp"
#include "updater/OutcomeReconciler.hpp"
#include "updater/UpdaterService.hpp"
#include "updater/Version.hpp"
#include "updater/VersionGate.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/TaskLoop.hpp"

#include <plog/Log.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <clocale>
#endif

namespace fs = std::filesystem;

namespace
{

std::atomic<bool> g_signal_quit{ false };

void OnTerminationSignal(int) { g_signal_quit = true; }

// Arguments that describe a one-shot action and must not be repeated by a relaunch
bool IsOneShotArgument(const std::string& arg)
{
    return arg == "--check-updates" || arg == "--enable-autostart" || arg == "--disable-autostart";
}

} // namespace

CommandLineOptions CommandLineOptions::Parse(const std::vector<std::string>& args)
{
    CommandLineOptions options;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--version")
            options.showVersion = true;
        else if (arg == "--check-updates")
            options.checkUpdates = true;
        else if (arg == "--enable-autostart")
            options.enableAutostart = true;
        else if (arg == "--disable-autostart")
            options.disableAutostart = true;
        else if (arg == "--no-update-check")
            options.noUpdateCheck = true;
        else if (arg == "--config-dir" && i + 1 < args.size())
            options.configDir = args[++i];
        else if (arg.rfind("--config-dir=", 0) == 0)
            options.configDir = arg.substr(std::string("--config-dir=").size());
        else
            options.unknown.push_back(arg);
    }
    return options;
}

Application::Application(int argc, char** argv)
    : notifier_(std::make_unique<ui::NativeUserNotifier>())
    , tasks_(std::make_unique<utils::TaskLoop>())
{
    for (int i = 1; i < argc; ++i)
    {
        args_.emplace_back(argv[i]);
    }
    options_ = CommandLineOptions::Parse(args_);
}

Application::~Application() { cleanup(); }

fs::path Application::DefaultConfigDirectory()
{
#ifdef _WIN32
    if (const char* appData = std::getenv("APPDATA"); appData && *appData)
        return fs::path(appData) / "CrossTrans";
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return fs::path(xdg) / "crosstrans";
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".config" / "crosstrans";
#endif
    return utils::ProcessUtils::GetExecutablePath().parent_path();
}

int Application::run()
{
    if (options_.showVersion)
    {
        std::cout << "CrossTrans " << CROSSTRANS_VERSION_STRING << std::endl;
        return 0;
    }

    if (!initialize())
    {
        return exit_code_;
    }

    mainLoop();
    return 0;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    quit_requested_ = true;
}

bool Application::initialize()
{
    config_dir_ = options_.configDir.empty() ? DefaultConfigDirectory() : options_.configDir;
    std::error_code ec;
    fs::create_directories(config_dir_, ec);

    if (!checkSingleInstance())
        return false;

    if (!initializeLogging())
    {
        exit_code_ = 1;
        return false;
    }

    PLOG_INFO << "CrossTrans " << CROSSTRANS_VERSION_STRING << " starting (config " << config_dir_.string() << ")";
    for (const auto& arg : options_.unknown)
    {
        PLOG_WARNING << "Ignoring unknown argument: " << arg;
    }

    applyDeferredRenames();
    if (deferred_applied_ > 0)
    {
        // The executable was replaced on disk; continue in the new image
        restart_requested_ = true;
        return false;
    }

    settings_ = std::make_unique<SettingsStore>(config_dir_ / "config.toml");
    if (!settings_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            settings_->lastError());
    }

    if (!runVersionGate())
        return false;

    setupUpdater();
    reconcileLastUpdate();
    syncAutostart();
    scheduleStartupCheck();

    std::signal(SIGINT, OnTerminationSignal);
    std::signal(SIGTERM, OnTerminationSignal);
    return true;
}

bool Application::checkSingleInstance()
{
    bool alreadyRunning = false;
    instance_guard_ = SingleInstanceGuard::Acquire(SingleInstanceGuard::kDefaultPort, &alreadyRunning);
    if (instance_guard_)
        return true;

    if (alreadyRunning)
    {
        notifier_->showAlreadyRunning();
        return false;
    }

    // The lock itself is broken; run unguarded rather than not at all
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                        "Could not verify that CrossTrans runs only once",
                                        "Single instance port unavailable");
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_dir_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    fs::path logDir = utils::LogManager::GetLogDirectory();
    utils::LogManager::LoggerConfig config{ .name = "main",
                                            .filepath = (logDir / "run.log").string(),
                                            .append_override = std::nullopt,
                                            .level_override = std::nullopt,
                                            .max_file_size = 10 * 1024 * 1024,
                                            .backup_count = 3,
                                            .add_console_appender = true };
    bool registered = utils::LogManager::RegisterLogger<0>(config);
    if (!registered)
        return false;

    if (!utils::ErrorReporter::InitializeLogFile((logDir / "errors.log").string()))
        PLOG_WARNING << "Error reports will only reach run.log";

#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    std::setlocale(LC_ALL, ".UTF-8");
#endif

    return true;
}

void Application::applyDeferredRenames()
{
    utils::DeferredRename deferred(config_dir_ / utils::DeferredRename::kJournalFileName);
    if (!deferred.hasPending())
        return;

    deferred_applied_ = deferred.applyPending();
    PLOG_INFO << "Applied " << deferred_applied_ << " deferred replacement(s)";
    if (deferred.hasPending())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Installation,
                                            "A scheduled update could not be applied yet",
                                            "Pending entries remain in " + deferred.journalPath().string());
    }
}

bool Application::runVersionGate()
{
    fs::path exeDir = utils::ProcessUtils::GetExecutablePath().parent_path();
    updater::VersionGate gate(*settings_, { config_dir_ / "cache", exeDir / "cache" });

    auto outcome = gate.checkAndMaybeRestart(updater::Version(CROSSTRANS_VERSION_STRING),
                                             settings_->snapshot().lastRunVersion);
    if (outcome == updater::GateOutcome::Restart)
    {
        PLOG_INFO << "Restarting after version change";
        restart_requested_ = true;
        return false;
    }
    return true;
}

void Application::setupUpdater()
{
    updater::UpdaterOptions opts;
    opts.logDir = utils::LogManager::GetLogDirectory();
    for (const auto& arg : args_)
    {
        if (!IsOneShotArgument(arg))
            opts.relaunchArgs.push_back(arg);
    }

    updater_service_ = std::make_unique<updater::UpdaterService>(*settings_, std::move(opts));
    updater_service_->initialize(CROSSTRANS_GITHUB_OWNER, CROSSTRANS_GITHUB_REPO,
                                 updater::Version(CROSSTRANS_VERSION_STRING));
}

void Application::reconcileLastUpdate()
{
    updater::ReconcileActions actions;
    actions.scheduleOnReboot = [this](const fs::path& packagePath, std::string& outError)
    { return updater_service_->scheduleReplaceOnReboot(packagePath, outError); };
    actions.isRenamePending = [this](const fs::path& directory)
    { return utils::DeferredRename(config_dir_ / utils::DeferredRename::kJournalFileName).hasPendingFrom(directory); };
    actions.openReleasePage = [this]() { openReleasePage(); };
    actions.recordInstall = [this](bool success)
    {
        if (!settings_->recordInstall(success))
            PLOG_WARNING << "Could not persist install statistics";
    };
    actions.postDelayed = [this](std::chrono::milliseconds delay, std::function<void()> task)
    { tasks_->postDelayed(delay, std::move(task)); };

    updater::OutcomeReconciler reconciler(updater::StatusMarkers(), *notifier_, std::move(actions));
    auto report = reconciler.reconcile(updater::Version(CROSSTRANS_VERSION_STRING));
    if (report.outcome != updater::ReconcileOutcome::Nothing)
    {
        PLOG_INFO << "Last update: " << updater::toString(report.outcome);
    }
}

void Application::syncAutostart()
{
    autostart_ = std::make_unique<AutostartRegistrar>();

    // The OS registration is authoritative; the setting only mirrors it
    bool wanted = autostart_->isEnabled();
    if (options_.enableAutostart)
        wanted = true;
    else if (options_.disableAutostart)
        wanted = false;

    std::string error;
    if (wanted || autostart_->isEnabled())
    {
        // Re-registering refreshes the command in case the executable moved
        if (!autostart_->setEnabled(wanted, error))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Autostart, "Could not update launch at login",
                                                error);
        }
    }

    bool live = autostart_->isEnabled();
    if (settings_->snapshot().autostart != live && !settings_->modify([live](AppSettings& s) { s.autostart = live; }))
    {
        PLOG_WARNING << "Could not save the launch at login setting";
    }
    PLOG_INFO << "Launch at login: " << (live ? "enabled" : "disabled");
}

void Application::scheduleStartupCheck()
{
    if (options_.checkUpdates)
    {
        tasks_->post(
            [this]()
            {
                updater_service_->checkForUpdatesAsync([this](const updater::CheckResult& result)
                                                       { tasks_->post([this, result]() { onCheckFinished(result, true); }); });
            });
        return;
    }

    if (options_.noUpdateCheck || !settings_->snapshot().autoCheckUpdates)
    {
        PLOG_INFO << "Startup update check disabled";
        return;
    }

    tasks_->postDelayed(std::chrono::milliseconds(kStartupCheckDelayMs),
                        [this]()
                        {
                            updater_service_->checkForUpdatesAsync(
                                [this](const updater::CheckResult& result)
                                { tasks_->post([this, result]() { onCheckFinished(result, false); }); });
                        });
}

void Application::onCheckFinished(const updater::CheckResult& result, bool manual)
{
    using Status = updater::CheckResult::Status;
    auto current = updater::Version(CROSSTRANS_VERSION_STRING);

    if (!manual)
    {
        // Background checks stay silent unless there is something to install
        if (result.status == Status::Available)
            notifier_->showUpdateAvailable(result.package, current);
        return;
    }

    switch (result.status)
    {
    case Status::NoUpdate:
        notifier_->showInfo("CrossTrans Update", "CrossTrans " + current.toString() + " is up to date.");
        requestExit();
        return;
    case Status::CheckFailed:
        notifier_->showError("CrossTrans Update", "Could not check for updates: " + result.error.message);
        requestExit();
        return;
    case Status::Available:
        break;
    }

    if (!updater_service_->canSelfUpdate())
    {
        if (notifier_->confirmOpenReleasePage(result.package))
            openReleasePage();
        requestExit();
        return;
    }

    if (!notifier_->confirmInstall(result.package, current))
    {
        PLOG_INFO << "Update to " << result.package.version.toString() << " declined";
        requestExit();
        return;
    }

    auto lastLogged = std::make_shared<std::atomic<int>>(-10);
    bool started = updater_service_->startDownload(
        [lastLogged](const updater::DownloadProgress& progress)
        {
            int step = progress.percentage / 10 * 10;
            if (step > lastLogged->load())
            {
                lastLogged->store(step);
                PLOG_INFO << "Downloading update: " << progress.percentage << "%";
            }
        },
        [this](const updater::FetchResult& fetched) { tasks_->post([this, fetched]() { onDownloadFinished(fetched); }); });
    if (!started)
    {
        notifier_->showError("CrossTrans Update", "The download could not be started.");
        requestExit();
    }
}

void Application::onDownloadFinished(const updater::FetchResult& result)
{
    if (!result.success)
    {
        if (result.errorKind != updater::FetchErrorKind::Cancelled)
        {
            notifier_->showError("CrossTrans Update", "The update could not be downloaded: " + result.error.message);
        }
        requestExit();
        return;
    }

    std::string error;
    if (!updater_service_->applyUpdate(error))
    {
        notifier_->showError("CrossTrans Update", "The update could not be started: " + error);
        requestExit();
        return;
    }

    // The installer waits for this process to disappear
    PLOG_INFO << "Installer started, exiting";
    requestExit();
}

void Application::openReleasePage()
{
    std::string url = updater_service_ ? updater_service_->releasesPageUrl()
                                       : std::string("https://github.com/") + CROSSTRANS_GITHUB_OWNER + "/" +
                                             CROSSTRANS_GITHUB_REPO + "/releases/latest";
    if (!utils::ProcessUtils::OpenUrl(url))
    {
        notifier_->showInfo("CrossTrans Update", "Download the latest version from:\n" + url);
    }
}

void Application::mainLoop()
{
    while (running_)
    {
        tasks_->runOnce(std::chrono::milliseconds(100));

        if (g_signal_quit)
            requestExit();

        handleQuitRequests();
    }
}

void Application::handleQuitRequests()
{
    if (!quit_requested_)
        return;

    if (updater_service_)
    {
        updater_service_->shutdown();
    }
    running_ = false;
}

void Application::cleanup()
{
    if (updater_service_)
    {
        updater_service_->shutdown();
        updater_service_.reset();
    }
    instance_guard_.reset();
    PLOG_INFO << "CrossTrans shut down";
}
