#include "platform/ProcessUtils.hpp"
#include "updater/InstallPlan.hpp"
#include "updater/InstallRoutine.hpp"
#include "updater/StatusMarkers.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace
{

// update.log goes next to the application logs when the plan names them, otherwise into the
// download directory so a failed attempt stays diagnosable
void InitializeLogging(const updater::InstallPlan& plan, const fs::path& planPath)
{
    std::error_code ec;
    fs::path logDir = plan.logDir;
    if (logDir.empty() || !fs::is_directory(logDir, ec))
        logDir = plan.tempDir.empty() ? planPath.parent_path() : fs::path(plan.tempDir);

    fs::path configDir = plan.logDir.empty() ? logDir : fs::path(plan.logDir).parent_path();
    if (!utils::LogManager::Initialize(configDir, logDir))
    {
        std::cerr << "crosstrans-installer: logging unavailable in " << logDir.string() << "\n";
        return;
    }
    utils::LogManager::LoggerConfig config{ .name = "installer",
                                            .filepath = (logDir / "update.log").string(),
                                            .append_override = true,
                                            .level_override = plog::debug,
                                            .max_file_size = 1024 * 1024,
                                            .backup_count = 1,
                                            .add_console_appender = false };
    bool registered = utils::LogManager::RegisterLogger<0>(config);
    if (!registered)
        std::cerr << "crosstrans-installer: cannot open " << (logDir / "update.log").string() << "\n";
}

// Last resort once the plan is known: record the failure and bring the application back
int RecoverFromCrash(const updater::InstallPlan& plan, const std::string& what)
{
    std::cerr << "crosstrans-installer: " << what << "\n";
    try
    {
        PLOG_FATAL << "Installer failed: " << what;

        updater::StatusMarkers markers(plan.markerDir.empty() ? updater::StatusMarkers::DefaultDirectory()
                                                              : fs::path(plan.markerDir));
        std::string error;
        if (!markers.writeError("Installer stopped unexpectedly: " + what,
                                updater::toCode(updater::InstallErrorKind::Unexpected), error))
        {
            std::cerr << "crosstrans-installer: " << error << "\n";
        }

        std::error_code ec;
        if (fs::is_regular_file(plan.installPath, ec) &&
            !utils::ProcessUtils::LaunchProcess(plan.installPath, plan.relaunchArgs, utils::LaunchMode::Detached,
                                                fs::path(plan.installPath).parent_path()))
        {
            std::cerr << "crosstrans-installer: could not relaunch " << plan.installPath << "\n";
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "crosstrans-installer: recovery failed: " << e.what() << "\n";
    }
    return 1;
}

int Usage()
{
    std::cerr << "usage: crosstrans-installer --plan <install_plan.json>\n";
    return 2;
}

} // namespace

int main(int argc, char** argv)
{
    fs::path planPath;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--plan" && i + 1 < argc)
            planPath = argv[++i];
        else
            return Usage();
    }
    if (planPath.empty())
        return Usage();

    updater::InstallPlan plan;
    std::string error;
    if (!updater::InstallPlan::loadFromFile(planPath, plan, error))
    {
        // Without a plan there is nothing to roll back; report through the default marker location
        std::cerr << "crosstrans-installer: " << error << "\n";
        updater::StatusMarkers markers;
        std::string markerError;
        if (!markers.writeError("Invalid install plan: " + error, updater::toCode(updater::InstallErrorKind::InvalidPlan),
                                markerError))
        {
            std::cerr << "crosstrans-installer: " << markerError << "\n";
        }
        return 2;
    }

    updater::InstallOutcome outcome;
    try
    {
        InitializeLogging(plan, planPath);
        PLOG_INFO << "crosstrans-installer started with plan " << planPath.string();

        updater::InstallRoutine routine(plan);
        outcome = routine.run();
    }
    catch (const std::exception& e)
    {
        int code = RecoverFromCrash(plan, e.what());
        utils::LogManager::Shutdown();
        return code;
    }

    if (outcome.success)
    {
        PLOG_INFO << "Install finished: CrossTrans " << plan.newVersion.toString();
    }
    else
    {
        PLOG_ERROR << "Install aborted (" << updater::toString(outcome.errorKind) << "): " << outcome.message
                   << (outcome.rolledBack ? ", previous version restored" : "")
                   << (outcome.relaunched ? ", application relaunched" : "");
    }

    utils::LogManager::Shutdown();
    return outcome.success ? 0 : 1;
}
