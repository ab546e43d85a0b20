#include "app/Application.hpp"
#include "platform/ProcessUtils.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <string>
#include <vector>

int main(int argc, char** argv)
{
    int exitCode = 0;
    bool restart = false;
    std::vector<std::string> args;
    {
        Application app{ argc, argv };
        exitCode = app.run();
        restart = app.restartRequested();
        args = app.arguments();
    }

    // The application is torn down here, so the instance lock is free for the successor
    if (restart)
    {
        if (!utils::ProcessUtils::ReExec(utils::ProcessUtils::GetExecutablePath(), args))
        {
            PLOG_ERROR << "Restart failed";
            exitCode = 1;
        }
    }

    utils::LogManager::Shutdown();
    return exitCode;
}
