#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::filesystem::path LogManager::s_log_dir = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::filesystem::path& configDir,
                            const std::optional<std::filesystem::path>& logDir)
{
    if (s_initialized)
        return true;

    s_settings = LoadSettings(configDir / "config.toml");
    s_log_dir = logDir.value_or(configDir / "logs");

    std::error_code ec;
    std::filesystem::create_directories(s_log_dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_log_dir.string() + ": " + ec.message());
        return false;
    }

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logging used before initialization", config.name);
        return false;
    }

    if (!config.append_override.value_or(s_settings.append))
    {
        std::ofstream truncate(config.filepath, std::ios::trunc);
    }

    try
    {
        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
        plog::Logger<InstanceId>& logger =
            plog::init<InstanceId>(config.level_override.value_or(s_settings.level), file.get());
        s_appenders.push_back(std::move(file));

        if (config.add_console_appender)
        {
            auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log " + config.filepath,
                                   ex.what());
        return false;
    }
    return true;
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    // plog holds raw appender pointers; mute it before they are destroyed
    if (auto* logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    s_appenders.clear();
    s_initialized = false;
}

LogManager::Settings LogManager::ParseSettings(const toml::table& config)
{
    Settings settings;
    settings.append = config["global"]["append_logs"].value_or(settings.append);

    std::int64_t level = config["app"]["debug"]["logging_level"].value_or(std::int64_t{ -1 });
    if (level >= plog::none && level <= plog::verbose)
        settings.level = static_cast<plog::Severity>(level);
    return settings;
}

const LogManager::Settings& LogManager::CurrentSettings() { return s_settings; }

std::filesystem::path LogManager::GetLogDirectory() { return s_log_dir; }

LogManager::Settings LogManager::LoadSettings(const std::filesystem::path& configPath)
{
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec))
        return {};

    try
    {
        return ParseSettings(toml::parse_file(configPath.string()));
    }
    catch (const toml::parse_error&)
    {
        // ConfigManager reports the broken file once logging is up
        return {};
    }
}

} // namespace utils
