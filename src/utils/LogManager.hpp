#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>
#include <toml++/toml.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns the plog appenders for the process. Both executables call Initialize once,
// register their file logger, and call Shutdown on the way out.
class LogManager
{
public:
    // Logging knobs read from config.toml
    struct Settings
    {
        bool append = true;                   // [global] append_logs
        plog::Severity level = plog::info;    // [app.debug] logging_level, 0 (none) .. 6 (verbose)
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Loads Settings from <configDir>/config.toml and creates the log directory
    // (<configDir>/logs unless given). Calling it again is a no-op.
    static bool Initialize(const std::filesystem::path& configDir,
                           const std::optional<std::filesystem::path>& logDir = std::nullopt);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static Settings ParseSettings(const toml::table& config);
    static const Settings& CurrentSettings();
    static std::filesystem::path GetLogDirectory();

private:
    LogManager() = default;

    static Settings LoadSettings(const std::filesystem::path& configPath);

    static bool s_initialized;
    static Settings s_settings;
    static std::filesystem::path s_log_dir;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
