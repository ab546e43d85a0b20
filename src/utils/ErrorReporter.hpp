#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // startup, single instance guard, version gate
    Configuration,  // TOML parsing, settings persistence
    Update,         // update check and state machine
    Network,        // release query, package download
    Installation,   // install hand-off and external routine
    Autostart,      // login registration
    Unknown
};

enum class ErrorSeverity
{
    Warning, // degraded, the run continues
    Error    // the operation failed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string user_message;      // what the user would be told
    std::string technical_details; // what goes into the logs
    std::string timestamp;
};

/**
 * @brief Process-wide sink for failures that are not worth a dialog
 *
 * Every report goes to plog and, once InitializeLogFile has been called, is
 * appended as one line to errors.log. The most recent reports are kept in
 * memory so a failure dialog can attach them.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Autostart,
 *                                "Could not update launch at login",
 *                                "RegSetValueExW failed: 5");
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxRecent = 50;

    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    /**
     * @brief Start mirroring reports into a plain text file
     *
     * Writes a run separator so consecutive runs stay distinguishable.
     * @return false if the file cannot be opened; reports still reach plog
     */
    static bool InitializeLogFile(const std::string& path);

    // Oldest first, at most kMaxRecent entries
    static std::vector<ErrorReport> RecentReports();
    static std::size_t ErrorCount();
    static void Reset();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static void WriteLineLocked(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_recent;
    static std::size_t s_error_count;
    static std::string s_log_path;
};

} // namespace utils
