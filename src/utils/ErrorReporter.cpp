#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_recent;
std::size_t ErrorReporter::s_error_count = 0;
std::string ErrorReporter::s_log_path;

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                           const std::string& technical_details)
{
    ErrorReport report{ category, severity, user_message, technical_details, GetTimestamp() };

    if (severity == ErrorSeverity::Error)
    {
        PLOG_ERROR << "[" << CategoryToString(category) << "] " << user_message
                   << (technical_details.empty() ? "" : " | ") << technical_details;
    }
    else
    {
        PLOG_WARNING << "[" << CategoryToString(category) << "] " << user_message
                     << (technical_details.empty() ? "" : " | ") << technical_details;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    if (severity == ErrorSeverity::Error)
        ++s_error_count;
    WriteLineLocked(report);
    if (s_recent.size() >= kMaxRecent)
        s_recent.erase(s_recent.begin());
    s_recent.push_back(std::move(report));
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    Report(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    Report(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::InitializeLogFile(const std::string& path)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::ofstream ofs(path, std::ios::app);
    if (!ofs)
    {
        PLOG_WARNING << "Cannot open error log " << path;
        s_log_path.clear();
        return false;
    }
    s_log_path = path;
    ofs << "\n=== Run started " << GetTimestamp() << " ===\n";
    return true;
}

std::vector<ErrorReport> ErrorReporter::RecentReports()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_recent;
}

std::size_t ErrorReporter::ErrorCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_count;
}

void ErrorReporter::Reset()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_recent.clear();
    s_error_count = 0;
    s_log_path.clear();
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Update:
        return "Update";
    case ErrorCategory::Network:
        return "Network";
    case ErrorCategory::Installation:
        return "Installation";
    case ErrorCategory::Autostart:
        return "Autostart";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    return severity == ErrorSeverity::Error ? "Error" : "Warning";
}

std::string ErrorReporter::GetTimestamp()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void ErrorReporter::WriteLineLocked(const ErrorReport& report)
{
    if (s_log_path.empty())
        return;

    std::ofstream ofs(s_log_path, std::ios::app);
    if (!ofs)
        return;

    ofs << "[" << report.timestamp << "] [" << CategoryToString(report.category) << "] ["
        << SeverityToString(report.severity) << "] " << report.user_message;
    if (!report.technical_details.empty())
        ofs << " | " << report.technical_details;
    ofs << '\n';
}

} // namespace utils
