#include <catch2/catch_test_macros.hpp>

#include "utils/ErrorReporter.hpp"
#include "temp_dir.hpp"

#include <string>

using utils::ErrorCategory;
using utils::ErrorReporter;
using utils::ErrorSeverity;

TEST_CASE("Error reporter keeps recent reports and mirrors them to a file", "[utils][errors]") {
    ErrorReporter::Reset();
    test_utils::TempDir dir("errors");
    std::string logPath = (dir / "errors.log").string();

    SECTION("Reports are recorded oldest first") {
        ErrorReporter::ReportWarning(ErrorCategory::Autostart, "Could not update launch at login", "denied");
        ErrorReporter::ReportError(ErrorCategory::Network, "Download failed");

        auto recent = ErrorReporter::RecentReports();
        REQUIRE(recent.size() == 2);
        REQUIRE(recent[0].category == ErrorCategory::Autostart);
        REQUIRE(recent[0].severity == ErrorSeverity::Warning);
        REQUIRE(recent[0].technical_details == "denied");
        REQUIRE(recent[1].severity == ErrorSeverity::Error);
        REQUIRE_FALSE(recent[1].timestamp.empty());
        REQUIRE(ErrorReporter::ErrorCount() == 1);
    }

    SECTION("Only the newest reports are kept") {
        for (std::size_t i = 0; i < ErrorReporter::kMaxRecent + 5; ++i) {
            ErrorReporter::ReportWarning(ErrorCategory::Update, "warning " + std::to_string(i));
        }
        auto recent = ErrorReporter::RecentReports();
        REQUIRE(recent.size() == ErrorReporter::kMaxRecent);
        REQUIRE(recent.front().user_message == "warning 5");
    }

    SECTION("Log file gets one line per report") {
        REQUIRE(ErrorReporter::InitializeLogFile(logPath));
        ErrorReporter::ReportError(ErrorCategory::Installation, "Installer failed", "exit 3");

        std::string contents = test_utils::readFile(dir / "errors.log");
        REQUIRE(contents.find("=== Run started") != std::string::npos);
        REQUIRE(contents.find("[Installation] [Error] Installer failed | exit 3") != std::string::npos);
    }

    SECTION("Unwritable log path is refused") {
        REQUIRE_FALSE(ErrorReporter::InitializeLogFile((dir / "missing/dir/errors.log").string()));
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "still recorded");
        REQUIRE(ErrorReporter::RecentReports().size() == 1);
    }

    ErrorReporter::Reset();
}
