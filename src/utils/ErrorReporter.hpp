#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, console, crash handler
    Configuration,  // TOML parsing, invalid values, command line
    Discovery,      // directory walk, registry listings
    ServiceControl, // sc.exe queries and actions
    Scheduler,      // schtasks.exe queries and actions
    ProcessControl, // snapshot, kill, wait
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but the run continues
    Fatal    // Run cannot continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short message for the operator
    std::string technical_details; // Details for the log file
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error funnel for the application layer
 *
 * Every report is written to plog at the matching severity and kept in a
 * bounded history so the run can be summarized at exit.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Configuration,
 *                              "Configuration file has errors",
 *                              "line 3: expected '='");
 *
 *   // At exit:
 *   PLOG_INFO << ErrorReporter::CountAtLeast(ErrorSeverity::Error) << " errors";
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    /**
     * @brief Copy of the retained reports, oldest first
     */
    static std::vector<ErrorReport> GetHistorySnapshot();

    /**
     * @brief Number of retained reports at or above `severity`
     */
    static size_t CountAtLeast(ErrorSeverity severity);

    /**
     * @brief Get the last error (for quick checks)
     */
    static ErrorReport GetLastError();

    static void ClearHistory();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    /**
     * @brief Get current timestamp as a formatted string
     */
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_history;
    static constexpr size_t MAX_HISTORY_SIZE = 100;
};

} // namespace utils
