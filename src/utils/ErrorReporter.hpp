#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, single instance, crash handler
    Configuration,  // config.toml, template images
    ScreenCapture,  // desktop grab
    Detection,      // template matching
    AudioSession,   // WASAPI sessions and click fallback
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // degraded, keeps running
    Error,   // an operation failed
    Fatal    // startup cannot continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;
    std::string technical_details;
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

// Process-wide sink for problems found by startup code, the detector and
// the actuators. Each report goes to plog immediately and is kept in a
// bounded queue; the shell drains it to explain a failed startup on stderr.
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Drains the queue, oldest first
    static std::vector<ErrorReport> GetPendingErrors();

    // Most recent queued report, or a default report when empty
    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    // Local time, "YYYY-MM-DD HH:MM:SS"
    static std::string GetTimestamp();

    static constexpr std::size_t MAX_QUEUE_SIZE = 100;

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
};

} // namespace utils
