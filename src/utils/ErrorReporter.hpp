#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Initialization, // logging, config bootstrap
    Network,        // status poll, manifest fetch
    Transfer,       // per-file download/upload
    Permission,     // folder access, notification delivery
    Configuration,  // TOML parsing, invalid config
    Unknown
};

enum class ErrorSeverity
{
    Warning, // degraded, the operation carries on
    Error,   // the operation failed, siblings continue
    Fatal    // the command cannot run at all
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string message; // one line for the terminal
    std::string subject; // file, folder or URL the report is about, if any
    std::string details;
    std::chrono::system_clock::time_point time;

    // Whether this report makes a one-shot command exit non-zero. Network,
    // transfer and permission problems count even as warnings.
    bool countsAsFailure() const;

    // "message: details"
    std::string describe() const;
};

const char* to_string(ErrorCategory category);

/**
 * @brief Process-wide report queue
 *
 * Workers and the owner thread report here; every report is logged through
 * plog and queued (newest 100 kept) until the front end drains it.
 */
class ErrorReporter
{
public:
    static void Report(ErrorReport report);

    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "");

    // action is "pull", "upload", "download"...; file becomes the subject
    static void ReportTransferFailure(const std::string& action, const std::string& file, const std::string& error);

    // Takes every queued report, oldest first
    static std::vector<ErrorReport> GetPendingErrors();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
