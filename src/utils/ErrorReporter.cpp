#include "ErrorReporter.hpp"

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;

bool ErrorReport::countsAsFailure() const
{
    if (severity != ErrorSeverity::Warning)
        return true;

    switch (category)
    {
    case ErrorCategory::Network:
    case ErrorCategory::Transfer:
    case ErrorCategory::Permission:
        return true;
    default:
        return false;
    }
}

std::string ErrorReport::describe() const
{
    return details.empty() ? message : message + ": " + details;
}

const char* to_string(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Network:
        return "Network";
    case ErrorCategory::Transfer:
        return "Transfer";
    case ErrorCategory::Permission:
        return "Permission";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

void ErrorReporter::Report(ErrorReport report)
{
    report.time = std::chrono::system_clock::now();

    const plog::Severity level = report.severity == ErrorSeverity::Warning ? plog::warning
                                 : report.severity == ErrorSeverity::Error ? plog::error
                                                                           : plog::fatal;
    PLOG(level) << "[" << to_string(report.category) << "] " << report.describe();

    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.push_back(std::move(report));

    // Oldest reports go first when nobody drains the queue
    if (s_queue.size() > MAX_QUEUE_SIZE)
    {
        s_queue.erase(s_queue.begin());
    }
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report({ category, ErrorSeverity::Warning, message, {}, details, {} });
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report({ category, ErrorSeverity::Error, message, {}, details, {} });
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report({ category, ErrorSeverity::Fatal, message, {}, details, {} });
}

void ErrorReporter::ReportTransferFailure(const std::string& action, const std::string& file, const std::string& error)
{
    Report({ ErrorCategory::Transfer, ErrorSeverity::Error, "Failed to " + action + " " + file, file, error, {} });
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports;
    reports.swap(s_queue);
    return reports;
}

} // namespace utils
