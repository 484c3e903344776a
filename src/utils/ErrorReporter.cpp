#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;
ErrorContext ErrorReporter::s_context;

std::string ErrorReport::describe() const
{
    std::string text = "[";
    text += ErrorReporter::SeverityToString(severity);
    text += "] ";
    text += ErrorReporter::CategoryToString(category);
    if (!context.stage.empty())
        text += " in " + context.stage;
    text += ": " + user_message;
    if (!technical_details.empty())
        text += " (" + technical_details + ")";
    return text;
}

ErrorReporter::RunScope::RunScope(std::string run_id)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    previous_ = std::exchange(s_context.run_id, std::move(run_id));
}

ErrorReporter::RunScope::~RunScope()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_context.run_id = std::move(previous_);
}

ErrorReporter::StageScope::StageScope(std::string stage)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    previous_ = std::exchange(s_context.stage, std::move(stage));
}

ErrorReporter::StageScope::~StageScope()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_context.stage = std::move(previous_);
}

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                           const std::string& technical_details)
{
    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.user_message = user_message;
    report.technical_details = technical_details;
    report.timestamp = utcTimestamp();

    std::lock_guard<std::mutex> lock(s_mutex);
    report.context = s_context;

    std::string log_msg = "[" + std::string(CategoryToString(category)) + "]";
    if (!report.context.run_id.empty())
        log_msg += "[" + report.context.run_id + "]";
    if (!report.context.stage.empty())
        log_msg += "[" + report.context.stage + "]";
    log_msg += " " + user_message;
    if (!technical_details.empty())
        log_msg += " | Details: " + technical_details;

    switch (severity)
    {
    case ErrorSeverity::Warning:
        PLOG_WARNING << log_msg;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << log_msg;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << log_msg;
        break;
    }

    s_error_queue.push_back(std::move(report));
    if (s_error_queue.size() > MAX_QUEUE_SIZE)
        s_error_queue.erase(s_error_queue.begin());
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    Report(category, ErrorSeverity::Fatal, user_message, technical_details);
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

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors;
    errors.swap(s_error_queue);
    return errors;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

ErrorContext ErrorReporter::CurrentContext()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_context;
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::Consistency:
        return "Consistency";
    case ErrorCategory::Reporting:
        return "Reporting";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::utcTimestamp()
{
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace utils
