#include "ErrorReporter.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const std::string& details)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << "[" << ToString(category) << "] " << message << (details.empty() ? "" : " | ") << details;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << "[" << ToString(category) << "] " << message << (details.empty() ? "" : " | ") << details;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << "[" << ToString(category) << "] " << message << (details.empty() ? "" : " | ") << details;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << "[" << ToString(category) << "] " << message << (details.empty() ? "" : " | ") << details;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_queue.size() >= kMaxQueued)
        s_queue.erase(s_queue.begin());
    s_queue.push_back(ErrorReport{ category, severity, message, details, std::chrono::system_clock::now() });
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Fatal, message, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, message, details);
}

bool ErrorReporter::HasPending()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::Drain()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> out;
    out.swap(s_queue);
    return out;
}

std::size_t ErrorReporter::CountAtLeast(ErrorSeverity severity)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return static_cast<std::size_t>(std::count_if(s_queue.begin(), s_queue.end(),
                                                  [severity](const ErrorReport& r) { return r.severity >= severity; }));
}

void ErrorReporter::Clear()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
}

const char* ErrorReporter::ToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "initialization";
    case ErrorCategory::Configuration:
        return "configuration";
    case ErrorCategory::Gazetteer:
        return "gazetteer";
    case ErrorCategory::Embedding:
        return "embedding";
    case ErrorCategory::LanguageModel:
        return "language_model";
    case ErrorCategory::Matching:
        return "matching";
    case ErrorCategory::Unknown:
        break;
    }
    return "unknown";
}

const char* ErrorReporter::ToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "info";
    case ErrorSeverity::Warning:
        return "warning";
    case ErrorSeverity::Error:
        return "error";
    case ErrorSeverity::Fatal:
        return "fatal";
    }
    return "unknown";
}

std::string ErrorReporter::FormatTime(std::chrono::system_clock::time_point time)
{
    const auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
