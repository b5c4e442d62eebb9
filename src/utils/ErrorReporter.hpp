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
    Initialization, // logging, startup wiring
    Configuration,  // TOML parsing, invalid config
    Gazetteer,      // reference data loading, generation builds
    Embedding,      // embedding provider failures
    LanguageModel,  // LLM extraction failures
    Matching,       // cascade stage failures
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // a capability degraded, matching continues
    Error,   // an operation failed, the previous state is kept
    Fatal    // the matcher cannot become ready
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message; // short, operator-facing
    std::string details; // provider error text, file paths, parse positions
    std::chrono::system_clock::time_point time{};
};

/**
 * @brief Process-wide record of degraded capabilities and failures.
 *
 * Every report is logged through plog and kept in a bounded queue so callers
 * (the --check report, tests, an embedding service) can tell why a signal is
 * missing without scraping log files:
 *
 * @code
 * ErrorReporter::ReportWarning(ErrorCategory::Embedding, "Embedding index unavailable", "HTTP 401");
 * for (const auto& report : ErrorReporter::Drain())
 *     ...
 * @endcode
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxQueued = 100;

    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& details = "");

    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");

    static bool HasPending();

    // Oldest first; empties the queue
    static std::vector<ErrorReport> Drain();

    // Queued reports at or above the given severity
    static std::size_t CountAtLeast(ErrorSeverity severity);

    static void Clear();

    static const char* ToString(ErrorCategory category);
    static const char* ToString(ErrorSeverity severity);

    // "2025-03-14 09:26:53" in local time
    static std::string FormatTime(std::chrono::system_clock::time_point time);

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
};

} // namespace utils
