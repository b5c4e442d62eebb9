#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../matching/Diagnostics.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
bool LogManager::s_console = false;
std::string LogManager::s_directory = "logs";
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    ReadConfig(config_path);
    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before LogManager::Initialize",
                                   config.name);
        return false;
    }
    if (plog::get<InstanceId>())
        return true;

    const std::string path = (std::filesystem::path(s_directory) / config.filename).string();
    try
    {
        if (!s_append_logs)
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
        auto& logger = plog::init<InstanceId>(config.level_override.value_or(s_default_level), file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot open log file for " + config.name,
                                   path + ": " + ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<matching::Diagnostics::kLogInstance>(const LoggerConfig&);

#if CMATCH_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsConsoleEnabled() { return s_console; }

const std::string& LogManager::LogDirectory() { return s_directory; }

std::optional<plog::Severity> LogManager::ParseSeverity(const std::string& text)
{
    if (text.size() == 1 && text[0] >= '0' && text[0] <= '6')
        return static_cast<plog::Severity>(text[0] - '0');

    std::string lower;
    for (char c : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "none")
        return plog::none;
    if (lower == "fatal")
        return plog::fatal;
    if (lower == "error")
        return plog::error;
    if (lower == "warning" || lower == "warn")
        return plog::warning;
    if (lower == "info")
        return plog::info;
    if (lower == "debug")
        return plog::debug;
    if (lower == "verbose" || lower == "trace")
        return plog::verbose;
    return std::nullopt;
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot create log directory",
                                   s_directory + ": " + ec.message());
        return false;
    }
    return true;
}

void LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return;

    toml::table root;
    try
    {
        root = toml::parse_file(config_path);
    }
    catch (const toml::parse_error& pe)
    {
        // ConfigManager reports the full parse error once logging is up
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(pe.description()));
        return;
    }

    const auto* logging = root["logging"].as_table();
    if (!logging)
        return;

    if (auto v = (*logging)["append"].value<bool>())
        s_append_logs = *v;
    if (auto v = (*logging)["console"].value<bool>())
        s_console = *v;
    if (auto v = (*logging)["directory"].value<std::string>(); v && !v->empty())
        s_directory = *v;

    const auto& level = (*logging)["level"];
    std::optional<plog::Severity> severity;
    if (auto name = level.value<std::string>())
        severity = ParseSeverity(*name);
    else if (auto number = level.value<int64_t>(); number && *number >= 0 && *number <= 6)
        severity = static_cast<plog::Severity>(*number);

    if (severity)
        s_default_level = *severity;
    else if (level)
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown logging level",
                                     "expected none|fatal|error|warning|info|debug|verbose or 0-6");
}

} // namespace utils
