#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

/**
 * @brief Sets up plog instances from the [logging] table of config.toml.
 *
 * Recognized keys: level (severity name or 0-6), directory, append, console.
 * Instance 0 is the application log; other subsystems register their own
 * instance id (see matching::Diagnostics::kLogInstance).
 */
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filename;                         // relative to the log directory
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // A missing file keeps defaults; a malformed [logging] table is reported and ignored
    static bool Initialize(const std::string& config_path = "config.toml");

    template <int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsConsoleEnabled();
    static const std::string& LogDirectory();

    // "debug", "warning", ... or "0".."6"; nullopt for anything else
    static std::optional<plog::Severity> ParseSeverity(const std::string& text);

private:
    LogManager() = default;

    static void ReadConfig(const std::string& config_path);
    static bool PrepareLogDirectory();

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_console;
    static std::string s_directory;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
