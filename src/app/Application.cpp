#include "Application.hpp"

#include "../config/ConfigManager.hpp"
#include "../extract/OpenAILocationExtractor.hpp"
#include "../gazetteer/GazetteerLoader.hpp"
#include "../matching/CommuneMatcher.hpp"
#include "../matching/Diagnostics.hpp"
#include "../matching/MatchResultJson.hpp"
#include "../provider/OpenAIEmbeddingProvider.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../utils/Profile.hpp"

#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitDataUnavailable = 1;
constexpr int kExitUsage = 2;

std::optional<double> parseUnit(const std::string& text)
{
    try
    {
        std::size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size() || v < 0.0 || v > 1.0)
            return std::nullopt;
        return v;
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

std::optional<std::size_t> parseCount(const std::string& text)
{
    try
    {
        std::size_t used = 0;
        long long v = std::stoll(text, &used);
        if (used != text.size() || v <= 0)
            return std::nullopt;
        return static_cast<std::size_t>(v);
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

} // anonymous namespace

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application() = default;

void Application::printUsage(std::ostream& out)
{
    out << "Usage: comuna_match [options] [query...]\n"
        << "  --config FILE    configuration file (default: config.toml)\n"
        << "  --data FILE      commune reference data (overrides [gazetteer] path)\n"
        << "  --threshold X    relaxed fuzzy acceptance threshold in [0, 1]\n"
        << "  --suggest N      print up to N suggested communes instead of the match result\n"
        << "  --verbose        trace every cascade stage to logs/matching.log\n"
        << "  --check          test the configured providers and exit\n"
        << "Queries are read from stdin, one per line, when none are given.\n";
}

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        std::cerr << "comuna_match: " << usage_error_ << "\n";
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (options_.help)
    {
        printUsage(std::cout);
        return kExitOk;
    }

    if (!initializeLogging())
        return kExitUsage;

    initializeConfig();

    if (options_.check)
        return checkProviders();

    if (!buildMatcher())
        return kExitDataUnavailable;

    if (!options_.queries.empty())
    {
        for (const auto& query : options_.queries)
            handleQuery(query);
    }
    else
    {
        std::string line;
        while (std::getline(std::cin, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            reloadIfConfigChanged();
            handleQuery(line);
        }
    }

    utils::LogManager::Shutdown();
    return kExitOk;
}

bool Application::parseCommandLineArgs()
{
    for (std::size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        auto value = [&](const char* flag) -> std::optional<std::string>
        {
            if (i + 1 >= args_.size())
            {
                usage_error_ = std::string(flag) + " requires a value";
                return std::nullopt;
            }
            return args_[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            options_.help = true;
        }
        else if (arg == "--config")
        {
            auto v = value("--config");
            if (!v)
                return false;
            options_.config_path = *v;
        }
        else if (arg == "--data")
        {
            auto v = value("--data");
            if (!v)
                return false;
            options_.data_path = *v;
        }
        else if (arg == "--threshold")
        {
            auto v = value("--threshold");
            if (!v)
                return false;
            options_.threshold = parseUnit(*v);
            if (!options_.threshold)
            {
                usage_error_ = "--threshold expects a number in [0, 1], got '" + *v + "'";
                return false;
            }
        }
        else if (arg == "--suggest")
        {
            auto v = value("--suggest");
            if (!v)
                return false;
            options_.suggest = parseCount(*v);
            if (!options_.suggest)
            {
                usage_error_ = "--suggest expects a positive integer, got '" + *v + "'";
                return false;
            }
        }
        else if (arg == "--verbose")
        {
            options_.verbose = true;
        }
        else if (arg == "--check")
        {
            options_.check = true;
        }
        else if (arg == "--")
        {
            options_.queries.insert(options_.queries.end(), args_.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                                    args_.end());
            break;
        }
        else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
        {
            usage_error_ = "unknown option " + arg;
            return false;
        }
        else
        {
            options_.queries.push_back(arg);
        }
    }
    return true;
}

bool Application::initializeLogging()
{
    CMATCH_PROFILE_FUNCTION();

    if (!utils::LogManager::Initialize(options_.config_path))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        std::cerr << "comuna_match: failed to initialize logging\n";
        return false;
    }

    using utils::LogManager;
    if (!LogManager::RegisterLogger<0>({ .name = "main",
                                        .filename = "comuna_match.log",
                                        .add_console_appender = LogManager::IsConsoleEnabled() }))
    {
        std::cerr << "comuna_match: cannot open " << LogManager::LogDirectory() << "/comuna_match.log\n";
        return false;
    }

    if (!LogManager::RegisterLogger<matching::Diagnostics::kLogInstance>(
            { .name = "matching", .filename = "matching.log", .level_override = plog::debug }))
    {
        PLOG_WARNING << "Cascade trace log unavailable; verbose tracing is disabled";
        options_.verbose = false;
    }

#if CMATCH_PROFILING_LEVEL >= 1
    if (!LogManager::RegisterLogger<profiling::kProfilingLogInstance>(
            { .name = "profiling", .filename = "profiling.log", .level_override = plog::debug }))
    {
        PLOG_WARNING << "Profiling log unavailable";
    }
#endif

    return true;
}

void Application::initializeConfig()
{
    CMATCH_PROFILE_FUNCTION();

    config_ = std::make_unique<ConfigManager>(options_.config_path);
    if (!registerMatcherSettings(*config_, settings_))
        PLOG_ERROR << "Matcher settings registration failed: " << config_->lastError();

    if (!config_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            config_->lastError());
    }

    if (options_.threshold)
        settings_.matching.confidence_threshold = *options_.threshold;
    applyDiagnostics();
}

void Application::applyDiagnostics()
{
    matching::Diagnostics::SetVerbose(options_.verbose || settings_.verbose);
    matching::Diagnostics::SetMaxPreview(settings_.max_preview);
}

std::string Application::dataPath() const
{
    return options_.data_path.value_or(settings_.gazetteer_path);
}

bool Application::buildMatcher()
{
    CMATCH_PROFILE_FUNCTION();

    if (settings_.embedding.enabled)
        embedder_ = std::make_shared<provider::OpenAIEmbeddingProvider>(settings_.embedding);
    if (settings_.llm.enabled)
        extractor_ = std::make_shared<extract::OpenAILocationExtractor>(settings_.llm);

    try
    {
        auto records = gazetteer::GazetteerLoader::loadFile(dataPath());
        matching::CommuneMatcher::Dependencies deps;
        deps.embedder = embedder_;
        deps.extractor = extractor_;
        matcher_ = std::make_unique<matching::CommuneMatcher>(std::move(records), settings_.matching, std::move(deps));
        return true;
    }
    catch (const gazetteer::DataUnavailableError& ex)
    {
        PLOG_FATAL << "Commune data unavailable: " << ex.what();
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Gazetteer, "Commune data unavailable", ex.what());
        std::cerr << "comuna_match: " << ex.what() << "\n";
        return false;
    }
}

int Application::checkProviders()
{
    nlohmann::json report;
    report["config"] = config_->path();
    report["data"] = dataPath();

    try
    {
        report["communes"] = gazetteer::GazetteerLoader::loadFile(dataPath()).size();
    }
    catch (const gazetteer::DataUnavailableError& ex)
    {
        report["communes"] = nullptr;
        report["data_error"] = ex.what();
    }

    if (settings_.llm.enabled)
        report["llm"] = extract::OpenAILocationExtractor(settings_.llm).testConnection();
    else
        report["llm"] = "disabled";

    if (settings_.embedding.enabled)
        report["embedding"] = provider::OpenAIEmbeddingProvider(settings_.embedding).testConnection();
    else
        report["embedding"] = "disabled";

    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : utils::ErrorReporter::Drain())
    {
        issues.push_back({ { "time", utils::ErrorReporter::FormatTime(issue.time) },
                           { "category", utils::ErrorReporter::ToString(issue.category) },
                           { "severity", utils::ErrorReporter::ToString(issue.severity) },
                           { "message", issue.message },
                           { "details", issue.details } });
    }
    report["issues"] = std::move(issues);

    std::cout << report.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return report.contains("data_error") ? kExitDataUnavailable : kExitOk;
}

void Application::handleQuery(const std::string& query)
{
    if (options_.suggest)
    {
        nlohmann::json out;
        out["query"] = query;
        out["suggestions"] = matcher_->suggestions(query, *options_.suggest);
        std::cout << out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return;
    }

    const auto result = matcher_->match(query);
    std::cout << matching::toJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

void Application::reloadIfConfigChanged()
{
    const std::string before = dataPath();
    if (!config_->reloadIfChanged())
        return;

    if (options_.threshold)
        settings_.matching.confidence_threshold = *options_.threshold;
    applyDiagnostics();
    PLOG_INFO << "Matching thresholds and providers changed in config take effect on restart";

    const std::string after = dataPath();
    if (after == before)
        return;

    try
    {
        matcher_->reload(gazetteer::GazetteerLoader::loadFile(after));
    }
    catch (const gazetteer::DataUnavailableError& ex)
    {
        PLOG_ERROR << "Keeping current commune data, reload from " << after << " failed: " << ex.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Gazetteer, "Commune data reload failed", ex.what());
    }
}
