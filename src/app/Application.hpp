#pragma once

#include "../config/MatcherSettings.hpp"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;

namespace matching
{
class CommuneMatcher;
}

namespace provider
{
class IEmbeddingProvider;
}

namespace extract
{
class ILocationExtractor;
}

/**
 * @brief Command-line driver: resolves each query and prints one JSON line per result.
 *
 * comuna_match [--config FILE] [--data FILE] [--threshold X] [--suggest N]
 *              [--verbose] [--check] [query...]
 *
 * Without query arguments, queries are read from stdin one per line; config.toml
 * is polled between lines and a changed data path triggers a reload.
 */
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

    static void printUsage(std::ostream& out);

private:
    struct Options
    {
        std::string config_path = "config.toml";
        std::optional<std::string> data_path;
        std::optional<double> threshold;
        std::optional<std::size_t> suggest;
        bool verbose = false;
        bool check = false;
        bool help = false;
        std::vector<std::string> queries;
    };

    bool parseCommandLineArgs();
    bool initializeLogging();
    void initializeConfig();
    void applyDiagnostics();
    bool buildMatcher();
    int checkProviders();

    void handleQuery(const std::string& query);
    void reloadIfConfigChanged();
    std::string dataPath() const;

    std::vector<std::string> args_;
    Options options_;
    std::string usage_error_;

    std::unique_ptr<ConfigManager> config_;
    MatcherSettings settings_;
    std::shared_ptr<provider::IEmbeddingProvider> embedder_;
    std::shared_ptr<extract::ILocationExtractor> extractor_;
    std::unique_ptr<matching::CommuneMatcher> matcher_;
};
