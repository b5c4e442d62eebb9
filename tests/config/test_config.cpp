#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "config/ConfigManager.hpp"
#include "config/MatcherSettings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;

TEST_CASE("MatcherSettings - defaults", "[config]")
{
    ConfigManager config("does-not-exist.toml");
    MatcherSettings settings;
    REQUIRE(registerMatcherSettings(config, settings));
    REQUIRE(config.load());

    REQUIRE_THAT(settings.matching.embedding_threshold, WithinAbs(0.85, 1e-9));
    REQUIRE_THAT(settings.matching.fuzzy_threshold, WithinAbs(0.9, 1e-9));
    REQUIRE_THAT(settings.matching.trigram_threshold, WithinAbs(0.6, 1e-9));
    REQUIRE_THAT(settings.matching.confidence_threshold, WithinAbs(0.7, 1e-9));
    REQUIRE(settings.matching.suggestion_limit == 5);
    REQUIRE(settings.gazetteer_path == "assets/communes.json");
    REQUIRE_FALSE(settings.llm.enabled);
    REQUIRE_FALSE(settings.embedding.enabled);
    REQUIRE_FALSE(settings.verbose);
}

TEST_CASE("MatcherSettings - loading TOML", "[config]")
{
    ConfigManager config;
    MatcherSettings settings;
    REQUIRE(registerMatcherSettings(config, settings));

    SECTION("Values override defaults")
    {
        REQUIRE(config.loadFromString(R"(
[matching]
fuzzy_threshold = 0.95
confidence_threshold = 0.6
suggestion_limit = 8
fuzzy_algorithm = "token_sort_ratio"

[gazetteer]
path = "data/comunas.json"

[llm]
enabled = true
api_key = "sk-test"
model = "gpt-4o"
timeout_ms = 3000
sample_size = 10

[embedding]
enabled = true
api_key = "sk-test"
batch_size = 0

[logging]
verbose = true
max_preview = 40
)"));
        REQUIRE_THAT(settings.matching.fuzzy_threshold, WithinAbs(0.95, 1e-9));
        REQUIRE_THAT(settings.matching.confidence_threshold, WithinAbs(0.6, 1e-9));
        REQUIRE(settings.matching.suggestion_limit == 8);
        REQUIRE(settings.matching.fuzzy_algorithm == processing::MatchAlgorithm::TokenSortRatio);
        REQUIRE(settings.gazetteer_path == "data/comunas.json");
        REQUIRE(settings.llm.enabled);
        REQUIRE(settings.llm.model == "gpt-4o");
        REQUIRE(settings.llm.timeout_ms == 3000);
        REQUIRE(settings.llm.sample_size == 10);
        REQUIRE(settings.embedding.batch_size == 1);
        REQUIRE(settings.verbose);
        REQUIRE(settings.max_preview == 40);
    }

    SECTION("Out-of-range values keep their defaults")
    {
        REQUIRE(config.loadFromString(R"(
[matching]
fuzzy_threshold = 1.5
trigram_threshold = -0.2
suggestion_limit = -3
)"));
        REQUIRE_THAT(settings.matching.fuzzy_threshold, WithinAbs(0.9, 1e-9));
        REQUIRE_THAT(settings.matching.trigram_threshold, WithinAbs(0.6, 1e-9));
        REQUIRE(settings.matching.suggestion_limit == 5);
    }

    SECTION("Reloading resets keys removed from the file")
    {
        REQUIRE(config.loadFromString("[matching]\nfuzzy_threshold = 0.8\n"));
        REQUIRE_THAT(settings.matching.fuzzy_threshold, WithinAbs(0.8, 1e-9));
        REQUIRE(config.loadFromString(""));
        REQUIRE_THAT(settings.matching.fuzzy_threshold, WithinAbs(0.9, 1e-9));
    }

    SECTION("Parse errors are reported")
    {
        REQUIRE_FALSE(config.loadFromString("[matching\nfuzzy_threshold = ", "broken.toml"));
        REQUIRE(std::string(config.lastError()).find("broken.toml") != std::string::npos);
    }
}

TEST_CASE("MatcherSettings - API key from environment", "[config]")
{
    ::setenv("OPENAI_API_KEY", "sk-from-env", 1);

    provider::ProviderConfig cfg;
    SettingsSerializer::applyEnvironment(cfg);
    REQUIRE(cfg.api_key == "sk-from-env");

    cfg.api_key = "sk-explicit";
    SettingsSerializer::applyEnvironment(cfg);
    REQUIRE(cfg.api_key == "sk-explicit");

    ::unsetenv("OPENAI_API_KEY");
}

TEST_CASE("ConfigManager - table registration", "[config]")
{
    ConfigManager config;
    REQUIRE(config.registerTable("", TableCallbacks{}, { "matching" }));
    REQUIRE_FALSE(config.registerTable("", TableCallbacks{}, { "matching" }));
    REQUIRE(config.registerTable("", TableCallbacks{}, { "other" }));
}

TEST_CASE("ConfigManager - unknown top-level keys and nested sections", "[config]")
{
    ConfigManager config;
    MatcherSettings settings;
    REQUIRE(registerMatcherSettings(config, settings));

    std::string nested_path;
    TableCallbacks nested;
    nested.load = [&nested_path](const toml::table& section) {
        nested_path = section["path"].value_or(std::string("unset"));
    };
    REQUIRE(config.registerTable("gazetteer", std::move(nested), { "path" }));

    REQUIRE(config.loadFromString("[matchng]\nfuzzy_threshold = 0.5\n[gazetteer]\npath = \"x.json\"\n"));
    REQUIRE(config.unknownKeys() == std::vector<std::string>{ "matchng" });
    REQUIRE(nested_path == "x.json");
    REQUIRE_THAT(settings.matching.fuzzy_threshold, WithinAbs(0.9, 1e-9));

    REQUIRE(config.loadFromString("gazetteer = 3\n"));
    REQUIRE(config.unknownKeys().empty());
    REQUIRE(nested_path == "unset");
}

TEST_CASE("ConfigManager - file dispatch and reload", "[config]")
{
    const auto path = std::filesystem::temp_directory_path() / "comuna_match_config_test.toml";
    {
        std::ofstream out(path);
        out << "[gazetteer]\npath = \"first.json\"\n";
    }

    ConfigManager config(path.string());
    MatcherSettings settings;
    REQUIRE(registerMatcherSettings(config, settings));
    REQUIRE(config.load());
    REQUIRE(settings.gazetteer_path == "first.json");
    REQUIRE_FALSE(config.reloadIfChanged());

    {
        std::ofstream out(path);
        out << "[gazetteer]\npath = \"second.json\"\n";
    }
    std::filesystem::last_write_time(path, std::filesystem::last_write_time(path) + std::chrono::seconds(5));
    REQUIRE(config.reloadIfChanged());
    REQUIRE(settings.gazetteer_path == "second.json");

    std::filesystem::remove(path);
}
