#include "MatcherSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdlib>

#include <plog/Log.h>

MatcherSettings::MatcherSettings()
{
    applyDefaults();
}

void MatcherSettings::applyDefaults()
{
    matching = matching::CascadeConfig{};
    gazetteer_path = "assets/communes.json";

    llm = provider::LanguageModelConfig{};
    llm.model = "gpt-4o-mini";

    embedding = provider::EmbeddingConfig{};
    embedding.model = "text-embedding-3-small";

    verbose = false;
    max_preview = 120;
}

double SettingsSerializer::readUnit(const toml::table& section, const char* key, double fallback)
{
    auto v = section[key].value<double>();
    if (!v)
        return fallback;
    if (*v < 0.0 || *v > 1.0)
    {
        PLOG_WARNING << "Config value " << key << "=" << *v << " outside [0, 1], keeping " << fallback;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Threshold out of range",
                                            std::string(key) + " must be within [0, 1]");
        return fallback;
    }
    return *v;
}

std::size_t SettingsSerializer::readCount(const toml::table& section, const char* key, std::size_t fallback)
{
    auto v = section[key].value<int64_t>();
    if (!v)
        return fallback;
    if (*v < 0)
    {
        PLOG_WARNING << "Config value " << key << "=" << *v << " is negative, keeping " << fallback;
        return fallback;
    }
    return static_cast<std::size_t>(*v);
}

void SettingsSerializer::deserializeMatching(const toml::table& section, matching::CascadeConfig& cfg)
{
    cfg.embedding_threshold = readUnit(section, "embedding_threshold", cfg.embedding_threshold);
    cfg.fuzzy_threshold = readUnit(section, "fuzzy_threshold", cfg.fuzzy_threshold);
    cfg.trigram_threshold = readUnit(section, "trigram_threshold", cfg.trigram_threshold);
    cfg.confidence_threshold = readUnit(section, "confidence_threshold", cfg.confidence_threshold);
    cfg.suggestion_threshold = readUnit(section, "suggestion_threshold", cfg.suggestion_threshold);
    cfg.nl_confidence_threshold = readUnit(section, "nl_confidence_threshold", cfg.nl_confidence_threshold);
    cfg.substring_bonus = readUnit(section, "substring_bonus", cfg.substring_bonus);

    cfg.min_substring_length = readCount(section, "min_substring_length", cfg.min_substring_length);
    cfg.sentence_token_limit = readCount(section, "sentence_token_limit", cfg.sentence_token_limit);
    cfg.suggestion_limit = readCount(section, "suggestion_limit", cfg.suggestion_limit);
    cfg.candidate_pool = readCount(section, "candidate_pool", cfg.candidate_pool);

    if (auto v = section["fuzzy_algorithm"].value<std::string>())
    {
        if (auto algo = processing::parseMatchAlgorithm(*v))
            cfg.fuzzy_algorithm = *algo;
        else
            PLOG_WARNING << "Unknown fuzzy_algorithm '" << *v << "', keeping " << processing::toString(cfg.fuzzy_algorithm);
    }
}

void SettingsSerializer::deserializeProvider(const toml::table& section, provider::ProviderConfig& cfg)
{
    if (auto v = section["enabled"].value<bool>())
        cfg.enabled = *v;
    if (auto v = section["base_url"].value<std::string>())
        cfg.base_url = *v;
    if (auto v = section["model"].value<std::string>())
        cfg.model = *v;
    if (auto v = section["api_key"].value<std::string>())
        cfg.api_key = *v;
    if (auto v = section["timeout_ms"].value<int>())
        cfg.timeout_ms = *v > 0 ? *v : cfg.timeout_ms;
    if (auto v = section["connect_timeout_ms"].value<int>())
        cfg.connect_timeout_ms = *v > 0 ? *v : cfg.connect_timeout_ms;
    cfg.max_concurrent_requests = readCount(section, "max_concurrent_requests", cfg.max_concurrent_requests);
    if (cfg.max_concurrent_requests == 0)
        cfg.max_concurrent_requests = 1;
}

void SettingsSerializer::deserializeLanguageModel(const toml::table& section, provider::LanguageModelConfig& cfg)
{
    deserializeProvider(section, cfg);
    cfg.sample_size = readCount(section, "sample_size", cfg.sample_size);
    if (auto v = section["temperature"].value<double>())
        cfg.temperature = *v;
    if (auto v = section["max_tokens"].value<int>())
        cfg.max_tokens = *v;
    if (auto v = section["prompt"].value<std::string>())
        cfg.prompt = *v;
    applyEnvironment(cfg);
}

void SettingsSerializer::deserializeEmbedding(const toml::table& section, provider::EmbeddingConfig& cfg)
{
    deserializeProvider(section, cfg);
    cfg.batch_size = readCount(section, "batch_size", cfg.batch_size);
    if (cfg.batch_size == 0)
        cfg.batch_size = 1;
    applyEnvironment(cfg);
}

void SettingsSerializer::applyEnvironment(provider::ProviderConfig& cfg)
{
    if (!cfg.api_key.empty())
        return;
    if (const char* key = std::getenv("OPENAI_API_KEY"))
        cfg.api_key = key;
}

bool registerMatcherSettings(ConfigManager& config, MatcherSettings& settings)
{
    TableCallbacks cb;
    cb.load = [&settings](const toml::table& root)
    {
        settings.applyDefaults();

        static const toml::table empty;
        auto section = [&root](const char* name) -> const toml::table&
        {
            const auto* tbl = root[name].as_table();
            return tbl ? *tbl : empty;
        };

        SettingsSerializer::deserializeMatching(section("matching"), settings.matching);
        if (auto v = section("gazetteer")["path"].value<std::string>())
            settings.gazetteer_path = *v;
        SettingsSerializer::deserializeLanguageModel(section("llm"), settings.llm);
        SettingsSerializer::deserializeEmbedding(section("embedding"), settings.embedding);

        const auto& logging = section("logging");
        if (auto v = logging["verbose"].value<bool>())
            settings.verbose = *v;
        if (auto v = logging["max_preview"].value<int64_t>())
            settings.max_preview = *v > 0 ? static_cast<std::size_t>(*v) : settings.max_preview;
    };

    return config.registerTable("", std::move(cb), { "matching", "gazetteer", "llm", "embedding", "logging" });
}
