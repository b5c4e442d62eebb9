#pragma once

#include "../matching/CascadeConfig.hpp"
#include "../provider/ProviderTypes.hpp"

#include <cstddef>
#include <string>

#include <toml++/toml.h>

class ConfigManager;

// Everything config.toml can set for the matcher; defaults apply to absent keys
struct MatcherSettings
{
    matching::CascadeConfig matching;
    std::string gazetteer_path = "assets/communes.json";
    provider::LanguageModelConfig llm;
    provider::EmbeddingConfig embedding;

    // [logging] keys consumed here; level, append and console are read by LogManager
    bool verbose = false;
    std::size_t max_preview = 120;

    MatcherSettings();
    void applyDefaults();
};

class SettingsSerializer
{
public:
    static void deserializeMatching(const toml::table& section, matching::CascadeConfig& cfg);
    static void deserializeLanguageModel(const toml::table& section, provider::LanguageModelConfig& cfg);
    static void deserializeEmbedding(const toml::table& section, provider::EmbeddingConfig& cfg);

    // Fills an empty api_key from OPENAI_API_KEY
    static void applyEnvironment(provider::ProviderConfig& cfg);

private:
    static void deserializeProvider(const toml::table& section, provider::ProviderConfig& cfg);
    static double readUnit(const toml::table& section, const char* key, double fallback);
    static std::size_t readCount(const toml::table& section, const char* key, std::size_t fallback);
};

// Registers [matching], [gazetteer], [llm], [embedding] and [logging] handlers writing into settings
bool registerMatcherSettings(ConfigManager& config, MatcherSettings& settings);
