#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace extract
{

enum class IntentType
{
    PharmacySearch,
    LocationQuery,
    General
};

// "pharmacy_search", "location_query" or "general"
std::optional<IntentType> parseIntentType(std::string_view name);
const char* toString(IntentType type);

// Which extractor produced the intent
enum class ExtractionSource
{
    LanguageModel,
    Regex
};

const char* toString(ExtractionSource source);

struct LocationIntent
{
    std::string original_query;
    std::string extracted_location; // empty when no place was found
    IntentType intent_type = IntentType::General;
    double confidence = 0.0;
    std::string reasoning;          // logged, never used for decisions
    ExtractionSource source = ExtractionSource::Regex;

    bool operator==(const LocationIntent&) const = default;
};

} // namespace extract
