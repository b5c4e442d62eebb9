#include "LocationIntent.hpp"

namespace extract
{

std::optional<IntentType> parseIntentType(std::string_view name)
{
    if (name == "pharmacy_search")
        return IntentType::PharmacySearch;
    if (name == "location_query")
        return IntentType::LocationQuery;
    if (name == "general")
        return IntentType::General;
    return std::nullopt;
}

const char* toString(IntentType type)
{
    switch (type)
    {
    case IntentType::PharmacySearch:
        return "pharmacy_search";
    case IntentType::LocationQuery:
        return "location_query";
    case IntentType::General:
        return "general";
    }
    return "general";
}

const char* toString(ExtractionSource source)
{
    switch (source)
    {
    case ExtractionSource::LanguageModel:
        return "llm";
    case ExtractionSource::Regex:
        return "regex";
    }
    return "regex";
}

} // namespace extract
