#pragma once

#include "LocationIntent.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace extract
{

struct IntentParseResult
{
    bool ok = false;
    std::string error_message;
    LocationIntent intent;
};

// Checks required keys, their types, intent_type membership and the confidence range.
// Returns an empty string when the object conforms.
std::string validateIntentJson(const nlohmann::json& object);

// Parses model output (optionally wrapped in a ```json fence) into a LocationIntent
IntentParseResult parseIntentResponse(const std::string& content, const std::string& original_query);

} // namespace extract
