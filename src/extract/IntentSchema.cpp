#include "IntentSchema.hpp"
#include "../provider/ProviderHelpers.hpp"

namespace extract
{

std::string validateIntentJson(const nlohmann::json& object)
{
    if (!object.is_object())
        return "response is not a JSON object";

    auto location = object.find("extracted_location");
    if (location == object.end())
        return "missing key: extracted_location";
    if (!location->is_string())
        return "extracted_location must be a string";

    auto intent = object.find("intent_type");
    if (intent == object.end())
        return "missing key: intent_type";
    if (!intent->is_string())
        return "intent_type must be a string";
    if (!parseIntentType(intent->get<std::string>()))
        return "intent_type not one of pharmacy_search|location_query|general";

    auto confidence = object.find("confidence");
    if (confidence == object.end())
        return "missing key: confidence";
    if (!confidence->is_number())
        return "confidence must be a number";
    const double value = confidence->get<double>();
    if (!(value >= 0.0 && value <= 1.0))
        return "confidence outside [0, 1]";

    auto reasoning = object.find("reasoning");
    if (reasoning != object.end() && !reasoning->is_string() && !reasoning->is_null())
        return "reasoning must be a string";

    return {};
}

IntentParseResult parseIntentResponse(const std::string& content, const std::string& original_query)
{
    IntentParseResult result;

    const std::string body = provider::helpers::strip_code_fence(content);
    if (body.empty())
    {
        result.error_message = "empty model output";
        return result;
    }

    nlohmann::json json = nlohmann::json::parse(body, nullptr, /*allow_exceptions*/ false);
    if (json.is_discarded())
    {
        result.error_message = "model output is not valid JSON";
        return result;
    }

    result.error_message = validateIntentJson(json);
    if (!result.error_message.empty())
        return result;

    auto location = json["extracted_location"].get<std::string>();
    const auto first = location.find_first_not_of(" \t\r\n");
    const auto last = location.find_last_not_of(" \t\r\n");
    location = first == std::string::npos ? std::string() : location.substr(first, last - first + 1);

    result.intent.original_query = original_query;
    result.intent.extracted_location = std::move(location);
    result.intent.intent_type = *parseIntentType(json["intent_type"].get<std::string>());
    result.intent.confidence = json["confidence"].get<double>();
    if (auto it = json.find("reasoning"); it != json.end() && it->is_string())
        result.intent.reasoning = it->get<std::string>();
    result.intent.source = ExtractionSource::LanguageModel;
    result.ok = true;
    return result;
}

} // namespace extract
