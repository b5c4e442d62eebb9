#include "MatchResultJson.hpp"

#include <type_traits>

namespace matching
{

using json = nlohmann::json;

json toJson(const MatchEvidence& evidence)
{
    return std::visit(
        [](const auto& ev) -> json
        {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, NoEvidence>)
            {
                return json::object();
            }
            else if constexpr (std::is_same_v<T, ExactEvidence>)
            {
                return json{ { "kind", "exact" }, { "alias", ev.alias } };
            }
            else if constexpr (std::is_same_v<T, FuzzyEvidence>)
            {
                return json{ { "kind", "fuzzy" },
                             { "alias", ev.alias },
                             { "raw_score", ev.raw_score },
                             { "substring_bonus", ev.substring_bonus } };
            }
            else if constexpr (std::is_same_v<T, TrigramEvidence>)
            {
                return json{ { "kind", "trigram" },
                             { "shared_shingles", ev.shared_shingles },
                             { "union_size", ev.union_size } };
            }
            else if constexpr (std::is_same_v<T, EmbeddingEvidence>)
            {
                return json{ { "kind", "embedding" }, { "alias", ev.alias }, { "cosine", ev.cosine } };
            }
            else
            {
                static_assert(std::is_same_v<T, NlEvidence>, "unhandled evidence type");
                return json{ { "kind", "nl_extracted" },
                             { "extracted_location", ev.extracted_location },
                             { "source", extract::toString(ev.source) },
                             { "alias", ev.alias } };
            }
        },
        evidence);
}

json toJson(const extract::LocationIntent& intent)
{
    return json{ { "original_query", intent.original_query },
                 { "extracted_location", intent.extracted_location },
                 { "intent_type", extract::toString(intent.intent_type) },
                 { "confidence", intent.confidence },
                 { "reasoning", intent.reasoning },
                 { "source", extract::toString(intent.source) } };
}

json toJson(const MatchResult& result)
{
    json j;
    j["original_query"] = result.original_query;
    j["normalized_query"] = result.normalized_query;
    j["matched_commune"] = result.matched_commune ? json(*result.matched_commune) : json(nullptr);
    j["confidence"] = result.confidence;
    j["method"] = toString(result.method);

    json suggestions = json::array();
    for (const auto& candidate : result.suggestions)
        suggestions.push_back(json{ { "commune", candidate.commune }, { "score", candidate.score } });
    j["suggestions"] = std::move(suggestions);

    if (result.intent)
        j["intent"] = toJson(*result.intent);
    j["evidence"] = toJson(result.evidence);
    j["generation"] = result.generation;
    return j;
}

} // namespace matching
