#include "RegexLocationExtractor.hpp"
#include "../processing/TextUtils.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <string_view>

namespace extract
{

namespace
{

constexpr std::array<std::string_view, 38> kFillerWords = {
    "buscar", "busco", "busca", "buscando", "encontrar", "encuentro", "necesito", "necesita", "quiero",
    "queria", "dame", "muestrame", "ver", "hay", "donde", "que", "cual", "cuales", "alguna", "algun",
    "farmacia", "farmacias", "medicamento", "medicamentos", "remedio", "remedios", "turno", "abierta",
    "abiertas", "abierto", "abiertos", "cerca", "cercana", "cercanas", "favor", "hoy", "ahora", "comuna"
};

constexpr std::array<std::string_view, 12> kEdgeWords = { "en", "de", "del", "a", "al", "para",
                                                          "por", "con", "sin", "hacia", "desde", "y" };

constexpr std::array<std::string_view, 7> kPharmacyWords = { "farmacia", "farmacias", "medicamento", "medicamentos",
                                                             "remedio", "remedios", "turno" };

constexpr std::array<std::string_view, 7> kConnectorWords = { "de", "del", "la", "las", "los", "el", "y" };

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& words, const std::string& word)
{
    return std::find(words.begin(), words.end(), word) != words.end();
}

// Multi-word request phrases removed before the word filter
const std::regex& phrasePattern()
{
    static const std::regex pattern(
        R"((^| )(?:por favor|de turno|de urgencia|24 horas|lo mas cerca|mas cercanas?|más cercanas?)(?= |$))");
    return pattern;
}

} // namespace

bool RegexLocationExtractor::isFillerWord(const std::string& normalized_word)
{
    return contains(kFillerWords, normalized_word);
}

bool RegexLocationExtractor::isEdgeWord(const std::string& normalized_word)
{
    return contains(kEdgeWords, normalized_word);
}

bool RegexLocationExtractor::isPharmacyWord(const std::string& normalized_word)
{
    return contains(kPharmacyWords, normalized_word);
}

bool RegexLocationExtractor::isConnectorWord(const std::string& normalized_word)
{
    return contains(kConnectorWords, normalized_word);
}

bool RegexLocationExtractor::looksLikeSentence(const std::string& normalized_query,
                                               std::size_t max_plain_tokens) const
{
    const auto tokens = processing::splitWords(normalized_query);
    if (tokens.size() > max_plain_tokens)
        return true;
    return std::any_of(tokens.begin(), tokens.end(),
                       [](const std::string& token) { return isFillerWord(token) || isEdgeWord(token); });
}

LocationIntent RegexLocationExtractor::extract(const std::string& query) const
{
    LocationIntent intent;
    intent.original_query = query;
    intent.source = ExtractionSource::Regex;

    std::string text = processing::stripPunctuation(processing::foldCase(query));
    text = std::regex_replace(text, phrasePattern(), "$1");

    bool pharmacy_related = false;
    std::vector<std::string> kept;
    for (auto& word : processing::splitWords(text))
    {
        const std::string key = normalizer_.normalizeText(word);
        if (isPharmacyWord(key))
            pharmacy_related = true;
        if (key.empty() || isFillerWord(key))
            continue;
        kept.push_back(std::move(word));
    }

    auto edge = [this](const std::string& word) { return isEdgeWord(normalizer_.normalizeText(word)); };
    while (!kept.empty() && edge(kept.front()))
        kept.erase(kept.begin());
    while (!kept.empty() && edge(kept.back()))
        kept.pop_back();

    for (std::size_t i = 0; i < kept.size(); ++i)
    {
        if (i > 0 && isConnectorWord(normalizer_.normalizeText(kept[i])))
            continue;
        kept[i] = processing::titleCase(kept[i]);
    }

    intent.extracted_location = processing::joinWords(kept);
    if (intent.extracted_location.empty())
    {
        intent.intent_type = IntentType::General;
        intent.confidence = 0.0;
        intent.reasoning = "regex fallback: no location words left";
    }
    else
    {
        intent.intent_type = pharmacy_related ? IntentType::PharmacySearch : IntentType::LocationQuery;
        intent.confidence = 0.5;
        intent.reasoning = "regex fallback";
    }
    return intent;
}

} // namespace extract
