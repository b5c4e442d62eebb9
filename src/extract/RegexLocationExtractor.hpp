#pragma once

#include "LocationIntent.hpp"
#include "../processing/FoldingTextNormalizer.hpp"

#include <cstddef>
#include <string>

namespace extract
{

/**
 * @brief Deterministic place-name extraction used when no language model answers.
 *
 * Case-folds the query (accents kept), removes punctuation and request phrases,
 * drops filler words anywhere and prepositions at the phrase edges, then
 * title-cases what remains:
 *
 * @code
 * RegexLocationExtractor x;
 * x.extract("farmacias en la florida").extracted_location;        // "La Florida"
 * x.extract("¿Dónde hay farmacias de turno en Viña del Mar?")...; // "Viña del Mar"
 * x.extract("dónde hay farmacias").extracted_location;            // ""
 * @endcode
 *
 * Never throws.
 */
class RegexLocationExtractor
{
public:
    RegexLocationExtractor() = default;

    LocationIntent extract(const std::string& query) const;

    // True when a normalized query reads as a sentence rather than a bare place name:
    // it contains a filler word or preposition, or has more than max_plain_tokens words.
    bool looksLikeSentence(const std::string& normalized_query, std::size_t max_plain_tokens) const;

    // Words are compared in normalized form ("dónde" -> "donde")
    static bool isFillerWord(const std::string& normalized_word);
    static bool isEdgeWord(const std::string& normalized_word);

private:
    static bool isPharmacyWord(const std::string& normalized_word);
    static bool isConnectorWord(const std::string& normalized_word);

    processing::FoldingTextNormalizer normalizer_;
};

} // namespace extract
