#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "extract/RegexLocationExtractor.hpp"

using namespace extract;
using Catch::Matchers::WithinAbs;

TEST_CASE("RegexLocationExtractor - extracts place names", "[extract][regex]")
{
    RegexLocationExtractor extractor;

    SECTION("Pharmacy request with a preposition")
    {
        auto intent = extractor.extract("farmacias en la florida");
        REQUIRE(intent.extracted_location == "La Florida");
        REQUIRE(intent.intent_type == IntentType::PharmacySearch);
        REQUIRE(intent.source == ExtractionSource::Regex);
        REQUIRE(intent.original_query == "farmacias en la florida");
        REQUIRE_THAT(intent.confidence, WithinAbs(0.5, 1e-9));
    }

    SECTION("Question marks, accents and request phrases")
    {
        auto intent = extractor.extract("¿Dónde hay farmacias de turno en Viña del Mar?");
        REQUIRE(intent.extracted_location == "Viña del Mar");
        REQUIRE(intent.intent_type == IntentType::PharmacySearch);
    }

    SECTION("Filler words around an accented name")
    {
        auto intent = extractor.extract("necesito farmacias abiertas cerca de Quilpué por favor");
        REQUIRE(intent.extracted_location == "Quilpué");
    }

    SECTION("Location without pharmacy words")
    {
        auto intent = extractor.extract("comuna de temuco");
        REQUIRE(intent.extracted_location == "Temuco");
        REQUIRE(intent.intent_type == IntentType::LocationQuery);
    }

    SECTION("Nothing left after filtering")
    {
        auto intent = extractor.extract("dónde hay farmacias");
        REQUIRE(intent.extracted_location.empty());
        REQUIRE(intent.intent_type == IntentType::General);
        REQUIRE_THAT(intent.confidence, WithinAbs(0.0, 1e-9));
    }

    SECTION("Empty input never throws")
    {
        auto intent = extractor.extract("");
        REQUIRE(intent.extracted_location.empty());
    }
}

TEST_CASE("RegexLocationExtractor - sentence detection", "[extract][regex]")
{
    RegexLocationExtractor extractor;

    SECTION("Bare place names are not sentences")
    {
        REQUIRE_FALSE(extractor.looksLikeSentence("la florida", 4));
        REQUIRE_FALSE(extractor.looksLikeSentence("quilpue", 4));
        REQUIRE_FALSE(extractor.looksLikeSentence("", 4));
    }

    SECTION("Filler words or prepositions make a sentence")
    {
        REQUIRE(extractor.looksLikeSentence("farmacias en la florida", 4));
        REQUIRE(extractor.looksLikeSentence("donde hay farmacias", 4));
        // Names with a preposition read as sentences; the cascade checks exact aliases first
        REQUIRE(extractor.looksLikeSentence("san jose de maipo", 4));
    }

    SECTION("Long inputs are sentences")
    {
        REQUIRE(extractor.looksLikeSentence("uno dos tres cuatro cinco", 4));
        REQUIRE_FALSE(extractor.looksLikeSentence("uno dos tres cuatro", 4));
    }

    SECTION("Word lists compare normalized words")
    {
        REQUIRE(RegexLocationExtractor::isFillerWord("donde"));
        REQUIRE(RegexLocationExtractor::isFillerWord("farmacias"));
        REQUIRE_FALSE(RegexLocationExtractor::isFillerWord("florida"));
        REQUIRE(RegexLocationExtractor::isEdgeWord("en"));
        REQUIRE_FALSE(RegexLocationExtractor::isEdgeWord("la"));
    }
}
