#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "gazetteer/Gazetteer.hpp"
#include "gazetteer/TrigramIndex.hpp"
#include "processing/FoldingTextNormalizer.hpp"
#include "../utils/commune_fixture.hpp"

using namespace gazetteer;
using Catch::Matchers::WithinAbs;

TEST_CASE("TrigramIndex - shingles", "[trigram]")
{
    SECTION("Padded trigrams of a single word")
    {
        auto grams = TrigramIndex::shingles("abc");
        // "  abc  " -> "  a", " ab", "abc", "bc ", "c  "
        REQUIRE(grams.size() == 5);
        REQUIRE(grams.count(U"  a") == 1);
        REQUIRE(grams.count(U"c  ") == 1);
    }

    SECTION("Trigrams are codepoint based")
    {
        auto grams = TrigramIndex::shingles("ñu");
        REQUIRE(grams.count(U" ñu") == 1);
    }

    SECTION("Empty input has no shingles")
    {
        REQUIRE(TrigramIndex::shingles("").empty());
    }
}

TEST_CASE("TrigramIndex - search", "[trigram]")
{
    processing::FoldingTextNormalizer normalizer;
    auto gz = Gazetteer::build(test_utils::sampleCommunes(), normalizer);
    auto index = TrigramIndex::build(gz);

    SECTION("Exact key scores 1.0")
    {
        auto hits = index.search("temuco", 5);
        REQUIRE_FALSE(hits.empty());
        REQUIRE(gz.record(hits.front().commune).canonical_name == "Temuco");
        REQUIRE_THAT(hits.front().jaccard, WithinAbs(1.0, 1e-9));
    }

    SECTION("Misspelling shares part of the shingles")
    {
        auto hits = index.search("kilpue", 5);
        REQUIRE_FALSE(hits.empty());
        REQUIRE(gz.record(hits.front().commune).canonical_name == "Quilpué");
        REQUIRE(hits.front().shared == 5);
        REQUIRE(hits.front().union_size == 12);
        REQUIRE_THAT(hits.front().jaccard, WithinAbs(5.0 / 12.0, 1e-9));
    }

    SECTION("Results are sorted and bounded by top_k")
    {
        auto hits = index.search("la", 3);
        REQUIRE(hits.size() <= 3);
        for (size_t i = 1; i < hits.size(); ++i)
            REQUIRE(hits[i - 1].jaccard >= hits[i].jaccard);
    }

    SECTION("No overlap gives no hits")
    {
        REQUIRE(index.search("xyz123", 5).empty());
        REQUIRE(index.search("", 5).empty());
        REQUIRE(index.search("temuco", 0).empty());
    }

    SECTION("Aggregated shingles cover every alias of a commune")
    {
        // "Valpo" is an explicit alias of Valparaíso
        auto hits = index.search("valpo", 1);
        REQUIRE(hits.size() == 1);
        REQUIRE(gz.record(hits.front().commune).canonical_name == "Valparaíso");
    }

    SECTION("Index survives moving the gazetteer")
    {
        auto moved = std::move(gz);
        auto hits = index.search("temuco", 1);
        REQUIRE(hits.size() == 1);
        REQUIRE(moved.record(hits.front().commune).canonical_name == "Temuco");
    }
}
