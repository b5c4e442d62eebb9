#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "gazetteer/EmbeddingIndex.hpp"
#include "gazetteer/Gazetteer.hpp"
#include "processing/FoldingTextNormalizer.hpp"
#include "provider/ProviderTypes.hpp"
#include "../utils/commune_fixture.hpp"
#include "../utils/fake_providers.hpp"

using namespace gazetteer;
using Catch::Matchers::WithinAbs;

TEST_CASE("EmbeddingIndex - normalize", "[embedding]")
{
    provider::Embedding v{3.0f, 4.0f};
    REQUIRE(EmbeddingIndex::normalize(v));
    REQUIRE_THAT(v[0], WithinAbs(0.6, 1e-6));
    REQUIRE_THAT(v[1], WithinAbs(0.8, 1e-6));

    provider::Embedding zero{0.0f, 0.0f};
    REQUIRE_FALSE(EmbeddingIndex::normalize(zero));
    provider::Embedding empty;
    REQUIRE_FALSE(EmbeddingIndex::normalize(empty));
}

TEST_CASE("EmbeddingIndex - build and search", "[embedding]")
{
    processing::FoldingTextNormalizer normalizer;
    auto gz = Gazetteer::build(test_utils::sampleCommunes(), normalizer);
    test_utils::FakeEmbeddingProvider embedder;

    auto index = EmbeddingIndex::build(gz, embedder);

    SECTION("Every distinct raw alias is encoded in one call")
    {
        REQUIRE(embedder.calls() == 1);
        REQUIRE(index.dimension() == test_utils::FakeEmbeddingProvider::kDimension);
        REQUIRE(index.size() > gz.size());
    }

    SECTION("Identical text scores cosine 1 for its commune")
    {
        auto hits = index.search(test_utils::FakeEmbeddingProvider::letterHistogram("Temuco"), 3);
        REQUIRE_FALSE(hits.empty());
        REQUIRE(gz.record(hits.front().commune).canonical_name == "Temuco");
        REQUIRE_THAT(hits.front().cosine, WithinAbs(1.0, 1e-6));
        for (size_t i = 1; i < hits.size(); ++i)
            REQUIRE(hits[i - 1].cosine >= hits[i].cosine);
    }

    SECTION("One hit per commune")
    {
        auto hits = index.search(test_utils::FakeEmbeddingProvider::letterHistogram("Quilpue"), 50);
        REQUIRE(hits.size() == gz.size());
    }

    SECTION("Dimension mismatch throws InvalidResponse")
    {
        try
        {
            (void)index.search(provider::Embedding(3, 1.0f), 5);
            FAIL("expected SignalUnavailable");
        }
        catch (const provider::SignalUnavailable& ex)
        {
            REQUIRE(ex.kind() == provider::SignalError::InvalidResponse);
        }
    }

    SECTION("Zero query vector yields no hits")
    {
        REQUIRE(index.search(provider::Embedding(test_utils::FakeEmbeddingProvider::kDimension, 0.0f), 5).empty());
    }
}

TEST_CASE("EmbeddingIndex - provider failure propagates", "[embedding]")
{
    processing::FoldingTextNormalizer normalizer;
    auto gz = Gazetteer::build(test_utils::sampleCommunes(), normalizer);
    test_utils::FakeEmbeddingProvider embedder;
    embedder.failWith(provider::SignalError::Timeout);

    REQUIRE_THROWS_AS(EmbeddingIndex::build(gz, embedder), provider::SignalUnavailable);
}
