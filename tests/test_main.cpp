// Catch2WithMain provides main(); this file holds the end-to-end smoke test
// against the commune list shipped in assets/.

#include <catch2/catch_test_macros.hpp>
#include "gazetteer/GazetteerLoader.hpp"
#include "matching/CommuneMatcher.hpp"
#include "matching/Diagnostics.hpp"

#include <string>
#include <vector>

TEST_CASE("Bundled commune list smoke test", "[smoke]")
{
    auto records = gazetteer::GazetteerLoader::loadFile(std::string(CMATCH_ASSETS_DIR) + "/communes.json");
    REQUIRE(records.size() >= 50);

    matching::CommuneMatcher matcher(std::move(records));
    REQUIRE(matcher.match("Quilpué").matched_commune == "Quilpué");
    REQUIRE(matcher.match("farmacias en la florida").matched_commune == "La Florida");
    REQUIRE(matcher.match("kilpue").matched_commune == "Quilpué");
    REQUIRE_FALSE(matcher.match("xyz123").matched());
}

TEST_CASE("Every bundled commune name resolves to itself", "[smoke]")
{
    auto records = gazetteer::GazetteerLoader::loadFile(std::string(CMATCH_ASSETS_DIR) + "/communes.json");
    std::vector<std::string> names;
    for (const auto& record : records)
        names.push_back(record.canonical_name);
    REQUIRE(names.size() == records.size());

    matching::CommuneMatcher matcher(std::move(records));
    for (const auto& name : names)
    {
        CAPTURE(name);
        auto result = matcher.match(name);
        REQUIRE(result.matched_commune == name);
        REQUIRE(result.method == matching::MatchMethod::Exact);
        REQUIRE(result.confidence == 1.0);
        REQUIRE_FALSE(result.intent.has_value());
    }
}

TEST_CASE("Diagnostics - previews", "[smoke][diagnostics]")
{
    matching::Diagnostics::SetMaxPreview(8);
    REQUIRE(matching::Diagnostics::Preview("Quilpué") == "Quilpué");
    REQUIRE(matching::Diagnostics::Preview("line\nbreak") == "line\\nbre... (10 bytes)");
    matching::Diagnostics::SetMaxPreview(7);
    REQUIRE(matching::Diagnostics::Preview("Quilpué") == "Quilpu... (8 bytes)");
    REQUIRE(matching::Diagnostics::Preview("a\x01b") == "a?b");
    matching::Diagnostics::SetMaxPreview(120);
}

TEST_CASE("Diagnostics - candidate summaries", "[smoke][diagnostics]")
{
    matching::CandidateList candidates;
    REQUIRE(matching::Diagnostics::DescribeCandidates(candidates) == "(none)");

    for (const char* name : { "Quilpué", "Quillota", "Quintero" })
    {
        matching::ScoredCandidate c;
        c.commune = name;
        c.score = 0.5;
        candidates.push_back(c);
    }
    candidates[0].score = 10.0 / 13.0;
    REQUIRE(matching::Diagnostics::DescribeCandidates(candidates, 2) == "Quilpué=0.769, Quillota=0.500, +1 more");
}
