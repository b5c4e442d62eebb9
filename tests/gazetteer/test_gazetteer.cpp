#include <catch2/catch_test_macros.hpp>
#include "gazetteer/Gazetteer.hpp"
#include "processing/FoldingTextNormalizer.hpp"
#include "../utils/commune_fixture.hpp"

#include <algorithm>
#include <set>

using namespace gazetteer;
using test_utils::commune;

namespace
{
bool hasAlias(const CommuneRecord& record, const std::string& raw)
{
    return std::find(record.aliases.begin(), record.aliases.end(), raw) != record.aliases.end();
}
} // namespace

TEST_CASE("Gazetteer - build and exact lookup", "[gazetteer]")
{
    processing::FoldingTextNormalizer normalizer;
    auto gz = Gazetteer::build(test_utils::sampleCommunes(), normalizer);

    REQUIRE(gz.size() == 20);

    SECTION("Every canonical name resolves through its normalized key")
    {
        for (const auto& name : gz.canonicalNames())
        {
            const auto* record = gz.exactLookup(normalizer.normalizeText(name));
            REQUIRE(record != nullptr);
            REQUIRE(record->canonical_name == name);
        }
    }

    SECTION("Accent-free and upper-case spellings resolve to the canonical commune")
    {
        REQUIRE(gz.exactLookup("quilpue")->canonical_name == "Quilpué");
        REQUIRE(gz.exactLookup("nunoa")->canonical_name == "Ñuñoa");
        REQUIRE(gz.exactLookup("vina del mar")->canonical_name == "Viña del Mar");
    }

    SECTION("Unknown keys return nullptr")
    {
        REQUIRE(gz.exactLookup("xyz123") == nullptr);
        REQUIRE(gz.exactLookup("") == nullptr);
        REQUIRE(gz.lookupAlias("xyz123") == nullptr);
    }

    SECTION("Explicit aliases are indexed")
    {
        REQUIRE(gz.exactLookup("valpo")->canonical_name == "Valparaíso");
        REQUIRE(gz.exactLookup("santiago centro")->canonical_name == "Santiago");
        REQUIRE(gz.lookupAlias("valpo")->kind == AliasKind::Explicit);
    }

    SECTION("Derived aliases drop leading articles and trailing qualifiers")
    {
        REQUIRE(gz.exactLookup("florida")->canonical_name == "La Florida");
        REQUIRE(gz.exactLookup("angeles")->canonical_name == "Los Ángeles");
        REQUIRE(gz.exactLookup("puente")->canonical_name == "Puente Alto");
        REQUIRE(gz.lookupAlias("florida")->kind == AliasKind::Derived);
    }

    SECTION("Records carry their raw spellings, canonical first")
    {
        const auto* quilpue = gz.find("Quilpué");
        REQUIRE(quilpue != nullptr);
        REQUIRE(quilpue->aliases.front() == "Quilpué");
        REQUIRE(hasAlias(*quilpue, "Quilpue"));
        REQUIRE(hasAlias(*quilpue, "QUILPUÉ"));
        REQUIRE(hasAlias(*quilpue, "QUILPUE"));
    }

    SECTION("Alias keys are unique and parallel to alias entries")
    {
        const auto& keys = gz.aliasKeys();
        REQUIRE(keys.size() == gz.aliasEntries().size());
        std::set<std::string> unique(keys.begin(), keys.end());
        REQUIRE(unique.size() == keys.size());
        for (size_t i = 0; i < keys.size(); ++i)
            REQUIRE(gz.aliasEntries()[i].normalized == keys[i]);
        REQUIRE(gz.allAliases() == keys);
    }

    SECTION("find uses the exact canonical spelling")
    {
        REQUIRE(gz.find("Las Condes") != nullptr);
        REQUIRE(gz.find("las condes") == nullptr);
    }
}

TEST_CASE("Gazetteer - mostCommon orders by pharmacy count", "[gazetteer]")
{
    processing::FoldingTextNormalizer normalizer;

    SECTION("Descending popularity")
    {
        auto gz = Gazetteer::build(test_utils::sampleCommunes(), normalizer);
        auto top = gz.mostCommon(3);
        REQUIRE(top == std::vector<std::string>{"Santiago", "Las Condes", "Providencia"});
    }

    SECTION("Ties keep input order and n may exceed size")
    {
        auto gz = Gazetteer::build({commune("Temuco", "La Araucanía", 5), commune("Arica", "Arica", 5),
                                    commune("Calama", "Antofagasta", 9)},
                                   normalizer);
        auto all = gz.mostCommon(10);
        REQUIRE(all == std::vector<std::string>{"Calama", "Temuco", "Arica"});
        REQUIRE(gz.mostCommon(0).empty());
    }
}

TEST_CASE("Gazetteer - validation", "[gazetteer]")
{
    processing::FoldingTextNormalizer normalizer;

    SECTION("Empty input throws DataUnavailableError")
    {
        REQUIRE_THROWS_AS(Gazetteer::build({}, normalizer), DataUnavailableError);
    }

    SECTION("Records without a usable name are skipped")
    {
        REQUIRE_THROWS_AS(Gazetteer::build({commune("", "X"), commune("  ?! ", "Y")}, normalizer),
                          DataUnavailableError);

        auto gz = Gazetteer::build({commune("", "X"), commune("Temuco", "La Araucanía")}, normalizer);
        REQUIRE(gz.size() == 1);
    }

    SECTION("Duplicate canonical names keep the first record")
    {
        auto gz = Gazetteer::build({commune("Maipú", "Metropolitana", 10), commune("MAIPU", "Otra", 99)},
                                   normalizer);
        REQUIRE(gz.size() == 1);
        REQUIRE(gz.record(0).region == "Metropolitana");
        REQUIRE(gz.record(0).pharmacy_count == 10);
    }

    SECTION("Explicit alias claimed by a canonical name stays with that commune")
    {
        auto gz = Gazetteer::build({commune("Santiago", "Metropolitana"),
                                    commune("Estación Central", "Metropolitana", 0, {"Santiago", "Estacion"})},
                                   normalizer);
        REQUIRE(gz.exactLookup("santiago")->canonical_name == "Santiago");
        REQUIRE(gz.exactLookup("estacion")->canonical_name == "Estación Central");
    }

    SECTION("Ambiguous derived aliases are dropped")
    {
        // Both would derive "condes"
        auto gz = Gazetteer::build({commune("Las Condes", "Metropolitana"), commune("Los Condes", "Ficticia")},
                                   normalizer);
        REQUIRE(gz.exactLookup("condes") == nullptr);
        REQUIRE(gz.exactLookup("las condes")->canonical_name == "Las Condes");
        REQUIRE(gz.exactLookup("los condes")->canonical_name == "Los Condes");
    }

    SECTION("Names are trimmed")
    {
        auto gz = Gazetteer::build({commune("  Temuco ", " La Araucanía ")}, normalizer);
        REQUIRE(gz.record(0).canonical_name == "Temuco");
        REQUIRE(gz.record(0).region == "La Araucanía");
    }
}

TEST_CASE("Gazetteer - deriveAliases", "[gazetteer]")
{
    processing::FoldingTextNormalizer normalizer;

    auto aliases = Gazetteer::deriveAliases("La Florida", normalizer);
    REQUIRE(aliases.front() == "La Florida");
    REQUIRE(std::find(aliases.begin(), aliases.end(), "Florida") != aliases.end());
    REQUIRE(std::find(aliases.begin(), aliases.end(), "LA FLORIDA") != aliases.end());
    REQUIRE(std::find(aliases.begin(), aliases.end(), "la florida") != aliases.end());

    auto single = Gazetteer::deriveAliases("Temuco", normalizer);
    REQUIRE(std::find(single.begin(), single.end(), "TEMUCO") != single.end());
    std::set<std::string> unique(single.begin(), single.end());
    REQUIRE(unique.size() == single.size());
}
