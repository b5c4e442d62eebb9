#include <catch2/catch_test_macros.hpp>
#include "gazetteer/GazetteerLoader.hpp"

#include <filesystem>
#include <fstream>
#include <limits>

using namespace gazetteer;

TEST_CASE("GazetteerLoader - flat layout", "[gazetteer][loader]")
{
    SECTION("communes array with optional fields")
    {
        auto records = GazetteerLoader::parseString(R"({
            "communes": [
                {"name": "Quilpué", "region": "Valparaíso", "aliases": ["Quilpue", 7], "pharmacies": 34},
                {"name": "Temuco", "region": "La Araucanía"}
            ]
        })");
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].canonical_name == "Quilpué");
        REQUIRE(records[0].region == "Valparaíso");
        REQUIRE(records[0].aliases == std::vector<std::string>{"Quilpue"});
        REQUIRE(records[0].pharmacy_count == 34);
        REQUIRE(records[1].pharmacy_count == 0);
        REQUIRE(records[1].aliases.empty());
    }

    SECTION("Pharmacy counts are clamped to the representable range")
    {
        auto records = GazetteerLoader::parseString(R"({"communes": [
            {"name": "Arica", "pharmacies": 1e30},
            {"name": "Iquique", "pharmacies": -4},
            {"name": "Calama", "pharmacies": 12.7}
        ]})");
        REQUIRE(records.size() == 3);
        REQUIRE(records[0].pharmacy_count == std::numeric_limits<std::size_t>::max());
        REQUIRE(records[1].pharmacy_count == 0);
        REQUIRE(records[2].pharmacy_count == 12);
    }

    SECTION("Bare array")
    {
        auto records = GazetteerLoader::parseString(R"([{"name": "Arica", "region": "Arica y Parinacota"}])");
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].canonical_name == "Arica");
    }

    SECTION("Malformed entries are skipped")
    {
        auto records = GazetteerLoader::parseString(R"({"communes": [{"region": "Sin nombre"}, "Temuco", 42,
                                                                     {"name": "Osorno", "region": "Los Lagos"}]})");
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].canonical_name == "Osorno");
    }
}

TEST_CASE("GazetteerLoader - analyzer layout", "[gazetteer][loader]")
{
    auto records = GazetteerLoader::parseString(R"({
        "communes_data": {
            "QUILPUE": {
                "original_name": "Quilpué",
                "region": "Valparaíso",
                "variations": ["quilpue", "QUILPUE"],
                "statistics": {"total_pharmacies": 12}
            },
            "TEMUCO": {"region": "La Araucanía"}
        }
    })");

    REQUIRE(records.size() == 2);
    // Keys are visited in sorted order
    REQUIRE(records[0].canonical_name == "Quilpué");
    REQUIRE(records[0].aliases.size() == 2);
    REQUIRE(records[0].pharmacy_count == 12);
    REQUIRE(records[1].canonical_name == "TEMUCO");
}

TEST_CASE("GazetteerLoader - errors", "[gazetteer][loader]")
{
    SECTION("Invalid JSON")
    {
        REQUIRE_THROWS_AS(GazetteerLoader::parseString("{not json"), DataUnavailableError);
    }

    SECTION("Unknown layout")
    {
        REQUIRE_THROWS_AS(GazetteerLoader::parseString(R"({"regions": []})"), DataUnavailableError);
    }

    SECTION("Missing file")
    {
        REQUIRE_THROWS_AS(GazetteerLoader::loadFile("does/not/exist/communes.json"), DataUnavailableError);
    }
}

TEST_CASE("GazetteerLoader - loadFile reads from disk", "[gazetteer][loader]")
{
    const auto path = std::filesystem::temp_directory_path() / "comuna_match_loader_test.json";
    {
        std::ofstream out(path, std::ios::binary);
        out << R"({"communes": [{"name": "Valdivia", "region": "Los Ríos", "pharmacies": 31}]})";
    }

    auto records = GazetteerLoader::loadFile(path.string());
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].canonical_name == "Valdivia");
    REQUIRE(records[0].pharmacy_count == 31);

    std::filesystem::remove(path);
}
