#include "commune_fixture.hpp"

namespace test_utils {

gazetteer::CommuneRecord commune(const char* name, const char* region, std::size_t pharmacies,
                                 std::vector<std::string> aliases) {
    gazetteer::CommuneRecord record;
    record.canonical_name = name;
    record.region = region;
    record.pharmacy_count = pharmacies;
    record.aliases = std::move(aliases);
    return record;
}

std::vector<gazetteer::CommuneRecord> sampleCommunes() {
    return {
        commune("Quilpué", "Valparaíso", 34),
        commune("La Florida", "Metropolitana", 98),
        commune("Las Condes", "Metropolitana", 148),
        commune("Santiago", "Metropolitana", 312, {"Santiago Centro"}),
        commune("Valparaíso", "Valparaíso", 76, {"Valpo"}),
        commune("Viña del Mar", "Valparaíso", 92),
        commune("La Serena", "Coquimbo", 48),
        commune("Maipú", "Metropolitana", 120),
        commune("Temuco", "La Araucanía", 58),
        commune("Antofagasta", "Antofagasta", 63),
        commune("Villa Alemana", "Valparaíso", 26),
        commune("La Reina", "Metropolitana", 27),
        commune("San José de Maipo", "Metropolitana", 3),
        commune("Puente Alto", "Metropolitana", 105),
        commune("Concepción", "Biobío", 71),
        commune("Ñuñoa", "Metropolitana", 87),
        commune("Providencia", "Metropolitana", 141),
        commune("Los Ángeles", "Biobío", 32),
        commune("Quillota", "Valparaíso", 19),
        commune("Quilicura", "Metropolitana", 38),
    };
}

}  // namespace test_utils
