#pragma once

#include "CommuneRecord.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace gazetteer
{

/**
 * @brief Reads commune reference data from JSON.
 *
 * Accepted layouts:
 * @code
 * {"communes": [{"name": "Quilpué", "region": "Valparaíso", "aliases": ["Quilpue"], "pharmacies": 12}]}
 * [{"name": "Quilpué", "region": "Valparaíso"}]
 * {"communes_data": {"QUILPUE": {"original_name": "Quilpué", "region": "Valparaíso",
 *                                "variations": ["quilpue"], "statistics": {"total_pharmacies": 12}}}}
 * @endcode
 * Malformed entries are skipped with a warning; the Gazetteer performs the
 * remaining validation.
 */
class GazetteerLoader
{
public:
    // @throws DataUnavailableError when the file is missing, unreadable or not JSON
    static std::vector<CommuneRecord> loadFile(const std::string& path);

    // @throws DataUnavailableError when the text is not JSON or has an unknown layout
    static std::vector<CommuneRecord> parseString(const std::string& text);

    // @throws DataUnavailableError for an unknown layout
    static std::vector<CommuneRecord> parse(const nlohmann::json& root);
};

} // namespace gazetteer
