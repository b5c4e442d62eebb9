#include "GazetteerLoader.hpp"
#include "../utils/ErrorReporter.hpp"

#include <fstream>
#include <limits>
#include <plog/Log.h>

using json = nlohmann::json;

namespace
{

std::string stringField(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

std::size_t countField(const json& value)
{
    if (value.is_number_unsigned())
        return value.get<std::size_t>();
    if (value.is_number_integer())
    {
        const auto v = value.get<long long>();
        return v > 0 ? static_cast<std::size_t>(v) : 0;
    }
    if (value.is_number_float())
    {
        // Casting a double beyond SIZE_MAX is undefined; saturate instead
        constexpr auto kMax = std::numeric_limits<std::size_t>::max();
        const auto v = value.get<double>();
        if (!(v > 0.0))
            return 0;
        return v >= static_cast<double>(kMax) ? kMax : static_cast<std::size_t>(v);
    }
    return 0;
}

std::vector<std::string> stringList(const json& object, const char* key)
{
    std::vector<std::string> out;
    auto it = object.find(key);
    if (it == object.end() || !it->is_array())
        return out;
    for (const auto& item : *it)
    {
        if (item.is_string())
            out.push_back(item.get<std::string>());
    }
    return out;
}

/// Helper: {"name", "region", "aliases"?, "pharmacies"?}
bool parseFlatRecord(const json& item, gazetteer::CommuneRecord& out)
{
    if (!item.is_object())
        return false;
    out.canonical_name = stringField(item, "name");
    if (out.canonical_name.empty())
        out.canonical_name = stringField(item, "canonical_name");
    if (out.canonical_name.empty())
        return false;
    out.region = stringField(item, "region");
    out.aliases = stringList(item, "aliases");
    if (auto it = item.find("pharmacies"); it != item.end())
        out.pharmacy_count = countField(*it);
    else if (auto pc = item.find("pharmacy_count"); pc != item.end())
        out.pharmacy_count = countField(*pc);
    return true;
}

/// Helper: analyzer layout keyed by upper-case name
bool parseAnalyzerRecord(const std::string& key, const json& item, gazetteer::CommuneRecord& out)
{
    if (!item.is_object())
        return false;
    out.canonical_name = stringField(item, "original_name");
    if (out.canonical_name.empty())
        out.canonical_name = key;
    out.region = stringField(item, "region");
    out.aliases = stringList(item, "variations");
    if (auto stats = item.find("statistics"); stats != item.end() && stats->is_object())
    {
        if (auto total = stats->find("total_pharmacies"); total != stats->end())
            out.pharmacy_count = countField(*total);
    }
    return true;
}

} // namespace

namespace gazetteer
{

std::vector<CommuneRecord> GazetteerLoader::loadFile(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        PLOG_ERROR << "GazetteerLoader: Failed to open commune data file: " << path;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Gazetteer, "Commune data file not found", path);
        throw DataUnavailableError("cannot open commune data file: " + path);
    }

    json root = json::parse(file, nullptr, /*allow_exceptions*/ false);
    if (root.is_discarded())
    {
        PLOG_ERROR << "GazetteerLoader: JSON parse error in " << path;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Gazetteer, "Commune data file is not valid JSON",
                                          path);
        throw DataUnavailableError("commune data file is not valid JSON: " + path);
    }

    auto records = parse(root);
    PLOG_INFO << "GazetteerLoader: Loaded " << records.size() << " communes from " << path;
    return records;
}

std::vector<CommuneRecord> GazetteerLoader::parseString(const std::string& text)
{
    json root = json::parse(text, nullptr, /*allow_exceptions*/ false);
    if (root.is_discarded())
        throw DataUnavailableError("commune data is not valid JSON");
    return parse(root);
}

std::vector<CommuneRecord> GazetteerLoader::parse(const json& root)
{
    std::vector<CommuneRecord> records;
    std::size_t error_count = 0;

    const json* flat = nullptr;
    if (root.is_array())
        flat = &root;
    else if (root.is_object() && root.contains("communes") && root["communes"].is_array())
        flat = &root["communes"];

    if (flat)
    {
        std::size_t position = 0;
        for (const auto& item : *flat)
        {
            ++position;
            CommuneRecord record;
            if (parseFlatRecord(item, record))
            {
                records.push_back(std::move(record));
            }
            else
            {
                PLOG_WARNING << "GazetteerLoader: Skipping malformed commune entry #" << position;
                ++error_count;
            }
        }
    }
    else if (root.is_object() && root.contains("communes_data") && root["communes_data"].is_object())
    {
        for (const auto& [key, item] : root["communes_data"].items())
        {
            CommuneRecord record;
            if (parseAnalyzerRecord(key, item, record))
            {
                records.push_back(std::move(record));
            }
            else
            {
                PLOG_WARNING << "GazetteerLoader: Skipping malformed commune entry '" << key << "'";
                ++error_count;
            }
        }
    }
    else
    {
        throw DataUnavailableError("unknown commune data layout (expected communes, communes_data or an array)");
    }

    if (error_count > 0)
    {
        PLOG_WARNING << "GazetteerLoader: Encountered " << error_count << " malformed entries";
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Gazetteer, "Malformed commune entries skipped",
                                            std::to_string(error_count) + " entries");
    }
    return records;
}

} // namespace gazetteer
