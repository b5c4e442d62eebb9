#pragma once

#include "CommuneRecord.hpp"
#include "../processing/ITextNormalizer.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace gazetteer
{

/**
 * @brief Immutable commune reference list with its alias table.
 *
 * Every alias is stored in normalized form and maps to exactly one commune.
 * Aliases come from three sources, in decreasing priority: canonical names,
 * explicit aliases supplied with the data, and derived spellings (accent-free,
 * upper/lower case, without a leading article or a trailing cardinal word).
 */
class Gazetteer
{
public:
    /**
     * @brief Validates the records and builds the alias table.
     *
     * Records with an empty name are skipped, duplicate canonical names keep the
     * first occurrence, and colliding aliases are dropped; each case logs a warning.
     * @throws DataUnavailableError when no record survives validation
     */
    static Gazetteer build(std::vector<CommuneRecord> records, const processing::ITextNormalizer& normalizer);

    // Commune owning the normalized alias, or nullptr
    const CommuneRecord* exactLookup(const std::string& normalized) const;

    // Alias entry for a normalized key, or nullptr
    const AliasEntry* lookupAlias(const std::string& normalized) const;

    // Commune by canonical name (exact spelling), or nullptr
    const CommuneRecord* find(const std::string& canonical_name) const;

    std::vector<std::string> allAliases() const { return alias_keys_; }
    // Normalized keys parallel to aliasEntries()
    const std::vector<std::string>& aliasKeys() const { return alias_keys_; }
    const std::vector<AliasEntry>& aliasEntries() const { return aliases_; }

    const std::vector<CommuneRecord>& records() const { return records_; }
    const CommuneRecord& record(std::size_t index) const { return records_.at(index); }
    std::size_t size() const { return records_.size(); }

    std::vector<std::string> canonicalNames() const;

    // Canonical names by pharmacy_count descending, then input order
    std::vector<std::string> mostCommon(std::size_t n) const;

    // Raw spellings derived from a canonical name, without duplicates, canonical first
    static std::vector<std::string> deriveAliases(const std::string& canonical_name,
                                                  const processing::ITextNormalizer& normalizer);

private:
    Gazetteer() = default;

    bool claim(const std::string& normalized, const std::string& raw, std::size_t commune, AliasKind kind);
    void addRawAlias(std::size_t commune, const std::string& raw);

    std::vector<CommuneRecord> records_;
    std::vector<AliasEntry> aliases_;
    std::vector<std::string> alias_keys_;
    std::vector<std::size_t> popularity_order_;
    std::unordered_map<std::string, std::size_t> alias_index_;     // normalized -> aliases_ slot
    std::unordered_map<std::string, std::size_t> canonical_index_; // canonical name -> records_ slot
};

} // namespace gazetteer
