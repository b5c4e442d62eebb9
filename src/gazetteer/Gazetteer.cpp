#include "Gazetteer.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <array>
#include <numeric>
#include <string_view>

namespace gazetteer
{

namespace
{

constexpr std::array<std::string_view, 6> kLeadingArticles = { "la", "las", "el", "los", "de", "del" };
constexpr std::array<std::string_view, 6> kTrailingQualifiers = { "norte", "sur", "este", "oeste", "alto", "bajo" };

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& words, const std::string& word)
{
    return std::find(words.begin(), words.end(), word) != words.end();
}

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

void pushUnique(std::vector<std::string>& out, std::string value)
{
    if (value.empty())
        return;
    if (std::find(out.begin(), out.end(), value) == out.end())
        out.push_back(std::move(value));
}

} // namespace

std::vector<std::string> Gazetteer::deriveAliases(const std::string& canonical_name,
                                                  const processing::ITextNormalizer& normalizer)
{
    std::vector<std::string> base;
    pushUnique(base, canonical_name);

    auto words = processing::splitWords(canonical_name);
    if (words.size() > 1 && contains(kLeadingArticles, normalizer.normalizeText(words.front())))
    {
        pushUnique(base, processing::joinWords(std::vector<std::string>(words.begin() + 1, words.end())));
    }
    if (words.size() > 1 && contains(kTrailingQualifiers, normalizer.normalizeText(words.back())))
    {
        pushUnique(base, processing::joinWords(std::vector<std::string>(words.begin(), words.end() - 1)));
    }

    std::vector<std::string> out;
    for (const auto& form : base)
    {
        const std::string unaccented = normalizer.stripAccents(form);
        pushUnique(out, form);
        pushUnique(out, unaccented);
        pushUnique(out, processing::upperCase(form));
        pushUnique(out, processing::foldCase(form));
        pushUnique(out, processing::upperCase(unaccented));
        pushUnique(out, processing::foldCase(unaccented));
    }
    return out;
}

Gazetteer Gazetteer::build(std::vector<CommuneRecord> records, const processing::ITextNormalizer& normalizer)
{
    Gazetteer gz;
    gz.records_.reserve(records.size());

    // Canonical names first: they own their keys unconditionally
    std::vector<std::vector<std::string>> explicit_aliases;
    std::size_t skipped = 0;
    for (auto& input : records)
    {
        CommuneRecord record;
        record.canonical_name = trim(input.canonical_name);
        record.region = trim(input.region);
        record.pharmacy_count = input.pharmacy_count;

        const std::string key = normalizer.normalizeText(record.canonical_name);
        if (key.empty())
        {
            PLOG_WARNING << "Gazetteer: Skipping record with empty name (region '" << record.region << "')";
            ++skipped;
            continue;
        }
        if (auto it = gz.alias_index_.find(key); it != gz.alias_index_.end())
        {
            PLOG_WARNING << "Gazetteer: Duplicate commune '" << record.canonical_name << "' (same as '"
                         << gz.records_[gz.aliases_[it->second].commune].canonical_name << "'), keeping the first";
            ++skipped;
            continue;
        }

        const std::size_t index = gz.records_.size();
        gz.canonical_index_.emplace(record.canonical_name, index);
        gz.records_.push_back(std::move(record));
        explicit_aliases.push_back(std::move(input.aliases));
        gz.claim(key, gz.records_[index].canonical_name, index, AliasKind::Canonical);
        gz.addRawAlias(index, gz.records_[index].canonical_name);
    }

    if (gz.records_.empty())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Gazetteer, "No usable commune records",
                                          std::to_string(records.size()) + " input records, " +
                                              std::to_string(skipped) + " skipped");
        throw DataUnavailableError("gazetteer has no usable commune records");
    }

    // Explicit aliases: first commune to claim a key keeps it
    for (std::size_t i = 0; i < gz.records_.size(); ++i)
    {
        for (const auto& raw_alias : explicit_aliases[i])
        {
            const std::string raw = trim(raw_alias);
            const std::string key = normalizer.normalizeText(raw);
            if (key.empty())
                continue;
            if (gz.claim(key, raw, i, AliasKind::Explicit))
            {
                gz.addRawAlias(i, raw);
                continue;
            }
            const auto& owner = gz.aliases_[gz.alias_index_.at(key)];
            if (owner.commune == i)
            {
                gz.addRawAlias(i, raw);
            }
            else
            {
                PLOG_WARNING << "Gazetteer: Alias '" << raw << "' of '" << gz.records_[i].canonical_name
                             << "' already belongs to '" << gz.records_[owner.commune].canonical_name
                             << "', dropping it";
            }
        }
    }

    // Derived aliases: keys reachable from more than one commune are ambiguous and dropped
    struct DerivedKey
    {
        std::string raw;
        std::size_t commune = 0;
        bool ambiguous = false;
        std::vector<std::string> spellings;
    };
    std::vector<std::string> derived_order;
    std::unordered_map<std::string, DerivedKey> derived;
    for (std::size_t i = 0; i < gz.records_.size(); ++i)
    {
        for (const auto& raw : deriveAliases(gz.records_[i].canonical_name, normalizer))
        {
            const std::string key = normalizer.normalizeText(raw);
            if (key.empty())
                continue;
            if (auto owner = gz.alias_index_.find(key); owner != gz.alias_index_.end())
            {
                // Spelling variants of a key this commune already owns are kept as raw aliases
                if (gz.aliases_[owner->second].commune == i)
                    gz.addRawAlias(i, raw);
                continue;
            }
            auto [it, inserted] = derived.try_emplace(key);
            if (inserted)
            {
                it->second.raw = raw;
                it->second.commune = i;
                derived_order.push_back(key);
            }
            else if (it->second.commune != i)
            {
                it->second.ambiguous = true;
            }
            it->second.spellings.push_back(raw);
        }
    }

    for (const auto& key : derived_order)
    {
        const auto& entry = derived.at(key);
        if (entry.ambiguous)
        {
            PLOG_WARNING << "Gazetteer: Derived alias '" << entry.raw << "' is ambiguous between communes, dropping it";
            continue;
        }
        gz.claim(key, entry.raw, entry.commune, AliasKind::Derived);
        for (const auto& spelling : entry.spellings)
            gz.addRawAlias(entry.commune, spelling);
    }

    gz.popularity_order_.resize(gz.records_.size());
    std::iota(gz.popularity_order_.begin(), gz.popularity_order_.end(), std::size_t{ 0 });
    std::stable_sort(gz.popularity_order_.begin(), gz.popularity_order_.end(), [&gz](std::size_t a, std::size_t b)
                     { return gz.records_[a].pharmacy_count > gz.records_[b].pharmacy_count; });

    if (skipped > 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Gazetteer, "Some commune records were skipped",
                                            std::to_string(skipped) + " of " + std::to_string(records.size()));
    }
    PLOG_INFO << "Gazetteer: Built " << gz.records_.size() << " communes with " << gz.aliases_.size()
              << " alias keys";
    return gz;
}

bool Gazetteer::claim(const std::string& normalized, const std::string& raw, std::size_t commune, AliasKind kind)
{
    if (alias_index_.count(normalized))
        return false;
    alias_index_.emplace(normalized, aliases_.size());
    aliases_.push_back(AliasEntry{ normalized, raw, commune, kind });
    alias_keys_.push_back(normalized);
    return true;
}

void Gazetteer::addRawAlias(std::size_t commune, const std::string& raw)
{
    pushUnique(records_[commune].aliases, raw);
}

const CommuneRecord* Gazetteer::exactLookup(const std::string& normalized) const
{
    auto it = alias_index_.find(normalized);
    if (it == alias_index_.end())
        return nullptr;
    return &records_[aliases_[it->second].commune];
}

const AliasEntry* Gazetteer::lookupAlias(const std::string& normalized) const
{
    auto it = alias_index_.find(normalized);
    if (it == alias_index_.end())
        return nullptr;
    return &aliases_[it->second];
}

const CommuneRecord* Gazetteer::find(const std::string& canonical_name) const
{
    auto it = canonical_index_.find(canonical_name);
    if (it == canonical_index_.end())
        return nullptr;
    return &records_[it->second];
}

std::vector<std::string> Gazetteer::canonicalNames() const
{
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& record : records_)
        out.push_back(record.canonical_name);
    return out;
}

std::vector<std::string> Gazetteer::mostCommon(std::size_t n) const
{
    std::vector<std::string> out;
    for (std::size_t i = 0; i < popularity_order_.size() && out.size() < n; ++i)
        out.push_back(records_[popularity_order_[i]].canonical_name);
    return out;
}

} // namespace gazetteer
