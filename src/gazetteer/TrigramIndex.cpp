#include "TrigramIndex.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>

namespace gazetteer
{

std::unordered_set<std::u32string> TrigramIndex::shingles(const std::string& normalized)
{
    std::unordered_set<std::u32string> out;
    if (normalized.empty())
        return out;

    const std::u32string padded = U"  " + processing::utf8ToUtf32(normalized) + U"  ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i)
        out.insert(padded.substr(i, 3));
    return out;
}

TrigramIndex TrigramIndex::build(const Gazetteer& gazetteer)
{
    CMATCH_PROFILE_FUNCTION();

    TrigramIndex index;
    index.names_ = gazetteer.canonicalNames();
    index.commune_shingles_.resize(gazetteer.size());

    for (const auto& alias : gazetteer.aliasEntries())
    {
        for (const auto& gram : shingles(alias.normalized))
            index.commune_shingles_[alias.commune].insert(gram);
    }

    for (std::size_t commune = 0; commune < index.commune_shingles_.size(); ++commune)
    {
        for (const auto& gram : index.commune_shingles_[commune])
            index.postings_[gram].push_back(commune);
    }
    return index;
}

std::vector<TrigramHit> TrigramIndex::search(const std::string& normalized, std::size_t top_k) const
{
    std::vector<TrigramHit> hits;
    if (names_.empty() || normalized.empty() || top_k == 0)
        return hits;

    const auto query = shingles(normalized);

    std::unordered_map<std::size_t, std::size_t> shared;
    for (const auto& gram : query)
    {
        auto it = postings_.find(gram);
        if (it == postings_.end())
            continue;
        for (std::size_t commune : it->second)
            ++shared[commune];
    }

    hits.reserve(shared.size());
    for (const auto& [commune, count] : shared)
    {
        const std::size_t union_size = query.size() + commune_shingles_[commune].size() - count;
        TrigramHit hit;
        hit.commune = commune;
        hit.shared = count;
        hit.union_size = union_size;
        hit.jaccard = union_size == 0 ? 0.0 : static_cast<double>(count) / static_cast<double>(union_size);
        hits.push_back(hit);
    }

    std::sort(hits.begin(), hits.end(),
              [this](const TrigramHit& a, const TrigramHit& b)
              {
                  if (a.jaccard != b.jaccard)
                      return a.jaccard > b.jaccard;
                  return names_[a.commune] < names_[b.commune];
              });
    if (hits.size() > top_k)
        hits.resize(top_k);
    return hits;
}

} // namespace gazetteer
