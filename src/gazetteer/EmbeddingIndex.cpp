#include "EmbeddingIndex.hpp"
#include "../provider/ProviderTypes.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace gazetteer
{

bool EmbeddingIndex::normalize(provider::Embedding& vec)
{
    double norm = 0.0;
    for (float v : vec)
        norm += static_cast<double>(v) * static_cast<double>(v);
    if (vec.empty() || norm <= 0.0)
        return false;
    const double inv = 1.0 / std::sqrt(norm);
    for (float& v : vec)
        v = static_cast<float>(static_cast<double>(v) * inv);
    return true;
}

EmbeddingIndex EmbeddingIndex::build(const Gazetteer& gazetteer, provider::IEmbeddingProvider& embedder)
{
    CMATCH_PROFILE_FUNCTION();

    std::vector<std::string> texts;
    std::vector<std::size_t> owners;
    std::unordered_map<std::string, std::size_t> seen;
    for (std::size_t i = 0; i < gazetteer.size(); ++i)
    {
        for (const auto& alias : gazetteer.record(i).aliases)
        {
            if (seen.emplace(alias, texts.size()).second)
            {
                texts.push_back(alias);
                owners.push_back(i);
            }
        }
    }

    auto vectors = embedder.encode(texts);
    if (vectors.size() != texts.size())
    {
        throw provider::SignalUnavailable(provider::SignalError::InvalidResponse, embedder.providerName(),
                                          "returned " + std::to_string(vectors.size()) + " vectors for " +
                                              std::to_string(texts.size()) + " aliases");
    }

    EmbeddingIndex index;
    index.names_ = gazetteer.canonicalNames();
    index.entries_.reserve(texts.size());
    for (std::size_t i = 0; i < texts.size(); ++i)
    {
        auto& vec = vectors[i];
        if (index.dimension_ == 0)
            index.dimension_ = vec.size();
        if (vec.size() != index.dimension_)
        {
            throw provider::SignalUnavailable(provider::SignalError::InvalidResponse, embedder.providerName(),
                                              "inconsistent embedding dimension for '" + texts[i] + "'");
        }
        if (!normalize(vec))
        {
            PLOG_WARNING << "EmbeddingIndex: Zero vector for alias '" << texts[i] << "', skipping it";
            continue;
        }
        index.entries_.push_back(Entry{ owners[i], texts[i], std::move(vec) });
    }

    PLOG_INFO << "EmbeddingIndex: Encoded " << index.entries_.size() << " aliases (" << index.dimension_
              << " dimensions)";
    return index;
}

std::vector<EmbeddingHit> EmbeddingIndex::search(provider::Embedding query, std::size_t top_k) const
{
    std::vector<EmbeddingHit> hits;
    if (entries_.empty() || top_k == 0)
        return hits;
    if (query.size() != dimension_)
    {
        throw provider::SignalUnavailable(provider::SignalError::InvalidResponse, "embedding index",
                                          "query dimension " + std::to_string(query.size()) + " != index dimension " +
                                              std::to_string(dimension_));
    }
    if (!normalize(query))
        return hits;

    std::unordered_map<std::size_t, std::size_t> best; // commune -> slot in hits
    for (const auto& entry : entries_)
    {
        double dot = 0.0;
        for (std::size_t d = 0; d < dimension_; ++d)
            dot += static_cast<double>(entry.unit[d]) * static_cast<double>(query[d]);
        dot = std::clamp(dot, -1.0, 1.0);

        auto [it, inserted] = best.try_emplace(entry.commune, hits.size());
        if (inserted)
            hits.push_back(EmbeddingHit{ entry.commune, dot, entry.alias });
        else if (dot > hits[it->second].cosine)
            hits[it->second] = EmbeddingHit{ entry.commune, dot, entry.alias };
    }

    std::sort(hits.begin(), hits.end(),
              [this](const EmbeddingHit& a, const EmbeddingHit& b)
              {
                  if (a.cosine != b.cosine)
                      return a.cosine > b.cosine;
                  return names_[a.commune] < names_[b.commune];
              });
    if (hits.size() > top_k)
        hits.resize(top_k);
    return hits;
}

} // namespace gazetteer
