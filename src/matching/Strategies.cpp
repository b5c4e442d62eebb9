#include "Strategies.hpp"
#include "../processing/TextUtils.hpp"
#include "../provider/ProviderTypes.hpp"

#include <algorithm>
#include <unordered_map>

namespace matching
{

void sortCandidates(CandidateList& candidates)
{
    std::sort(candidates.begin(), candidates.end(),
              [](const ScoredCandidate& a, const ScoredCandidate& b)
              {
                  if (a.score != b.score)
                      return a.score > b.score;
                  return a.commune < b.commune;
              });
}

CandidateList ExactStrategy::search(const StrategyQuery& query) const
{
    CandidateList out;
    const auto* alias = query.generation.gazetteer.lookupAlias(query.normalized);
    if (!alias)
        return out;
    const auto& record = query.generation.gazetteer.record(alias->commune);
    out.push_back(ScoredCandidate{ record.canonical_name, 1.0, ExactEvidence{ alias->raw } });
    return out;
}

FuzzyStrategy::FuzzyStrategy(std::shared_ptr<const processing::IFuzzyMatcher> matcher, const CascadeConfig& cfg)
    : matcher_(std::move(matcher))
    , algorithm_(cfg.fuzzy_algorithm)
    , floor_(cfg.suggestion_threshold)
    , substring_bonus_(cfg.substring_bonus)
    , min_substring_length_(cfg.min_substring_length)
{
}

CandidateList FuzzyStrategy::search(const StrategyQuery& query) const
{
    CandidateList out;
    if (query.normalized.empty())
        return out;

    const auto& gazetteer = query.generation.gazetteer;
    const auto& keys = gazetteer.aliasKeys();
    const auto& entries = gazetteer.aliasEntries();
    const auto scores = matcher_->scoreAll(query.normalized, keys, algorithm_);

    const std::size_t query_length = processing::utf8ToUtf32(query.normalized).size();

    std::unordered_map<std::size_t, std::size_t> best; // commune -> slot in out
    for (std::size_t i = 0; i < keys.size() && i < scores.size(); ++i)
    {
        const double raw = scores[i];
        bool bonus = false;
        if (substring_bonus_ > 0.0 && query_length >= min_substring_length_ &&
            processing::utf8ToUtf32(keys[i]).size() >= min_substring_length_ &&
            (keys[i].find(query.normalized) != std::string::npos ||
             query.normalized.find(keys[i]) != std::string::npos))
        {
            bonus = true;
        }
        const double score = std::clamp(raw + (bonus ? substring_bonus_ : 0.0), 0.0, 1.0);
        if (score < floor_)
            continue;

        const std::size_t commune = entries[i].commune;
        ScoredCandidate candidate{ gazetteer.record(commune).canonical_name, score,
                                   FuzzyEvidence{ entries[i].raw, raw, bonus } };
        auto [it, inserted] = best.try_emplace(commune, out.size());
        if (inserted)
            out.push_back(std::move(candidate));
        else if (score > out[it->second].score)
            out[it->second] = std::move(candidate);
    }

    sortCandidates(out);
    return out;
}

TrigramStrategy::TrigramStrategy(const CascadeConfig& cfg)
    : top_k_(cfg.candidate_pool)
{
}

CandidateList TrigramStrategy::search(const StrategyQuery& query) const
{
    CandidateList out;
    for (const auto& hit : query.generation.trigrams.search(query.normalized, top_k_))
    {
        out.push_back(ScoredCandidate{ query.generation.gazetteer.record(hit.commune).canonical_name, hit.jaccard,
                                       TrigramEvidence{ hit.shared, hit.union_size } });
    }
    return out;
}

EmbeddingStrategy::EmbeddingStrategy(std::shared_ptr<provider::IEmbeddingProvider> embedder,
                                     const CascadeConfig& cfg)
    : embedder_(std::move(embedder))
    , top_k_(cfg.candidate_pool)
{
}

bool EmbeddingStrategy::isAvailable(const gazetteer::GazetteerGeneration& generation) const
{
    return embedder_ && generation.embeddings.has_value() && generation.embeddings->size() > 0;
}

CandidateList EmbeddingStrategy::search(const StrategyQuery& query) const
{
    CandidateList out;
    if (!isAvailable(query.generation))
        return out;

    auto vectors = embedder_->encode({ query.text }, query.cancel_flag);
    if (vectors.size() != 1)
    {
        throw provider::SignalUnavailable(provider::SignalError::InvalidResponse, embedder_->providerName(),
                                          "expected one query vector");
    }

    for (const auto& hit : query.generation.embeddings->search(std::move(vectors.front()), top_k_))
    {
        const double score = std::clamp(hit.cosine, 0.0, 1.0);
        out.push_back(ScoredCandidate{ query.generation.gazetteer.record(hit.commune).canonical_name, score,
                                       EmbeddingEvidence{ hit.alias, hit.cosine } });
    }
    sortCandidates(out);
    return out;
}

} // namespace matching
