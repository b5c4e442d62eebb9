#pragma once

#include "CascadeConfig.hpp"
#include "IMatchStrategy.hpp"
#include "../processing/IFuzzyMatcher.hpp"
#include "../provider/IEmbeddingProvider.hpp"

#include <memory>

namespace matching
{

// Normalized alias lookup; a hit scores 1.0
class ExactStrategy : public IMatchStrategy
{
public:
    const char* name() const override { return "exact"; }
    MatchMethod method() const override { return MatchMethod::Exact; }
    CandidateList search(const StrategyQuery& query) const override;
};

/**
 * @brief Edit-distance similarity against every normalized alias.
 *
 * Score per alias is the fuzzy ratio plus a fixed bonus when one string
 * contains the other (both at least min_substring_length codepoints),
 * clamped to 1. A commune scores its best alias. Candidates below
 * suggestion_threshold are dropped.
 */
class FuzzyStrategy : public IMatchStrategy
{
public:
    FuzzyStrategy(std::shared_ptr<const processing::IFuzzyMatcher> matcher, const CascadeConfig& cfg);

    const char* name() const override { return "fuzzy"; }
    MatchMethod method() const override { return MatchMethod::Fuzzy; }
    CandidateList search(const StrategyQuery& query) const override;

private:
    std::shared_ptr<const processing::IFuzzyMatcher> matcher_;
    processing::MatchAlgorithm algorithm_;
    double floor_;
    double substring_bonus_;
    std::size_t min_substring_length_;
};

// Jaccard similarity over padded character trigrams
class TrigramStrategy : public IMatchStrategy
{
public:
    explicit TrigramStrategy(const CascadeConfig& cfg);

    const char* name() const override { return "trigram"; }
    MatchMethod method() const override { return MatchMethod::Trigram; }
    CandidateList search(const StrategyQuery& query) const override;

private:
    std::size_t top_k_;
};

// Cosine similarity between the query embedding and the generation's alias vectors
class EmbeddingStrategy : public IMatchStrategy
{
public:
    EmbeddingStrategy(std::shared_ptr<provider::IEmbeddingProvider> embedder, const CascadeConfig& cfg);

    const char* name() const override { return "embedding"; }
    MatchMethod method() const override { return MatchMethod::Embedding; }
    bool isAvailable(const gazetteer::GazetteerGeneration& generation) const override;
    CandidateList search(const StrategyQuery& query) const override;

private:
    std::shared_ptr<provider::IEmbeddingProvider> embedder_;
    std::size_t top_k_;
};

} // namespace matching
