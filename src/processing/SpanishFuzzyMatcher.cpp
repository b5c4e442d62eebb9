#include "SpanishFuzzyMatcher.hpp"
#include "FoldingTextNormalizer.hpp"

#include <algorithm>

#include <rapidfuzz/fuzz.hpp>

namespace processing
{

namespace
{

struct AlgorithmName
{
    MatchAlgorithm algorithm;
    const char* name;
};

constexpr AlgorithmName kAlgorithmNames[] = {
    { MatchAlgorithm::Ratio, "ratio" },
    { MatchAlgorithm::PartialRatio, "partial_ratio" },
    { MatchAlgorithm::TokenSortRatio, "token_sort_ratio" },
    { MatchAlgorithm::TokenSetRatio, "token_set_ratio" },
};

// Builds the rapidfuzz cached scorer for the query once and hands it to fn.
// Cached scorers return the same values as the free fuzz:: functions.
template <typename Fn>
auto withScorer(MatchAlgorithm algorithm, const std::string& query, Fn&& fn)
{
    switch (algorithm)
    {
    case MatchAlgorithm::PartialRatio:
        return fn(rapidfuzz::fuzz::CachedPartialRatio<char>(query));
    case MatchAlgorithm::TokenSortRatio:
        return fn(rapidfuzz::fuzz::CachedTokenSortRatio<char>(query));
    case MatchAlgorithm::TokenSetRatio:
        return fn(rapidfuzz::fuzz::CachedTokenSetRatio<char>(query));
    case MatchAlgorithm::Ratio:
        break;
    }
    return fn(rapidfuzz::fuzz::CachedRatio<char>(query));
}

} // namespace

std::optional<MatchAlgorithm> parseMatchAlgorithm(const std::string& name)
{
    for (const auto& entry : kAlgorithmNames)
    {
        if (name == entry.name)
            return entry.algorithm;
    }
    return std::nullopt;
}

const char* toString(MatchAlgorithm algorithm)
{
    for (const auto& entry : kAlgorithmNames)
    {
        if (entry.algorithm == algorithm)
            return entry.name;
    }
    return "ratio";
}

SpanishFuzzyMatcher::SpanishFuzzyMatcher()
    : normalizer_(std::make_shared<FoldingTextNormalizer>())
{
}

SpanishFuzzyMatcher::SpanishFuzzyMatcher(std::shared_ptr<const ITextNormalizer> normalizer)
    : normalizer_(normalizer ? std::move(normalizer) : std::make_shared<FoldingTextNormalizer>())
{
}

SpanishFuzzyMatcher::~SpanishFuzzyMatcher() = default;

std::vector<double> SpanishFuzzyMatcher::scoreRaw(const std::string& query, const std::vector<std::string>& candidates,
                                                  MatchAlgorithm algorithm) const
{
    std::vector<std::string> folded;
    folded.reserve(candidates.size());
    for (const auto& candidate : candidates)
        folded.push_back(candidate.empty() ? std::string() : normalizer_->normalizeText(candidate));
    return scoreAll(normalizer_->normalizeText(query), folded, algorithm);
}

std::optional<FuzzyMatch> SpanishFuzzyMatcher::findBestMatch(const std::string& query,
                                                             const std::vector<std::string>& candidates,
                                                             double threshold, MatchAlgorithm algorithm) const
{
    if (query.empty() || candidates.empty())
        return std::nullopt;

    const auto scores = scoreRaw(query, candidates, algorithm);
    // max_element keeps the first of equal scores
    const auto best = std::max_element(scores.begin(), scores.end());
    const auto index = static_cast<std::size_t>(best - scores.begin());
    if (candidates[index].empty() || *best < threshold)
        return std::nullopt;
    return FuzzyMatch{ *best, candidates[index], algorithm };
}

std::vector<FuzzyMatch> SpanishFuzzyMatcher::findMatches(const std::string& query,
                                                         const std::vector<std::string>& candidates,
                                                         double threshold, MatchAlgorithm algorithm) const
{
    std::vector<FuzzyMatch> matches;
    if (query.empty())
        return matches;

    const auto scores = scoreRaw(query, candidates, algorithm);
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        if (!candidates[i].empty() && scores[i] >= threshold)
            matches.push_back(FuzzyMatch{ scores[i], candidates[i], algorithm });
    }
    std::stable_sort(matches.begin(), matches.end(),
                     [](const FuzzyMatch& a, const FuzzyMatch& b) { return a.score > b.score; });
    return matches;
}

double SpanishFuzzyMatcher::similarity(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const
{
    if (s1.empty() || s2.empty())
        return 0.0;

    const std::string other = normalizer_->normalizeText(s2);
    return withScorer(algorithm, normalizer_->normalizeText(s1),
                      [&other](const auto& scorer) { return scorer.similarity(other) / 100.0; });
}

std::vector<double> SpanishFuzzyMatcher::scoreAll(const std::string& normalized_query,
                                                  const std::vector<std::string>& normalized_candidates,
                                                  MatchAlgorithm algorithm) const
{
    if (normalized_query.empty())
        return std::vector<double>(normalized_candidates.size(), 0.0);

    return withScorer(algorithm, normalized_query, [&normalized_candidates](const auto& scorer) {
        std::vector<double> scores;
        scores.reserve(normalized_candidates.size());
        for (const auto& candidate : normalized_candidates)
            scores.push_back(candidate.empty() ? 0.0 : scorer.similarity(candidate) / 100.0);
        return scores;
    });
}

} // namespace processing
