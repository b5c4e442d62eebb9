#pragma once

#include <optional>
#include <string>
#include <vector>

namespace processing
{

/**
 * @brief Fuzzy matching algorithms supported by the matcher.
 */
enum class MatchAlgorithm
{
    Ratio,          // Indel-based ratio over the whole string (default)
    PartialRatio,   // Best aligned substring ("florida" vs "la florida")
    TokenSortRatio, // Order-independent tokens ("mar vina del" vs "vina del mar")
    TokenSetRatio   // Set-based tokens, ignores duplicated words
};

// Parses "ratio", "partial_ratio", "token_sort_ratio" or "token_set_ratio"
std::optional<MatchAlgorithm> parseMatchAlgorithm(const std::string& name);
const char* toString(MatchAlgorithm algorithm);

/**
 * @brief Result of a fuzzy matching operation.
 */
struct FuzzyMatch
{
    double score = 0.0;                              // Similarity normalized to [0.0, 1.0]
    std::string matched;                             // Candidate text as passed in
    MatchAlgorithm algorithm = MatchAlgorithm::Ratio;
};

/**
 * @brief Abstract interface for fuzzy string matchers.
 *
 * Implementations normalize both sides before scoring, except for scoreAll()
 * which expects text that already went through the same normalizer (used by
 * the gazetteer strategies whose aliases are normalized once per generation).
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Find the best matching candidate above the threshold.
     *
     * @return The best match if score >= threshold, otherwise std::nullopt.
     *         Ties keep the earliest candidate.
     */
    virtual std::optional<FuzzyMatch> findBestMatch(const std::string& query,
                                                    const std::vector<std::string>& candidates, double threshold,
                                                    MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    /**
     * @brief Find all candidates matching above the threshold, sorted by score (descending).
     */
    virtual std::vector<FuzzyMatch> findMatches(const std::string& query, const std::vector<std::string>& candidates,
                                                double threshold,
                                                MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    /**
     * @brief Similarity between two strings in [0.0, 1.0].
     */
    virtual double similarity(const std::string& s1, const std::string& s2,
                              MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    /**
     * @brief Scores every pre-normalized candidate against a pre-normalized query.
     *
     * One cached scorer is built for the query. The returned vector is parallel
     * to @p candidates.
     */
    virtual std::vector<double> scoreAll(const std::string& normalized_query,
                                         const std::vector<std::string>& normalized_candidates,
                                         MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;
};

} // namespace processing
