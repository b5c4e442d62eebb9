#pragma once

#include "IFuzzyMatcher.hpp"
#include "ITextNormalizer.hpp"
#include <memory>

namespace processing
{

/**
 * @brief Fuzzy string matcher for Spanish place names.
 *
 * Both sides are folded through an ITextNormalizer (accents, case,
 * punctuation) and scored with a rapidfuzz-cpp cached scorer built once per
 * query. Scores are rescaled from 0-100 to [0, 1].
 *
 * Example:
 * @code
 * SpanishFuzzyMatcher matcher;
 * double score = matcher.similarity("Quilpué", "QUILPUE"); // 1.0
 * double typo = matcher.similarity("kilpue", "quilpue");   // ~0.77
 * @endcode
 */
class SpanishFuzzyMatcher : public IFuzzyMatcher
{
public:
    SpanishFuzzyMatcher();
    explicit SpanishFuzzyMatcher(std::shared_ptr<const ITextNormalizer> normalizer);
    ~SpanishFuzzyMatcher() override;

    std::optional<FuzzyMatch> findBestMatch(const std::string& query, const std::vector<std::string>& candidates,
                                            double threshold,
                                            MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    std::vector<FuzzyMatch> findMatches(const std::string& query, const std::vector<std::string>& candidates,
                                        double threshold,
                                        MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    double similarity(const std::string& s1, const std::string& s2,
                      MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    std::vector<double> scoreAll(const std::string& normalized_query,
                                 const std::vector<std::string>& normalized_candidates,
                                 MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

private:
    // Folds query and candidates, then scores through scoreAll()
    std::vector<double> scoreRaw(const std::string& query, const std::vector<std::string>& candidates,
                                 MatchAlgorithm algorithm) const;

    std::shared_ptr<const ITextNormalizer> normalizer_;
};

} // namespace processing
