#pragma once

#include "MatchTypes.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace matching
{

/**
 * @brief Merges candidate pools from several strategies into one suggestion list.
 *
 * A commune appearing in several pools keeps its highest score (and that
 * candidate's evidence). Candidates below @p min_score and the excluded
 * commune are dropped; the rest are ordered by score descending, then
 * canonical name, and cut to @p limit.
 */
class SuggestionRanker
{
public:
    static CandidateList rank(const std::vector<CandidateList>& pools, const std::optional<std::string>& excluding,
                              std::size_t limit, double min_score);
};

} // namespace matching
