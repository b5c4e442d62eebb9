#include "SuggestionRanker.hpp"
#include "IMatchStrategy.hpp"

#include <unordered_map>

namespace matching
{

CandidateList SuggestionRanker::rank(const std::vector<CandidateList>& pools,
                                     const std::optional<std::string>& excluding, std::size_t limit,
                                     double min_score)
{
    CandidateList merged;
    if (limit == 0)
        return merged;

    std::unordered_map<std::string, std::size_t> slots;
    for (const auto& pool : pools)
    {
        for (const auto& candidate : pool)
        {
            if (candidate.score < min_score)
                continue;
            if (excluding && candidate.commune == *excluding)
                continue;

            auto [it, inserted] = slots.try_emplace(candidate.commune, merged.size());
            if (inserted)
                merged.push_back(candidate);
            else if (candidate.score > merged[it->second].score)
                merged[it->second] = candidate;
        }
    }

    sortCandidates(merged);
    if (merged.size() > limit)
        merged.resize(limit);
    return merged;
}

} // namespace matching
