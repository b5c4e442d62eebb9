#pragma once

#include "MatchTypes.hpp"
#include "../gazetteer/Generation.hpp"

#include <atomic>
#include <string>

namespace matching
{

struct StrategyQuery
{
    const gazetteer::GazetteerGeneration& generation;
    const std::string& normalized; // working string after normalization
    const std::string& text;       // working string as the user (or extractor) wrote it
    const std::atomic<bool>* cancel_flag = nullptr;
};

/**
 * @brief One signal source of the cascade.
 *
 * search() returns candidates sorted by score descending (ties by canonical
 * name), at most one per commune. It may throw; the cascade runs every
 * strategy through run_stage() and treats a failure as "no candidates".
 */
class IMatchStrategy
{
public:
    virtual ~IMatchStrategy() = default;

    virtual const char* name() const = 0;
    virtual MatchMethod method() const = 0;

    // False when the strategy cannot run against this generation at all
    virtual bool isAvailable(const gazetteer::GazetteerGeneration& generation) const
    {
        (void)generation;
        return true;
    }

    virtual CandidateList search(const StrategyQuery& query) const = 0;
};

// Sorts by score descending, then canonical name ascending
void sortCandidates(CandidateList& candidates);

} // namespace matching
