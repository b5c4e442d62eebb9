#include "MatchTypes.hpp"

namespace matching
{

const char* toString(MatchMethod method)
{
    switch (method)
    {
    case MatchMethod::Exact:
        return "exact";
    case MatchMethod::Trigram:
        return "trigram";
    case MatchMethod::Fuzzy:
        return "fuzzy";
    case MatchMethod::Embedding:
        return "embedding";
    case MatchMethod::NlExtracted:
        return "nl_extracted";
    case MatchMethod::None:
        return "none";
    }
    return "none";
}

std::vector<std::string> MatchResult::suggestionNames() const
{
    std::vector<std::string> names;
    names.reserve(suggestions.size());
    for (const auto& candidate : suggestions)
        names.push_back(candidate.commune);
    return names;
}

} // namespace matching
