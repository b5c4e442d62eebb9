#pragma once

#include "../processing/IFuzzyMatcher.hpp"

#include <cstddef>

namespace matching
{

// Thresholds and limits of the matching cascade; loaded from [matching] in config.toml
struct CascadeConfig
{
    double embedding_threshold = 0.85;
    double fuzzy_threshold = 0.9;
    double trigram_threshold = 0.6;
    double confidence_threshold = 0.7;   // default for match() callers; relaxed fuzzy acceptance
    double suggestion_threshold = 0.3;   // floor for candidates offered as suggestions
    double nl_confidence_threshold = 0.5;
    double substring_bonus = 0.2;
    std::size_t min_substring_length = 3;
    std::size_t sentence_token_limit = 4;
    std::size_t suggestion_limit = 5;
    std::size_t candidate_pool = 10;     // top_k requested from trigram and embedding search
    processing::MatchAlgorithm fuzzy_algorithm = processing::MatchAlgorithm::Ratio;
};

} // namespace matching
