#pragma once

#include "../extract/LocationIntent.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace matching
{

enum class MatchMethod
{
    Exact,
    Trigram,
    Fuzzy,
    Embedding,
    NlExtracted,
    None
};

// "exact", "trigram", "fuzzy", "embedding", "nl_extracted", "none"
const char* toString(MatchMethod method);

// Strategy-specific evidence carried alongside a candidate

struct NoEvidence
{
    bool operator==(const NoEvidence&) const = default;
};

struct ExactEvidence
{
    std::string alias;

    bool operator==(const ExactEvidence&) const = default;
};

struct FuzzyEvidence
{
    std::string alias;
    double raw_score = 0.0; // before the substring bonus
    bool substring_bonus = false;

    bool operator==(const FuzzyEvidence&) const = default;
};

struct TrigramEvidence
{
    std::size_t shared_shingles = 0;
    std::size_t union_size = 0;

    bool operator==(const TrigramEvidence&) const = default;
};

struct EmbeddingEvidence
{
    std::string alias;
    double cosine = 0.0;

    bool operator==(const EmbeddingEvidence&) const = default;
};

struct NlEvidence
{
    std::string extracted_location;
    extract::ExtractionSource source = extract::ExtractionSource::Regex;
    std::string alias;

    bool operator==(const NlEvidence&) const = default;
};

using MatchEvidence =
    std::variant<NoEvidence, ExactEvidence, FuzzyEvidence, TrigramEvidence, EmbeddingEvidence, NlEvidence>;

struct ScoredCandidate
{
    std::string commune; // canonical name
    double score = 0.0;  // [0, 1]
    MatchEvidence evidence;

    bool operator==(const ScoredCandidate&) const = default;
};

using CandidateList = std::vector<ScoredCandidate>;

struct MatchResult
{
    std::string original_query;
    std::string normalized_query;
    std::optional<std::string> matched_commune;
    double confidence = 0.0;
    MatchMethod method = MatchMethod::None;
    CandidateList suggestions; // never contains matched_commune; non-increasing score
    std::optional<extract::LocationIntent> intent;
    std::uint64_t generation = 0;
    MatchEvidence evidence;

    bool matched() const { return matched_commune.has_value(); }
    std::vector<std::string> suggestionNames() const;

    bool operator==(const MatchResult&) const = default;
};

} // namespace matching
