#pragma once

#include "Gazetteer.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gazetteer
{

struct TrigramHit
{
    std::size_t commune = 0;
    double jaccard = 0.0;
    std::size_t shared = 0;     // shingles in common with the query
    std::size_t union_size = 0;
};

/**
 * @brief Shingle index over normalized aliases for cheap approximate recall.
 *
 * Each alias is padded with two spaces on both sides ("  quilpue  ") and cut
 * into codepoint trigrams. A commune's shingle set is the union over all of
 * its aliases; search() scores communes sharing at least one shingle with the
 * query by Jaccard similarity.
 */
class TrigramIndex
{
public:
    TrigramIndex() = default;

    static TrigramIndex build(const Gazetteer& gazetteer);

    // Distinct padded trigrams of a normalized string
    static std::unordered_set<std::u32string> shingles(const std::string& normalized);

    // Sorted by Jaccard descending, ties by canonical name; at most top_k hits
    std::vector<TrigramHit> search(const std::string& normalized, std::size_t top_k) const;

    std::size_t shingleCount() const { return postings_.size(); }

private:
    std::vector<std::string> names_; // canonical names for tie-breaks
    std::unordered_map<std::u32string, std::vector<std::size_t>> postings_;
    std::vector<std::unordered_set<std::u32string>> commune_shingles_;
};

} // namespace gazetteer
