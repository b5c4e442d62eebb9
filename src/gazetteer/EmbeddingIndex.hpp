#pragma once

#include "Gazetteer.hpp"
#include "../provider/IEmbeddingProvider.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gazetteer
{

struct EmbeddingHit
{
    std::size_t commune = 0;
    double cosine = 0.0;
    std::string alias; // raw alias whose vector scored best
};

/**
 * @brief Unit-length vectors for every distinct raw alias of a gazetteer.
 *
 * Built once per generation; search() returns the best cosine per commune.
 */
class EmbeddingIndex
{
public:
    EmbeddingIndex() = default;

    /**
     * @brief Encodes each distinct raw alias once (the provider batches requests).
     * @throws provider::SignalUnavailable when the provider fails or returns
     *         vectors of inconsistent dimension
     */
    static EmbeddingIndex build(const Gazetteer& gazetteer, provider::IEmbeddingProvider& embedder);

    // Scales to unit length; false for an empty or all-zero vector
    static bool normalize(provider::Embedding& vec);

    /**
     * @brief Best cosine per commune, descending (ties by canonical name).
     * @throws provider::SignalUnavailable(InvalidResponse) on a dimension mismatch
     */
    std::vector<EmbeddingHit> search(provider::Embedding query, std::size_t top_k) const;

    std::size_t dimension() const { return dimension_; }
    std::size_t size() const { return entries_.size(); }

private:
    struct Entry
    {
        std::size_t commune = 0;
        std::string alias;
        provider::Embedding unit;
    };

    std::vector<Entry> entries_;
    std::vector<std::string> names_;
    std::size_t dimension_ = 0;
};

} // namespace gazetteer
