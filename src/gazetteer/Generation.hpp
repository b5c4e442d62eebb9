#pragma once

#include "EmbeddingIndex.hpp"
#include "Gazetteer.hpp"
#include "TrigramIndex.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace processing
{
class ITextNormalizer;
}

namespace provider
{
class IEmbeddingProvider;
}

namespace gazetteer
{

// One immutable snapshot of reference data and every index derived from it
struct GazetteerGeneration
{
    std::uint64_t id = 0;
    Gazetteer gazetteer;
    TrigramIndex trigrams;
    std::optional<EmbeddingIndex> embeddings; // absent when disabled or the provider failed
};

class GenerationBuilder
{
public:
    GenerationBuilder(std::shared_ptr<const processing::ITextNormalizer> normalizer,
                      std::shared_ptr<provider::IEmbeddingProvider> embedder);

    /**
     * @brief Builds the gazetteer and all indices for a new generation.
     *
     * An embedding provider failure is logged and leaves the generation without
     * an embedding index.
     * @throws DataUnavailableError when no usable record remains
     */
    std::shared_ptr<const GazetteerGeneration> build(std::vector<CommuneRecord> records, std::uint64_t id) const;

private:
    std::shared_ptr<const processing::ITextNormalizer> normalizer_;
    std::shared_ptr<provider::IEmbeddingProvider> embedder_;
};

/**
 * @brief Publishes the active generation to concurrent readers.
 *
 * Readers take a shared_ptr copy once per query and finish against it, so a
 * publish() never exposes a partially built generation and never invalidates
 * one that is still in use.
 */
class GenerationHandle
{
public:
    GenerationHandle() = default;

    std::shared_ptr<const GazetteerGeneration> current() const;
    void publish(std::shared_ptr<const GazetteerGeneration> generation);

    std::uint64_t nextId() { return next_id_.fetch_add(1, std::memory_order_relaxed); }

private:
    mutable std::mutex mtx_;
    std::shared_ptr<const GazetteerGeneration> current_;
    std::atomic<std::uint64_t> next_id_{ 1 };
};

} // namespace gazetteer
