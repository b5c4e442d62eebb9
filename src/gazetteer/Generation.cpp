#include "Generation.hpp"
#include "../processing/ITextNormalizer.hpp"
#include "../provider/IEmbeddingProvider.hpp"
#include "../provider/ProviderTypes.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

namespace gazetteer
{

GenerationBuilder::GenerationBuilder(std::shared_ptr<const processing::ITextNormalizer> normalizer,
                                     std::shared_ptr<provider::IEmbeddingProvider> embedder)
    : normalizer_(std::move(normalizer))
    , embedder_(std::move(embedder))
{
}

std::shared_ptr<const GazetteerGeneration> GenerationBuilder::build(std::vector<CommuneRecord> records,
                                                                    std::uint64_t id) const
{
    CMATCH_PROFILE_FUNCTION();

    Gazetteer gz = Gazetteer::build(std::move(records), *normalizer_);
    TrigramIndex trigrams = TrigramIndex::build(gz);

    std::optional<EmbeddingIndex> embeddings;
    if (embedder_ && embedder_->isReady())
    {
        try
        {
            embeddings = EmbeddingIndex::build(gz, *embedder_);
        }
        catch (const provider::SignalUnavailable& ex)
        {
            PLOG_WARNING << "Generation " << id << ": embedding index unavailable: " << ex.what();
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Embedding,
                                                "Embedding index not built, semantic matching disabled", ex.what());
        }
    }

    PLOG_INFO << "Generation " << id << " ready: " << gz.size() << " communes, " << trigrams.shingleCount()
              << " shingles, embeddings " << (embeddings ? "on" : "off");

    return std::make_shared<const GazetteerGeneration>(
        GazetteerGeneration{ id, std::move(gz), std::move(trigrams), std::move(embeddings) });
}

std::shared_ptr<const GazetteerGeneration> GenerationHandle::current() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return current_;
}

void GenerationHandle::publish(std::shared_ptr<const GazetteerGeneration> generation)
{
    std::shared_ptr<const GazetteerGeneration> previous;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        previous = std::move(current_);
        current_ = std::move(generation);
    }
    // previous is released outside the lock; in-flight readers keep it alive
}

} // namespace gazetteer
