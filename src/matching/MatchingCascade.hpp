#pragma once

#include "CascadeConfig.hpp"
#include "MatchTypes.hpp"
#include "../gazetteer/Generation.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace processing
{
class ITextNormalizer;
class IFuzzyMatcher;
}

namespace provider
{
class IEmbeddingProvider;
}

namespace extract
{
class ILocationExtractor;
}

namespace matching
{

/**
 * @brief Resolves one query against one gazetteer generation.
 *
 * Stages run in fixed priority order and the first confident stage wins:
 * natural-language extraction for sentence-like queries, exact alias lookup,
 * embedding similarity, strict fuzzy, trigram, relaxed fuzzy. Every stage runs
 * through run_stage(), so provider failures only remove that stage's
 * candidates. run() never throws for a built generation.
 *
 * The embedding provider and the location extractor are optional. A provider
 * that reports NotConfigured is not called again by this cascade.
 */
class MatchingCascade
{
public:
    struct RunOptions
    {
        double confidence_threshold = 0.7;
        std::size_t suggestion_limit = 5;
        const std::atomic<bool>* cancel_flag = nullptr;
    };

    MatchingCascade(CascadeConfig config, std::shared_ptr<const processing::ITextNormalizer> normalizer,
                    std::shared_ptr<const processing::IFuzzyMatcher> fuzzy,
                    std::shared_ptr<provider::IEmbeddingProvider> embedder = nullptr,
                    std::shared_ptr<extract::ILocationExtractor> extractor = nullptr);
    ~MatchingCascade();

    MatchingCascade(const MatchingCascade&) = delete;
    MatchingCascade& operator=(const MatchingCascade&) = delete;

    [[nodiscard]] MatchResult run(const gazetteer::GazetteerGeneration& generation, const std::string& query,
                                  const RunOptions& options) const;

    // Options carrying the configured defaults
    RunOptions defaultOptions() const;

    const CascadeConfig& config() const;

    // False once the provider is absent, not ready, or reported NotConfigured
    bool embeddingActive() const;
    bool languageModelActive() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace matching
