#pragma once

#include "CascadeConfig.hpp"
#include "MatchTypes.hpp"
#include "MatchingCascade.hpp"
#include "../gazetteer/CommuneRecord.hpp"
#include "../gazetteer/Generation.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

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
 * @brief Public entry point: owns the active gazetteer generation and the cascade.
 *
 * match() and suggestions() may be called from any number of threads. Each call
 * pins the generation that is current when it starts, so a concurrent reload()
 * never changes the data a call is working on.
 */
class CommuneMatcher
{
public:
    struct Dependencies
    {
        std::shared_ptr<const processing::ITextNormalizer> normalizer; // FoldingTextNormalizer when null
        std::shared_ptr<const processing::IFuzzyMatcher> fuzzy;        // SpanishFuzzyMatcher when null
        std::shared_ptr<provider::IEmbeddingProvider> embedder;         // optional
        std::shared_ptr<extract::ILocationExtractor> extractor;         // optional
    };

    /**
     * @brief Builds generation 1 from @p records.
     * @throws gazetteer::DataUnavailableError when no usable record is supplied
     */
    CommuneMatcher(std::vector<gazetteer::CommuneRecord> records, CascadeConfig config = {},
                   Dependencies deps = {});
    ~CommuneMatcher();

    CommuneMatcher(const CommuneMatcher&) = delete;
    CommuneMatcher& operator=(const CommuneMatcher&) = delete;

    // Uses the configured confidence threshold
    [[nodiscard]] MatchResult match(const std::string& query) const;

    [[nodiscard]] MatchResult match(const std::string& query, double confidence_threshold,
                                    const std::atomic<bool>* cancel_flag = nullptr) const;

    // Matched commune first (when any), then ranked alternatives; at most @p limit names
    [[nodiscard]] std::vector<std::string> suggestions(const std::string& query, std::size_t limit = 5) const;

    /**
     * @brief Builds a new generation and swaps it in atomically.
     *
     * Reloads are serialized. On failure the previous generation stays active.
     * @throws gazetteer::DataUnavailableError when no usable record is supplied
     */
    void reload(std::vector<gazetteer::CommuneRecord> records);

    std::shared_ptr<const gazetteer::GazetteerGeneration> generation() const { return handle_.current(); }

    const MatchingCascade& cascade() const { return *cascade_; }

private:
    Dependencies deps_;
    gazetteer::GenerationBuilder builder_;
    std::unique_ptr<MatchingCascade> cascade_;
    gazetteer::GenerationHandle handle_;
    std::mutex reload_mtx_;
};

} // namespace matching
