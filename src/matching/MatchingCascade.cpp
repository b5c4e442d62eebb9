#include "MatchingCascade.hpp"
#include "Diagnostics.hpp"
#include "StageRunner.hpp"
#include "Strategies.hpp"
#include "SuggestionRanker.hpp"
#include "../extract/ILocationExtractor.hpp"
#include "../extract/RegexLocationExtractor.hpp"
#include "../processing/IFuzzyMatcher.hpp"
#include "../processing/ITextNormalizer.hpp"
#include "../provider/IEmbeddingProvider.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <vector>

#include <plog/Log.h>

namespace matching
{

namespace
{

void logStage(const char* name, const StageResult<CandidateList>& stage)
{
    if (!Diagnostics::IsVerbose())
        return;

    std::ostringstream oss;
    oss << "[Cascade] stage=" << name << " duration=" << stage.duration.count() << "us";
    if (stage.succeeded)
        oss << " status=ok candidates=" << Diagnostics::DescribeCandidates(stage.result);
    else
        oss << " status=error reason=" << (stage.error ? *stage.error : "unknown");
    PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
}

// Runs one strategy as a named, timed stage and traces its candidates
StageResult<CandidateList> runStrategy(const IMatchStrategy& strategy, const StrategyQuery& query)
{
    auto stage = run_stage<CandidateList>(strategy.name(), [&]() { return strategy.search(query); });
    logStage(strategy.name(), stage);
    return stage;
}

void logDecision(const MatchResult& result)
{
    if (!Diagnostics::IsVerbose())
        return;

    PLOG_INFO_(Diagnostics::kLogInstance)
        << "[Cascade] decision method=" << toString(result.method)
        << " commune=" << (result.matched_commune ? *result.matched_commune : "-")
        << " confidence=" << result.confidence << " generation=" << result.generation
        << " suggestions=" << Diagnostics::DescribeCandidates(result.suggestions);
}

double topScore(const CandidateList& candidates)
{
    return candidates.empty() ? 0.0 : candidates.front().score;
}

} // anonymous namespace

struct MatchingCascade::Impl
{
    Impl(CascadeConfig cfg, std::shared_ptr<const processing::ITextNormalizer> norm,
         std::shared_ptr<const processing::IFuzzyMatcher> fuzzy_matcher,
         std::shared_ptr<provider::IEmbeddingProvider> embedding_provider,
         std::shared_ptr<extract::ILocationExtractor> location_extractor)
        : config(std::move(cfg))
        , normalizer(std::move(norm))
        , embedder(std::move(embedding_provider))
        , extractor(std::move(location_extractor))
        , fuzzy(std::move(fuzzy_matcher), config)
        , trigram(config)
        , embedding(embedder, config)
    {
    }

    bool embeddingUsable() const
    {
        return embedder && !embedding_disabled.load(std::memory_order_relaxed) && embedder->isReady();
    }

    bool extractorUsable() const
    {
        return extractor && !extractor_disabled.load(std::memory_order_relaxed) && extractor->isReady();
    }

    void noteSignalFailure(const StageResult<CandidateList>& stage, std::atomic<bool>& disabled, const char* what)
    {
        if (stage.signal_error == provider::SignalError::NotConfigured && !disabled.exchange(true))
        {
            PLOG_WARNING << what << " is not configured; disabling it for this process";
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching,
                                                std::string(what) + " disabled", stage.error.value_or(""));
        }
    }

    extract::LocationIntent extractLocation(const gazetteer::GazetteerGeneration& generation,
                                            const std::string& query, const std::atomic<bool>* cancel_flag)
    {
        if (extractorUsable())
        {
            auto llm_stage = run_stage<extract::LocationIntent>(
                "llm_extract",
                [&]()
                {
                    return extractor->extract(query, generation.gazetteer.mostCommon(generation.gazetteer.size()),
                                              cancel_flag);
                });

            if (llm_stage.succeeded)
            {
                const auto& intent = llm_stage.result;
                if (Diagnostics::IsVerbose())
                {
                    PLOG_INFO_(Diagnostics::kLogInstance)
                        << "[Cascade] stage=llm_extract status=ok duration=" << llm_stage.duration.count()
                        << "us location=" << Diagnostics::Preview(intent.extracted_location)
                        << " intent=" << extract::toString(intent.intent_type)
                        << " confidence=" << intent.confidence
                        << " reasoning=" << Diagnostics::Preview(intent.reasoning);
                }
                if (!intent.extracted_location.empty() && intent.confidence >= config.nl_confidence_threshold)
                    return intent;
            }
            else if (llm_stage.signal_error == provider::SignalError::NotConfigured &&
                     !extractor_disabled.exchange(true))
            {
                PLOG_WARNING << "Location extractor is not configured; disabling it for this process";
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::LanguageModel,
                                                    "Location extractor disabled", llm_stage.error.value_or(""));
            }

            if (Diagnostics::IsVerbose())
                PLOG_INFO_(Diagnostics::kLogInstance) << "[Cascade] fallback=regex_extract";
        }

        auto regex_stage = run_stage<extract::LocationIntent>("regex_extract",
                                                              [&]() { return regex.extract(query); });
        if (!regex_stage.succeeded)
        {
            extract::LocationIntent empty;
            empty.original_query = query;
            return empty;
        }
        return regex_stage.result;
    }

    void coldStart(const gazetteer::GazetteerGeneration& generation, MatchResult& result, std::size_t limit) const
    {
        for (auto& name : generation.gazetteer.mostCommon(limit))
            result.suggestions.push_back(ScoredCandidate{ std::move(name), 0.0, NoEvidence{} });
    }

    void accept(MatchResult& result, const ScoredCandidate& winner, MatchMethod method,
                const std::vector<CandidateList>& pools, std::size_t limit) const
    {
        result.matched_commune = winner.commune;
        result.confidence = std::clamp(winner.score, 0.0, 1.0);
        result.method = method;
        result.evidence = winner.evidence;
        result.suggestions = SuggestionRanker::rank(pools, winner.commune, limit, config.suggestion_threshold);
    }

    CascadeConfig config;
    std::shared_ptr<const processing::ITextNormalizer> normalizer;
    std::shared_ptr<provider::IEmbeddingProvider> embedder;
    std::shared_ptr<extract::ILocationExtractor> extractor;

    extract::RegexLocationExtractor regex;
    ExactStrategy exact;
    FuzzyStrategy fuzzy;
    TrigramStrategy trigram;
    EmbeddingStrategy embedding;

    std::atomic<bool> embedding_disabled{ false };
    std::atomic<bool> extractor_disabled{ false };
};

MatchingCascade::MatchingCascade(CascadeConfig config, std::shared_ptr<const processing::ITextNormalizer> normalizer,
                                 std::shared_ptr<const processing::IFuzzyMatcher> fuzzy,
                                 std::shared_ptr<provider::IEmbeddingProvider> embedder,
                                 std::shared_ptr<extract::ILocationExtractor> extractor)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(normalizer), std::move(fuzzy), std::move(embedder),
                                   std::move(extractor)))
{
}

MatchingCascade::~MatchingCascade() = default;

const CascadeConfig& MatchingCascade::config() const { return impl_->config; }

MatchingCascade::RunOptions MatchingCascade::defaultOptions() const
{
    RunOptions options;
    options.confidence_threshold = impl_->config.confidence_threshold;
    options.suggestion_limit = impl_->config.suggestion_limit;
    return options;
}

bool MatchingCascade::embeddingActive() const { return impl_->embeddingUsable(); }

bool MatchingCascade::languageModelActive() const { return impl_->extractorUsable(); }

MatchResult MatchingCascade::run(const gazetteer::GazetteerGeneration& generation, const std::string& query,
                                 const RunOptions& options) const
{
    CMATCH_PROFILE_FUNCTION();

    auto& impl = *impl_;
    const auto& cfg = impl.config;

    MatchResult result;
    result.original_query = query;
    result.generation = generation.id;

    const auto nq = impl.normalizer->normalize(query);
    result.normalized_query = nq.normalized;

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[Cascade] stage=input raw=" << Diagnostics::Preview(query)
            << " normalized=" << Diagnostics::Preview(nq.normalized) << " generation=" << generation.id;
    }

    if (nq.empty())
    {
        impl.coldStart(generation, result, options.suggestion_limit);
        logDecision(result);
        return result;
    }

    std::string working_text = query;
    std::string working_normalized = nq.normalized;
    std::optional<NlEvidence> nl_evidence;

    if (!generation.gazetteer.lookupAlias(nq.normalized) &&
        impl.regex.looksLikeSentence(nq.normalized, cfg.sentence_token_limit))
    {
        auto intent = impl.extractLocation(generation, query, options.cancel_flag);
        const std::string extracted_normalized = impl.normalizer->normalizeText(intent.extracted_location);
        nl_evidence = NlEvidence{ intent.extracted_location, intent.source, {} };
        result.intent = std::move(intent);

        if (extracted_normalized.empty())
        {
            impl.coldStart(generation, result, options.suggestion_limit);
            result.evidence = *nl_evidence;
            logDecision(result);
            return result;
        }

        working_text = result.intent->extracted_location;
        working_normalized = extracted_normalized;
        result.normalized_query = working_normalized;
    }

    const StrategyQuery strategy_query{ generation, working_normalized, working_text, options.cancel_flag };

    auto exact_stage = runStrategy(impl.exact, strategy_query);
    if (exact_stage.succeeded && !exact_stage.result.empty())
    {
        const auto& winner = exact_stage.result.front();
        result.matched_commune = winner.commune;
        result.confidence = 1.0;
        if (nl_evidence)
        {
            result.method = MatchMethod::NlExtracted;
            nl_evidence->alias = std::get<ExactEvidence>(winner.evidence).alias;
            result.evidence = *nl_evidence;
        }
        else
        {
            result.method = impl.exact.method();
            result.evidence = winner.evidence;
        }
        logDecision(result);
        return result;
    }

    std::vector<CandidateList> pools;
    double best_seen = 0.0;

    if (impl.embeddingUsable() && impl.embedding.isAvailable(generation))
    {
        auto embedding_stage = runStrategy(impl.embedding, strategy_query);
        if (embedding_stage.succeeded)
        {
            best_seen = std::max(best_seen, topScore(embedding_stage.result));
            pools.push_back(std::move(embedding_stage.result));
            if (topScore(pools.back()) >= cfg.embedding_threshold)
            {
                impl.accept(result, pools.back().front(), impl.embedding.method(), pools, options.suggestion_limit);
                logDecision(result);
                return result;
            }
        }
        else
        {
            impl.noteSignalFailure(embedding_stage, impl.embedding_disabled, "Embedding provider");
        }
    }

    auto fuzzy_stage = runStrategy(impl.fuzzy, strategy_query);
    std::optional<ScoredCandidate> fuzzy_top;
    if (fuzzy_stage.succeeded)
    {
        best_seen = std::max(best_seen, topScore(fuzzy_stage.result));
        if (!fuzzy_stage.result.empty())
            fuzzy_top = fuzzy_stage.result.front();
        pools.push_back(std::move(fuzzy_stage.result));
        if (fuzzy_top && fuzzy_top->score >= cfg.fuzzy_threshold)
        {
            impl.accept(result, *fuzzy_top, impl.fuzzy.method(), pools, options.suggestion_limit);
            logDecision(result);
            return result;
        }
    }

    auto trigram_stage = runStrategy(impl.trigram, strategy_query);
    if (trigram_stage.succeeded)
    {
        best_seen = std::max(best_seen, topScore(trigram_stage.result));
        pools.push_back(std::move(trigram_stage.result));
        if (topScore(pools.back()) >= cfg.trigram_threshold)
        {
            impl.accept(result, pools.back().front(), impl.trigram.method(), pools, options.suggestion_limit);
            logDecision(result);
            return result;
        }
    }

    // Relaxed fuzzy acceptance at the caller's confidence threshold
    if (fuzzy_top && fuzzy_top->score >= options.confidence_threshold)
    {
        impl.accept(result, *fuzzy_top, impl.fuzzy.method(), pools, options.suggestion_limit);
        logDecision(result);
        return result;
    }

    result.method = MatchMethod::None;
    result.confidence = std::clamp(best_seen, 0.0, 1.0);
    result.suggestions = SuggestionRanker::rank(pools, std::nullopt, options.suggestion_limit, cfg.suggestion_threshold);
    if (nl_evidence)
        result.evidence = *nl_evidence;
    logDecision(result);
    return result;
}

} // namespace matching
