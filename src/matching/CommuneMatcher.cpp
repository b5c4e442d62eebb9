#include "CommuneMatcher.hpp"
#include "../processing/FoldingTextNormalizer.hpp"
#include "../processing/SpanishFuzzyMatcher.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>

#include <plog/Log.h>

namespace matching
{

namespace
{

CommuneMatcher::Dependencies withDefaults(CommuneMatcher::Dependencies deps)
{
    if (!deps.normalizer)
        deps.normalizer = std::make_shared<processing::FoldingTextNormalizer>();
    if (!deps.fuzzy)
        deps.fuzzy = std::make_shared<processing::SpanishFuzzyMatcher>(deps.normalizer);
    return deps;
}

} // anonymous namespace

CommuneMatcher::CommuneMatcher(std::vector<gazetteer::CommuneRecord> records, CascadeConfig config,
                               Dependencies deps)
    : deps_(withDefaults(std::move(deps)))
    , builder_(deps_.normalizer, deps_.embedder)
    , cascade_(std::make_unique<MatchingCascade>(std::move(config), deps_.normalizer, deps_.fuzzy, deps_.embedder,
                                                 deps_.extractor))
{
    handle_.publish(builder_.build(std::move(records), handle_.nextId()));

    const auto gen = handle_.current();
    PLOG_INFO << "Commune matcher ready: generation " << gen->id << ", " << gen->gazetteer.size() << " communes, "
              << gen->gazetteer.aliasEntries().size() << " aliases, embeddings "
              << (gen->embeddings ? "enabled" : "disabled") << ", language model "
              << (cascade_->languageModelActive() ? "enabled" : "disabled");
}

CommuneMatcher::~CommuneMatcher() = default;

MatchResult CommuneMatcher::match(const std::string& query) const
{
    return match(query, cascade_->config().confidence_threshold);
}

MatchResult CommuneMatcher::match(const std::string& query, double confidence_threshold,
                                  const std::atomic<bool>* cancel_flag) const
{
    auto options = cascade_->defaultOptions();
    options.confidence_threshold = std::clamp(confidence_threshold, 0.0, 1.0);
    options.cancel_flag = cancel_flag;

    const auto gen = handle_.current();
    return cascade_->run(*gen, query, options);
}

std::vector<std::string> CommuneMatcher::suggestions(const std::string& query, std::size_t limit) const
{
    CMATCH_PROFILE_FUNCTION();

    std::vector<std::string> names;
    if (limit == 0)
        return names;

    auto options = cascade_->defaultOptions();
    options.suggestion_limit = limit;

    const auto gen = handle_.current();
    const auto result = cascade_->run(*gen, query, options);

    if (result.matched_commune)
        names.push_back(*result.matched_commune);
    for (const auto& candidate : result.suggestions)
    {
        if (names.size() >= limit)
            break;
        names.push_back(candidate.commune);
    }
    return names;
}

void CommuneMatcher::reload(std::vector<gazetteer::CommuneRecord> records)
{
    CMATCH_PROFILE_FUNCTION();

    std::lock_guard<std::mutex> lock(reload_mtx_);
    const auto previous = handle_.current();
    const auto id = handle_.nextId();

    std::shared_ptr<const gazetteer::GazetteerGeneration> next;
    try
    {
        next = builder_.build(std::move(records), id);
    }
    catch (const gazetteer::DataUnavailableError& ex)
    {
        PLOG_ERROR << "Reload rejected, keeping generation " << (previous ? previous->id : 0) << ": " << ex.what();
        throw;
    }

    handle_.publish(next);
    PLOG_INFO << "Published generation " << next->id << " (" << next->gazetteer.size() << " communes), replacing "
              << (previous ? previous->id : 0);
}

} // namespace matching
