#include "fake_providers.hpp"

#include "processing/FoldingTextNormalizer.hpp"

#include <thread>

namespace test_utils {

provider::Embedding FakeEmbeddingProvider::letterHistogram(const std::string& text) {
    static const processing::FoldingTextNormalizer normalizer;
    provider::Embedding vec(kDimension, 0.0f);
    for (char c : normalizer.normalizeText(text)) {
        if (c >= 'a' && c <= 'z')
            vec[static_cast<std::size_t>(c - 'a')] += 1.0f;
        else if (c >= '0' && c <= '9')
            vec[26] += 1.0f;
    }
    return vec;
}

void FakeEmbeddingProvider::addSynonym(const std::string& text, const std::string& target) {
    static const processing::FoldingTextNormalizer normalizer;
    synonyms_[normalizer.normalizeText(text)] = target;
}

std::vector<provider::Embedding> FakeEmbeddingProvider::encode(const std::vector<std::string>& texts,
                                                               const std::atomic<bool>* cancel_flag) {
    static const processing::FoldingTextNormalizer normalizer;
    ++calls_;
    if (!ready)
        throw provider::SignalUnavailable(provider::SignalError::NotConfigured, providerName(), "not ready");
    if (failure)
        throw provider::SignalUnavailable(*failure, providerName(), "scripted failure");
    if (cancel_flag && cancel_flag->load())
        throw provider::SignalUnavailable(provider::SignalError::Cancelled, providerName(), "cancelled");

    std::vector<provider::Embedding> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        auto it = synonyms_.find(normalizer.normalizeText(text));
        out.push_back(letterHistogram(it != synonyms_.end() ? it->second : text));
    }
    return out;
}

void FakeLocationExtractor::respond(const std::string& location, extract::IntentType type, double confidence) {
    std::lock_guard<std::mutex> lock(mtx_);
    scripted_ = extract::LocationIntent{};
    scripted_.extracted_location = location;
    scripted_.intent_type = type;
    scripted_.confidence = confidence;
    scripted_.reasoning = "scripted";
    scripted_.source = extract::ExtractionSource::LanguageModel;
}

extract::LocationIntent FakeLocationExtractor::extract(const std::string& query,
                                                       const std::vector<std::string>& known_names,
                                                       const std::atomic<bool>* cancel_flag) {
    ++calls_;
    last_known_names_ = known_names.size();

    if (delay.count() > 0) {
        const auto deadline = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel_flag && cancel_flag->load())
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    if (cancel_flag && cancel_flag->load())
        throw provider::SignalUnavailable(provider::SignalError::Cancelled, providerName(), "cancelled");
    if (failure)
        throw provider::SignalUnavailable(*failure, providerName(), "scripted failure");

    std::lock_guard<std::mutex> lock(mtx_);
    auto intent = scripted_;
    intent.original_query = query;
    return intent;
}

}  // namespace test_utils
