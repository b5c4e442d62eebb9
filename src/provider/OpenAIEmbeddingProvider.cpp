#include "OpenAIEmbeddingProvider.hpp"
#include "ProviderHelpers.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>

namespace provider
{

OpenAIEmbeddingProvider::OpenAIEmbeddingProvider(EmbeddingConfig cfg)
    : cfg_(std::move(cfg))
    , gate_(cfg_.max_concurrent_requests)
{
    if (cfg_.batch_size == 0)
        cfg_.batch_size = 1;
}

OpenAIEmbeddingProvider::~OpenAIEmbeddingProvider() = default;

const char* OpenAIEmbeddingProvider::providerName() const
{
    return "OpenAI embeddings";
}

std::string OpenAIEmbeddingProvider::validateConfig(const EmbeddingConfig& cfg)
{
    if (!cfg.enabled)
        return "Embedding provider disabled";
    if (cfg.api_key.empty())
        return "Missing API key";
    if (cfg.base_url.empty())
        return "Missing base URL";
    if (cfg.model.empty())
        return "Missing model";
    return {};
}

bool OpenAIEmbeddingProvider::isReady() const
{
    return validateConfig(cfg_).empty();
}

std::string OpenAIEmbeddingProvider::buildUrl() const
{
    return helpers::normalize_endpoint(cfg_.base_url, "embeddings");
}

std::vector<Header> OpenAIEmbeddingProvider::buildHeaders() const
{
    return { { "Content-Type", "application/json" }, bearer_auth(cfg_.api_key) };
}

SessionConfig OpenAIEmbeddingProvider::sessionConfig(const std::atomic<bool>* cancel_flag) const
{
    SessionConfig session;
    session.connect_timeout_ms = cfg_.connect_timeout_ms;
    session.timeout_ms = cfg_.timeout_ms;
    session.cancel_flag = cancel_flag;
    return session;
}

nlohmann::json OpenAIEmbeddingProvider::buildRequestBody(const std::vector<std::string>& batch) const
{
    nlohmann::json body = nlohmann::json::object();
    body["model"] = cfg_.model;
    body["input"] = batch;
    body["encoding_format"] = "float";
    return body;
}

std::vector<Embedding> OpenAIEmbeddingProvider::encode(const std::vector<std::string>& texts,
                                                       const std::atomic<bool>* cancel_flag)
{
    CMATCH_PROFILE_FUNCTION();

    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
        throw SignalUnavailable(SignalError::NotConfigured, providerName(), validation_error);

    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (std::size_t start = 0; start < texts.size(); start += cfg_.batch_size)
    {
        const std::size_t end = std::min(texts.size(), start + cfg_.batch_size);
        std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));
        auto vectors = encodeBatch(batch, cancel_flag);
        for (auto& v : vectors)
            out.push_back(std::move(v));
    }
    return out;
}

std::vector<Embedding> OpenAIEmbeddingProvider::encodeBatch(const std::vector<std::string>& batch,
                                                            const std::atomic<bool>* cancel_flag)
{
    const helpers::CallDeadline deadline(cfg_.timeout_ms);
    auto permit = gate_.acquire(deadline.remaining(), cancel_flag);
    if (cancel_flag && cancel_flag->load(std::memory_order_relaxed))
        throw SignalUnavailable(SignalError::Cancelled, providerName(), "cancelled before request");
    if (!permit.acquired() || deadline.expired())
        throw SignalUnavailable(SignalError::Timeout, providerName(), "timed out waiting for a request slot");

    SessionConfig session = sessionConfig(cancel_flag);
    deadline.clamp(session);
    const std::string body = buildRequestBody(batch).dump();
    const auto response = provider::post_json(buildUrl(), body, buildHeaders(), session);

    if (!response.ok())
    {
        const auto err_type = helpers::categorize_http_error(response);
        const std::string snippet = !response.error.empty() ? response.error : response.text;
        const std::string message = helpers::get_error_description(err_type, response.status_code, snippet);
        if (err_type != helpers::HttpErrorType::Cancelled)
        {
            PLOG_WARNING << providerName() << " request failed: " << message;
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Embedding,
                                                std::string(providerName()) + " request failed", message);
        }
        throw SignalUnavailable(helpers::to_signal_error(err_type), providerName(), message);
    }

    PLOG_DEBUG << providerName() << " encoded " << batch.size() << " texts in " << response.elapsed_ms << " ms";
    try
    {
        return parseResponse(response.text, batch.size());
    }
    catch (const SignalUnavailable& ex)
    {
        PLOG_WARNING << providerName() << " response parse failed: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Embedding,
                                            std::string(providerName()) + " response parse failed", ex.what());
        throw;
    }
}

std::vector<Embedding> OpenAIEmbeddingProvider::parseResponse(const std::string& body, std::size_t expected)
{
    const char* name = "OpenAI embeddings";
    nlohmann::json json = nlohmann::json::parse(body, nullptr, /*allow_exceptions*/ false);
    if (json.is_discarded() || !json.is_object())
        throw SignalUnavailable(SignalError::InvalidResponse, name, "response is not a JSON object");

    auto data = json.find("data");
    if (data == json.end() || !data->is_array())
        throw SignalUnavailable(SignalError::InvalidResponse, name, "missing data array");
    if (data->size() != expected)
        throw SignalUnavailable(SignalError::InvalidResponse, name,
                                "expected " + std::to_string(expected) + " embeddings, got " +
                                    std::to_string(data->size()));

    std::vector<Embedding> out(expected);
    std::vector<bool> filled(expected, false);
    std::size_t dimension = 0;

    for (std::size_t pos = 0; pos < data->size(); ++pos)
    {
        const auto& item = (*data)[pos];
        if (!item.is_object())
            throw SignalUnavailable(SignalError::InvalidResponse, name, "data item is not an object");

        std::size_t index = pos;
        if (auto it = item.find("index"); it != item.end())
        {
            if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<long long>() >= 0))
                throw SignalUnavailable(SignalError::InvalidResponse, name, "invalid index field");
            index = it->get<std::size_t>();
        }
        if (index >= expected || filled[index])
            throw SignalUnavailable(SignalError::InvalidResponse, name, "index out of range or duplicated");

        auto emb = item.find("embedding");
        if (emb == item.end() || !emb->is_array() || emb->empty())
            throw SignalUnavailable(SignalError::InvalidResponse, name, "missing embedding vector");
        if (dimension == 0)
            dimension = emb->size();
        else if (emb->size() != dimension)
            throw SignalUnavailable(SignalError::InvalidResponse, name, "inconsistent embedding dimension");

        Embedding vec;
        vec.reserve(emb->size());
        for (const auto& component : *emb)
        {
            if (!component.is_number())
                throw SignalUnavailable(SignalError::InvalidResponse, name, "non-numeric embedding component");
            const double value = component.get<double>();
            if (!std::isfinite(value))
                throw SignalUnavailable(SignalError::InvalidResponse, name, "non-finite embedding component");
            vec.push_back(static_cast<float>(value));
        }
        out[index] = std::move(vec);
        filled[index] = true;
    }
    return out;
}

std::string OpenAIEmbeddingProvider::testConnection()
{
    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
        return "Config Error: " + validation_error;

    try
    {
        const auto vectors = encode({ "Quilpué" });
        return "Success: " + std::string(providerName()) + " returned a " + std::to_string(vectors.front().size()) +
               "-dimensional vector";
    }
    catch (const SignalUnavailable& ex)
    {
        return std::string("Error: ") + ex.what();
    }
}

} // namespace provider
