#pragma once

#include "IEmbeddingProvider.hpp"
#include "ConcurrencyGate.hpp"
#include "HttpCommon.hpp"
#include "ProviderTypes.hpp"

#include <nlohmann/json.hpp>

namespace provider
{

// Client for OpenAI-compatible /v1/embeddings endpoints
class OpenAIEmbeddingProvider : public IEmbeddingProvider
{
public:
    explicit OpenAIEmbeddingProvider(EmbeddingConfig cfg);
    ~OpenAIEmbeddingProvider() override;

    const char* providerName() const override;
    bool isReady() const override;
    std::vector<Embedding> encode(const std::vector<std::string>& texts,
                                  const std::atomic<bool>* cancel_flag = nullptr) override;
    std::string testConnection() override;

    const EmbeddingConfig& config() const { return cfg_; }

    // Empty string when the configuration is usable
    static std::string validateConfig(const EmbeddingConfig& cfg);

    std::string buildUrl() const;
    nlohmann::json buildRequestBody(const std::vector<std::string>& batch) const;

    /**
     * @brief Parses an embeddings response, honouring the per-item "index" field.
     * @throws SignalUnavailable(InvalidResponse) when the payload is malformed or
     *         does not contain exactly @p expected vectors of equal dimension
     */
    static std::vector<Embedding> parseResponse(const std::string& body, std::size_t expected);

private:
    std::vector<Embedding> encodeBatch(const std::vector<std::string>& batch, const std::atomic<bool>* cancel_flag);
    std::vector<Header> buildHeaders() const;
    SessionConfig sessionConfig(const std::atomic<bool>* cancel_flag) const;

    EmbeddingConfig cfg_;
    ConcurrencyGate gate_;
};

} // namespace provider
