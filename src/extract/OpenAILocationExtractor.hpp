#pragma once

#include "ILLMLocationExtractor.hpp"

namespace extract
{

class OpenAILocationExtractor : public ILLMLocationExtractor
{
public:
    explicit OpenAILocationExtractor(provider::LanguageModelConfig cfg);

    const char* providerName() const override;

    // "https://api.openai.com" -> "https://api.openai.com/v1/chat/completions"
    static std::string normalizeURL(const std::string& base_url);

    // Pulls choices[0].message.content out of a chat-completions envelope
    static ParseResult extractMessageContent(const std::string& body);

protected:
    std::string validateConfig(const provider::LanguageModelConfig& cfg) const override;
    bool hasValidRuntimeConfig() const override;
    void buildHeaders(const Job& job, std::vector<provider::Header>& headers) const override;
    std::string buildUrl(const Job& job) const override;
    void buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const override;
    ParseResult parseResponse(const Job& job, const provider::HttpResponse& resp) const override;
    std::string connectionSuccessMessage() const override;
    std::string testConnectionImpl() override;
};

} // namespace extract
