#pragma once

#include "ILocationExtractor.hpp"
#include "../provider/ConcurrencyGate.hpp"
#include "../provider/HttpCommon.hpp"
#include "../provider/ProviderTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace extract
{

/**
 * @brief Shared request plumbing for chat-completion based extractors.
 *
 * Subclasses describe the wire format (headers, URL, body, response envelope);
 * this class owns prompt rendering, the concurrency gate, error
 * categorization and schema validation of the model's JSON answer.
 */
class ILLMLocationExtractor : public ILocationExtractor
{
public:
    explicit ILLMLocationExtractor(provider::LanguageModelConfig cfg);
    ~ILLMLocationExtractor() override;

    bool isReady() const override;
    LocationIntent extract(const std::string& query, const std::vector<std::string>& known_names,
                           const std::atomic<bool>* cancel_flag = nullptr) override;
    std::string testConnection() override;

    const provider::LanguageModelConfig& config() const { return cfg_; }

protected:
    struct Job
    {
        std::string query;
        std::vector<std::string> known_names;
    };

    enum class Role
    {
        System,
        User,
        Assistant
    };

    struct ChatMessage
    {
        Role role = Role::User;
        std::string content;
    };

    struct Prompt
    {
        std::vector<ChatMessage> messages;
    };

    struct PromptContext
    {
        std::vector<std::pair<std::string, std::string>> replacements;
    };

    struct ParseResult
    {
        bool ok = false;
        std::string error_message;
        std::string content; // assistant message text
    };

    struct RequestResult
    {
        bool success = false;
        provider::SignalError error = provider::SignalError::InvalidResponse;
        std::string error_message;
        LocationIntent intent;
    };

    virtual std::string validateConfig(const provider::LanguageModelConfig& cfg) const;
    virtual bool hasValidRuntimeConfig() const;
    virtual void buildHeaders(const Job& job, std::vector<provider::Header>& headers) const = 0;
    virtual std::string buildUrl(const Job& job) const = 0;
    virtual void buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const = 0;
    virtual ParseResult parseResponse(const Job& job, const provider::HttpResponse& resp) const = 0;
    virtual void augmentPromptContext(const Job& job, PromptContext& ctx) const;
    virtual void configureSession(const Job& job, provider::SessionConfig& cfg) const;
    virtual std::string connectionSuccessMessage() const;
    virtual std::string testConnectionImpl();

    Prompt buildPrompt(const Job& job) const;
    static void replaceAll(std::string& target, const std::string& placeholder, const std::string& value);
    RequestResult performRequest(const Job& job, const std::atomic<bool>* cancel_flag);

    provider::LanguageModelConfig cfg_;
    provider::ConcurrencyGate gate_;
};

} // namespace extract
