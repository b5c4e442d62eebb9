#include "OpenAILocationExtractor.hpp"
#include "../provider/ProviderHelpers.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace extract
{

OpenAILocationExtractor::OpenAILocationExtractor(provider::LanguageModelConfig cfg)
    : ILLMLocationExtractor(std::move(cfg))
{
}

const char* OpenAILocationExtractor::providerName() const
{
    return "OpenAI";
}

std::string OpenAILocationExtractor::validateConfig(const provider::LanguageModelConfig& cfg) const
{
    auto base = ILLMLocationExtractor::validateConfig(cfg);
    if (!base.empty())
        return base;
    if (cfg.api_key.empty())
        return "Missing API key";
    if (cfg.base_url.empty())
        return "Missing base URL";
    if (cfg.model.empty())
        return "Missing model";
    return {};
}

bool OpenAILocationExtractor::hasValidRuntimeConfig() const
{
    return !cfg_.api_key.empty() && !cfg_.model.empty() && !cfg_.base_url.empty();
}

void OpenAILocationExtractor::buildHeaders(const Job& job, std::vector<provider::Header>& headers) const
{
    (void)job;
    headers.push_back({ "Content-Type", "application/json" });
    headers.push_back(provider::bearer_auth(cfg_.api_key));
}

std::string OpenAILocationExtractor::buildUrl(const Job& job) const
{
    (void)job;
    return normalizeURL(cfg_.base_url);
}

void OpenAILocationExtractor::buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const
{
    (void)job;
    body["model"] = cfg_.model;
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : prompt.messages)
    {
        std::string role = "user";
        switch (message.role)
        {
        case Role::System:
            role = "system";
            break;
        case Role::Assistant:
            role = "assistant";
            break;
        default:
            role = "user";
            break;
        }
        messages.push_back({ { "role", role }, { "content", message.content } });
    }
    body["messages"] = std::move(messages);
    body["temperature"] = cfg_.temperature;
    body["max_tokens"] = cfg_.max_tokens;
}

OpenAILocationExtractor::ParseResult OpenAILocationExtractor::extractMessageContent(const std::string& body)
{
    ParseResult result;
    auto json = nlohmann::json::parse(body, nullptr, /*allow_exceptions*/ false);
    if (json.is_discarded() || !json.is_object())
    {
        result.error_message = "response is not a JSON object";
        return result;
    }

    auto choices = json.find("choices");
    if (choices == json.end() || !choices->is_array() || choices->empty())
    {
        result.error_message = "missing choices in response";
        return result;
    }

    const auto& choice = choices->at(0);
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object())
    {
        result.error_message = "missing message content";
        return result;
    }
    const auto& message = choice["message"];
    auto content = message.find("content");
    if (content == message.end() || !content->is_string())
    {
        result.error_message = "missing message content";
        return result;
    }

    result.content = content->get<std::string>();
    result.ok = true;
    return result;
}

OpenAILocationExtractor::ParseResult OpenAILocationExtractor::parseResponse(const Job& job,
                                                                           const provider::HttpResponse& resp) const
{
    (void)job;
    return extractMessageContent(resp.text);
}

std::string OpenAILocationExtractor::connectionSuccessMessage() const
{
    return "Success: Connection test passed, model returned a valid location intent";
}

std::string OpenAILocationExtractor::testConnectionImpl()
{
    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
        return "Config Error: " + validation_error;

    std::string models_url = cfg_.base_url;
    while (!models_url.empty() && models_url.back() == '/')
        models_url.pop_back();
    if (models_url.size() >= 3 && models_url.compare(models_url.size() - 3, 3, "/v1") == 0)
        models_url += "/models";
    else
        models_url += "/v1/models";

    std::vector<provider::Header> headers{ provider::bearer_auth(cfg_.api_key) };
    provider::SessionConfig session;
    session.connect_timeout_ms = cfg_.connect_timeout_ms;
    session.timeout_ms = cfg_.timeout_ms;

    const auto resp = provider::get(models_url, headers, session);
    if (!resp.error.empty())
        return "Error: Cannot connect to base URL - " + resp.error;
    if (resp.status_code < 200 || resp.status_code >= 300)
        return "Error: Base URL returned HTTP " + std::to_string(resp.status_code);

    if (resp.text.find('"' + cfg_.model + '"') == std::string::npos)
        return "Warning: Model '" + cfg_.model + "' not found in available models list";

    return ILLMLocationExtractor::testConnectionImpl();
}

std::string OpenAILocationExtractor::normalizeURL(const std::string& base_url)
{
    return provider::helpers::normalize_endpoint(base_url, "chat/completions");
}

} // namespace extract
