#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace provider
{

// Why an optional signal (embedding, language model) produced nothing
enum class SignalError
{
    NotConfigured,
    Timeout,
    Cancelled,
    Transport,
    HttpStatus,
    InvalidResponse
};

const char* toString(SignalError error);

/**
 * @brief Typed provider failure.
 *
 * Thrown by provider clients and converted into a failed stage by the
 * matching cascade; never escapes a match() call.
 */
class SignalUnavailable : public std::runtime_error
{
public:
    SignalUnavailable(SignalError kind, std::string provider, const std::string& detail);

    SignalError kind() const noexcept { return kind_; }
    const std::string& provider() const noexcept { return provider_; }

private:
    SignalError kind_;
    std::string provider_;
};

// Endpoint settings shared by every OpenAI-compatible client
struct ProviderConfig
{
    bool enabled = false;
    std::string base_url = "https://api.openai.com";
    std::string model;
    std::string api_key;
    int timeout_ms = 5000;
    int connect_timeout_ms = 2000;
    std::size_t max_concurrent_requests = 4;
};

struct LanguageModelConfig : ProviderConfig
{
    std::size_t sample_size = 20; // known commune names listed in the prompt
    double temperature = 0.1;
    int max_tokens = 200;
    std::string prompt;           // overrides the built-in template when non-empty
};

struct EmbeddingConfig : ProviderConfig
{
    std::size_t batch_size = 64;  // inputs per /v1/embeddings request
};

} // namespace provider
