#pragma once

#include <atomic>
#include <string>
#include <vector>

namespace provider
{

using Embedding = std::vector<float>;

/**
 * @brief Text-to-vector encoder used for semantic similarity.
 *
 * Must be deterministic for identical input. Implementations are shared by
 * every query and must be safe to call concurrently.
 */
class IEmbeddingProvider
{
public:
    virtual ~IEmbeddingProvider() = default;

    virtual const char* providerName() const = 0;

    // False when credentials or endpoint are missing; encode() would throw NotConfigured
    virtual bool isReady() const = 0;

    /**
     * @brief Encode every text, preserving order.
     * @throws SignalUnavailable on any provider failure, including cancellation
     */
    virtual std::vector<Embedding> encode(const std::vector<std::string>& texts,
                                          const std::atomic<bool>* cancel_flag = nullptr) = 0;

    // Human-readable connectivity check ("Success: ..." / "Error: ...")
    virtual std::string testConnection() = 0;
};

} // namespace provider
