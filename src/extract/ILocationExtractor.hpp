#pragma once

#include "LocationIntent.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace extract
{

/**
 * @brief Pulls a place name and an intent out of a free-form sentence.
 *
 * Implementations are shared across queries; extract() must be safe to call
 * concurrently and must honour @p cancel_flag for the call it belongs to only.
 */
class ILocationExtractor
{
public:
    virtual ~ILocationExtractor() = default;

    virtual const char* providerName() const = 0;
    virtual bool isReady() const = 0;

    /**
     * @param known_names canonical commune names offered to the model as context
     * @throws provider::SignalUnavailable on timeout, cancellation, transport or
     *         HTTP errors, and on responses that fail schema validation
     */
    virtual LocationIntent extract(const std::string& query, const std::vector<std::string>& known_names,
                                   const std::atomic<bool>* cancel_flag = nullptr) = 0;

    virtual std::string testConnection() = 0;
};

} // namespace extract
