#include "ProviderTypes.hpp"

namespace provider
{

const char* toString(SignalError error)
{
    switch (error)
    {
    case SignalError::NotConfigured:
        return "not_configured";
    case SignalError::Timeout:
        return "timeout";
    case SignalError::Cancelled:
        return "cancelled";
    case SignalError::Transport:
        return "transport";
    case SignalError::HttpStatus:
        return "http_status";
    case SignalError::InvalidResponse:
        return "invalid_response";
    }
    return "unknown";
}

SignalUnavailable::SignalUnavailable(SignalError kind, std::string provider, const std::string& detail)
    : std::runtime_error(provider + " unavailable (" + toString(kind) + "): " + detail)
    , kind_(kind)
    , provider_(std::move(provider))
{
}

} // namespace provider
