#pragma once

#include "HttpCommon.hpp"
#include "ProviderTypes.hpp"

#include <algorithm>
#include <chrono>
#include <string>

namespace provider
{
namespace helpers
{

// Categorize HTTP errors
enum class HttpErrorType
{
    Success,
    Cancelled,
    Timeout,
    NetworkError,
    RateLimited,
    ServerError,
    ClientError,
    Other
};

inline HttpErrorType categorize_http_error(const HttpResponse& resp)
{
    if (resp.cancelled)
        return HttpErrorType::Cancelled;

    if (!resp.error.empty())
    {
        if (resp.timed_out || resp.error.find("timeout") != std::string::npos ||
            resp.error.find("Timeout") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        return HttpErrorType::NetworkError;
    }

    if (resp.status_code >= 200 && resp.status_code < 300)
    {
        return HttpErrorType::Success;
    }

    switch (resp.status_code)
    {
    case 408: // Request Timeout
    case 504: // Gateway Timeout
        return HttpErrorType::Timeout;
    case 429:
        return HttpErrorType::RateLimited;
    case 400:
    case 401:
    case 403:
    case 404:
        return HttpErrorType::ClientError;
    default:
        if (resp.status_code >= 500)
            return HttpErrorType::ServerError;
        return HttpErrorType::Other;
    }
}

inline SignalError to_signal_error(HttpErrorType type)
{
    switch (type)
    {
    case HttpErrorType::Cancelled:
        return SignalError::Cancelled;
    case HttpErrorType::Timeout:
        return SignalError::Timeout;
    case HttpErrorType::NetworkError:
        return SignalError::Transport;
    default:
        return SignalError::HttpStatus;
    }
}

inline std::string get_error_description(HttpErrorType type, int status_code, const std::string& text_snippet)
{
    std::string snippet = text_snippet.size() > 200 ? text_snippet.substr(0, 200) + "..." : text_snippet;
    switch (type)
    {
    case HttpErrorType::Cancelled:
        return "Request cancelled by caller";
    case HttpErrorType::Timeout:
        return "Request timeout: " + snippet;
    case HttpErrorType::NetworkError:
        return "Network error: " + snippet;
    case HttpErrorType::RateLimited:
        return "Rate limited (HTTP 429): " + snippet;
    case HttpErrorType::ServerError:
        return "Server error (HTTP " + std::to_string(status_code) + "): " + snippet;
    case HttpErrorType::ClientError:
        return "Client error (HTTP " + std::to_string(status_code) + "): " + snippet;
    default:
        return "HTTP " + std::to_string(status_code) + ": " + snippet;
    }
}

// Appends the OpenAI-compatible endpoint path unless base_url already names one.
// "https://api.openai.com" -> "https://api.openai.com/v1/chat/completions"
// "http://localhost:8080/v1" -> "http://localhost:8080/v1/chat/completions"
inline std::string normalize_endpoint(const std::string& base_url, const std::string& endpoint)
{
    std::string url = base_url;

    while (!url.empty() && url.back() == '/')
        url.pop_back();

    if (url.empty())
        return url;

    std::size_t scheme_end = url.find("://");
    std::size_t path_start = (scheme_end != std::string::npos) ? url.find('/', scheme_end + 3) : url.find('/');

    if (path_start != std::string::npos)
    {
        std::string path = url.substr(path_start);
        if (path.find("/v1/" + endpoint) != std::string::npos)
            return url;
        if (path == "/v1")
            return url + "/" + endpoint;
        return url;
    }

    return url + "/v1/" + endpoint;
}

// Strips a surrounding ```json ... ``` (or bare ```) fence from model output
inline std::string strip_code_fence(const std::string& text)
{
    std::size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    std::size_t end = text.find_last_not_of(" \t\r\n");
    std::string body = text.substr(begin, end - begin + 1);

    if (body.rfind("```", 0) != 0)
        return body;

    std::size_t first_newline = body.find('\n');
    if (first_newline == std::string::npos)
        return {};
    std::size_t closing = body.rfind("```");
    if (closing == std::string::npos || closing <= first_newline)
        closing = body.size();
    body = body.substr(first_newline + 1, closing - first_newline - 1);

    begin = body.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    end = body.find_last_not_of(" \t\r\n");
    return body.substr(begin, end - begin + 1);
}

// One timeout budget per provider call, shared by the permit wait and the transfer
class CallDeadline
{
public:
    explicit CallDeadline(int budget_ms)
        : end_(std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(budget_ms, 1)))
    {
    }

    std::chrono::milliseconds remaining() const
    {
        const auto left =
            std::chrono::duration_cast<std::chrono::milliseconds>(end_ - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    bool expired() const { return remaining().count() <= 0; }

    // Caps both session timeouts at the time left. cpr reads 0 as "no timeout",
    // so an expired deadline must be caught with expired() before sending.
    void clamp(SessionConfig& cfg) const
    {
        const int left = static_cast<int>(std::max<long long>(remaining().count(), 1));
        cfg.timeout_ms = cfg.timeout_ms > 0 ? std::min(cfg.timeout_ms, left) : left;
        cfg.connect_timeout_ms = cfg.connect_timeout_ms > 0 ? std::min(cfg.connect_timeout_ms, left) : left;
    }

private:
    std::chrono::steady_clock::time_point end_;
};

} // namespace helpers
} // namespace provider
