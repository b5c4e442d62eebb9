#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <vector>

namespace provider
{

struct Header
{
    std::string name;
    std::string value;
};

// "Authorization: Bearer <key>" as used by every OpenAI-compatible endpoint
Header bearer_auth(std::string_view api_key);

struct SessionConfig
{
    int connect_timeout_ms = 2000;
    int timeout_ms = 5000;
    // Polled during the transfer; a fresh session is opened per request
    const std::atomic<bool>* cancel_flag = nullptr;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // transport failure, empty when the server answered
    bool timed_out = false;
    bool cancelled = false;
    double elapsed_ms = 0.0;

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// POST with a JSON body; Content-Type is added unless the caller sets one
HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg);

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg);

} // namespace provider
