#include "HttpCommon.hpp"

#include <algorithm>
#include <cctype>

#include <cpr/cpr.h>

namespace provider
{

namespace
{

bool cancel_requested(const SessionConfig& cfg)
{
    return cfg.cancel_flag != nullptr && cfg.cancel_flag->load(std::memory_order_relaxed);
}

bool same_header_name(std::string_view a, std::string_view b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

// Configures a session owned by the caller. The progress callback is stored
// inside the session, so the session must not be moved after this call.
void configure_session(cpr::Session& session, const std::string& url, const std::vector<Header>& headers,
                       const SessionConfig& cfg, bool json_body)
{
    cpr::Header h;
    for (const auto& header : headers)
        h.emplace(header.name, header.value);
    if (json_body && std::none_of(headers.begin(), headers.end(),
                                  [](const Header& x) { return same_header_name(x.name, "Content-Type"); }))
        h.emplace("Content-Type", "application/json");

    session.SetUrl(cpr::Url{ url });
    session.SetHeader(h);
    session.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    session.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    if (cfg.cancel_flag)
    {
        // libcurl aborts the transfer when the progress callback returns false
        session.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
            {
                const auto* flag = reinterpret_cast<const std::atomic<bool>*>(userdata);
                return !flag->load(std::memory_order_relaxed);
            },
            reinterpret_cast<intptr_t>(cfg.cancel_flag)));
    }
}

HttpResponse cancelled_before_send()
{
    HttpResponse out;
    out.error = "cancelled before request";
    out.cancelled = true;
    return out;
}

HttpResponse convert(cpr::Response&& r, const SessionConfig& cfg)
{
    HttpResponse out;
    out.elapsed_ms = r.elapsed * 1000.0;
    if (r.error)
    {
        out.error = r.error.message.empty() ? std::string("transport error") : r.error.message;
        out.timed_out = r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
        out.cancelled = cancel_requested(cfg);
        return out;
    }
    out.status_code = static_cast<int>(r.status_code);
    out.text = std::move(r.text);
    return out;
}

} // namespace

Header bearer_auth(std::string_view api_key)
{
    return { "Authorization", "Bearer " + std::string(api_key) };
}

HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg)
{
    if (cancel_requested(cfg))
        return cancelled_before_send();

    cpr::Session session;
    configure_session(session, url, headers, cfg, true);
    session.SetBody(cpr::Body{ body });
    return convert(session.Post(), cfg);
}

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    if (cancel_requested(cfg))
        return cancelled_before_send();

    cpr::Session session;
    configure_session(session, url, headers, cfg, false);
    return convert(session.Get(), cfg);
}

} // namespace provider
