#include <catch2/catch_test_macros.hpp>
#include "provider/ConcurrencyGate.hpp"
#include "provider/ProviderHelpers.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace provider;
using namespace provider::helpers;

TEST_CASE("ProviderHelpers - normalize_endpoint", "[provider][helpers]")
{
    REQUIRE(normalize_endpoint("https://api.openai.com", "chat/completions") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(normalize_endpoint("https://api.openai.com/", "embeddings") == "https://api.openai.com/v1/embeddings");
    REQUIRE(normalize_endpoint("http://localhost:8080/v1", "embeddings") == "http://localhost:8080/v1/embeddings");
    REQUIRE(normalize_endpoint("http://localhost:8080/v1/embeddings", "embeddings") ==
            "http://localhost:8080/v1/embeddings");
    REQUIRE(normalize_endpoint("", "embeddings").empty());
}

TEST_CASE("ProviderHelpers - strip_code_fence", "[provider][helpers]")
{
    REQUIRE(strip_code_fence("  {\"a\": 1}  ") == "{\"a\": 1}");
    REQUIRE(strip_code_fence("```json\n{\"a\": 1}\n```") == "{\"a\": 1}");
    REQUIRE(strip_code_fence("```\n{\"a\": 1}") == "{\"a\": 1}");
    REQUIRE(strip_code_fence("```").empty());
    REQUIRE(strip_code_fence(" \n ").empty());
}

TEST_CASE("ProviderHelpers - error categorization", "[provider][helpers]")
{
    HttpResponse resp;

    SECTION("Success")
    {
        resp.status_code = 200;
        REQUIRE(categorize_http_error(resp) == HttpErrorType::Success);
    }

    SECTION("Transport failures")
    {
        resp.error = "Operation timed out";
        resp.timed_out = true;
        REQUIRE(categorize_http_error(resp) == HttpErrorType::Timeout);
        REQUIRE(to_signal_error(HttpErrorType::Timeout) == SignalError::Timeout);

        resp.timed_out = false;
        resp.error = "Could not resolve host";
        REQUIRE(categorize_http_error(resp) == HttpErrorType::NetworkError);
        REQUIRE(to_signal_error(HttpErrorType::NetworkError) == SignalError::Transport);

        resp.cancelled = true;
        REQUIRE(categorize_http_error(resp) == HttpErrorType::Cancelled);
        REQUIRE(to_signal_error(HttpErrorType::Cancelled) == SignalError::Cancelled);
    }

    SECTION("HTTP status codes")
    {
        resp.status_code = 429;
        REQUIRE(categorize_http_error(resp) == HttpErrorType::RateLimited);
        resp.status_code = 401;
        REQUIRE(categorize_http_error(resp) == HttpErrorType::ClientError);
        resp.status_code = 503;
        REQUIRE(categorize_http_error(resp) == HttpErrorType::ServerError);
        resp.status_code = 504;
        REQUIRE(categorize_http_error(resp) == HttpErrorType::Timeout);
        REQUIRE(to_signal_error(HttpErrorType::ServerError) == SignalError::HttpStatus);
    }

    SECTION("Descriptions truncate long bodies")
    {
        const std::string body(500, 'x');
        auto text = get_error_description(HttpErrorType::ServerError, 502, body);
        REQUIRE(text.rfind("Server error (HTTP 502): ", 0) == 0);
        REQUIRE(text.size() < 250);
    }
}

TEST_CASE("ConcurrencyGate - bounds in-flight permits", "[provider][gate]")
{
    ConcurrencyGate gate(2);
    REQUIRE(gate.limit() == 2);

    SECTION("Permits release on destruction")
    {
        {
            auto a = gate.acquire(std::chrono::milliseconds(10));
            auto b = gate.acquire(std::chrono::milliseconds(10));
            REQUIRE(a.acquired());
            REQUIRE(b.acquired());
            REQUIRE(gate.inFlight() == 2);

            auto c = gate.acquire(std::chrono::milliseconds(10));
            REQUIRE_FALSE(c.acquired());
        }
        REQUIRE(gate.inFlight() == 0);
    }

    SECTION("A waiter gets the released permit")
    {
        auto a = gate.acquire(std::chrono::milliseconds(10));
        auto b = gate.acquire(std::chrono::milliseconds(10));

        std::thread releaser([held = std::move(a)]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            held = ConcurrencyGate::Permit{};
        });
        auto c = gate.acquire(std::chrono::seconds(2));
        releaser.join();
        REQUIRE(c.acquired());
        REQUIRE(gate.inFlight() == 2);
    }

    SECTION("A queued caller leaves as soon as it is cancelled")
    {
        auto a = gate.acquire(std::chrono::milliseconds(10));
        auto b = gate.acquire(std::chrono::milliseconds(10));

        std::atomic<bool> cancel{ false };
        std::thread canceller([&cancel]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            cancel.store(true);
        });
        const auto start = std::chrono::steady_clock::now();
        auto c = gate.acquire(std::chrono::seconds(5), &cancel);
        const auto waited = std::chrono::steady_clock::now() - start;
        canceller.join();

        REQUIRE_FALSE(c.acquired());
        REQUIRE(waited < std::chrono::seconds(1));
        REQUIRE(gate.inFlight() == 2);
    }

    SECTION("A raised cancel flag does not block a free slot")
    {
        std::atomic<bool> cancel{ true };
        auto a = gate.acquire(std::chrono::milliseconds(10), &cancel);
        REQUIRE(a.acquired());
    }

    SECTION("Zero limit is treated as one")
    {
        ConcurrencyGate single(0);
        REQUIRE(single.limit() == 1);
    }
}

TEST_CASE("CallDeadline - session timeouts never exceed the remaining budget", "[provider][helpers]")
{
    SECTION("Fresh budget caps the configured timeouts")
    {
        CallDeadline deadline(300);
        SessionConfig cfg;
        cfg.timeout_ms = 5000;
        cfg.connect_timeout_ms = 2000;
        deadline.clamp(cfg);
        REQUIRE(cfg.timeout_ms <= 300);
        REQUIRE(cfg.timeout_ms > 0);
        REQUIRE(cfg.connect_timeout_ms <= 300);
        REQUIRE_FALSE(deadline.expired());
    }

    SECTION("Shorter configured timeouts are kept")
    {
        CallDeadline deadline(5000);
        SessionConfig cfg;
        cfg.timeout_ms = 1000;
        cfg.connect_timeout_ms = 200;
        deadline.clamp(cfg);
        REQUIRE(cfg.timeout_ms == 1000);
        REQUIRE(cfg.connect_timeout_ms == 200);
    }

    SECTION("Spent budget clamps to one millisecond, never zero")
    {
        CallDeadline deadline(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        REQUIRE(deadline.expired());
        REQUIRE(deadline.remaining().count() == 0);
        SessionConfig cfg;
        deadline.clamp(cfg);
        REQUIRE(cfg.timeout_ms == 1);
        REQUIRE(cfg.connect_timeout_ms == 1);
    }
}
