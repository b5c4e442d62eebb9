#include <catch2/catch_test_macros.hpp>
#include "extract/OpenAILocationExtractor.hpp"
#include "utils/silent_server.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace extract;

TEST_CASE("OpenAILocationExtractor - configuration", "[provider][llm]")
{
    SECTION("Not ready with empty config")
    {
        OpenAILocationExtractor extractor{ provider::LanguageModelConfig{} };
        REQUIRE_FALSE(extractor.isReady());
    }

    SECTION("Ready with key, model and base URL")
    {
        provider::LanguageModelConfig cfg;
        cfg.enabled = true;
        cfg.api_key = "test-key";
        cfg.model = "gpt-4o-mini";
        OpenAILocationExtractor extractor{ cfg };
        REQUIRE(extractor.isReady());
        REQUIRE(std::string(extractor.providerName()) == "OpenAI");
    }

    SECTION("extract() on an unconfigured client throws NotConfigured")
    {
        OpenAILocationExtractor extractor{ provider::LanguageModelConfig{} };
        try
        {
            (void)extractor.extract("farmacias en temuco", { "Temuco" });
            FAIL("expected SignalUnavailable");
        }
        catch (const provider::SignalUnavailable& ex)
        {
            REQUIRE(ex.kind() == provider::SignalError::NotConfigured);
        }
    }

    SECTION("Endpoint normalization")
    {
        REQUIRE(OpenAILocationExtractor::normalizeURL("https://api.openai.com") ==
                "https://api.openai.com/v1/chat/completions");
        REQUIRE(OpenAILocationExtractor::normalizeURL("http://localhost:11434/v1") ==
                "http://localhost:11434/v1/chat/completions");
    }
}

TEST_CASE("OpenAILocationExtractor - response envelope", "[provider][llm]")
{
    SECTION("Message content is extracted")
    {
        auto result = OpenAILocationExtractor::extractMessageContent(
            R"({"choices": [{"message": {"role": "assistant", "content": "{\"extracted_location\": \"Temuco\"}"}}]})");
        REQUIRE(result.ok);
        REQUIRE(result.content == R"({"extracted_location": "Temuco"})");
    }

    SECTION("Missing pieces are errors")
    {
        REQUIRE_FALSE(OpenAILocationExtractor::extractMessageContent("<html>").ok);
        REQUIRE(OpenAILocationExtractor::extractMessageContent(R"({"choices": []})").error_message ==
                "missing choices in response");
        REQUIRE(OpenAILocationExtractor::extractMessageContent(R"({"choices": [{"message": {}}]})").error_message ==
                "missing message content");
    }
}

TEST_CASE("OpenAILocationExtractor - stalled endpoint", "[provider][llm][timeout]")
{
    test_utils::SilentServer server;
    provider::LanguageModelConfig cfg;
    cfg.enabled = true;
    cfg.api_key = "test-key";
    cfg.model = "gpt-4o-mini";
    cfg.base_url = server.baseUrl();
    cfg.timeout_ms = 300;
    OpenAILocationExtractor extractor{ cfg };

    auto runExtract = [&extractor](const std::atomic<bool>* cancel_flag) {
        const auto start = std::chrono::steady_clock::now();
        provider::SignalError kind = provider::SignalError::NotConfigured;
        try
        {
            (void)extractor.extract("farmacias de turno en kilpue", { "Quilpué" }, cancel_flag);
            FAIL("extract succeeded against a server that never answers");
        }
        catch (const provider::SignalUnavailable& ex)
        {
            kind = ex.kind();
        }
        return std::make_pair(kind, std::chrono::steady_clock::now() - start);
    };

    SECTION("Times out within the configured budget")
    {
        auto [kind, took] = runExtract(nullptr);
        REQUIRE(kind == provider::SignalError::Timeout);
        REQUIRE(took < std::chrono::milliseconds(300 + 300));
    }

    SECTION("Cancellation ends the request early")
    {
        cfg.timeout_ms = 10000;
        OpenAILocationExtractor patient{ cfg };
        std::atomic<bool> cancel{ false };
        std::thread canceller([&cancel]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            cancel.store(true);
        });
        const auto start = std::chrono::steady_clock::now();
        provider::SignalError kind = provider::SignalError::NotConfigured;
        try
        {
            (void)patient.extract("farmacias de turno en kilpue", { "Quilpué" }, &cancel);
        }
        catch (const provider::SignalUnavailable& ex)
        {
            kind = ex.kind();
        }
        const auto took = std::chrono::steady_clock::now() - start;
        canceller.join();

        REQUIRE(kind == provider::SignalError::Cancelled);
        REQUIRE(took < std::chrono::seconds(5));
    }
}
