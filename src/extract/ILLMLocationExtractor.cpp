#include "ILLMLocationExtractor.hpp"
#include "IntentSchema.hpp"
#include "../matching/Diagnostics.hpp"
#include "../provider/ProviderHelpers.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>

namespace extract
{

namespace
{

constexpr const char* kSystemPrompt =
    "Eres un experto en análisis de texto para extraer ubicaciones en consultas sobre farmacias en Chile.";

constexpr const char* kDefaultTemplate = R"(Eres un asistente especializado en extraer ubicaciones geográficas de consultas sobre farmacias en Chile.

TAREA: Analiza la siguiente consulta y extrae la comuna/ciudad mencionada.

CONSULTA: "{query}"

COMUNAS DISPONIBLES (ejemplo): {communes}...

INSTRUCCIONES:
1. Identifica si la consulta menciona una ubicación específica
2. Extrae SOLO el nombre de la comuna/ciudad
3. Normaliza el nombre (ej: "la florida" -> "La Florida")
4. Si no hay ubicación clara, devuelve vacío

RESPONDE SOLO CON UN OBJETO JSON:
{
    "extracted_location": "nombre de la comuna extraída o vacío",
    "intent_type": "pharmacy_search|location_query|general",
    "confidence": 0.0-1.0,
    "reasoning": "breve explicación de tu decisión"
}

EJEMPLOS:
- "farmacias en la florida" -> {"extracted_location": "La Florida", "intent_type": "pharmacy_search", "confidence": 0.95, "reasoning": "comuna explícita"}
- "necesito medicamentos en las condes" -> {"extracted_location": "Las Condes", "intent_type": "pharmacy_search", "confidence": 0.90, "reasoning": "comuna explícita"}
- "dónde hay farmacias" -> {"extracted_location": "", "intent_type": "general", "confidence": 0.1, "reasoning": "sin ubicación"}
)";

} // namespace

ILLMLocationExtractor::ILLMLocationExtractor(provider::LanguageModelConfig cfg)
    : cfg_(std::move(cfg))
    , gate_(cfg_.max_concurrent_requests)
{
}

ILLMLocationExtractor::~ILLMLocationExtractor() = default;

bool ILLMLocationExtractor::isReady() const
{
    return validateConfig(cfg_).empty() && hasValidRuntimeConfig();
}

LocationIntent ILLMLocationExtractor::extract(const std::string& query, const std::vector<std::string>& known_names,
                                              const std::atomic<bool>* cancel_flag)
{
    CMATCH_PROFILE_FUNCTION();

    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
        throw provider::SignalUnavailable(provider::SignalError::NotConfigured, providerName(), validation_error);

    Job job;
    job.query = query;
    const std::size_t sample = std::min(cfg_.sample_size, known_names.size());
    job.known_names.assign(known_names.begin(), known_names.begin() + static_cast<std::ptrdiff_t>(sample));

    auto result = performRequest(job, cancel_flag);
    if (!result.success)
        throw provider::SignalUnavailable(result.error, providerName(), result.error_message);

    PLOG_DEBUG_(matching::Diagnostics::kLogInstance)
        << providerName() << " extracted '" << result.intent.extracted_location << "' ("
        << toString(result.intent.intent_type) << ", " << result.intent.confidence
        << ") from: " << matching::Diagnostics::Preview(query) << " - " << result.intent.reasoning;
    return std::move(result.intent);
}

std::string ILLMLocationExtractor::testConnection()
{
    return testConnectionImpl();
}

std::string ILLMLocationExtractor::validateConfig(const provider::LanguageModelConfig& cfg) const
{
    if (!cfg.enabled)
        return "Language model disabled";
    return {};
}

bool ILLMLocationExtractor::hasValidRuntimeConfig() const
{
    return true;
}

void ILLMLocationExtractor::augmentPromptContext(const Job&, PromptContext&) const {}

void ILLMLocationExtractor::configureSession(const Job&, provider::SessionConfig& cfg) const
{
    cfg.connect_timeout_ms = cfg_.connect_timeout_ms;
    cfg.timeout_ms = cfg_.timeout_ms;
}

std::string ILLMLocationExtractor::connectionSuccessMessage() const
{
    return std::string("Success: ") + providerName() + " connection test passed";
}

std::string ILLMLocationExtractor::testConnectionImpl()
{
    Job job;
    job.query = "farmacias en la florida";
    job.known_names = { "La Florida", "Las Condes", "Quilpué" };

    const auto result = performRequest(job, nullptr);
    if (result.success)
        return connectionSuccessMessage();

    if (!result.error_message.empty())
        return "Error: Test extraction failed - " + result.error_message;

    return "Error: Test extraction failed";
}

ILLMLocationExtractor::Prompt ILLMLocationExtractor::buildPrompt(const Job& job) const
{
    PromptContext ctx;
    std::string communes;
    for (const auto& name : job.known_names)
    {
        if (!communes.empty())
            communes += ", ";
        communes += name;
    }
    // {query} last so user text containing "{communes}" is not expanded
    ctx.replacements.emplace_back("{communes}", communes);
    ctx.replacements.emplace_back("{query}", job.query);
    augmentPromptContext(job, ctx);

    std::string user_prompt = cfg_.prompt.empty() ? std::string(kDefaultTemplate) : cfg_.prompt;
    for (const auto& repl : ctx.replacements)
        replaceAll(user_prompt, repl.first, repl.second);

    Prompt prompt;
    prompt.messages.push_back({ Role::System, kSystemPrompt });
    prompt.messages.push_back({ Role::User, std::move(user_prompt) });
    return prompt;
}

void ILLMLocationExtractor::replaceAll(std::string& target, const std::string& placeholder, const std::string& value)
{
    if (placeholder.empty())
        return;
    size_t pos = 0;
    while ((pos = target.find(placeholder, pos)) != std::string::npos)
    {
        target.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
}

ILLMLocationExtractor::RequestResult ILLMLocationExtractor::performRequest(const Job& job,
                                                                           const std::atomic<bool>* cancel_flag)
{
    RequestResult result;

    const provider::helpers::CallDeadline deadline(cfg_.timeout_ms);
    auto permit = gate_.acquire(deadline.remaining(), cancel_flag);
    if (cancel_flag && cancel_flag->load(std::memory_order_relaxed))
    {
        result.error = provider::SignalError::Cancelled;
        result.error_message = "cancelled before request";
        return result;
    }
    if (!permit.acquired() || deadline.expired())
    {
        result.error = provider::SignalError::Timeout;
        result.error_message = "timed out waiting for a request slot";
        return result;
    }

    auto prompt = buildPrompt(job);
    nlohmann::json body_json = nlohmann::json::object();
    buildRequestBody(job, prompt, body_json);
    std::string body = body_json.dump();
    if (matching::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(matching::Diagnostics::kLogInstance) << "final post body: " << matching::Diagnostics::Preview(body);
    }

    std::vector<provider::Header> headers;
    buildHeaders(job, headers);

    provider::SessionConfig session_cfg;
    configureSession(job, session_cfg);
    deadline.clamp(session_cfg);
    session_cfg.cancel_flag = cancel_flag;

    const auto url = buildUrl(job);
    const auto response = provider::post_json(url, body, headers, session_cfg);

    if (!response.ok())
    {
        auto err_type = provider::helpers::categorize_http_error(response);
        const std::string snippet = !response.error.empty() ? response.error : response.text;
        result.error = provider::helpers::to_signal_error(err_type);
        result.error_message = provider::helpers::get_error_description(err_type, response.status_code, snippet);
        if (err_type != provider::helpers::HttpErrorType::Cancelled)
        {
            PLOG_WARNING << providerName() << " request failed: " << result.error_message;
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::LanguageModel,
                                                std::string(providerName()) + " request failed",
                                                result.error_message);
        }
        return result;
    }

    PLOG_DEBUG << providerName() << " answered in " << response.elapsed_ms << " ms";
    auto parse = parseResponse(job, response);
    if (!parse.ok)
    {
        result.error = provider::SignalError::InvalidResponse;
        result.error_message = parse.error_message.empty() ? "parse error" : parse.error_message;
        PLOG_WARNING << providerName() << " response parse failed: " << result.error_message;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::LanguageModel,
                                            std::string(providerName()) + " response parse failed",
                                            result.error_message);
        return result;
    }

    auto intent = parseIntentResponse(parse.content, job.query);
    if (!intent.ok)
    {
        result.error = provider::SignalError::InvalidResponse;
        result.error_message = "schema validation failed: " + intent.error_message;
        PLOG_WARNING << providerName() << " " << result.error_message << " in: "
                     << matching::Diagnostics::Preview(parse.content);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::LanguageModel,
                                            std::string(providerName()) + " returned an invalid intent",
                                            result.error_message);
        return result;
    }

    result.success = true;
    result.intent = std::move(intent.intent);
    return result;
}

} // namespace extract
