#pragma once

#include "../provider/ProviderTypes.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace matching
{

// Outcome of one cascade stage; a failure means "skip this signal for this query"
template <typename T>
struct StageResult
{
    T result{};
    bool succeeded = true;
    std::optional<std::string> error;
    std::optional<provider::SignalError> signal_error; // set when a provider failed
    std::chrono::microseconds duration{ 0 };
    std::string stage_name;

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name)
    {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name,
                               std::optional<provider::SignalError> signal = std::nullopt)
    {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.signal_error = signal;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace matching
