#pragma once

#include "StageResult.hpp"
#include "Diagnostics.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../provider/ProviderTypes.hpp"
#include "../utils/Profile.hpp"
#include "../utils/ErrorReporter.hpp"

namespace matching
{

// Runs a stage (callable returning T) and converts exceptions into a typed failure.
// Measures duration; provider failures keep their SignalError for the caller.
template <typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    CMATCH_PROFILE_STAGE(stage_name);

    using namespace std::chrono;
    auto start = steady_clock::now();
    auto elapsed = [&start]() { return duration_cast<microseconds>(steady_clock::now() - start); };
    try
    {
        T res = fn();
        auto dur = elapsed();
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const provider::SignalUnavailable& ex)
    {
        auto dur = elapsed();
        if (ex.kind() == provider::SignalError::Cancelled)
        {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' cancelled after " << dur.count() << "us";
        }
        else
        {
            PLOG_WARNING_(Diagnostics::kLogInstance)
                << "Stage '" << stage_name << "' skipped after " << dur.count() << "us: " << ex.what();
        }
        return StageResult<T>::failure(ex.what(), dur, stage_name, ex.kind());
    }
    catch (const std::exception& ex)
    {
        auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching, "Matching stage failed",
                                            stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace matching
