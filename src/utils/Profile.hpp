#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

// CMATCH_PROFILING_LEVEL comes from CMake:
//   0 = off
//   1 = scope timers written to the profiling logger
//   2 = Tracy zones plus scope timers

#ifndef CMATCH_PROFILING_LEVEL
#define CMATCH_PROFILING_LEVEL 0
#endif

#if CMATCH_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if CMATCH_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if CMATCH_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;

// Scopes slower than this are logged at info so they show without debug output.
// Provider round-trips usually land here; local cascade stages should not.
constexpr std::chrono::milliseconds kSlowScope{ 250 };

namespace detail
{

/**
 * @brief Logs the wall time of a scope to the profiling logger.
 *
 * The label is not copied; pass a literal, __FUNCTION__ or a name that
 * outlives the scope (cascade stage names are static strings).
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view label) noexcept
        : label_(label)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        const auto elapsed = std::chrono::steady_clock::now() - start_;
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
        if (elapsed >= kSlowScope)
        {
            PLOG_INFO_(kProfilingLogInstance) << "[slow] " << label_ << " " << us / 1000 << " ms";
        }
        else
        {
            PLOG_DEBUG_(kProfilingLogInstance) << label_ << " " << us << " us";
        }
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string_view label_;
    std::chrono::steady_clock::time_point start_;
};

#if CMATCH_PROFILING_LEVEL >= 2
inline void NameZone(tracy::ScopedZone& zone, std::string_view label) noexcept
{
    if (label.empty())
        return;
    const auto len = label.size() > 0xFFFF ? std::uint16_t{ 0xFFFF } : static_cast<std::uint16_t>(label.size());
    zone.Name(label.data(), len);
}
#endif

} // namespace detail
#endif

} // namespace profiling

#if CMATCH_PROFILING_LEVEL == 0
#define CMATCH_PROFILE_FUNCTION() ((void)0)
#define CMATCH_PROFILE_STAGE(label) ((void)sizeof(label))

#elif CMATCH_PROFILING_LEVEL == 1
#define CMATCH_PROFILE_FUNCTION() ::profiling::detail::ScopeTimer cmatch_scope_timer_(__FUNCTION__)
#define CMATCH_PROFILE_STAGE(label) ::profiling::detail::ScopeTimer cmatch_scope_timer_(label)

#else
#define CMATCH_PROFILE_FUNCTION()  \
    ZoneScopedN(__FUNCTION__);     \
    ::profiling::detail::ScopeTimer cmatch_scope_timer_(__FUNCTION__)

#define CMATCH_PROFILE_STAGE(label)                                 \
    ZoneScoped;                                                     \
    ::profiling::detail::NameZone(___tracy_scoped_zone, label);     \
    ::profiling::detail::ScopeTimer cmatch_scope_timer_(label)
#endif
