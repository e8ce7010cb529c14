#pragma once

#include <chrono>
#include <string_view>

// MEMLINK_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Timer only (std::chrono + plog)
//   2 = Tracy + Timer (full profiling)

#ifndef MEMLINK_PROFILING_LEVEL
#define MEMLINK_PROFILING_LEVEL 0
#endif

#if MEMLINK_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if MEMLINK_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace memlink::profiling
{

#if MEMLINK_PROFILING_LEVEL >= 1
/**
 * @brief RAII scope timer, logs elapsed time at debug level on destruction
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name) noexcept
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG << "[PROFILE] " << name_ << " took " << elapsed.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string_view name_;
    std::chrono::steady_clock::time_point start_;
};
#endif

} // namespace memlink::profiling

#if MEMLINK_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))

#elif MEMLINK_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() ::memlink::profiling::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::memlink::profiling::ScopeTimer __profiling_timer(nameExpr)

#elif MEMLINK_PROFILING_LEVEL >= 2
#define PROFILE_SCOPE_FUNCTION() \
    ZoneScopedN(__FUNCTION__);   \
    ::memlink::profiling::ScopeTimer __profiling_timer(__FUNCTION__)

#define PROFILE_SCOPE_CUSTOM(nameExpr) \
    ZoneScoped;                        \
    ::memlink::profiling::ScopeTimer __profiling_timer(nameExpr)

#endif
