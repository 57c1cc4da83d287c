#pragma once
#include "metrics.hpp"
#include <string>
#include <utility>

#define SDET_CONCAT_(a, b) a##b
#define SDET_CONCAT(a, b) SDET_CONCAT_(a, b)

// Times the rest of the enclosing scope into metrics under `stage`.
#define SDET_TRACE_STAGE(metrics, stage) \
    sdet::ScopeStamp SDET_CONCAT(_scope_stamp_, __LINE__)(metrics, stage)

namespace sdet {
struct ScopeStamp {
    Metrics& m;
    std::string stage;
    Clock::time_point t0;

    ScopeStamp(Metrics& met, std::string s) : m(met), stage(std::move(s)), t0(Clock::now()) {}

    ~ScopeStamp() { m.observe(stage, std::chrono::duration<double, std::milli>(Clock::now() - t0).count()); }

    ScopeStamp(const ScopeStamp&) = delete;
    ScopeStamp& operator=(const ScopeStamp&) = delete;
};
}
