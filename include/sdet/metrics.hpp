#pragma once
#include "frame.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace sdet {
struct StageLatency {
    std::string stage;
    uint64_t count = 0;
    double last_ms = 0;
    double mean_ms = 0;
    double recent_ms = 0;   // exponentially weighted, tracks the last few dozen samples
    double max_ms = 0;
};

// Aggregates only; memory stays flat however long the session runs.
class Metrics {
public:
    void observe(const std::string& stage, double ms) {
        std::lock_guard<std::mutex> lk(mu_);
        StageLatency& s = slot(stage);
        ++s.count;
        s.last_ms = ms;
        s.mean_ms += (ms - s.mean_ms) / static_cast<double>(s.count);
        s.recent_ms = s.count == 1 ? ms : s.recent_ms + kAlpha * (ms - s.recent_ms);
        if (ms > s.max_ms) s.max_ms = ms;
    }

    StageLatency get(const std::string& stage) const {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& s : stages_) if (s.stage == stage) return s;
        return StageLatency{stage};
    }

    std::vector<StageLatency> summary() const {
        std::lock_guard<std::mutex> lk(mu_);
        return stages_;
    }

    // one call per published frame
    void tick(Clock::time_point now = Clock::now()) {
        std::lock_guard<std::mutex> lk(mu_);
        if (window_n_ == 0 && window_start_ == Clock::time_point{}) window_start_ = now;
        ++window_n_;
        double sec = std::chrono::duration<double>(now - window_start_).count();
        if (sec >= 1.0) {
            fps_ = window_n_ / sec;
            window_n_ = 0;
            window_start_ = now;
        }
    }

    double fps() const {
        std::lock_guard<std::mutex> lk(mu_);
        return fps_;
    }

    bool dump_csv(const std::string& path) const {
        std::ofstream f(path);
        if (!f) return false;
        f << "stage,count,last_ms,mean_ms,recent_ms,max_ms\n";
        for (auto& s : summary())
            f << s.stage << "," << s.count << "," << s.last_ms << "," << s.mean_ms << ","
              << s.recent_ms << "," << s.max_ms << "\n";
        return static_cast<bool>(f);
    }

private:
    StageLatency& slot(const std::string& stage) {
        for (auto& s : stages_) if (s.stage == stage) return s;
        stages_.push_back(StageLatency{stage});
        return stages_.back();
    }

    static constexpr double kAlpha = 0.1;
    mutable std::mutex mu_;
    std::vector<StageLatency> stages_;
    Clock::time_point window_start_{};
    uint64_t window_n_ = 0;
    double fps_ = 0;
};
}   // namespace sdet
