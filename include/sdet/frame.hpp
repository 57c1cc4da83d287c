#pragma once
#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>

namespace sdet {
using Clock = std::chrono::steady_clock;

// Pixel payload is never written after the frame leaves its producer.
struct Frame {
    uint64_t seq = 0;
    cv::Mat bgr;
    Clock::time_point captured{};
};
}
