#pragma once
#include "frame.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace sdet {
// box.angle is in degrees (OpenCV convention).
struct Detection {
    cv::RotatedRect box;
    int cls = 0;
    std::string label;
    float score = 0.f;
};
using Dets = std::vector<Detection>;

struct DetectedFrame {
    Frame frame;
    Dets dets;
};
}
