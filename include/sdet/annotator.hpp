#pragma once
#include "detection.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace sdet {
struct HudStats {
    double fps = 0;
    double latency_ms = 0;
    double detect_ms = 0;
};

// Fixed palette indexed by class id modulo its size.
cv::Scalar class_color(int cls);
// "<label> <score with two decimals>"
std::string format_label(const Detection& d);

// Draws every detection onto a fresh copy of `in`. Never throws for empty
// input or geometry outside the frame; such geometry is clipped.
Frame annotate(const Frame& in, const Dets& dets);

// FPS / latency / detection time in the top-left corner.
void draw_hud(cv::Mat& img, const HudStats& s);
}
