#pragma once
#include "frame.hpp"
#include <opencv2/core.hpp>

namespace sdet {
// Scale plus padding applied by letterbox(); maps model space back to frame space.
struct LetterboxInfo {
    float scale = 1.f;
    int pad_x = 0;
    int pad_y = 0;

    cv::Point2f to_frame(cv::Point2f p) const { return {(p.x - pad_x) / scale, (p.y - pad_y) / scale}; }
};

// Only for frames that have not been handed to another stage yet.
void resize_inplace(Frame& f, int w, int h);

// Fit `src` into a side x side square, keeping aspect ratio, grey padding.
cv::Mat letterbox(const cv::Mat& src, int side, LetterboxInfo& info);
}
