#pragma once
#include "detection.hpp"
#include "preprocess.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace sdet {
// Intersection over union of two oriented boxes; 0 for degenerate boxes.
float IoU(const cv::RotatedRect& a, const cv::RotatedRect& b);

// Greedy, highest score first. A box is only suppressed by a kept box of the same class.
Dets NMS(const Dets& ds, float thr);

// Decodes one YOLO OBB output blob, shape [1, 4 + classes + 1, anchors] or its
// transpose. Rows: cx, cy, w, h, class scores..., angle (radians). Boxes below
// conf are skipped; coordinates are mapped back through `lb`.
Dets decode_obb(const cv::Mat& out, float conf, const LetterboxInfo& lb,
                const std::vector<std::string>& names);

// Number of classes a blob of this shape carries, or -1 if it is not an OBB head.
int obb_class_count(const cv::Mat& out);
}
