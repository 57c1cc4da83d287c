#include "sdet/preprocess.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace sdet {
void resize_inplace(Frame& f, int w, int h){
  if(f.bgr.empty() || (f.bgr.cols==w && f.bgr.rows==h)) return;
  cv::Mat out;
  int interp = (w*h < f.bgr.cols*f.bgr.rows) ? cv::INTER_AREA : cv::INTER_LINEAR;
  cv::resize(f.bgr, out, cv::Size(w,h), 0, 0, interp);
  f.bgr = out;
}

cv::Mat letterbox(const cv::Mat& src, int side, LetterboxInfo& info){
  info.scale = std::min(side/(float)src.cols, side/(float)src.rows);
  int nw = std::max(1,(int)std::round(src.cols*info.scale));
  int nh = std::max(1,(int)std::round(src.rows*info.scale));
  info.pad_x = (side-nw)/2; info.pad_y = (side-nh)/2;
  cv::Mat resized; cv::resize(src, resized, cv::Size(nw,nh), 0, 0, cv::INTER_LINEAR);
  cv::Mat out(side, side, src.type(), cv::Scalar(114,114,114));
  resized.copyTo(out(cv::Rect(info.pad_x, info.pad_y, nw, nh)));
  return out;
}
}
