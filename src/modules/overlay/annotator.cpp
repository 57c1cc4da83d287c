#include "sdet/annotator.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

namespace sdet {
namespace {
// Ultralytics palette, stored as BGR.
const cv::Scalar kPalette[] = {
    {56,56,255},  {151,157,255}, {31,112,255}, {29,178,255}, {49,210,207},
    {10,249,72},  {23,204,146},  {134,219,61}, {52,147,26},  {187,212,0},
    {168,153,44}, {255,194,0},   {147,69,52},  {255,115,100},{236,24,0},
    {255,56,132}, {133,0,82},    {255,56,203}, {200,149,255},{199,55,255}};
constexpr int kPaletteSize = sizeof(kPalette)/sizeof(kPalette[0]);

// cv drawing clips to the image; keep the integer math far from overflow.
constexpr float kCoordLimit = 1 << 20;
cv::Point to_px(const cv::Point2f& p){
  return { (int)std::lround(std::clamp(p.x, -kCoordLimit, kCoordLimit)),
           (int)std::lround(std::clamp(p.y, -kCoordLimit, kCoordLimit)) };
}

bool finite(const cv::RotatedRect& r){
  return std::isfinite(r.center.x) && std::isfinite(r.center.y) && std::isfinite(r.size.width)
      && std::isfinite(r.size.height) && std::isfinite(r.angle);
}

constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
constexpr double kFontScale = 0.6;
}

cv::Scalar class_color(int cls){
  int i = cls % kPaletteSize; if(i<0) i += kPaletteSize;
  return kPalette[i];
}

std::string format_label(const Detection& d){
  char buf[32]; std::snprintf(buf, sizeof(buf), " %.2f", d.score);
  return d.label + buf;
}

Frame annotate(const Frame& in, const Dets& dets){
  Frame out{in.seq, in.bgr.clone(), in.captured};
  cv::Mat& img = out.bgr;
  if(img.empty()) return out;
  for(auto& d : dets){
    if(!finite(d.box)) continue;
    cv::Point2f c4[4]; d.box.points(c4);
    cv::Point pts[4]; int top=0;
    for(int k=0;k<4;++k){ pts[k]=to_px(c4[k]); if(pts[k].y<pts[top].y) top=k; }
    const cv::Point* poly = pts; int npts = 4;
    cv::Scalar color = class_color(d.cls);
    cv::polylines(img, &poly, &npts, 1, true, color, 2, cv::LINE_AA);
    cv::Rect bounds = cv::boundingRect(std::vector<cv::Point>(pts, pts+4));
    if((bounds & cv::Rect(0,0,img.cols,img.rows)).empty()) continue;

    std::string label = format_label(d);
    int base=0; cv::Size ts = cv::getTextSize(label, kFont, kFontScale, 1, &base);
    // above the highest corner, pulled back inside the frame
    int x = std::clamp(pts[top].x - ts.width/2, 0, std::max(0, img.cols - ts.width));
    int y = std::clamp(pts[top].y - 5, ts.height, std::max(ts.height, img.rows - base));
    cv::rectangle(img, cv::Point(x, y - ts.height), cv::Point(x + ts.width, y + base), color, cv::FILLED);
    cv::putText(img, label, cv::Point(x, y), kFont, kFontScale, cv::Scalar(255,255,255), 1, cv::LINE_AA);
  }
  return out;
}

void draw_hud(cv::Mat& img, const HudStats& s){
  if(img.empty()) return;
  char line[64];
  const cv::Scalar green(0,255,0);
  std::snprintf(line, sizeof(line), "FPS: %.1f", s.fps);
  cv::putText(img, line, {10,30}, kFont, 0.7, green, 2);
  std::snprintf(line, sizeof(line), "Latency: %.1f ms", s.latency_ms);
  cv::putText(img, line, {10,60}, kFont, 0.7, green, 2);
  std::snprintf(line, sizeof(line), "Det Time: %.1f ms", s.detect_ms);
  cv::putText(img, line, {10,90}, kFont, 0.7, green, 2);
}
}
