#include <doctest/doctest.h>
#include "sdet/annotator.hpp"
#include <opencv2/core.hpp>
#include <limits>

using namespace sdet;

namespace {
Frame gradient(int w, int h){
  Frame f; f.seq = 3; f.bgr = cv::Mat(h, w, CV_8UC3);
  for(int y=0;y<h;++y) for(int x=0;x<w;++x) f.bgr.at<cv::Vec3b>(y,x) = cv::Vec3b(x%256, y%256, (x+y)%256);
  return f;
}
bool same(const cv::Mat& a, const cv::Mat& b){ return a.size()==b.size() && a.type()==b.type() && cv::norm(a,b,cv::NORM_INF)==0; }
Detection det(cv::RotatedRect r, int cls=0, float score=0.5f){ return Detection{r, cls, "ship", score}; }
}

TEST_CASE("annotate with no detections is a fresh identical copy"){
  Frame f = gradient(64,48);
  Frame out = annotate(f, {});
  CHECK(out.seq==f.seq);
  CHECK(out.captured==f.captured);
  CHECK(out.bgr.data!=f.bgr.data);
  CHECK(same(out.bgr, f.bgr));
}

TEST_CASE("annotate draws without touching the input"){
  Frame f = gradient(64,48);
  cv::Mat before = f.bgr.clone();
  Frame out = annotate(f, {det(cv::RotatedRect({32,24},{20,10},30))});
  CHECK(same(f.bgr, before));
  CHECK_FALSE(same(out.bgr, before));
}

TEST_CASE("annotate is deterministic"){
  Frame f = gradient(80,60);
  Dets ds{det(cv::RotatedRect({30,30},{25,12},15),2,0.77f), det(cv::RotatedRect({50,20},{8,30},-40),5,0.31f)};
  CHECK(same(annotate(f,ds).bgr, annotate(f,ds).bgr));
}

TEST_CASE("annotate clips geometry outside the frame"){
  Frame f = gradient(64,48);
  const float inf = std::numeric_limits<float>::infinity();
  const float nan = std::numeric_limits<float>::quiet_NaN();
  Dets ds{
    det(cv::RotatedRect({-30,-30},{20,20},0)),
    det(cv::RotatedRect({60,45},{100,100},45)),
    det(cv::RotatedRect({1e9f,-1e9f},{1e9f,1e9f},10)),
    det(cv::RotatedRect({10,10},{inf,5},0)),
    det(cv::RotatedRect({nan,10},{5,5},0)),
    det(cv::RotatedRect({20,20},{0,0},0))};
  Frame out;
  CHECK_NOTHROW(out = annotate(f, ds));
  CHECK(out.bgr.cols==64);
  CHECK(out.bgr.rows==48);
  CHECK(out.bgr.type()==CV_8UC3);
}

TEST_CASE("annotate on an empty frame"){
  Frame f;
  CHECK_NOTHROW(annotate(f, {det(cv::RotatedRect({1,1},{2,2},0))}));
}

TEST_CASE("class colors are stable and wrap"){
  CHECK(class_color(3)==class_color(3));
  CHECK(class_color(0)!=class_color(1));
  CHECK(class_color(20)==class_color(0));
  CHECK(class_color(-1)==class_color(19));
}

TEST_CASE("labels carry two decimals"){
  Detection d = det(cv::RotatedRect(), 0, 0.876f);
  CHECK(format_label(d)=="ship 0.88");
  d.score = 1.f;
  CHECK(format_label(d)=="ship 1.00");
}

TEST_CASE("hud draws in the corner only"){
  cv::Mat img(200,300,CV_8UC3,cv::Scalar::all(0));
  draw_hud(img, HudStats{29.7, 120.5, 33.3});
  CHECK(cv::countNonZero(img(cv::Rect(0,0,200,100)).reshape(1)) > 0);
  CHECK(cv::countNonZero(img(cv::Rect(0,120,300,80)).reshape(1)) == 0);
}
