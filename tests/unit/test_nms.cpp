#include <doctest/doctest.h>
#include "sdet/postprocess.hpp"

using namespace sdet;

namespace {
Detection det(cv::Point2f c, float score, int cls){ return Detection{cv::RotatedRect(c,{10,10},0), cls, "c"+std::to_string(cls), score}; }
}

TEST_CASE("NMS keeps only the higher score above threshold"){
  Dets ds{det({5,5},0.8f,0), det({6,6},0.9f,0)};
  auto out = NMS(ds, 0.5f);
  REQUIRE(out.size()==1);
  CHECK(out[0].score == doctest::Approx(0.9f));
}

TEST_CASE("NMS keeps both below threshold"){
  Dets ds{det({5,5},0.9f,0), det({10,5},0.8f,0)};   // IoU 1/3
  CHECK(NMS(ds, 0.5f).size()==2);
  CHECK(NMS(ds, 0.3f).size()==1);
}

TEST_CASE("NMS never suppresses across classes"){
  Dets ds{det({5,5},0.9f,0), det({5,5},0.8f,1)};
  CHECK(NMS(ds, 0.1f).size()==2);
}

TEST_CASE("NMS output is highest score first"){
  Dets ds{det({0,0},0.3f,0), det({50,50},0.7f,0), det({100,100},0.5f,0)};
  auto out = NMS(ds, 0.5f);
  REQUIRE(out.size()==3);
  CHECK(out[0].score > out[1].score);
  CHECK(out[1].score > out[2].score);
}

TEST_CASE("NMS suppressed box does not suppress others"){
  // b overlaps a and c, a and c do not overlap; b loses to a, c survives
  Dets ds{det({0,0},0.9f,0), det({4,0},0.8f,0), det({8,0},0.7f,0)};
  auto out = NMS(ds, 0.4f);
  REQUIRE(out.size()==2);
  CHECK(out[0].score == doctest::Approx(0.9f));
  CHECK(out[1].score == doctest::Approx(0.7f));
}

TEST_CASE("NMS empty"){ CHECK(NMS({}, 0.5f).empty()); }
