#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "sdet/postprocess.hpp"

using namespace sdet;

TEST_CASE("IoU identical boxes"){
  cv::RotatedRect a({50,50},{20,10},30);
  CHECK(IoU(a,a) == doctest::Approx(1.0).epsilon(1e-3));
}

TEST_CASE("IoU axis aligned half overlap"){
  cv::RotatedRect a({5,5},{10,10},0), b({10,5},{10,10},0);
  CHECK(IoU(a,b) == doctest::Approx(1.0/3.0).epsilon(1e-3));
  CHECK(IoU(b,a) == doctest::Approx(IoU(a,b)));
}

TEST_CASE("IoU disjoint and degenerate"){
  cv::RotatedRect a({5,5},{10,10},0), far({100,100},{10,10},0), flat({5,5},{10,0},0);
  CHECK(IoU(a,far) == 0.f);
  CHECK(IoU(a,flat) == 0.f);
}

TEST_CASE("IoU square is invariant to a 90 degree turn"){
  cv::RotatedRect a({20,20},{10,10},0), b({20,20},{10,10},90);
  CHECK(IoU(a,b) == doctest::Approx(1.0).epsilon(1e-3));
}

TEST_CASE("IoU rotated cross overlap"){
  // 40x10 bar against the same bar turned 90 degrees: overlap is the 10x10 centre
  cv::RotatedRect a({50,50},{40,10},0), b({50,50},{40,10},90);
  CHECK(IoU(a,b) == doctest::Approx(100.0/700.0).epsilon(1e-3));
}
