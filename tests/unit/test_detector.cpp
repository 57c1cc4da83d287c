#include <doctest/doctest.h>
#include "sdet/detector.hpp"
#include "sdet/errors.hpp"
#include "sdet/session.hpp"
#include <filesystem>
#include <fstream>

using namespace sdet;
namespace fs = std::filesystem;

namespace {
std::string temp_file(const std::string& name, const std::string& body){
  auto path = (fs::temp_directory_path() / name).string();
  std::ofstream(path, std::ios::binary) << body;
  return path;
}
}

TEST_CASE("default labels are the DOTA v1 classes"){
  auto& n = default_obb_labels();
  REQUIRE(n.size()==15);
  CHECK(n[0]=="plane");
  CHECK(n[1]=="ship");
  CHECK(n[14]=="swimming pool");
}

TEST_CASE("label files"){
  auto p = temp_file("sdet_labels.txt", "ship\r\n\nharbor \nbridge");
  auto n = load_labels(p);
  REQUIRE(n.size()==3);
  CHECK(n[0]=="ship");
  CHECK(n[1]=="harbor");
  CHECK(n[2]=="bridge");
  CHECK_THROWS_AS(load_labels(temp_file("sdet_labels_empty.txt", "\n\n")), ModelLoadError);
  CHECK_THROWS_AS(load_labels("/nonexistent/labels.txt"), ModelLoadError);
}

TEST_CASE("weights that are not a model fail to load"){
  SessionConfig cfg;
  DnnObbDetector d(cfg);
  auto w = temp_file("sdet_garbage.onnx", "this is not a protobuf");
  CHECK_THROWS_AS(d.load(w), ModelLoadError);
  CHECK_FALSE(d.loaded());
  CHECK_THROWS_AS(d.load("/nonexistent/model.onnx"), ModelLoadError);
  CHECK_FALSE(d.loaded());
}

TEST_CASE("an unreadable label file fails the load"){
  SessionConfig cfg;
  cfg.labels = "/nonexistent/labels.txt";
  DnnObbDetector d(cfg);
  CHECK_THROWS_AS(d.load(temp_file("sdet_garbage2.onnx", "x")), ModelLoadError);
}

TEST_CASE("inference without a model is a per-frame error"){
  SessionConfig cfg;
  auto d = make_dnn_detector(cfg);
  Frame f; f.seq = 3; f.bgr = cv::Mat(48, 64, CV_8UC3, cv::Scalar::all(0));
  CHECK_THROWS_AS(d->infer(f, 0.25f, 0.45f), InferenceError);
}
