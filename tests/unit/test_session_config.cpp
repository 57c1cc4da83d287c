#include <doctest/doctest.h>
#include "sdet/errors.hpp"
#include "sdet/session.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace sdet;
namespace fs = std::filesystem;

namespace {
std::string weights_file(){
  auto p = (fs::temp_directory_path() / "sdet_cfg_test_weights.onnx").string();
  std::ofstream(p) << "x";
  return p;
}

YAML::Node minimal(const std::string& weights){
  YAML::Node n;
  n["input_url"] = "rtmp://relay/live/in";
  n["output_url"] = "rtmp://relay/live/out";
  n["weights"] = weights;
  n["fps"] = 25;
  n["width"] = 1280;
  n["height"] = 720;
  return n;
}
}

TEST_CASE("minimal config takes the defaults"){
  auto c = SessionConfig::from_yaml(minimal(weights_file()));
  CHECK_NOTHROW(c.validate());
  CHECK(c.fps==25);
  CHECK(c.conf_threshold == doctest::Approx(0.25f));
  CHECK(c.iou_threshold == doctest::Approx(0.45f));
  CHECK(c.queue_capacity==4);
  CHECK(c.source_drop==DropPolicy::DropNewest);
  CHECK(c.stage_drop==DropPolicy::DropOldest);
  CHECK(c.reconnect.max_attempts==5);
  CHECK(c.bitrate=="2000k");
}

TEST_CASE("optional keys override the defaults"){
  auto n = minimal(weights_file());
  n["conf_threshold"] = 0.5;
  n["queue_capacity"] = 8;
  n["source_drop"] = "oldest";
  n["reconnect"]["attempts"] = 2;
  n["reconnect"]["initial_ms"] = 100;
  n["reconnect"]["max_ms"] = 800;
  n["overlay_metrics"] = false;
  auto c = SessionConfig::from_yaml(n);
  CHECK(c.conf_threshold == doctest::Approx(0.5f));
  CHECK(c.queue_capacity==8);
  CHECK(c.source_drop==DropPolicy::DropOldest);
  CHECK(c.reconnect.max_attempts==2);
  CHECK(c.reconnect.initial==Millis(100));
  CHECK(c.reconnect.cap==Millis(800));
  CHECK_FALSE(c.overlay_metrics);
}

TEST_CASE("parse errors are InvalidConfig"){
  auto w = weights_file();
  auto missing = minimal(w); missing.remove("output_url");
  CHECK_THROWS_AS(SessionConfig::from_yaml(missing), InvalidConfig);
  auto wrong = minimal(w); wrong["fps"] = "fast";
  CHECK_THROWS_AS(SessionConfig::from_yaml(wrong), InvalidConfig);
  auto policy = minimal(w); policy["stage_drop"] = "random";
  CHECK_THROWS_AS(SessionConfig::from_yaml(policy), InvalidConfig);
  CHECK_THROWS_AS(SessionConfig::from_yaml(YAML::Load("[1, 2]")), InvalidConfig);
  CHECK_THROWS_AS(SessionConfig::load("/nonexistent/session.yaml"), InvalidConfig);
}

TEST_CASE("validation"){
  auto base = SessionConfig::from_yaml(minimal(weights_file()));
  auto bad = [&](auto mutate){ SessionConfig c = base; mutate(c); CHECK_THROWS_AS(c.validate(), InvalidConfig); };
  bad([](SessionConfig& c){ c.input_url.clear(); });
  bad([](SessionConfig& c){ c.output_url.clear(); });
  bad([](SessionConfig& c){ c.fps = 0; });
  bad([](SessionConfig& c){ c.width = -1; });
  bad([](SessionConfig& c){ c.conf_threshold = 1.5f; });
  bad([](SessionConfig& c){ c.iou_threshold = -0.1f; });
  bad([](SessionConfig& c){ c.weights = "/nonexistent/model.onnx"; });
  bad([](SessionConfig& c){ c.queue_capacity = 0; });
  bad([](SessionConfig& c){ c.dnn_backend = "tpu"; });
  bad([](SessionConfig& c){ c.model_input_size = 100; });
  bad([](SessionConfig& c){ c.reconnect.cap = Millis(1); });
}

TEST_CASE("load from file"){
  auto path = (fs::temp_directory_path() / "sdet_cfg_test.yaml").string();
  { std::ofstream f(path); f << YAML::Dump(minimal(weights_file())); }
  auto c = SessionConfig::load(path);
  CHECK(c.width==1280);
  CHECK(c.to_yaml()["output_url"].as<std::string>()=="rtmp://relay/live/out");
  std::remove(path.c_str());
}

TEST_CASE("board reaches running only with both endpoints up"){
  StateBoard b;
  b.reset(Phase::Starting);
  b.stage_connected(kSource);
  CHECK(b.phase()==Phase::Starting);
  b.stage_connected(kSink);
  CHECK(b.phase()==Phase::Running);
}

TEST_CASE("board failure rules"){
  StateBoard b;
  CHECK_FALSE(b.fail("too early"));
  CHECK(b.phase()==Phase::Idle);
  b.reset(Phase::Running);
  CHECK(b.fail("sink: gave up"));
  CHECK(b.phase()==Phase::Failed);
  CHECK(b.snapshot().last_error=="sink: gave up");
  CHECK_FALSE(b.begin_stop());

  b.reset(Phase::Running);
  CHECK(b.begin_stop());
  CHECK_FALSE(b.fail("late"));
  CHECK(b.phase()==Phase::Stopping);
}

TEST_CASE("board snapshot is a copy"){
  StateBoard b;
  b.reset(Phase::Running);
  b.processed(3);
  SessionState s = b.snapshot();
  b.processed(2);
  b.dropped();
  CHECK(s.frames_processed==3);
  CHECK(b.snapshot().frames_processed==5);
  CHECK(b.snapshot().frames_dropped==1);
}

TEST_CASE("names"){
  CHECK(std::string(phase_name(Phase::Running))=="running");
  CHECK(std::string(stage_name(kSink))=="sink");
  CHECK(std::string(stage_name(42))=="?");
}
