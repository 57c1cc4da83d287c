#include <doctest/doctest.h>
#include "sdet/tracer.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace sdet;
using namespace std::chrono_literals;

TEST_CASE("stage aggregates"){
  Metrics m;
  m.observe("detect", 10);
  m.observe("detect", 30);
  m.observe("publish", 5);
  auto d = m.get("detect");
  CHECK(d.count==2);
  CHECK(d.mean_ms == doctest::Approx(20));
  CHECK(d.max_ms == doctest::Approx(30));
  CHECK(d.last_ms == doctest::Approx(30));
  CHECK(d.recent_ms == doctest::Approx(12));
  CHECK(m.get("missing").count==0);
  auto all = m.summary();
  REQUIRE(all.size()==2);
  CHECK(all[0].stage=="detect");
  CHECK(all[1].stage=="publish");
}

TEST_CASE("trace macro times its scope"){
  Metrics m;
  { SDET_TRACE_STAGE(m, "annotate"); std::this_thread::sleep_for(5ms); }
  auto a = m.get("annotate");
  CHECK(a.count==1);
  CHECK(a.last_ms >= 4.0);
}

TEST_CASE("fps over a one second window"){
  Metrics m;
  auto t = Clock::now();
  for(int i=0;i<=25;++i) m.tick(t + i*40ms);
  CHECK(m.fps() == doctest::Approx(26.0).epsilon(0.01));
}

TEST_CASE("csv dump"){
  Metrics m;
  m.observe("source", 1.5);
  auto path = (std::filesystem::temp_directory_path() / "sdet_metrics_test.csv").string();
  REQUIRE(m.dump_csv(path));
  std::ifstream in(path);
  std::string header, row;
  std::getline(in, header); std::getline(in, row);
  CHECK(header=="stage,count,last_ms,mean_ms,recent_ms,max_ms");
  CHECK(row.rfind("source,1,1.5", 0)==0);
  std::remove(path.c_str());
}
