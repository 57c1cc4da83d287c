#include <doctest/doctest.h>
#include "sdet/bounded_queue.hpp"
#include <chrono>
#include <thread>

using namespace sdet;
using namespace std::chrono_literals;
using Q = BoundedQueue<int>;

TEST_CASE("drop newest keeps the queued frames"){
  Q q(2, DropPolicy::DropNewest);
  CHECK(q.push(1)==Q::PushResult::Queued);
  CHECK(q.push(2)==Q::PushResult::Queued);
  CHECK(q.push(3)==Q::PushResult::DroppedIncoming);
  CHECK(q.size()==2);
  CHECK(*q.pop_for(1ms)==1);
  CHECK(*q.pop_for(1ms)==2);
}

TEST_CASE("drop oldest keeps the latest frames in order"){
  Q q(2, DropPolicy::DropOldest);
  q.push(1); q.push(2);
  CHECK(q.push(3)==Q::PushResult::DroppedOldest);
  CHECK(q.size()==2);
  CHECK(*q.pop_for(1ms)==2);
  CHECK(*q.pop_for(1ms)==3);
}

TEST_CASE("pop times out on an empty queue"){
  Q q(1, DropPolicy::DropNewest);
  auto t0 = std::chrono::steady_clock::now();
  CHECK_FALSE(q.pop_for(20ms).has_value());
  CHECK(std::chrono::steady_clock::now() - t0 >= 15ms);
}

TEST_CASE("close lets consumers drain, then stops"){
  Q q(3, DropPolicy::DropNewest);
  q.push(1); q.push(2);
  q.close();
  CHECK(q.push(3)==Q::PushResult::Closed);
  CHECK_FALSE(q.closed_and_empty());
  CHECK(*q.pop_for(1ms)==1);
  CHECK(*q.pop_for(1ms)==2);
  CHECK(q.closed_and_empty());
  CHECK_FALSE(q.pop_for(1s).has_value());
}

TEST_CASE("abandon discards and wakes a waiting consumer"){
  Q q(3, DropPolicy::DropNewest);
  q.push(1); q.push(2);
  CHECK(q.abandon()==2);
  CHECK(q.closed_and_empty());

  Q idle(1, DropPolicy::DropOldest);
  std::thread t([&]{ std::this_thread::sleep_for(20ms); idle.abandon(); });
  auto t0 = std::chrono::steady_clock::now();
  CHECK_FALSE(idle.pop_for(5s).has_value());
  CHECK(std::chrono::steady_clock::now() - t0 < 2s);
  t.join();
}

TEST_CASE("zero capacity is clamped to one"){
  Q q(0, DropPolicy::DropNewest);
  CHECK(q.capacity()==1);
  CHECK(q.push(1)==Q::PushResult::Queued);
  CHECK(q.push(2)==Q::PushResult::DroppedIncoming);
}

TEST_CASE("drop policy names"){
  DropPolicy p;
  CHECK(parse_drop_policy("oldest", p));
  CHECK(p==DropPolicy::DropOldest);
  CHECK(parse_drop_policy("newest", p));
  CHECK(p==DropPolicy::DropNewest);
  CHECK_FALSE(parse_drop_policy("random", p));
}
