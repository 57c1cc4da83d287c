#pragma once
#include "sdet/coordinator.hpp"
#include "sdet/detection.hpp"
#include "sdet/bounded_queue.hpp"
#include "sdet/metrics.hpp"
#include "sdet/retry.hpp"
#include <array>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sdet::detail {
constexpr auto kQueuePoll = std::chrono::milliseconds(50);

// Everything one session's threads share. Stage threads hold a shared_ptr, so
// a stage abandoned after the grace period keeps its handles alive until its
// blocking call returns.
struct Session {
    Session(const SessionConfig& c, std::shared_ptr<StateBoard> b)
        : cfg(c), board(std::move(b)),
          raw(c.queue_capacity, c.source_drop),
          detected(c.queue_capacity, c.stage_drop),
          annotated(c.queue_capacity, c.stage_drop) {}

    const SessionConfig cfg;
    std::shared_ptr<StateBoard> board;
    Metrics metrics;

    std::unique_ptr<FrameSource> source;
    std::unique_ptr<Detector> detector;
    std::unique_ptr<FrameSink> sink;

    BoundedQueue<Frame> raw;
    BoundedQueue<DetectedFrame> detected;
    BoundedQueue<Frame> annotated;

    StopFlag stop;    // stop reading, drain what is queued
    StopFlag abort;   // drop everything, exit as soon as possible

    std::array<std::thread, kStageCount> threads;
    std::array<std::atomic<bool>, kStageCount> done{};

    // supervisor wake-up
    std::mutex mu;
    std::condition_variable cv;
    bool stop_requested = false;
    bool failed = false;

    bool all_done() const {
        for (auto& d : done) if (!d.load()) return false;
        return true;
    }

    void notify() {
        { std::lock_guard<std::mutex> lk(mu); }
        cv.notify_all();
    }

    // A stage ran out of retries or died; the session goes Failed unless it
    // is already on its way down.
    void report_fault(int stage, const std::string& what);

    // Counts a frame that was discarded by a full queue.
    template <typename T>
    void push(BoundedQueue<T>& q, T v) {
        auto r = q.push(std::move(v));
        if (r == BoundedQueue<T>::PushResult::DroppedIncoming || r == BoundedQueue<T>::PushResult::DroppedOldest)
            board->dropped();
    }
};

void run_source(Session& s);
void run_detect(Session& s);
void run_annotate(Session& s);
void run_sink(Session& s);
}
