#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sdet {
using Millis = std::chrono::milliseconds;

struct Backoff {
    int max_attempts = 5;
    Millis initial{500};
    Millis cap{4000};
    double factor = 2.0;

    // delay before reconnect attempt n (1-based)
    Millis delay(int attempt) const;
};

enum class LinkState { Connecting, Active, Retrying, Failed };
const char* link_state_name(LinkState s);

// Connection state of one stage endpoint with an explicit retry budget.
// Pure bookkeeping: the caller does the connecting and the sleeping.
class Link {
public:
    explicit Link(Backoff b) : backoff_(b) {}

    LinkState state() const { return state_; }
    int attempts() const { return attempts_; }
    const Backoff& backoff() const { return backoff_; }

    // Connecting/Retrying -> Active; the budget is refilled. Call it once the
    // endpoint has actually moved data, not when open() returns.
    void connected();
    // Any fault. Returns the delay before the next attempt and moves to
    // Retrying, or moves to Failed and returns zero once the budget is spent.
    Millis fault();

private:
    Backoff backoff_;
    LinkState state_ = LinkState::Connecting;
    int attempts_ = 0;
};

// Cooperative stop request shared by the stages of one session.
class StopFlag {
public:
    void request() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            set_ = true;
        }
        cv_.notify_all();
    }

    bool requested() const {
        std::lock_guard<std::mutex> lk(mu_);
        return set_;
    }

    // Sleeps for d unless stopped first. True if the full delay elapsed.
    bool sleep_for(Millis d) {
        std::unique_lock<std::mutex> lk(mu_);
        return !cv_.wait_for(lk, d, [&] { return set_; });
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool set_ = false;
};
}
