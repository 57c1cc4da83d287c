#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace sdet {
enum class DropPolicy { DropNewest, DropOldest };

inline bool parse_drop_policy(const std::string& s, DropPolicy& out) {
    if (s == "newest") out = DropPolicy::DropNewest;
    else if (s == "oldest") out = DropPolicy::DropOldest;
    else return false;
    return true;
}

inline const char* drop_policy_name(DropPolicy p) { return p == DropPolicy::DropNewest ? "newest" : "oldest"; }

// Fixed-capacity FIFO between two stages. push() never blocks: when full, one
// element is discarded according to the policy. Order of surviving elements is
// always preserved.
template <typename T>
class BoundedQueue {
public:
    enum class PushResult { Queued, DroppedIncoming, DroppedOldest, Closed };

    BoundedQueue(size_t capacity, DropPolicy policy) : cap_(capacity ? capacity : 1), policy_(policy) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    PushResult push(T v) {
        PushResult r = PushResult::Queued;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return PushResult::Closed;
            if (q_.size() >= cap_) {
                if (policy_ == DropPolicy::DropNewest) return PushResult::DroppedIncoming;
                q_.pop_front();
                r = PushResult::DroppedOldest;
            }
            q_.push_back(std::move(v));
        }
        cv_.notify_one();
        return r;
    }

    // Waits up to `timeout`. Empty result on timeout, or once closed and drained.
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        if (!cv_.wait_for(lk, timeout, [&] { return !q_.empty() || closed_; })) return std::nullopt;
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    // No further pushes; consumers drain what is left.
    void close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Close and discard everything still queued. Returns the discarded count.
    size_t abandon() {
        size_t n;
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
            n = q_.size();
            q_.clear();
        }
        cv_.notify_all();
        return n;
    }

    bool closed_and_empty() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_ && q_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    size_t capacity() const { return cap_; }

private:
    const size_t cap_;
    const DropPolicy policy_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_ = false;
};
}
