#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace execq {

// BoundedQueue
// - FIFO, fixed capacity
// - try_push_for waits up to a deadline for space (backpressure)
// - Blocking pop; close() wakes everyone and stops new pushes and pops
//
// Jobs left behind after close() are handed back by drain().

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    // Returns false if full for the whole wait or closed.
    // On success *position_out is the 1-based position of the new item.
    template <typename Rep, typename Period>
    bool try_push_for(T value, std::chrono::duration<Rep, Period> wait, size_t* position_out = nullptr) {
        std::unique_lock<std::mutex> lk(mu_);
        if (!not_full_.wait_for(lk, wait, [&]{ return closed_ || q_.size() < capacity_; })) return false;
        if (closed_) return false;
        q_.push_back(std::move(value));
        if (position_out) *position_out = q_.size();
        not_empty_.notify_one();
        return true;
    }

    // Returns false when closed.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        not_empty_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (closed_) return false;
        out = std::move(q_.front());
        q_.pop_front();
        not_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Removes and returns everything still queued.
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<T> out;
        out.reserve(q_.size());
        for (auto& v : q_) out.push_back(std::move(v));
        q_.clear();
        not_full_.notify_all();
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    size_t capacity() const { return capacity_; }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> q_;
    const size_t capacity_;
    bool closed_{false};
};

// Counting limiter bounding how many subprocess trees run at once.
class Limiter {
public:
    explicit Limiter(size_t slots) : slots_(slots ? slots : 1) {}

    void acquire() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return in_use_ < slots_; });
        in_use_++;
        if (in_use_ > peak_) peak_ = in_use_;
    }

    void release() {
        std::lock_guard<std::mutex> lk(mu_);
        if (in_use_ > 0) in_use_--;
        cv_.notify_one();
    }

    size_t in_use() const {
        std::lock_guard<std::mutex> lk(mu_);
        return in_use_;
    }

    size_t peak() const {
        std::lock_guard<std::mutex> lk(mu_);
        return peak_;
    }

    size_t slots() const { return slots_; }

    // Holds one slot for its lifetime.
    class Slot {
    public:
        explicit Slot(Limiter& l) : l_(l) { l_.acquire(); }
        ~Slot() { l_.release(); }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
    private:
        Limiter& l_;
    };

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    const size_t slots_;
    size_t in_use_{0};
    size_t peak_{0};
};

} // namespace execq
