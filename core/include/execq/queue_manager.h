#pragma once

#include "backend.h"
#include "job_queue.h"
#include "run_processor.h"

#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace execq {

struct QueueOptions {
    size_t capacity{200};
    size_t max_concurrent{4};
    int enqueue_wait_ms{1000};
};

// Single-process backend: bounded FIFO + worker threads + counting limiter.
// Many jobs may wait; at most max_concurrent execute.
class InProcessQueue : public IJobBackend {
public:
    InProcessQueue(RunProcessor& processor, QueueOptions opts);
    ~InProcessQueue() override;

    InProcessQueue(const InProcessQueue&) = delete;
    InProcessQueue& operator=(const InProcessQueue&) = delete;

    EnqueueResult submit(Job job) override;
    size_t position() const override { return queue_.size(); }
    void start(int workers) override;
    void shutdown() override;
    std::string name() const override { return "in-process"; }
    BackendStats stats() const override;
    // Covers both waiting jobs and popped jobs still waiting for a limiter slot.
    bool holds(RunId run_id) const override;

    const Limiter& limiter() const { return limiter_; }

private:
    void worker_loop(int id);
    void release(RunId run_id);

    RunProcessor& processor_;
    QueueOptions opts_;
    BoundedQueue<Job> queue_;
    Limiter limiter_;

    std::mutex lifecycle_mu_;
    std::vector<std::thread> workers_;
    bool started_{false};
    bool stopped_{false};

    mutable std::mutex held_mu_;
    std::set<RunId> held_;

    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace execq
