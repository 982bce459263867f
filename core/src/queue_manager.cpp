#include "execq/queue_manager.h"

#include <chrono>
#include <iostream>

namespace execq {

InProcessQueue::InProcessQueue(RunProcessor& processor, QueueOptions opts)
    : processor_(processor),
      opts_(opts),
      queue_(opts.capacity),
      limiter_(opts.max_concurrent) {}

InProcessQueue::~InProcessQueue() {
    shutdown();
}

EnqueueResult InProcessQueue::submit(Job job) {
    EnqueueResult r;
    const RunId run_id = job.run_id;
    size_t pos = 0;
    {
        std::lock_guard<std::mutex> lk(held_mu_);
        held_.insert(run_id);
    }
    if (!queue_.try_push_for(std::move(job), std::chrono::milliseconds(opts_.enqueue_wait_ms), &pos)) {
        release(run_id);
        rejected_++;
        std::cerr << "[queue] full or closed, rejecting run " << run_id << "\n";
        r.message = "Execution queue overloaded";
        return r;
    }
    r.accepted = true;
    r.position = pos;
    r.message = "Job enqueued (position: " + std::to_string(pos) + ")";
    return r;
}

void InProcessQueue::start(int workers) {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (started_) {
        std::cerr << "[queue] workers already running\n";
        return;
    }
    if (stopped_) {
        std::cerr << "[queue] cannot restart after shutdown\n";
        return;
    }
    if (workers < 1) workers = 1;
    started_ = true;
    workers_.reserve((size_t)workers);
    for (int i = 0; i < workers; i++) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
    std::cerr << "[queue] started " << workers << " workers (max_concurrent=" << limiter_.slots()
              << ", capacity=" << queue_.capacity() << ")\n";
}

void InProcessQueue::worker_loop(int id) {
    Job job;
    while (queue_.pop(job)) {
        Limiter::Slot slot(limiter_);
        try {
            RunStatus st = processor_.process(job.run_id, job.request);
            std::cerr << "[worker " << id << "] run " << job.run_id << " -> " << run_status_name(st) << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[worker " << id << "] run " << job.run_id << " failed: " << e.what() << "\n";
            (void)processor_.fail_run(job.run_id, std::string("Internal execution error: ") + e.what());
        }
        release(job.run_id);
        processed_++;
    }
}

void InProcessQueue::release(RunId run_id) {
    std::lock_guard<std::mutex> lk(held_mu_);
    held_.erase(run_id);
}

bool InProcessQueue::holds(RunId run_id) const {
    std::lock_guard<std::mutex> lk(held_mu_);
    return held_.count(run_id) > 0;
}

void InProcessQueue::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(lifecycle_mu_);
        if (stopped_) return;
        stopped_ = true;
        workers.swap(workers_);
    }

    queue_.close();
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }

    // Never leave a Run queued with nobody to pick it up.
    auto left = queue_.drain();
    for (const auto& job : left) {
        (void)processor_.fail_run(job.run_id, "Execution service shut down before run started");
        release(job.run_id);
    }
    std::cerr << "[queue] shut down (" << left.size() << " queued jobs resolved to error)\n";
}

BackendStats InProcessQueue::stats() const {
    BackendStats s;
    s.depth = queue_.size();
    s.in_flight = limiter_.in_use();
    s.processed = processed_.load();
    s.rejected = rejected_.load();
    return s;
}

} // namespace execq
