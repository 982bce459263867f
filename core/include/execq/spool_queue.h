#pragma once

#include "backend.h"
#include "job_queue.h"
#include "run_processor.h"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace execq {

class Reconciler;

// Spool layout:
//   inbox/<enqueued_ms>-<run_id>.json                           message {"run_id":N}
//   processing/<enqueued_ms>-<run_id>.json.<host>.<pid>.processing   claimed by a worker
// Both numbers are zero padded, so a directory scan sorted by name yields FIFO
// order (enqueue time, then run id).
std::string spool_message_name(int64_t enqueued_ms, RunId run_id);
// Accepts inbox and processing names. Claims written without a host parse
// with an empty owner_host.
bool parse_spool_message_name(const std::string& name, RunId* run_id, long* owner_pid,
                              std::string* owner_host = nullptr);

// gethostname() reduced to [A-Za-z0-9-]; the claim-name token for this machine.
std::string local_host_id();

struct SpoolOptions {
    std::filesystem::path dir;
    size_t capacity{200};
    size_t max_concurrent{4};
    int scan_ms{150};
    int reconcile_interval_ms{60000};   // <= 0 disables the periodic sweep
    std::string host;                   // empty: local_host_id()
};

// Distributed backend: the broker is a directory shared by every process
// (serve threads and standalone workers). Messages carry only the run id; the
// request is re-read from the store's request_json.
class SpoolQueue : public IJobBackend {
public:
    SpoolQueue(RunProcessor& processor, SpoolOptions opts, Reconciler* reconciler = nullptr);
    ~SpoolQueue() override;

    SpoolQueue(const SpoolQueue&) = delete;
    SpoolQueue& operator=(const SpoolQueue&) = delete;

    // Creates the spool directories and recovers messages claimed by dead processes.
    std::string open();

    // Returns claimed messages whose owner process is gone: queued Runs go back
    // to the inbox, running ones are failed as abandoned. Only claims made on
    // this host are checked; a pid means nothing on another machine, so claims
    // from other hosts are left to the Reconciler's age-based sweep.
    size_t recover_orphans();

    EnqueueResult submit(Job job) override;
    size_t position() const override;
    void start(int workers) override;
    void shutdown() override;
    std::string name() const override { return "spool"; }
    BackendStats stats() const override;
    // A message for the Run is waiting in the inbox.
    bool holds(RunId run_id) const override;

    // Claims and processes at most one message. Returns false if the inbox was empty.
    bool run_once();

    const std::filesystem::path& inbox() const { return inbox_; }
    const std::filesystem::path& processing() const { return processing_; }
    const std::string& host() const { return host_; }

private:
    std::optional<std::filesystem::path> claim_next();
    void handle_claimed(const std::filesystem::path& claimed, int wid);
    void worker_loop(int wid);
    void reconcile_loop();

    RunProcessor& processor_;
    SpoolOptions opts_;
    Reconciler* reconciler_;
    std::filesystem::path inbox_;
    std::filesystem::path processing_;
    std::string host_;
    Limiter limiter_;

    std::mutex lifecycle_mu_;
    std::condition_variable stop_cv_;
    bool stopping_{false};
    bool started_{false};
    std::vector<std::thread> workers_;
    std::thread reconcile_thread_;

    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace execq
