#include "test_common.h"

#include "execq/executor.h"
#include "execq/queue_manager.h"
#include "execq/reconciler.h"
#include "execq/run_processor.h"
#include "execq/run_store.h"
#include "execq/serialization.h"
#include "execq/util.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace execq;

namespace {

// Pretends to run a program for `hold_ms`, tracking how many run at once.
class CountingLauncher : public ILauncher {
public:
    explicit CountingLauncher(int hold_ms) : hold_ms_(hold_ms) {}

    bool launch(const LaunchSpec& spec, ProcResult* res) override {
        int now = ++current_;
        int prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms_));
        --current_;
        calls_++;
        *res = ProcResult{};
        res->exit_code = 0;
        res->stdout_data = "ran: " + spec.argv.back();
        res->elapsed_ms = hold_ms_;
        return true;
    }
    std::string name() const override { return "counting"; }

    int peak() const { return peak_.load(); }
    int calls() const { return calls_.load(); }

private:
    int hold_ms_;
    std::atomic<int> current_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};
};

Job make_job(IRunStore& store, AttemptId attempt) {
    Job job;
    job.request.attempt_id = attempt;
    job.request.language = "shell";
    SourceFile f;
    f.name = "main.sh";
    f.path = "main.sh";
    f.content = "echo hi";
    job.request.files.push_back(f);
    job.request.run_command = std::string("sh main.sh");

    Run run;
    run.attempt_id = attempt;
    run.created_ms = now_ms();
    run.request_json = request_to_json(job.request);
    expect_true(store.create(run).empty(), "create run");
    job.run_id = run.id;
    job.enqueued_ms = now_ms();
    return job;
}

bool wait_all_terminal(IRunStore& store, int64_t timeout_ms) {
    return wait_until([&] { return store.list_nonterminal().empty(); }, timeout_ms);
}

} // namespace

int main() {
    // 10 workers, 4 slots: many waiting, never more than 4 executing.
    {
        MemoryRunStore store;
        CountingLauncher launcher(80);
        Executor executor(ExecutorConfig{}, launcher);
        RunProcessor processor(store, executor);
        QueueOptions opts;
        opts.capacity = 50;
        opts.max_concurrent = 4;
        InProcessQueue q(processor, opts);
        q.start(10);

        std::vector<RunId> ids;
        for (int i = 0; i < 20; i++) {
            Job job = make_job(store, 100 + i);
            ids.push_back(job.run_id);
            EnqueueResult er = q.submit(std::move(job));
            expect_true(er.accepted, "submit accepted");
        }
        expect_true(wait_all_terminal(store, 20000), "all runs should finish");
        expect_true(launcher.peak() <= 4, "never more than max_concurrent executing");
        expect_true(launcher.peak() >= 2, "workers should run in parallel");
        expect_true(q.limiter().peak() <= 4, "limiter peak bounded");
        expect_eq_ll(launcher.calls(), 20, "every job executed once");

        for (RunId id : ids) {
            Run r = *store.get(id);
            expect_true(r.status == RunStatus::SUCCESS, "run should succeed");
            expect_true(r.started_ms && r.finished_ms && *r.finished_ms >= *r.started_ms, "timestamps set");
            expect_true(r.stdout_data && *r.stdout_data == "ran: sh main.sh", "stdout recorded");
        }
        q.shutdown();
        BackendStats st = q.stats();
        expect_eq_ll((long long)st.processed, 20, "processed counter");
        expect_eq_ll((long long)st.depth, 0, "queue empty");
    }

    // Full queue: bounded wait then overloaded.
    {
        MemoryRunStore store;
        CountingLauncher launcher(0);
        Executor executor(ExecutorConfig{}, launcher);
        RunProcessor processor(store, executor);
        QueueOptions opts;
        opts.capacity = 2;
        opts.enqueue_wait_ms = 50;
        InProcessQueue q(processor, opts);

        EnqueueResult a = q.submit(make_job(store, 1));
        EnqueueResult b = q.submit(make_job(store, 2));
        expect_true(a.accepted && b.accepted, "two fit");
        expect_eq_ll((long long)b.position, 2, "second position");
        expect_true(b.message == "Job enqueued (position: 2)", "position message");
        expect_eq_ll((long long)q.position(), 2, "depth 2");

        EnqueueResult c = q.submit(make_job(store, 3));
        expect_true(!c.accepted, "third rejected");
        expect_true(c.message == "Execution queue overloaded", "overload message");
        expect_eq_ll((long long)q.stats().rejected, 1, "rejected counter");

        // Never started: shutdown resolves everything still waiting.
        q.shutdown();
        for (const Run& r : store.list_nonterminal()) {
            // only the rejected job's run (never enqueued) may remain queued
            expect_eq_ll(r.attempt_id, 3, "only the rejected run remains queued");
        }
        auto ra = store.latest_created(1);
        expect_true(ra && ra->status == RunStatus::ERROR, "queued run resolved to error at shutdown");
        expect_true(ra->stderr_data && *ra->stderr_data == "Execution service shut down before run started",
                    "shutdown message");
    }

    // Shutdown while busy: in-flight finishes, waiting jobs become error.
    {
        MemoryRunStore store;
        CountingLauncher launcher(300);
        Executor executor(ExecutorConfig{}, launcher);
        RunProcessor processor(store, executor);
        QueueOptions opts;
        opts.max_concurrent = 1;
        InProcessQueue q(processor, opts);
        q.start(1);

        RunId first = 0;
        for (int i = 0; i < 4; i++) {
            Job job = make_job(store, 200 + i);
            if (i == 0) first = job.run_id;
            expect_true(q.submit(std::move(job)).accepted, "submit");
        }
        sleep_ms(100);
        q.shutdown();

        expect_true(store.list_nonterminal().empty(), "nothing left non-terminal after shutdown");
        expect_true(store.get(first)->status == RunStatus::SUCCESS, "in-flight run completed");
        int errors = 0;
        for (int i = 1; i < 4; i++) {
            auto r = store.latest_created(200 + i);
            if (r->status == RunStatus::ERROR) errors++;
        }
        expect_eq_ll(errors, 3, "waiting runs resolved to error");

        // Submitting after shutdown is refused.
        EnqueueResult late = q.submit(make_job(store, 999));
        expect_true(!late.accepted, "closed queue refuses jobs");
    }

    // A full queue frees capacity once a job completes.
    {
        MemoryRunStore store;
        CountingLauncher launcher(150);
        Executor executor(ExecutorConfig{}, launcher);
        RunProcessor processor(store, executor);
        QueueOptions opts;
        opts.capacity = 1;
        opts.max_concurrent = 1;
        opts.enqueue_wait_ms = 20;
        InProcessQueue q(processor, opts);
        q.start(1);

        Job first = make_job(store, 300);
        const RunId first_id = first.run_id;
        expect_true(q.submit(std::move(first)).accepted, "first accepted");
        // Wait for the worker to take it, then fill the single slot.
        expect_true(wait_until([&] { return q.position() == 0; }, 2000), "first job picked up");
        expect_true(q.submit(make_job(store, 301)).accepted, "second fills the queue");
        expect_true(!q.submit(make_job(store, 302)).accepted, "third refused while full");

        expect_true(wait_until([&] { return store.get(first_id)->status == RunStatus::SUCCESS; }, 5000),
                    "first job completes");
        expect_true(wait_until([&] { return q.position() == 0; }, 2000), "second job leaves the queue");
        expect_true(q.submit(make_job(store, 303)).accepted, "capacity available again");
        expect_true(wait_until([&] { return q.stats().processed == 3; }, 5000), "remaining jobs run");
        q.shutdown();
    }

    // Reconciliation never abandons a job the queue still holds, however long it waits.
    {
        MemoryRunStore store;
        CountingLauncher launcher(0);
        Executor executor(ExecutorConfig{}, launcher);
        RunProcessor processor(store, executor);
        InProcessQueue q(processor, QueueOptions{});
        Reconciler rec(processor, ReconcileOptions{});
        rec.attach_backend(&q);

        Job job = make_job(store, 400);
        const RunId held = job.run_id;
        expect_true(q.submit(std::move(job)).accepted, "submit to idle queue");
        expect_true(q.holds(held), "queue holds the waiting job");

        // An unrelated queued run with no job behind it is still abandoned.
        Job lost = make_job(store, 401);
        const RunId lost_id = lost.run_id;

        ReconcileReport rep = rec.sweep(now_ms() + ReconcileOptions{}.stale_grace_ms + 1);
        expect_eq_ll((long long)rep.queued_failed, 1, "only the lost run is failed");
        expect_true(store.get(held)->status == RunStatus::QUEUED, "held run stays queued");
        expect_true(store.get(lost_id)->status == RunStatus::ERROR, "lost run resolved");

        q.start(1);
        expect_true(wait_until([&] { return store.get(held)->status == RunStatus::SUCCESS; }, 5000),
                    "held run executes once workers start");
        expect_true(wait_until([&] { return !q.holds(held); }, 2000), "released after execution");
        q.shutdown();
    }

    std::cout << "test_queue_manager: ALL PASSED\n";
    return 0;
}
