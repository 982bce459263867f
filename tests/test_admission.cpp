#include "test_common.h"

#include "execq/admission.h"
#include "execq/hash.h"
#include "execq/serialization.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace execq;

namespace {

// Records submissions; can be told to refuse them.
class FakeBackend : public IJobBackend {
public:
    bool accept{true};
    std::vector<Job> jobs;

    EnqueueResult submit(Job job) override {
        EnqueueResult r;
        if (!accept) {
            r.message = "Execution queue overloaded";
            return r;
        }
        jobs.push_back(std::move(job));
        r.accepted = true;
        r.position = jobs.size();
        r.message = "Job enqueued (position: " + std::to_string(r.position) + ")";
        return r;
    }
    size_t position() const override { return jobs.size(); }
    void start(int) override {}
    void shutdown() override {}
    std::string name() const override { return "fake"; }
    BackendStats stats() const override { return BackendStats{}; }
    bool holds(RunId run_id) const override {
        for (const auto& j : jobs) {
            if (j.run_id == run_id) return true;
        }
        return false;
    }
};

ExecRequest request(const std::string& content = "print('hi')") {
    ExecRequest r;
    r.language = "python";
    SourceFile f;
    f.name = "main.py";
    f.content = content;
    r.files.push_back(f);
    return r;
}

void finish(IRunStore& store, RunId id) {
    Run r = *store.get(id);
    r.status = RunStatus::RUNNING;
    r.started_ms = r.created_ms;
    expect_true(store.update(r).empty(), "mark running");
    r.status = RunStatus::SUCCESS;
    r.finished_ms = r.created_ms + 1;
    expect_true(store.update(r).empty(), "mark success");
}

} // namespace

int main() {
    // Accepted: Run persisted queued, job handed over with the normalized request.
    {
        MemoryRunStore store;
        FakeBackend backend;
        AdmissionOptions opts;
        opts.throttle_ms = 0;
        AdmissionController adm(store, backend, opts);

        SubmitResult sr = adm.submit(11, request());
        expect_true(sr.kind == SubmitKind::ACCEPTED, "first submit accepted");
        expect_true(sr.run_id > 0, "run id assigned");
        expect_eq_ll((long long)sr.queue_position, 1, "queue position");
        expect_true(sr.message == "Job enqueued (position: 1)", "message: " + sr.message);

        Run r = *store.get(sr.run_id);
        expect_true(r.status == RunStatus::QUEUED, "run queued");
        expect_eq_ll(r.attempt_id, 11, "attempt recorded");
        expect_true(r.code_snapshot.has_value(), "small snapshot stored");
        expect_true(r.snapshot_hash == sha256_hex(*r.code_snapshot), "hash covers the snapshot");

        ExecRequest stored;
        std::string err;
        expect_true(request_from_json(r.request_json, &stored, &err), "request_json parses: " + err);
        expect_eq_ll(stored.attempt_id, 11, "attempt in request_json");
        expect_true(stored.files[0].path == "main.py", "path defaulted to name");

        expect_eq_ll((long long)backend.jobs.size(), 1, "one job submitted");
        expect_eq_ll(backend.jobs[0].run_id, sr.run_id, "job carries the run id");

        // Strict lock: the attempt already has a queued run.
        SubmitResult c = adm.submit(11, request());
        expect_true(c.kind == SubmitKind::CONFLICT, "second submit conflicts");
        expect_eq_ll(c.run_id, sr.run_id, "conflict names the blocking run");
        expect_true(c.message == "Run already in progress for this attempt (run_id=" + std::to_string(sr.run_id) + ")",
                    "conflict message: " + c.message);
        expect_eq_ll((long long)backend.jobs.size(), 1, "conflict creates no job");

        // Different attempts are independent.
        expect_true(adm.submit(12, request()).kind == SubmitKind::ACCEPTED, "other attempt accepted");

        // Once terminal, the attempt may run again.
        finish(store, sr.run_id);
        expect_true(adm.submit(11, request()).kind == SubmitKind::ACCEPTED, "resubmit after finish");
    }

    // Throttle
    {
        MemoryRunStore store;
        FakeBackend backend;
        AdmissionOptions opts;
        opts.throttle_ms = 60000;
        AdmissionController adm(store, backend, opts);
        SubmitResult first = adm.submit(5, request());
        expect_true(first.kind == SubmitKind::ACCEPTED, "first accepted");
        finish(store, first.run_id);

        SubmitResult t = adm.submit(5, request());
        expect_true(t.kind == SubmitKind::RATE_LIMITED, "too soon -> rate limited");
        expect_true(t.retry_after_ms > 0 && t.retry_after_ms <= 60000, "retry hint within throttle");
        expect_true(t.message == "Please wait 60s between runs", "throttle message: " + t.message);
        expect_eq_ll((long long)backend.jobs.size(), 1, "rate limited creates no job");
    }

    // Once the window elapses the attempt may run again.
    {
        MemoryRunStore store;
        FakeBackend backend;
        AdmissionOptions opts;
        opts.throttle_ms = 150;
        AdmissionController adm(store, backend, opts);
        SubmitResult first = adm.submit(6, request());
        expect_true(first.kind == SubmitKind::ACCEPTED, "first accepted");
        finish(store, first.run_id);

        SubmitResult early = adm.submit(6, request());
        expect_true(early.kind == SubmitKind::RATE_LIMITED, "inside the window");
        std::this_thread::sleep_for(std::chrono::milliseconds(early.retry_after_ms + 50));
        SubmitResult later = adm.submit(6, request());
        expect_true(later.kind == SubmitKind::ACCEPTED, "accepted after the window");
        expect_true(later.run_id != first.run_id, "a new run");
    }

    // Snapshot hash depends only on file names, paths and contents.
    {
        std::vector<SourceFile> a = request().files;
        a[0].path = "main.py";
        std::vector<SourceFile> same = a;
        expect_true(snapshot_hash(a) == snapshot_hash(same), "equal file sets hash equally");
        expect_true(files_canonical_json(a) == files_canonical_json(same), "canonical form is stable");
        expect_eq_ll((long long)snapshot_hash(a).size(), 64, "hex digest");

        std::vector<SourceFile> edited = a;
        edited[0].content += "\n";
        expect_true(snapshot_hash(edited) != snapshot_hash(a), "content change alters hash");

        std::vector<SourceFile> moved = a;
        moved[0].path = "src/main.py";
        expect_true(snapshot_hash(moved) != snapshot_hash(a), "path change alters hash");

        // Admission records the same hash for the normalized request.
        MemoryRunStore store;
        FakeBackend backend;
        AdmissionOptions opts;
        opts.throttle_ms = 0;
        AdmissionController adm(store, backend, opts);
        SubmitResult r1 = adm.submit(8, request());
        SubmitResult r2 = adm.submit(9, request());
        expect_true(r1.kind == SubmitKind::ACCEPTED && r2.kind == SubmitKind::ACCEPTED, "both accepted");
        expect_true(store.get(r1.run_id)->snapshot_hash == snapshot_hash(a), "admission uses the snapshot hash");
        expect_true(store.get(r1.run_id)->snapshot_hash == store.get(r2.run_id)->snapshot_hash,
                    "identical submissions share a hash");
    }

    // Overloaded backend: the Run exists but is resolved to error.
    {
        MemoryRunStore store;
        FakeBackend backend;
        backend.accept = false;
        AdmissionOptions opts;
        opts.throttle_ms = 0;
        AdmissionController adm(store, backend, opts);
        SubmitResult o = adm.submit(3, request());
        expect_true(o.kind == SubmitKind::OVERLOADED, "refused -> overloaded");
        expect_true(o.run_id > 0, "overloaded carries the run id");
        Run r = *store.get(o.run_id);
        expect_true(r.status == RunStatus::ERROR, "run resolved to error");
        expect_true(r.stderr_data && *r.stderr_data == "Execution queue overloaded", "stderr has the reason");
        expect_true(r.finished_ms.has_value(), "finished set");
        expect_true(!store.find_active(3).has_value(), "attempt not locked after overload");
    }

    // Invalid requests never touch the store.
    {
        MemoryRunStore store;
        FakeBackend backend;
        AdmissionOptions opts;
        opts.max_request_bytes = 64;
        AdmissionController adm(store, backend, opts);

        ExecRequest none;
        none.language = "c";
        expect_true(adm.submit(1, none).kind == SubmitKind::INVALID, "no files -> invalid");

        ExecRequest escape = request();
        escape.files[0].path = "../../etc/cron.d/x";
        expect_true(adm.submit(1, escape).kind == SubmitKind::INVALID, "path escape -> invalid");

        ExecRequest nolang = request();
        nolang.language.clear();
        expect_true(adm.submit(1, nolang).kind == SubmitKind::INVALID, "missing language -> invalid");

        ExecRequest big = request(std::string(100, 'x'));
        SubmitResult s = adm.submit(1, big);
        expect_true(s.kind == SubmitKind::INVALID, "oversized -> invalid");
        expect_true(s.message.find("too large") != std::string::npos, "size message: " + s.message);

        expect_true(!store.latest_created(1).has_value(), "no runs created");
        expect_true(backend.jobs.empty(), "no jobs submitted");
    }

    // Large snapshots keep only the hash.
    {
        MemoryRunStore store;
        FakeBackend backend;
        AdmissionOptions opts;
        opts.snapshot_max_bytes = 32;
        AdmissionController adm(store, backend, opts);
        SubmitResult s = adm.submit(2, request(std::string(200, 'y')));
        expect_true(s.kind == SubmitKind::ACCEPTED, "large request accepted");
        Run r = *store.get(s.run_id);
        expect_true(!r.code_snapshot.has_value(), "snapshot omitted above threshold");
        expect_eq_ll((long long)r.snapshot_hash.size(), 64, "hash still recorded");
    }

    // Concurrent submits for one attempt: exactly one wins.
    {
        MemoryRunStore store;
        FakeBackend backend;
        AdmissionOptions opts;
        opts.throttle_ms = 0;
        AdmissionController adm(store, backend, opts);
        std::atomic<int> accepted{0}, conflicts{0};
        std::vector<std::thread> ths;
        for (int i = 0; i < 8; i++) {
            ths.emplace_back([&] {
                SubmitResult r = adm.submit(77, request());
                if (r.kind == SubmitKind::ACCEPTED) accepted++;
                else if (r.kind == SubmitKind::CONFLICT) conflicts++;
            });
        }
        for (auto& t : ths) t.join();
        expect_eq_ll(accepted.load(), 1, "exactly one accepted");
        expect_eq_ll(conflicts.load(), 7, "the rest conflict");
    }

    expect_true(std::string(submit_kind_name(SubmitKind::RATE_LIMITED)) == "rate_limited", "kind name");

    std::cout << "test_admission: ALL PASSED\n";
    return 0;
}
