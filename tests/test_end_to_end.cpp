#include "test_common.h"

#include "execq/admission.h"
#include "execq/executor.h"
#include "execq/poller.h"
#include "execq/queue_manager.h"
#include "execq/run_processor.h"
#include "execq/run_store.h"
#include "execq/serialization.h"

#include <string>

using namespace execq;

namespace {

bool is_null(json_object* o, const char* k) {
    json_object* v = nullptr;
    return json_object_object_get_ex(o, k, &v) && v == nullptr;
}

ExecRequest shell_request(const std::string& content) {
    ExecRequest r;
    r.language = "shell";
    SourceFile f;
    f.name = "main.sh";
    f.content = content;
    r.files.push_back(f);
    r.run_command = std::string("sh main.sh");
    return r;
}

// Submits through admission and waits for the worker to finish the Run.
JsonDoc submit_and_poll(AdmissionController& adm, RunPoller& poller, AttemptId attempt, const ExecRequest& req) {
    SubmitResult sr = adm.submit(attempt, req);
    expect_true(sr.kind == SubmitKind::ACCEPTED, "accepted: " + sr.message);

    std::string status;
    bool done = wait_until([&] {
        PollResult pr = poller.get(sr.run_id, attempt);
        if (pr.kind != PollKind::FOUND) return false;
        JsonDoc v = json_parse(pr.view_json);
        return v && json_get_string(v.root, "status", &status) && status != "queued" && status != "running";
    }, 15000);
    expect_true(done, "run reaches a terminal status");

    PollResult pr = poller.get(sr.run_id, attempt);
    expect_true(pr.kind == PollKind::FOUND, "owner can read the run");
    expect_true(poller.get(sr.run_id, attempt + 1).kind == PollKind::UNAUTHORIZED, "other attempt refused");
    JsonDoc v = json_parse(pr.view_json);
    expect_true((bool)v, "view parses");
    int64_t rid = 0;
    expect_true(json_get_int64(v.root, "run_id", &rid) && rid == sr.run_id, "view carries the run id");
    return v;
}

} // namespace

int main() {
    MemoryRunStore store;
    DirectLauncher launcher;
    ExecutorConfig ec;
    ec.build_timeout_ms = 5000;
    ec.run_timeout_ms = 5000;
    Executor executor(ec, launcher);
    RunProcessor processor(store, executor);
    InProcessQueue queue(processor, QueueOptions{});
    AdmissionOptions ao;
    ao.throttle_ms = 0;
    AdmissionController adm(store, queue, ao);
    RunPoller poller(store);
    queue.start(2);

    // Success: run phase recorded, no build output.
    {
        JsonDoc v = submit_and_poll(adm, poller, 10, shell_request("echo hi\n"));
        std::string s;
        expect_true(json_get_string(v.root, "status", &s) && s == "success", "status success: " + s);
        expect_true(json_get_string(v.root, "stdout", &s) && s == "hi\n", "stdout persisted");
        int64_t code = -5;
        expect_true(json_get_int64(v.root, "exit_code", &code) && code == 0, "exit code 0");
        expect_true(is_null(v.root, "build_output"), "build_output null without a build phase");
        double t = -1;
        expect_true(json_get_double(v.root, "run_time", &t) && t >= 0, "run_time recorded");
        expect_true(json_get_double(v.root, "total_time", &t) && t >= 0, "total_time recorded");
        expect_true(json_get_string(v.root, "snapshot_hash", &s) && s.size() == 64, "snapshot hash in view");
    }

    // Compilation error: build output only, run phase left null.
    {
        ExecRequest req = shell_request("echo never\n");
        req.build_command = std::string("echo broken >&2; exit 2");
        JsonDoc v = submit_and_poll(adm, poller, 20, req);
        std::string s;
        expect_true(json_get_string(v.root, "status", &s) && s == "compilation_error", "status: " + s);
        json_object* b = nullptr;
        expect_true(json_object_object_get_ex(v.root, "build_output", &b) && b, "build_output present");
        int64_t code = 0;
        expect_true(json_get_int64(b, "exit_code", &code) && code == 2, "build exit code");
        expect_true(json_get_string(b, "stderr", &s) && s == "broken\n", "build stderr");
        expect_true(is_null(v.root, "stdout"), "run stdout null");
        expect_true(is_null(v.root, "exit_code"), "run exit_code null");
        expect_true(is_null(v.root, "run_time"), "run_time null");
        expect_true(!store.find_active(20).has_value(), "attempt unlocked after the run");
    }

    // Runtime failure lands as error with the program's own output.
    {
        JsonDoc v = submit_and_poll(adm, poller, 30, shell_request("echo partial; exit 7\n"));
        std::string s;
        expect_true(json_get_string(v.root, "status", &s) && s == "error", "status error: " + s);
        expect_true(json_get_string(v.root, "stdout", &s) && s == "partial\n", "partial stdout kept");
        int64_t code = 0;
        expect_true(json_get_int64(v.root, "exit_code", &code) && code == 7, "exit code 7");
    }

    queue.shutdown();
    expect_true(store.list_nonterminal().empty(), "nothing left queued");

    std::cout << "test_end_to_end: ALL PASSED\n";
    return 0;
}
