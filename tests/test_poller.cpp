#include "test_common.h"

#include "execq/poller.h"
#include "execq/serialization.h"
#include "execq/util.h"

#include <string>

using namespace execq;

static bool is_null(json_object* o, const char* k) {
    json_object* v = nullptr;
    return json_object_object_get_ex(o, k, &v) && v == nullptr;
}

int main() {
    expect_true(iso8601_utc(0) == "1970-01-01T00:00:00.000Z", "epoch formatting");
    expect_true(iso8601_utc(1700000000123) == "2023-11-14T22:13:20.123Z", "millisecond formatting");

    MemoryRunStore store;
    RunPoller poller(store);

    Run run;
    run.attempt_id = 42;
    run.created_ms = 1700000000000;
    run.request_json = "{}";
    run.snapshot_hash = std::string(64, 'a');
    expect_true(store.create(run).empty(), "create");

    // Queued: result fields are null, not empty.
    PollResult pr = poller.get(run.id);
    expect_true(pr.kind == PollKind::FOUND, "found");
    JsonDoc v = json_parse(pr.view_json);
    expect_true((bool)v, "view is JSON");
    std::string s;
    expect_true(json_get_string(v.root, "status", &s) && s == "queued", "status queued");
    expect_true(is_null(v.root, "build_output"), "no build output yet");
    expect_true(is_null(v.root, "stdout"), "stdout null");
    expect_true(is_null(v.root, "exit_code"), "exit_code null");
    expect_true(is_null(v.root, "started_at"), "started_at null");
    expect_true(is_null(v.root, "total_time"), "total_time null");
    expect_true(json_get_string(v.root, "created_at", &s) && s == "2023-11-14T22:13:20.000Z", "created_at");

    // Ownership
    expect_true(poller.get(run.id, 42).kind == PollKind::FOUND, "owner sees the run");
    PollResult other = poller.get(run.id, 43);
    expect_true(other.kind == PollKind::UNAUTHORIZED, "other attempt is refused");
    expect_true(other.view_json.empty() && !other.run, "refusal leaks nothing");
    expect_true(poller.get(run.id + 100).kind == PollKind::NOT_FOUND, "missing run");

    // Finished run with both phases.
    Run r = *store.get(run.id);
    r.status = RunStatus::RUNNING;
    r.started_ms = 1700000001000;
    expect_true(store.update(r).empty(), "running");
    r.status = RunStatus::SUCCESS;
    r.finished_ms = 1700000003500;
    r.build_stdout = "";
    r.build_stderr = "warning: unused\n";
    r.build_exit_code = 0;
    r.build_time_sec = 1.25;
    r.stdout_data = "42\n";
    r.stderr_data = "";
    r.exit_code = 0;
    r.run_time_sec = 0.5;
    expect_true(store.update(r).empty(), "success");

    pr = poller.get(run.id, 42);
    v = json_parse(pr.view_json);
    expect_true(json_get_string(v.root, "status", &s) && s == "success", "status success");
    expect_true(json_get_string(v.root, "stdout", &s) && s == "42\n", "stdout");
    int64_t code = -5;
    expect_true(json_get_int64(v.root, "exit_code", &code) && code == 0, "exit code");
    double total = 0;
    expect_true(json_get_double(v.root, "total_time", &total), "total_time present");
    expect_true(total > 2.49 && total < 2.51, "total_time is finished - started");

    json_object* b = nullptr;
    expect_true(json_object_object_get_ex(v.root, "build_output", &b) && b, "build_output object");
    expect_true(json_get_string(b, "stderr", &s) && s == "warning: unused\n", "build stderr");
    double bt = 0;
    expect_true(json_get_double(b, "execution_time", &bt) && bt > 1.24 && bt < 1.26, "build time");
    expect_true(json_get_string(v.root, "finished_at", &s) && s == "2023-11-14T22:13:23.500Z", "finished_at");

    std::cout << "test_poller: ALL PASSED\n";
    return 0;
}
