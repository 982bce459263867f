#include "execq/poller.h"
#include "execq/serialization.h"
#include "execq/util.h"

namespace execq {

namespace {

json_object* opt_str(const std::optional<std::string>& v) {
    return v ? json_new_string(*v) : nullptr;
}

json_object* opt_time(const std::optional<int64_t>& ms) {
    return ms ? json_new_string(iso8601_utc(*ms)) : nullptr;
}

} // namespace

std::string run_view_json(const Run& run) {
    JsonDoc d(json_object_new_object());
    json_object* o = d.root;
    json_object_object_add(o, "run_id", json_object_new_int64(run.id));
    json_object_object_add(o, "attempt_id", json_object_new_int64(run.attempt_id));
    json_object_object_add(o, "status", json_object_new_string(run_status_name(run.status)));

    if (run.build_stdout || run.build_stderr || run.build_exit_code) {
        json_object* b = json_object_new_object();
        json_object_object_add(b, "stdout", json_new_string(run.build_stdout.value_or("")));
        json_object_object_add(b, "stderr", json_new_string(run.build_stderr.value_or("")));
        json_object_object_add(b, "exit_code", json_object_new_int(run.build_exit_code.value_or(0)));
        json_object_object_add(b, "execution_time", json_object_new_double(run.build_time_sec.value_or(0.0)));
        json_object_object_add(o, "build_output", b);
    } else {
        json_object_object_add(o, "build_output", nullptr);
    }

    json_object_object_add(o, "stdout", opt_str(run.stdout_data));
    json_object_object_add(o, "stderr", opt_str(run.stderr_data));
    json_object_object_add(o, "exit_code", run.exit_code ? json_object_new_int(*run.exit_code) : nullptr);
    json_object_object_add(o, "run_time", run.run_time_sec ? json_object_new_double(*run.run_time_sec) : nullptr);

    json_object_object_add(o, "created_at", json_new_string(iso8601_utc(run.created_ms)));
    json_object_object_add(o, "started_at", opt_time(run.started_ms));
    json_object_object_add(o, "finished_at", opt_time(run.finished_ms));
    if (run.started_ms && run.finished_ms) {
        double total = (double)(*run.finished_ms - *run.started_ms) / 1000.0;
        json_object_object_add(o, "total_time", json_object_new_double(total));
    } else {
        json_object_object_add(o, "total_time", nullptr);
    }
    json_object_object_add(o, "snapshot_hash", json_new_string(run.snapshot_hash));
    return json_dump(o);
}

PollResult RunPoller::get(RunId run_id, std::optional<AttemptId> viewer_attempt) const {
    PollResult r;
    auto run = store_.get(run_id);
    if (!run) {
        r.kind = PollKind::NOT_FOUND;
        return r;
    }
    if (viewer_attempt && *viewer_attempt != run->attempt_id) {
        r.kind = PollKind::UNAUTHORIZED;
        return r;
    }
    r.kind = PollKind::FOUND;
    r.view_json = run_view_json(*run);
    r.run = std::move(run);
    return r;
}

} // namespace execq
