#include "execq/run_processor.h"
#include "execq/event_log.h"
#include "execq/serialization.h"
#include "execq/util.h"

#include <iostream>

namespace execq {

namespace {

std::string finish_payload(const Run& r) {
    JsonDoc d(json_object_new_object());
    json_object_object_add(d.root, "status", json_object_new_string(run_status_name(r.status)));
    if (r.exit_code) json_object_object_add(d.root, "exit_code", json_object_new_int(*r.exit_code));
    if (r.started_ms && r.finished_ms) {
        json_object_object_add(d.root, "total_ms", json_object_new_int64(*r.finished_ms - *r.started_ms));
    }
    return json_dump(d.root);
}

} // namespace

void apply_outcome(Run& run, const ExecOutcome& oc) {
    run.status = oc.status;
    if (oc.build) {
        run.build_stdout = oc.build->stdout_data;
        run.build_stderr = oc.build->stderr_data;
        run.build_exit_code = oc.build->exit_code;
        run.build_time_sec = oc.build->elapsed_sec;
    }
    if (oc.run) {
        run.stdout_data = oc.run->stdout_data;
        run.stderr_data = oc.run->stderr_data;
        run.exit_code = oc.run->exit_code;
        run.run_time_sec = oc.run->elapsed_sec;
    } else if (!oc.diagnostic.empty()) {
        run.stdout_data = std::string();
        run.stderr_data = oc.diagnostic;
        run.exit_code = -1;
    }
}

RunProcessor::RunProcessor(IRunStore& store, const Executor& executor, RunEventLog* events)
    : store_(store), executor_(executor), events_(events) {}

RunStatus RunProcessor::process(RunId run_id, const ExecRequest& req) {
    auto loaded = store_.get(run_id);
    if (!loaded) {
        std::cerr << "[worker] run " << run_id << " not found in store\n";
        return RunStatus::ERROR;
    }
    Run run = std::move(*loaded);
    if (run.status != RunStatus::QUEUED) {
        std::cerr << "[worker] run " << run_id << " is " << run_status_name(run.status) << ", skipping\n";
        return run.status;
    }

    run.status = RunStatus::RUNNING;
    run.started_ms = now_ms();
    std::string err = store_.update(run);
    if (!err.empty()) {
        std::cerr << "[worker] run " << run_id << " start failed: " << err << "\n";
        (void)fail_run(run_id, "Failed to start run: " + err);
        return RunStatus::ERROR;
    }
    if (events_) events_->event("START", run.id, run.attempt_id);

    ExecOutcome oc;
    try {
        oc = executor_.run(req);
    } catch (const std::exception& e) {
        oc = ExecOutcome{};
        oc.status = RunStatus::ERROR;
        oc.diagnostic = std::string("Executor failure: ") + e.what();
        std::cerr << "[worker] run " << run_id << " executor exception: " << e.what() << "\n";
    }

    apply_outcome(run, oc);
    run.finished_ms = now_ms();
    err = store_.update(run);
    if (!err.empty()) {
        std::cerr << "[worker] run " << run_id << " result not persisted: " << err << "\n";
        (void)fail_run(run_id, "Failed to persist result: " + err);
        return RunStatus::ERROR;
    }
    if (events_) events_->event("FINISH", run.id, run.attempt_id, finish_payload(run));
    return run.status;
}

RunStatus RunProcessor::process_stored(RunId run_id) {
    auto run = store_.get(run_id);
    if (!run) {
        std::cerr << "[worker] run " << run_id << " not found in store\n";
        return RunStatus::ERROR;
    }
    if (run->status != RunStatus::QUEUED) return run->status;

    ExecRequest req;
    std::string perr;
    if (!request_from_json(run->request_json, &req, &perr)) {
        std::cerr << "[worker] run " << run_id << " has unreadable request: " << perr << "\n";
        (void)fail_run(run_id, "Stored request is unreadable: " + perr);
        return RunStatus::ERROR;
    }
    return process(run_id, req);
}

std::string RunProcessor::fail_run(RunId run_id, const std::string& message) {
    auto loaded = store_.get(run_id);
    if (!loaded) return "run " + std::to_string(run_id) + " not found";
    Run run = std::move(*loaded);
    if (run_status_terminal(run.status)) return "";

    run.status = RunStatus::ERROR;
    run.finished_ms = now_ms();
    run.stdout_data = run.stdout_data.value_or("");
    run.stderr_data = message;
    run.exit_code = -1;
    std::string err = store_.update(run);
    if (!err.empty()) {
        std::cerr << "[worker] run " << run_id << " could not be marked error: " << err << "\n";
        return err;
    }
    if (events_) events_->event("FINISH", run.id, run.attempt_id, finish_payload(run));
    return "";
}

} // namespace execq
