#include "execq/admission.h"
#include "execq/event_log.h"
#include "execq/executor.h"
#include "execq/hash.h"
#include "execq/serialization.h"
#include "execq/util.h"

#include <iostream>

namespace execq {

namespace {

std::string reject_payload(SubmitKind kind, const std::string& message) {
    JsonDoc d(json_object_new_object());
    json_object_object_add(d.root, "kind", json_object_new_string(submit_kind_name(kind)));
    json_object_object_add(d.root, "message", json_new_string(message));
    return json_dump(d.root);
}

} // namespace

const char* submit_kind_name(SubmitKind k) {
    switch (k) {
    case SubmitKind::ACCEPTED: return "accepted";
    case SubmitKind::CONFLICT: return "conflict";
    case SubmitKind::RATE_LIMITED: return "rate_limited";
    case SubmitKind::OVERLOADED: return "overloaded";
    case SubmitKind::INVALID: return "invalid";
    }
    return "invalid";
}

AdmissionController::AdmissionController(IRunStore& store, IJobBackend& backend, AdmissionOptions opts,
                                         RunEventLog* events)
    : store_(store), backend_(backend), opts_(opts), events_(events) {}

std::string AdmissionController::validate(const ExecRequest& req) const {
    if (req.language.empty()) return "language is required";
    if (req.files.empty()) return "at least one file is required";
    size_t total = req.stdin_data.size();
    for (const auto& f : req.files) {
        if (f.name.empty()) return "file name is required";
        std::string err = validate_source_path(f.path.empty() ? f.name : f.path);
        if (!err.empty()) return err;
        total += f.content.size();
    }
    if (total > opts_.max_request_bytes) {
        return "request too large (" + std::to_string(total) + " bytes, limit " +
               std::to_string(opts_.max_request_bytes) + ")";
    }
    return "";
}

SubmitResult AdmissionController::submit(AttemptId attempt_id, const ExecRequest& request) {
    SubmitResult res;
    ExecRequest req = request;
    req.attempt_id = attempt_id;
    for (auto& f : req.files) {
        if (f.path.empty()) f.path = f.name;
    }

    std::string verr = validate(req);
    if (!verr.empty()) {
        res.kind = SubmitKind::INVALID;
        res.message = verr;
        if (events_) events_->event("REJECT", 0, attempt_id, reject_payload(res.kind, res.message));
        return res;
    }

    Run run;
    {
        std::lock_guard<std::mutex> lk(admit_mu_);

        if (auto active = store_.find_active(attempt_id)) {
            res.kind = SubmitKind::CONFLICT;
            res.run_id = active->id;
            res.message = "Run already in progress for this attempt (run_id=" + std::to_string(active->id) + ")";
        } else if (auto last = store_.latest_created(attempt_id)) {
            const int64_t since = now_ms() - last->created_ms;
            if (since < opts_.throttle_ms) {
                res.kind = SubmitKind::RATE_LIMITED;
                res.retry_after_ms = opts_.throttle_ms - since;
                res.message = "Please wait " + std::to_string(opts_.throttle_ms / 1000) + "s between runs";
            }
        }
        if (res.kind == SubmitKind::CONFLICT || res.kind == SubmitKind::RATE_LIMITED) {
            if (events_) events_->event("REJECT", res.run_id, attempt_id, reject_payload(res.kind, res.message));
            return res;
        }

        run.attempt_id = attempt_id;
        run.status = RunStatus::QUEUED;
        run.created_ms = now_ms();
        run.request_json = request_to_json(req);
        std::string files_json = files_canonical_json(req.files);
        run.snapshot_hash = sha256_hex(files_json);
        if (files_json.size() <= opts_.snapshot_max_bytes) run.code_snapshot = std::move(files_json);

        std::string err = store_.create(run);
        if (!err.empty()) {
            std::cerr << "[admission] store create failed: " << err << "\n";
            res.kind = SubmitKind::OVERLOADED;
            res.message = "Run store unavailable: " + err;
            return res;
        }
    }
    if (events_) events_->event("SUBMIT", run.id, attempt_id);

    Job job;
    job.run_id = run.id;
    job.request = std::move(req);
    job.enqueued_ms = now_ms();
    EnqueueResult er = backend_.submit(std::move(job));
    res.run_id = run.id;

    if (!er.accepted) {
        run.status = RunStatus::ERROR;
        run.stderr_data = er.message;
        run.finished_ms = now_ms();
        std::string err = store_.update(run);
        if (!err.empty()) std::cerr << "[admission] run " << run.id << " could not be marked error: " << err << "\n";
        res.kind = SubmitKind::OVERLOADED;
        res.message = er.message;
        if (events_) events_->event("REJECT", run.id, attempt_id, reject_payload(res.kind, res.message));
        return res;
    }

    res.kind = SubmitKind::ACCEPTED;
    res.queue_position = er.position;
    res.message = er.message;
    return res;
}

} // namespace execq
