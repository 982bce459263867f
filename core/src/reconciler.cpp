#include "execq/reconciler.h"
#include "execq/event_log.h"
#include "execq/serialization.h"
#include "execq/spool_queue.h"

#include <iostream>
#include <set>

namespace execq {

namespace fs = std::filesystem;

namespace {

std::string reconcile_payload(const char* reason, int64_t age_ms) {
    JsonDoc d(json_object_new_object());
    json_object_object_add(d.root, "reason", json_object_new_string(reason));
    json_object_object_add(d.root, "age_ms", json_object_new_int64(age_ms));
    return json_dump(d.root);
}

// Run ids that still have a message waiting in (or claimed from) the spool.
std::set<RunId> spooled_run_ids(const fs::path& dir, const char* sub) {
    std::set<RunId> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir / sub, ec), end; !ec && it != end; it.increment(ec)) {
        RunId id = 0;
        if (parse_spool_message_name(it->path().filename().string(), &id, nullptr)) out.insert(id);
    }
    return out;
}

} // namespace

Reconciler::Reconciler(RunProcessor& processor, ReconcileOptions opts, RunEventLog* events)
    : processor_(processor), opts_(std::move(opts)), events_(events) {}

ReconcileReport Reconciler::sweep(int64_t now) {
    ReconcileReport rep;
    const bool spool = !opts_.spool_dir.empty();
    std::set<RunId> waiting;
    if (spool) waiting = spooled_run_ids(opts_.spool_dir, "inbox");

    for (const Run& run : processor_.store().list_nonterminal()) {
        rep.examined++;
        if (run.status == RunStatus::QUEUED) {
            const int64_t age = now - run.created_ms;
            if (age <= opts_.stale_grace_ms) continue;
            // still deliverable: a worker will pick it up
            if (waiting.count(run.id)) continue;
            if (backend_ && backend_->holds(run.id)) continue;
            std::string err = processor_.fail_run(
                run.id, "Run abandoned: not picked up within " + std::to_string(opts_.stale_grace_ms / 1000) + " seconds");
            if (!err.empty()) continue;
            rep.queued_failed++;
            if (events_) events_->event("RECONCILE", run.id, run.attempt_id, reconcile_payload("queued", age));
        } else if (run.status == RunStatus::RUNNING) {
            const int64_t since = run.started_ms ? *run.started_ms : run.created_ms;
            const int64_t age = now - since;
            if (age <= opts_.run_budget_ms + opts_.stale_grace_ms) continue;
            std::string err = processor_.fail_run(
                run.id, "Run abandoned: no result after " + std::to_string(age / 1000) + " seconds");
            if (!err.empty()) continue;
            rep.running_failed++;
            if (events_) events_->event("RECONCILE", run.id, run.attempt_id, reconcile_payload("running", age));
        }
    }

    if (spool) {
        std::error_code ec;
        const fs::path processing = opts_.spool_dir / "processing";
        for (fs::directory_iterator it(processing, ec), end; !ec && it != end; it.increment(ec)) {
            RunId id = 0;
            if (!parse_spool_message_name(it->path().filename().string(), &id, nullptr)) continue;
            auto run = processor_.store().get(id);
            if (run && !run_status_terminal(run->status)) continue;
            std::error_code ec2;
            fs::remove(it->path(), ec2);
            if (!ec2) rep.messages_removed++;
        }
    }
    return rep;
}

} // namespace execq
