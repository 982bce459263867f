#include "services.h"

#include "execq/queue_manager.h"
#include "execq/spool_queue.h"

#include <iostream>

namespace execq {

Services::~Services() {
    if (backend) backend->shutdown();
}

std::filesystem::path store_dir(const ExecConfig& cfg) {
    return std::filesystem::path(cfg.data_dir) / "store";
}

std::filesystem::path spool_dir(const ExecConfig& cfg) {
    return std::filesystem::path(cfg.data_dir) / "spool";
}

std::filesystem::path events_path(const ExecConfig& cfg) {
    return std::filesystem::path(cfg.data_dir) / "logs" / "events.jsonl";
}

ExecutorConfig executor_config(const ExecConfig& cfg) {
    ExecutorConfig ec;
    ec.build_timeout_ms = cfg.build_timeout_ms;
    ec.run_timeout_ms = cfg.run_timeout_ms;
    ec.scratch_root = cfg.scratch_dir;
    ec.limits.output_max_bytes = cfg.output_max_bytes;
    ec.limits.rlimit_cpu_sec = cfg.rlimit_cpu_sec;
    ec.limits.rlimit_as_mb = cfg.rlimit_as_mb;
    ec.limits.rlimit_fsize_mb = cfg.rlimit_fsize_mb;
    ec.limits.rlimit_nofile = cfg.rlimit_nofile;
    ec.limits.rlimit_nproc = cfg.rlimit_nproc;
    return ec;
}

std::string build_services(const ExecConfig& cfg, Services* out) {
    std::string err = validate_config(cfg);
    if (!err.empty()) return err;
    out->cfg = cfg;

    out->launcher = make_launcher(cfg.launch_wrapper);
    out->executor.reset(new Executor(executor_config(cfg), *out->launcher));

    if (cfg.run_store == "memory") {
        out->store.reset(new MemoryRunStore());
    } else {
        std::unique_ptr<FileRunStore> fs_store(new FileRunStore(store_dir(cfg)));
        err = fs_store->open();
        if (!err.empty()) return "run store: " + err;
        out->store = std::move(fs_store);
    }

    if (cfg.events_enable) {
        std::unique_ptr<RunEventLog> ev(new RunEventLog(events_path(cfg)));
        err = ev->open();
        if (!err.empty()) return "event log: " + err;
        out->events = std::move(ev);
    }

    out->processor.reset(new RunProcessor(*out->store, *out->executor, out->events.get()));

    ReconcileOptions ro;
    ro.stale_grace_ms = cfg.stale_grace_ms;
    ro.run_budget_ms = (int64_t)cfg.build_timeout_ms + cfg.run_timeout_ms;
    if (cfg.queue_backend == "spool") ro.spool_dir = spool_dir(cfg);
    out->reconciler.reset(new Reconciler(*out->processor, ro, out->events.get()));

    if (cfg.queue_backend == "spool") {
        SpoolOptions so;
        so.dir = spool_dir(cfg);
        so.capacity = cfg.queue_max;
        so.max_concurrent = cfg.max_concurrent;
        so.scan_ms = cfg.spool_scan_ms;
        so.reconcile_interval_ms = cfg.reconcile_interval_ms;
        std::unique_ptr<SpoolQueue> sq(new SpoolQueue(*out->processor, so, out->reconciler.get()));
        err = sq->open();
        if (!err.empty()) return "spool: " + err;
        out->backend = std::move(sq);
    } else {
        QueueOptions qo;
        qo.capacity = cfg.queue_max;
        qo.max_concurrent = cfg.max_concurrent;
        qo.enqueue_wait_ms = cfg.enqueue_wait_ms;
        out->backend.reset(new InProcessQueue(*out->processor, qo));
    }
    out->reconciler->attach_backend(out->backend.get());

    AdmissionOptions ao;
    ao.throttle_ms = cfg.throttle_ms;
    ao.snapshot_max_bytes = cfg.snapshot_max_bytes;
    ao.max_request_bytes = cfg.max_request_bytes;
    out->admission.reset(new AdmissionController(*out->store, *out->backend, ao, out->events.get()));
    out->poller.reset(new RunPoller(*out->store));

    std::cerr << "[services] profile=" << profile_name(cfg.profile)
              << " backend=" << out->backend->name()
              << " store=" << cfg.run_store
              << " launcher=" << out->launcher->name()
              << " max_concurrent=" << cfg.max_concurrent
              << " queue_max=" << cfg.queue_max << "\n";
    return "";
}

} // namespace execq
