#include "cmd_worker.h"
#include "runner_utils.h"
#include "services.h"

#include "execq/serialization.h"
#include "execq/spool_queue.h"
#include "execq/util.h"

#include <csignal>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

using namespace execq;

namespace {

json_object* phase_to_json(const std::optional<PhaseResult>& p) {
    if (!p) return nullptr;
    json_object* o = json_object_new_object();
    json_object_object_add(o, "stdout", json_new_string(p->stdout_data));
    json_object_object_add(o, "stderr", json_new_string(p->stderr_data));
    json_object_object_add(o, "exit_code", json_object_new_int(p->exit_code));
    json_object_object_add(o, "execution_time", json_object_new_double(p->elapsed_sec));
    json_object_object_add(o, "timed_out", json_object_new_boolean(p->timed_out ? 1 : 0));
    json_object_object_add(o, "truncated", json_object_new_boolean(p->truncated ? 1 : 0));
    return o;
}

} // namespace

int cmd_worker(int argc, char** argv) {
    ::signal(SIGPIPE, SIG_IGN);
    install_stop_signals();

    apply_profile_defaults(detect_profile());
    ExecConfig cfg = load_config_from_env();
    if (cfg.queue_backend != "spool") {
        std::cerr << "[worker] standalone workers need EXECQ_QUEUE_BACKEND=spool\n";
        return 2;
    }
    int workers = std::atoi(arg_value(argc, argv, 2, "--workers", std::to_string(cfg.workers)).c_str());
    if (workers < 1) workers = 1;
    if (workers > 64) workers = 64;
    const bool once = has_flag(argc, argv, 2, "--once");

    Services svc;
    std::string err = build_services(cfg, &svc);
    if (!err.empty()) {
        std::cerr << "[worker] startup failed: " << err << "\n";
        return 2;
    }
    auto* spool = dynamic_cast<SpoolQueue*>(svc.backend.get());
    if (!spool) {
        std::cerr << "[worker] backend is not a spool\n";
        return 2;
    }

    if (once) {
        // Drain what is waiting now, on this thread, then exit.
        size_t n = 0;
        while (!stop_requested() && spool->run_once()) n++;
        std::cerr << "[worker] processed " << n << " message(s)\n";
        return 0;
    }

    spool->start(workers);
    std::cerr << "[worker] pid=" << ::getpid() << " workers=" << workers
              << " spool=" << spool_dir(cfg).string() << "\n";
    while (!stop_requested()) sleep_ms(200);

    std::cerr << "[worker] stopping\n";
    spool->shutdown();
    BackendStats st = spool->stats();
    std::cerr << "[worker] stopped processed=" << st.processed << "\n";
    return 0;
}

int cmd_reconcile(int, char**) {
    apply_profile_defaults(detect_profile());
    ExecConfig cfg = load_config_from_env();

    Services svc;
    std::string err = build_services(cfg, &svc);
    if (!err.empty()) {
        std::cerr << "[reconcile] startup failed: " << err << "\n";
        return 2;
    }
    if (cfg.queue_backend == "spool") {
        auto* spool = dynamic_cast<SpoolQueue*>(svc.backend.get());
        if (spool) {
            size_t n = spool->recover_orphans();
            if (n > 0) std::cerr << "[reconcile] recovered " << n << " orphaned message(s)\n";
        }
    }
    ReconcileReport rep = svc.reconciler->sweep(now_ms());

    JsonDoc d(json_object_new_object());
    json_object_object_add(d.root, "examined", json_object_new_int64((int64_t)rep.examined));
    json_object_object_add(d.root, "queued_failed", json_object_new_int64((int64_t)rep.queued_failed));
    json_object_object_add(d.root, "running_failed", json_object_new_int64((int64_t)rep.running_failed));
    json_object_object_add(d.root, "messages_removed", json_object_new_int64((int64_t)rep.messages_removed));
    std::cout << json_dump(d.root) << "\n";
    return 0;
}

int cmd_exec(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: execq_cli exec <request.json|->\n";
        return 2;
    }
    ::signal(SIGPIPE, SIG_IGN);
    apply_profile_defaults(detect_profile());
    ExecConfig cfg = load_config_from_env();

    std::string text, err;
    if (!read_input(argv[2], cfg.max_request_bytes * 2 + 64 * 1024, &text, &err)) {
        std::cerr << "[exec] " << err << "\n";
        return 2;
    }
    ExecRequest req;
    if (!request_from_json(text, &req, &err)) {
        std::cerr << "[exec] invalid request: " << err << "\n";
        return 2;
    }
    for (const auto& f : req.files) {
        std::string perr = validate_source_path(f.path.empty() ? f.name : f.path);
        if (!perr.empty()) {
            std::cerr << "[exec] invalid request: " << perr << "\n";
            return 2;
        }
    }

    auto launcher = make_launcher(cfg.launch_wrapper);
    Executor executor(executor_config(cfg), *launcher);
    ExecOutcome oc = executor.run(req);

    JsonDoc d(json_object_new_object());
    json_object_object_add(d.root, "status", json_object_new_string(run_status_name(oc.status)));
    json_object_object_add(d.root, "build", phase_to_json(oc.build));
    json_object_object_add(d.root, "run", phase_to_json(oc.run));
    json_object_object_add(d.root, "diagnostic", json_new_string(oc.diagnostic));
    std::cout << json_dump(d.root) << "\n";
    return oc.status == RunStatus::SUCCESS ? 0 : 1;
}
