#include "execq/config.h"
#include "execq/util.h"

#include <cstdlib>

namespace execq {

Profile detect_profile() {
    const char* env = std::getenv("EXECQ_PROFILE");
    if (!env) return Profile::DEV;
    std::string val = lower_ascii(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must run before any worker thread exists: setenv races with getenv.
    switch (p) {
        case Profile::DEV:
            set_env_if_missing("EXECQ_OUTPUT_MAX_BYTES",  "1048576");
            set_env_if_missing("EXECQ_RLIMIT_FSIZE_MB",   "64");
            set_env_if_missing("EXECQ_RLIMIT_NOFILE",     "256");
            set_env_if_missing("EXECQ_STALE_GRACE_MS",    "600000");
            break;

        case Profile::PROD:
            set_env_if_missing("EXECQ_OUTPUT_MAX_BYTES",  "262144");
            set_env_if_missing("EXECQ_RLIMIT_CPU_SEC",    "60");
            set_env_if_missing("EXECQ_RLIMIT_AS_MB",      "2048");
            set_env_if_missing("EXECQ_RLIMIT_FSIZE_MB",   "16");
            set_env_if_missing("EXECQ_RLIMIT_NOFILE",     "128");
            set_env_if_missing("EXECQ_RLIMIT_NPROC",      "256");
            set_env_if_missing("EXECQ_STALE_GRACE_MS",    "300000");
            break;
    }
}

namespace {

size_t getenv_size(const char* k, size_t defv, size_t min_v) {
    int64_t v = getenv_i64(k, (int64_t)defv);
    if (v < (int64_t)min_v) return min_v;
    return (size_t)v;
}

int getenv_clamped(const char* k, int defv, int min_v, int max_v) {
    int v = getenv_int(k, defv);
    if (v < min_v) return min_v;
    if (v > max_v) return max_v;
    return v;
}

} // namespace

ExecConfig load_config_from_env() {
    ExecConfig c;
    c.profile = detect_profile();

    c.max_concurrent = getenv_size("EXECQ_MAX_CONCURRENT", c.max_concurrent, 1);
    c.queue_max = getenv_size("EXECQ_QUEUE_MAX", c.queue_max, 1);
    c.enqueue_wait_ms = getenv_clamped("EXECQ_ENQUEUE_WAIT_MS", c.enqueue_wait_ms, 0, 60000);
    c.workers = getenv_clamped("EXECQ_WORKERS", c.workers, 0, 64);
    c.throttle_ms = getenv_i64("EXECQ_THROTTLE_MS", c.throttle_ms);
    if (c.throttle_ms < 0) c.throttle_ms = 0;

    c.run_timeout_ms = getenv_clamped("EXECQ_RUN_TIMEOUT_MS", c.run_timeout_ms, 100, 3600 * 1000);
    c.build_timeout_ms = getenv_clamped("EXECQ_BUILD_TIMEOUT_MS", c.build_timeout_ms, 100, 3600 * 1000);
    c.snapshot_max_bytes = getenv_size("EXECQ_SNAPSHOT_MAX_BYTES", c.snapshot_max_bytes, 0);
    c.output_max_bytes = getenv_size("EXECQ_OUTPUT_MAX_BYTES", c.output_max_bytes, 1024);
    c.max_request_bytes = getenv_size("EXECQ_MAX_REQUEST_BYTES", c.max_request_bytes, 1024);

    c.queue_backend = lower_ascii(getenv_str("EXECQ_QUEUE_BACKEND", c.queue_backend));
    c.run_store = lower_ascii(getenv_str("EXECQ_RUN_STORE", c.run_store));
    c.data_dir = getenv_str("EXECQ_DATA_DIR", c.data_dir);
    c.scratch_dir = getenv_str("EXECQ_SCRATCH_DIR", c.scratch_dir);
    c.launch_wrapper = getenv_str("EXECQ_LAUNCH_WRAPPER", c.launch_wrapper);
    c.stale_grace_ms = getenv_i64("EXECQ_STALE_GRACE_MS", c.stale_grace_ms);
    if (c.stale_grace_ms < 0) c.stale_grace_ms = 0;
    c.spool_scan_ms = getenv_clamped("EXECQ_SPOOL_SCAN_MS", c.spool_scan_ms, 20, 5000);
    c.reconcile_interval_ms = getenv_clamped("EXECQ_RECONCILE_INTERVAL_MS", c.reconcile_interval_ms, 0, 3600 * 1000);
    c.events_enable = getenv_bool("EXECQ_EVENTS_ENABLE", c.events_enable);

    c.api_token = getenv_str("EXECQ_API_TOKEN", "");

    c.rlimit_cpu_sec = getenv_clamped("EXECQ_RLIMIT_CPU_SEC", c.rlimit_cpu_sec, 0, 86400);
    c.rlimit_as_mb = getenv_size("EXECQ_RLIMIT_AS_MB", c.rlimit_as_mb, 0);
    c.rlimit_fsize_mb = getenv_size("EXECQ_RLIMIT_FSIZE_MB", c.rlimit_fsize_mb, 0);
    c.rlimit_nofile = getenv_clamped("EXECQ_RLIMIT_NOFILE", c.rlimit_nofile, 0, 1 << 20);
    c.rlimit_nproc = getenv_clamped("EXECQ_RLIMIT_NPROC", c.rlimit_nproc, 0, 1 << 20);
    return c;
}

std::string validate_config(const ExecConfig& cfg) {
    if (cfg.queue_backend != "in-process" && cfg.queue_backend != "spool") {
        return "EXECQ_QUEUE_BACKEND must be in-process or spool (got " + cfg.queue_backend + ")";
    }
    if (cfg.run_store != "file" && cfg.run_store != "memory") {
        return "EXECQ_RUN_STORE must be file or memory (got " + cfg.run_store + ")";
    }
    if (cfg.queue_backend == "spool" && cfg.run_store != "file") {
        return "the spool backend needs EXECQ_RUN_STORE=file so workers can read runs";
    }
    if (cfg.data_dir.empty()) return "EXECQ_DATA_DIR is empty";
    return "";
}

int serve_worker_count(const ExecConfig& cfg, int requested) {
    if (requested > 64) requested = 64;
    if (requested < 0) requested = 0;
    if (requested == 0 && cfg.queue_backend != "spool") return 1;
    return requested;
}

} // namespace execq
