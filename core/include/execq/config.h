#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace execq {

enum class Profile { DEV, PROD };

// Detect profile from EXECQ_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: generous output cap, no CPU/AS/NPROC rlimits
// PROD: smaller output cap, CPU/AS/NPROC rlimits on
void apply_profile_defaults(Profile p);

// Everything the service reads from the environment (EXECQ_*).
struct ExecConfig {
    Profile profile{Profile::DEV};

    size_t max_concurrent{4};
    size_t queue_max{200};
    int enqueue_wait_ms{1000};
    int workers{2};
    int64_t throttle_ms{2000};

    int run_timeout_ms{30000};
    int build_timeout_ms{120000};
    size_t snapshot_max_bytes{262144};
    size_t output_max_bytes{1024 * 1024};
    size_t max_request_bytes{4 * 1024 * 1024};

    std::string queue_backend{"in-process"};   // in-process | spool
    std::string run_store{"file"};              // file | memory
    std::string data_dir{"./var"};
    std::string scratch_dir;                    // empty: system temp
    std::string launch_wrapper;                 // empty: DirectLauncher
    int64_t stale_grace_ms{600000};
    int spool_scan_ms{150};
    int reconcile_interval_ms{60000};
    bool events_enable{true};

    std::string api_token;                      // empty: no auth on /api/*

    int rlimit_cpu_sec{0};
    size_t rlimit_as_mb{0};
    size_t rlimit_fsize_mb{64};
    int rlimit_nofile{256};
    int rlimit_nproc{0};
};

// Reads EXECQ_* (after apply_profile_defaults) and clamps out-of-range values.
ExecConfig load_config_from_env();

// Empty string when the configuration is usable.
std::string validate_config(const ExecConfig& cfg);

// Worker threads serve actually starts. Zero is an API-only front end and is
// only meaningful with the spool backend; the in-process backend gets at least one.
int serve_worker_count(const ExecConfig& cfg, int requested);

} // namespace execq
