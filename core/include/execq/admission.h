#pragma once

#include "backend.h"
#include "run_store.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace execq {

class RunEventLog;

struct AdmissionOptions {
    int64_t throttle_ms{2000};
    size_t snapshot_max_bytes{262144};
    size_t max_request_bytes{4 * 1024 * 1024};
};

enum class SubmitKind {
    ACCEPTED,
    CONFLICT,
    RATE_LIMITED,
    OVERLOADED,
    INVALID,
};

const char* submit_kind_name(SubmitKind k);

struct SubmitResult {
    SubmitKind kind{SubmitKind::INVALID};
    RunId run_id{0};            // new Run (accepted/overloaded) or the blocking Run (conflict)
    size_t queue_position{0};
    int64_t retry_after_ms{0};
    std::string message;
};

// Entry point for new execution requests: strict lock, per-attempt throttle,
// Run creation and hand-off to the backend.
class AdmissionController {
public:
    AdmissionController(IRunStore& store, IJobBackend& backend, AdmissionOptions opts,
                        RunEventLog* events = nullptr);

    SubmitResult submit(AttemptId attempt_id, const ExecRequest& req);

    // Shape checks only; empty string if the request is acceptable.
    std::string validate(const ExecRequest& req) const;

    const AdmissionOptions& options() const { return opts_; }

private:
    IRunStore& store_;
    IJobBackend& backend_;
    AdmissionOptions opts_;
    RunEventLog* events_;
    // Serializes lock check, throttle check and Run creation within this process.
    // Other processes sharing the store are not covered.
    std::mutex admit_mu_;
};

} // namespace execq
