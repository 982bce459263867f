#pragma once

#include "backend.h"
#include "run_processor.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace execq {

class RunEventLog;

struct ReconcileOptions {
    int64_t stale_grace_ms{600000};
    // Longest a healthy run can take: build timeout + run timeout.
    int64_t run_budget_ms{150000};
    // Spool root; empty when the in-process backend is in use.
    std::filesystem::path spool_dir;
};

struct ReconcileReport {
    size_t examined{0};
    size_t queued_failed{0};
    size_t running_failed{0};
    size_t messages_removed{0};
};

// Resolves Runs whose job vanished (process crash, lost message) to error so
// no attempt stays locked forever.
class Reconciler {
public:
    Reconciler(RunProcessor& processor, ReconcileOptions opts, RunEventLog* events = nullptr);

    // Queued Runs the backend still holds are never abandoned, however old.
    void attach_backend(const IJobBackend* backend) { backend_ = backend; }

    ReconcileReport sweep(int64_t now);

    const ReconcileOptions& options() const { return opts_; }

private:
    RunProcessor& processor_;
    ReconcileOptions opts_;
    RunEventLog* events_;
    const IJobBackend* backend_{nullptr};
};

} // namespace execq
