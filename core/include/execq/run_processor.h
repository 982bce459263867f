#pragma once

#include "executor.h"
#include "run_store.h"
#include "types.h"

#include <string>

namespace execq {

class RunEventLog;

// Worker-side step shared by both backends: queued -> running -> terminal.
class RunProcessor {
public:
    RunProcessor(IRunStore& store, const Executor& executor, RunEventLog* events = nullptr);

    // Runs a job whose request is already in memory. Returns the final status.
    // A Run that is no longer queued (reconciled, shut down) is left untouched.
    RunStatus process(RunId run_id, const ExecRequest& req);

    // Loads the request from the Run's stored request_json first.
    RunStatus process_stored(RunId run_id);

    // Resolves a non-terminal Run to error with `message` in stderr.
    // A Run that is already terminal is left as is.
    std::string fail_run(RunId run_id, const std::string& message);

    IRunStore& store() { return store_; }

private:
    IRunStore& store_;
    const Executor& executor_;
    RunEventLog* events_;
};

// Copies an ExecOutcome into the Run's phase fields and status.
void apply_outcome(Run& run, const ExecOutcome& oc);

} // namespace execq
