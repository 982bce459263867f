#pragma once

#include "run_store.h"
#include "types.h"

#include <optional>
#include <string>

namespace execq {

enum class PollKind { FOUND, NOT_FOUND, UNAUTHORIZED };

struct PollResult {
    PollKind kind{PollKind::NOT_FOUND};
    std::optional<Run> run;
    std::string view_json;  // set when FOUND
};

// Client-facing JSON of a Run. Absent fields render as null; total_time is
// finished - started in seconds and never derived from phase timers.
std::string run_view_json(const Run& run);

class RunPoller {
public:
    explicit RunPoller(IRunStore& store) : store_(store) {}

    // viewer_attempt: when given, must match the Run's attempt.
    PollResult get(RunId run_id, std::optional<AttemptId> viewer_attempt = std::nullopt) const;

private:
    IRunStore& store_;
};

} // namespace execq
