#include "execq/types.h"

namespace execq {

const char* run_status_name(RunStatus s) {
    switch (s) {
        case RunStatus::QUEUED: return "queued";
        case RunStatus::RUNNING: return "running";
        case RunStatus::SUCCESS: return "success";
        case RunStatus::ERROR: return "error";
        case RunStatus::TIMEOUT: return "timeout";
        case RunStatus::COMPILATION_ERROR: return "compilation_error";
        case RunStatus::CANCELLED: return "cancelled";
    }
    return "error";
}

std::optional<RunStatus> run_status_from_name(const std::string& s) {
    if (s == "queued") return RunStatus::QUEUED;
    if (s == "running") return RunStatus::RUNNING;
    if (s == "success") return RunStatus::SUCCESS;
    if (s == "error") return RunStatus::ERROR;
    if (s == "timeout") return RunStatus::TIMEOUT;
    if (s == "compilation_error") return RunStatus::COMPILATION_ERROR;
    if (s == "cancelled") return RunStatus::CANCELLED;
    return std::nullopt;
}

bool run_status_terminal(RunStatus s) {
    return s != RunStatus::QUEUED && s != RunStatus::RUNNING;
}

bool run_status_can_transition(RunStatus from, RunStatus to) {
    if (from == to) return true;
    switch (from) {
        case RunStatus::QUEUED:
            return to == RunStatus::RUNNING || to == RunStatus::ERROR || to == RunStatus::CANCELLED;
        case RunStatus::RUNNING:
            return to == RunStatus::SUCCESS || to == RunStatus::ERROR ||
                   to == RunStatus::TIMEOUT || to == RunStatus::COMPILATION_ERROR;
        default:
            return false;
    }
}

} // namespace execq
