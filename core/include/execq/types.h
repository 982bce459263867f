#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace execq {

using RunId = int64_t;
using AttemptId = int64_t;

// Run lifecycle. Wire names are the lowercase strings from run_status_name().
enum class RunStatus {
    QUEUED,
    RUNNING,
    SUCCESS,
    ERROR,
    TIMEOUT,
    COMPILATION_ERROR,
    CANCELLED, // reserved: nothing transitions into it yet
};

const char* run_status_name(RunStatus s);
std::optional<RunStatus> run_status_from_name(const std::string& s);
bool run_status_terminal(RunStatus s);

// Forward-only state machine:
//   queued  -> running | error | cancelled
//   running -> success | error | timeout | compilation_error
// Terminal states have no outgoing edges. Self-transitions are allowed
// so an unchanged status can be re-persisted.
bool run_status_can_transition(RunStatus from, RunStatus to);

struct SourceFile {
    std::string name;
    std::string path;    // project-relative; falls back to name when empty
    std::string content;
    bool is_main{false};
};

// What the client asked for. Serialized verbatim into Run::request_json.
struct ExecRequest {
    AttemptId attempt_id{0};
    std::string language;
    std::vector<SourceFile> files;
    std::string stdin_data;
    std::optional<std::string> build_command;
    std::optional<std::string> run_command;
};

// One subprocess phase (build or run).
struct PhaseResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code{-1};          // -1 when the phase timed out or never started
    double elapsed_sec{0.0};
    bool timed_out{false};
    bool truncated{false};
};

// Executor output: run-phase results plus the (possibly absent) build phase.
struct ExecOutcome {
    RunStatus status{RunStatus::ERROR};
    std::optional<PhaseResult> build;
    std::optional<PhaseResult> run;
    std::string diagnostic;     // infrastructure message when no phase produced output
};

// Durable record of one execution request and its outcome.
struct Run {
    RunId id{0};
    AttemptId attempt_id{0};
    RunStatus status{RunStatus::QUEUED};

    int64_t created_ms{0};
    std::optional<int64_t> started_ms;
    std::optional<int64_t> finished_ms;

    std::optional<std::string> build_stdout;
    std::optional<std::string> build_stderr;
    std::optional<int> build_exit_code;
    std::optional<double> build_time_sec;

    std::optional<std::string> stdout_data;
    std::optional<std::string> stderr_data;
    std::optional<int> exit_code;
    std::optional<double> run_time_sec;

    std::string request_json;                 // immutable once written
    std::optional<std::string> code_snapshot; // only when under the size threshold
    std::string snapshot_hash;                // SHA-256 hex of the canonical file list
};

// In-memory scheduling unit; lives between admission and worker pickup.
struct Job {
    RunId run_id{0};
    ExecRequest request;
    int64_t enqueued_ms{0};
};

} // namespace execq
