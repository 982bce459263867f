#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace execq {

struct ProcLimits {
    int timeout_ms{30000};                  // wall clock; <= 0 disables
    size_t output_max_bytes{1024 * 1024};   // per stream

    // 0 disables the corresponding rlimit.
    int rlimit_cpu_sec{0};
    size_t rlimit_as_mb{0};
    size_t rlimit_fsize_mb{64};
    int rlimit_nofile{256};
    int rlimit_nproc{0};

    bool no_new_privs{true};
};

struct ProcResult {
    int exit_code{-1};
    bool timed_out{false};
    bool truncated{false};      // either stream hit output_max_bytes
    std::string stdout_data;
    std::string stderr_data;
    int64_t elapsed_ms{0};
    std::string error;          // launcher failure, not child stderr
};

struct LaunchSpec {
    std::vector<std::string> argv;  // argv[0] resolved through PATH
    std::string cwd;
    std::string stdin_data;
    ProcLimits limits;
};

// Isolation seam: every subprocess the executor starts goes through one of these.
class ILauncher {
public:
    virtual ~ILauncher() = default;
    // Returns false when the process could not be started; res->error says why.
    virtual bool launch(const LaunchSpec& spec, ProcResult* res) = 0;
    virtual std::string name() const = 0;
};

// fork/exec in a fresh process group with rlimits and a scrubbed environment.
class DirectLauncher : public ILauncher {
public:
    bool launch(const LaunchSpec& spec, ProcResult* res) override;
    std::string name() const override { return "direct"; }
};

// Prepends an operator-supplied wrapper (bwrap, nsjail, firejail...) to argv.
class WrapperLauncher : public ILauncher {
public:
    explicit WrapperLauncher(std::vector<std::string> prefix) : prefix_(std::move(prefix)) {}
    bool launch(const LaunchSpec& spec, ProcResult* res) override;
    std::string name() const override { return "wrapper"; }

    const std::vector<std::string>& prefix() const { return prefix_; }

private:
    std::vector<std::string> prefix_;
};

// Empty or unparsable wrapper -> DirectLauncher.
std::unique_ptr<ILauncher> make_launcher(const std::string& wrapper_cmd);

// Runs argv, feeds stdin, captures stdout and stderr separately, and kills the
// whole process group once timeout_ms elapses. Returns true if the process started.
bool proc_run_capture(const LaunchSpec& spec, ProcResult* res);

// Split a command string into argv tokens.
// Supports single/double quotes and backslash escapes inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace execq
