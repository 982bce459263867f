#pragma once

#include "proc.h"
#include "types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace execq {

struct ExecutorConfig {
    int build_timeout_ms{120000};
    int run_timeout_ms{30000};
    ProcLimits limits;          // timeout_ms is overridden per phase
    std::string scratch_root;   // empty -> system temp directory
    std::string shell{"/bin/sh"};
};

struct LanguageCommands {
    std::optional<std::string> build;
    std::optional<std::string> run;
};

// Built-in commands for python, java, c and cpp (case-insensitive).
// Unknown languages get neither.
LanguageCommands default_commands(const std::string& language);

// Rejects empty, absolute and parent-escaping paths. Returns empty string if ok.
std::string validate_source_path(const std::string& path);

// mkdtemp-backed working directory, removed recursively on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& root);
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::filesystem::path path_;
    std::string error_;
};

// Build+run pipeline for one request. Holds no per-run state, so one instance
// is shared by every worker.
class Executor {
public:
    Executor(ExecutorConfig cfg, ILauncher& launcher);

    ExecOutcome run(const ExecRequest& req) const;

    const ExecutorConfig& config() const { return cfg_; }
    ILauncher& launcher() const { return launcher_; }

private:
    std::string materialize(const ExecRequest& req, const std::filesystem::path& dir) const;
    bool run_phase(const std::string& command,
                   const std::filesystem::path& cwd,
                   const std::string& stdin_data,
                   int timeout_ms,
                   PhaseResult* out,
                   std::string* launch_err) const;

    ExecutorConfig cfg_;
    ILauncher& launcher_;
};

} // namespace execq
