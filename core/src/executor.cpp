#include "execq/executor.h"
#include "execq/util.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace execq {

namespace fs = std::filesystem;

namespace {

std::string seconds_label(int ms) {
    if (ms % 1000 == 0) return std::to_string(ms / 1000);
    std::ostringstream oss;
    oss << (double)ms / 1000.0;
    return oss.str();
}

PhaseResult phase_from_proc(const ProcResult& pr) {
    PhaseResult p;
    p.stdout_data = pr.stdout_data;
    p.stderr_data = pr.stderr_data;
    p.exit_code = pr.exit_code;
    p.elapsed_sec = (double)pr.elapsed_ms / 1000.0;
    p.timed_out = pr.timed_out;
    p.truncated = pr.truncated;
    return p;
}

} // namespace

LanguageCommands default_commands(const std::string& language) {
    const std::string lang = lower_ascii(language);
    if (lang == "python") return {std::string("pip install -r requirements.txt"), std::string("python3 main.py")};
    if (lang == "java") return {std::string("javac *.java"), std::string("java Main")};
    if (lang == "c") return {std::string("gcc *.c -o app"), std::string("./app")};
    if (lang == "cpp") return {std::string("g++ *.cpp -o app"), std::string("./app")};
    return {};
}

std::string validate_source_path(const std::string& path) {
    if (path.empty()) return "empty file path";
    if (path.find('\0') != std::string::npos) return "file path contains NUL";
    fs::path p(path);
    if (p.is_absolute() || path[0] == '/') return "absolute file path: " + path;
    for (const auto& part : p) {
        if (part == "..") return "file path escapes project: " + path;
    }
    if (p.filename().empty() || p.filename() == ".") return "file path names a directory: " + path;
    return "";
}

// --- ScratchDir ---

ScratchDir::ScratchDir(const std::string& root) {
    fs::path base;
    if (!root.empty()) {
        base = root;
    } else {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) base = "/tmp";
    }
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        error_ = "scratch root " + base.string() + ": " + ec.message();
        return;
    }

    std::string tmpl = (base / "execq-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        error_ = std::string("mkdtemp: ") + std::strerror(errno);
        return;
    }
    path_ = buf.data();
}

ScratchDir::~ScratchDir() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
}

// --- Executor ---

Executor::Executor(ExecutorConfig cfg, ILauncher& launcher)
    : cfg_(std::move(cfg)), launcher_(launcher) {}

std::string Executor::materialize(const ExecRequest& req, const fs::path& dir) const {
    for (const auto& f : req.files) {
        const std::string& rel = f.path.empty() ? f.name : f.path;
        std::string verr = validate_source_path(rel);
        if (!verr.empty()) return verr;

        fs::path dst = dir / rel;
        std::error_code ec;
        fs::create_directories(dst.parent_path(), ec);
        if (ec) return "mkdir " + dst.parent_path().string() + ": " + ec.message();

        std::ofstream out(dst, std::ios::binary | std::ios::trunc);
        if (!out) return "open " + rel + ": " + std::strerror(errno);
        out.write(f.content.data(), (std::streamsize)f.content.size());
        if (!out) return "write " + rel + " failed";
    }
    return "";
}

bool Executor::run_phase(const std::string& command,
                         const fs::path& cwd,
                         const std::string& stdin_data,
                         int timeout_ms,
                         PhaseResult* out,
                         std::string* launch_err) const {
    LaunchSpec spec;
    spec.argv = {cfg_.shell, "-c", command};
    spec.cwd = cwd.string();
    spec.stdin_data = stdin_data;
    spec.limits = cfg_.limits;
    spec.limits.timeout_ms = timeout_ms;

    ProcResult pr;
    if (!launcher_.launch(spec, &pr)) {
        if (launch_err) *launch_err = pr.error.empty() ? "launch failed" : pr.error;
        return false;
    }
    *out = phase_from_proc(pr);
    if (pr.timed_out) {
        out->exit_code = -1;
        if (!out->stderr_data.empty() && out->stderr_data.back() != '\n') out->stderr_data += "\n";
        out->stderr_data += "Command timed out after " + seconds_label(timeout_ms) + " seconds";
    }
    return true;
}

ExecOutcome Executor::run(const ExecRequest& req) const {
    ExecOutcome oc;

    ScratchDir scratch(cfg_.scratch_root);
    if (!scratch.ok()) {
        oc.status = RunStatus::ERROR;
        oc.diagnostic = "Failed to create working directory: " + scratch.error();
        return oc;
    }

    std::string merr = materialize(req, scratch.path());
    if (!merr.empty()) {
        oc.status = RunStatus::ERROR;
        oc.diagnostic = "Failed to write project files: " + merr;
        return oc;
    }

    LanguageCommands defaults = default_commands(req.language);
    std::optional<std::string> build_cmd = req.build_command ? req.build_command : defaults.build;
    std::optional<std::string> run_cmd = req.run_command ? req.run_command : defaults.run;

    if (build_cmd && lower_ascii(req.language) == "python" &&
        build_cmd->find("requirements.txt") != std::string::npos) {
        std::error_code ec;
        if (!fs::exists(scratch.path() / "requirements.txt", ec)) build_cmd.reset();
    }

    if (build_cmd) {
        PhaseResult build;
        std::string lerr;
        if (!run_phase(*build_cmd, scratch.path(), "", cfg_.build_timeout_ms, &build, &lerr)) {
            oc.status = RunStatus::ERROR;
            oc.diagnostic = "Build launch failed: " + lerr;
            return oc;
        }
        const bool failed = build.timed_out || build.exit_code != 0;
        oc.build = std::move(build);
        if (failed) {
            oc.status = RunStatus::COMPILATION_ERROR;
            return oc;
        }
    }

    if (!run_cmd) {
        PhaseResult none;
        none.exit_code = -1;
        none.stderr_data = "No run command specified for " + req.language;
        oc.run = std::move(none);
        oc.status = RunStatus::ERROR;
        return oc;
    }

    PhaseResult run;
    std::string lerr;
    if (!run_phase(*run_cmd, scratch.path(), req.stdin_data, cfg_.run_timeout_ms, &run, &lerr)) {
        oc.status = RunStatus::ERROR;
        oc.diagnostic = "Run launch failed: " + lerr;
        return oc;
    }

    if (run.timed_out) oc.status = RunStatus::TIMEOUT;
    else if (run.exit_code != 0) oc.status = RunStatus::ERROR;
    else oc.status = RunStatus::SUCCESS;
    oc.run = std::move(run);
    return oc;
}

} // namespace execq
