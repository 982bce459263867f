#include "execq/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace execq {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        switch (st) {
        case NORM:
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have_token) out.push_back(cur);
                cur.clear();
                have_token = false;
            } else if (c == '\'') {
                st = SQ;
                have_token = true;
            } else if (c == '"') {
                st = DQ;
                esc = false;
                have_token = true;
            } else {
                cur.push_back(c);
                have_token = true;
            }
            break;
        case SQ:
            if (c == '\'') st = NORM;
            else cur.push_back(c);
            break;
        case DQ:
            if (esc) {
                cur.push_back(c);
                esc = false;
            } else if (c == '\\') {
                esc = true;
            } else if (c == '"') {
                st = NORM;
            } else {
                cur.push_back(c);
            }
            break;
        }
    }
    if (st != NORM) return {};
    if (have_token) out.push_back(cur);
    return out;
}

namespace {

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Writing stdin to a child that already exited must surface as EPIPE, not kill us.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { (void)std::signal(SIGPIPE, SIG_IGN); });
}

struct CappedSink {
    std::string* buf;
    size_t cap;
    bool* truncated;

    void append(const char* data, size_t n) {
        size_t can = cap > buf->size() ? cap - buf->size() : 0;
        size_t take = std::min(can, n);
        if (take < n) *truncated = true;
        if (take > 0) buf->append(data, take);
    }
};

// Reads whatever is available; closes fd at EOF or on a hard error.
void pump(int& fd, CappedSink& sink) {
    char buf[4096];
    while (fd >= 0) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
    }
}

// Everything the child needs is prepared before fork: after fork in a
// multithreaded parent only async-signal-safe calls are allowed.
[[noreturn]] void exec_child(const LaunchSpec& spec,
                             char* const* cargv,
                             char* const* cenv,
                             int in_fd, int out_fd, int err_fd,
                             long maxfd) {
    (void)dup2(in_fd, STDIN_FILENO);
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(err_fd, STDERR_FILENO);

    // own process group so a timeout can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);

    for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) _exit(126);

    (void)signal(SIGPIPE, SIG_DFL);

#ifdef __linux__
    if (spec.limits.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    const ProcLimits& lim = spec.limits;
    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

    execvpe(cargv[0], cargv, cenv);
    _exit(127);
}

} // namespace

bool proc_run_capture(const LaunchSpec& spec, ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (spec.argv.empty() || spec.argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    ignore_sigpipe_once();

    std::vector<char*> cargv;
    cargv.reserve(spec.argv.size() + 1);
    for (const auto& s : spec.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    // scrub loader injection from the inherited environment
    std::vector<std::string> env_store;
    for (char** e = environ; e && *e; e++) {
        if (std::strncmp(*e, "LD_PRELOAD=", 11) == 0) continue;
        if (std::strncmp(*e, "LD_LIBRARY_PATH=", 16) == 0) continue;
        env_store.emplace_back(*e);
    }
    std::vector<char*> cenv;
    cenv.reserve(env_store.size() + 1);
    for (auto& s : env_store) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_all();
        return false;
    }
    if (pid == 0) {
        exec_child(spec, cargv.data(), cenv.data(), in_pipe[0], out_pipe[1], err_pipe[1], maxfd);
    }

    // parent
    (void)setpgid(pid, pid);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblock(out_fd);
    set_nonblock(err_fd);
    if (spec.stdin_data.empty()) close_fd(in_fd);
    else set_nonblock(in_fd);

    const ProcLimits& lim = spec.limits;
    CappedSink out_sink{&res->stdout_data, lim.output_max_bytes, &res->truncated};
    CappedSink err_sink{&res->stderr_data, lim.output_max_bytes, &res->truncated};
    size_t write_off = 0;

    auto elapsed = [&] {
        return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    int status = 0;
    bool reaped = false;

    // Interleave stdin writes with stdout/stderr reads so neither side can
    // block the other on a full pipe.
    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }

        int64_t el = elapsed();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int64_t remaining = lim.timeout_ms - el;
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                reaped = true;
                break;
            }
            if (remaining < slice) slice = (int)remaining;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { in_idx = (int)nfds; fds[nfds++] = {in_fd, POLLOUT, 0}; }
        if (out_fd >= 0) { out_idx = (int)nfds; fds[nfds++] = {out_fd, POLLIN, 0}; }
        if (err_fd >= 0) { err_idx = (int)nfds; fds[nfds++] = {err_fd, POLLIN, 0}; }

        int pr = poll(fds, nfds, slice);
        if (pr < 0) {
            if (errno == EINTR) continue;
            res->error = std::string("poll failed: ") + std::strerror(errno);
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            reaped = true;
            break;
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < spec.stdin_data.size()) {
                ssize_t n = write(in_fd, spec.stdin_data.data() + write_off, spec.stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                // EPIPE: the child stopped reading; drop the rest
                write_off = spec.stdin_data.size();
            }
            if (write_off >= spec.stdin_data.size()) close_fd(in_fd);
        }
        if (out_idx >= 0 && fds[out_idx].revents) pump(out_fd, out_sink);
        if (err_idx >= 0 && fds[err_idx].revents) pump(err_fd, err_sink);
    }

    // Background processes left in the group would otherwise hold the pipes open.
    (void)kill(-pid, SIGKILL);

    close_fd(in_fd);
    pump(out_fd, out_sink);
    pump(err_fd, err_sink);
    close_fd(out_fd);
    close_fd(err_fd);

    res->elapsed_ms = elapsed();
    if (res->timed_out) {
        res->exit_code = -1;
    } else if (reaped && WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (reaped && WIFSIGNALED(status)) {
        res->exit_code = 128 + WTERMSIG(status);
    } else {
        res->exit_code = -1;
    }
    return true;
}

bool DirectLauncher::launch(const LaunchSpec& spec, ProcResult* res) {
    return proc_run_capture(spec, res);
}

bool WrapperLauncher::launch(const LaunchSpec& spec, ProcResult* res) {
    LaunchSpec wrapped = spec;
    wrapped.argv.clear();
    wrapped.argv.reserve(prefix_.size() + spec.argv.size());
    wrapped.argv.insert(wrapped.argv.end(), prefix_.begin(), prefix_.end());
    wrapped.argv.insert(wrapped.argv.end(), spec.argv.begin(), spec.argv.end());
    return proc_run_capture(wrapped, res);
}

std::unique_ptr<ILauncher> make_launcher(const std::string& wrapper_cmd) {
    auto toks = split_argv_quoted(wrapper_cmd);
    if (toks.empty()) return std::make_unique<DirectLauncher>();
    return std::make_unique<WrapperLauncher>(std::move(toks));
}

} // namespace execq
