#include "execq/run_store.h"
#include "execq/serialization.h"
#include "execq/util.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace execq {

namespace fs = std::filesystem;

namespace {

bool newer(const Run& a, const Run& b) {
    if (a.created_ms != b.created_ms) return a.created_ms > b.created_ms;
    return a.id > b.id;
}

bool parse_run_id(const std::string& s, RunId* out) {
    if (s.empty() || s.size() > 18) return false;
    RunId v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    *out = v;
    return true;
}

bool active(const Run& r) {
    return r.status == RunStatus::QUEUED || r.status == RunStatus::RUNNING;
}

// Exclusive flock held for the object's lifetime.
class FileLock {
public:
    explicit FileLock(const fs::path& p) {
        fd_ = ::open(p.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            error_ = "open " + p.string() + ": " + std::strerror(errno);
            return;
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            error_ = "flock " + p.string() + ": " + std::strerror(errno);
            ::close(fd_);
            fd_ = -1;
            return;
        }
    }
    ~FileLock() {
        if (fd_ >= 0) {
            (void)::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& error() const { return error_; }

private:
    int fd_{-1};
    std::string error_;
};

} // namespace

std::string check_run_update(const Run& prev, const Run& next) {
    if (prev.id != next.id) return "run id mismatch";
    if (prev.attempt_id != next.attempt_id) return "attempt_id is immutable";
    if (prev.request_json != next.request_json) return "request_json is immutable";
    if (!run_status_can_transition(prev.status, next.status)) {
        return std::string("illegal transition ") + run_status_name(prev.status) + " -> " +
               run_status_name(next.status);
    }
    if (prev.started_ms && next.started_ms != prev.started_ms) return "started_at already set";
    if (prev.finished_ms && next.finished_ms != prev.finished_ms) return "finished_at already set";
    return "";
}

// --- MemoryRunStore ---

std::string MemoryRunStore::create(Run& run) {
    std::lock_guard<std::mutex> lk(mu_);
    run.id = next_id_++;
    runs_[run.id] = run;
    return "";
}

std::optional<Run> MemoryRunStore::get(RunId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end()) return std::nullopt;
    return it->second;
}

std::string MemoryRunStore::update(const Run& run) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(run.id);
    if (it == runs_.end()) return "run " + std::to_string(run.id) + " not found";
    std::string err = check_run_update(it->second, run);
    if (!err.empty()) return err;
    it->second = run;
    return "";
}

std::optional<Run> MemoryRunStore::find_active(AttemptId attempt) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : runs_) {
        if (kv.second.attempt_id == attempt && active(kv.second)) return kv.second;
    }
    return std::nullopt;
}

std::optional<Run> MemoryRunStore::latest_created(AttemptId attempt) {
    std::lock_guard<std::mutex> lk(mu_);
    const Run* best = nullptr;
    for (const auto& kv : runs_) {
        if (kv.second.attempt_id != attempt) continue;
        if (!best || newer(kv.second, *best)) best = &kv.second;
    }
    if (!best) return std::nullopt;
    return *best;
}

std::vector<Run> MemoryRunStore::list_nonterminal() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Run> out;
    for (const auto& kv : runs_) {
        if (!run_status_terminal(kv.second.status)) out.push_back(kv.second);
    }
    return out;
}

// --- FileRunStore ---

FileRunStore::FileRunStore(fs::path root) : root_(std::move(root)) {}

std::string FileRunStore::open() {
    std::error_code ec;
    fs::create_directories(root_ / "runs", ec);
    if (ec) return "create " + (root_ / "runs").string() + ": " + ec.message();
    fs::create_directories(root_ / "attempts", ec);
    if (ec) return "create " + (root_ / "attempts").string() + ": " + ec.message();
    return "";
}

fs::path FileRunStore::run_path(RunId id) const {
    return root_ / "runs" / (std::to_string(id) + ".json");
}

std::string FileRunStore::create(Run& run) {
    FileLock lock(root_ / "store.lock");
    if (!lock.error().empty()) return lock.error();

    RunId last = 0;
    std::string counter = slurp_file(root_ / "next_id");
    while (!counter.empty() && (counter.back() == '\n' || counter.back() == ' ')) counter.pop_back();
    if (!counter.empty() && !parse_run_id(counter, &last)) return "corrupt id counter: " + counter;
    RunId id = last + 1;
    std::string err = write_atomic_file(root_ / "next_id", std::to_string(id) + "\n");
    if (!err.empty()) return "id counter: " + err;

    run.id = id;
    err = write_atomic_file(run_path(id), run_to_json(run));
    if (!err.empty()) return "run document: " + err;

    fs::path marker = root_ / "attempts" / std::to_string(run.attempt_id) / std::to_string(id);
    err = write_atomic_file(marker, "");
    if (!err.empty()) return "attempt index: " + err;
    return "";
}

std::optional<Run> FileRunStore::get(RunId id) {
    std::error_code ec;
    fs::path p = run_path(id);
    if (!fs::exists(p, ec)) return std::nullopt;
    Run r;
    if (!run_from_json(slurp_file(p), &r)) return std::nullopt;
    return r;
}

std::string FileRunStore::update(const Run& run) {
    FileLock lock(root_ / "store.lock");
    if (!lock.error().empty()) return lock.error();

    auto prev = get(run.id);
    if (!prev) return "run " + std::to_string(run.id) + " not found";
    std::string err = check_run_update(*prev, run);
    if (!err.empty()) return err;
    return write_atomic_file(run_path(run.id), run_to_json(run));
}

std::vector<Run> FileRunStore::runs_of_attempt(AttemptId attempt) {
    std::vector<Run> out;
    fs::path dir = root_ / "attempts" / std::to_string(attempt);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        RunId id = 0;
        // skips temp files from an interrupted marker write
        if (!parse_run_id(it->path().filename().string(), &id)) continue;
        if (auto r = get(id)) out.push_back(std::move(*r));
    }
    return out;
}

std::optional<Run> FileRunStore::find_active(AttemptId attempt) {
    for (auto& r : runs_of_attempt(attempt)) {
        if (active(r)) return r;
    }
    return std::nullopt;
}

std::optional<Run> FileRunStore::latest_created(AttemptId attempt) {
    std::optional<Run> best;
    for (auto& r : runs_of_attempt(attempt)) {
        if (!best || newer(r, *best)) best = std::move(r);
    }
    return best;
}

std::vector<Run> FileRunStore::list_nonterminal() {
    std::vector<Run> out;
    std::error_code ec;
    for (fs::directory_iterator it(root_ / "runs", ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() != ".json") continue;
        Run r;
        if (!run_from_json(slurp_file(it->path()), &r)) continue;
        if (!run_status_terminal(r.status)) out.push_back(std::move(r));
    }
    return out;
}

} // namespace execq
