#include "execq/spool_queue.h"
#include "execq/reconciler.h"
#include "execq/serialization.h"
#include "execq/util.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <iostream>

#include <signal.h>
#include <unistd.h>

namespace execq {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

std::vector<fs::path> list_messages(const fs::path& inbox) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(inbox, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string fn = it->path().filename().string();
        RunId id = 0;
        if (!parse_spool_message_name(fn, &id, nullptr)) continue;
        if (!ends_with(fn, ".json")) continue;
        out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string host_token(const std::string& raw) {
    std::string out;
    for (char c : raw) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
        out.push_back(ok ? c : '-');
    }
    if (out.size() > 64) out.resize(64);
    return out.empty() ? "localhost" : out;
}

bool process_alive(long pid) {
    if (pid <= 0) return false;
    if (::kill((pid_t)pid, 0) == 0) return true;
    return errno == EPERM;
}

} // namespace

std::string spool_message_name(int64_t enqueued_ms, RunId run_id) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%013lld-%019lld.json", (long long)enqueued_ms, (long long)run_id);
    return buf;
}

bool parse_spool_message_name(const std::string& name, RunId* run_id, long* owner_pid, std::string* owner_host) {
    // <ms>-<id>.json[.[<host>.]<pid>.processing]
    size_t dash = name.find('-');
    size_t dot = name.find(".json");
    if (dash == std::string::npos || dot == std::string::npos || dot < dash) return false;
    const std::string ms = name.substr(0, dash);
    const std::string id = name.substr(dash + 1, dot - dash - 1);
    if (!all_digits(ms) || !all_digits(id) || id.size() > 19) return false;
    if (id.size() == 19 && id > "9223372036854775807") return false;

    std::string rest = name.substr(dot + 5);
    long pid = 0;
    std::string host;
    if (!rest.empty()) {
        const std::string suf = ".processing";
        if (rest[0] != '.' || !ends_with(rest, suf)) return false;
        std::string owner = rest.substr(1, rest.size() - 1 - suf.size());
        size_t sep = owner.rfind('.');
        if (sep != std::string::npos) {
            host = owner.substr(0, sep);
            owner = owner.substr(sep + 1);
            if (host.empty() || host.find('.') != std::string::npos) return false;
        }
        if (!all_digits(owner) || owner.size() > 9) return false;
        pid = std::stol(owner);
    }
    if (run_id) *run_id = std::stoll(id);
    if (owner_pid) *owner_pid = pid;
    if (owner_host) *owner_host = host;
    return true;
}

std::string local_host_id() {
    char buf[256] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return "localhost";
    return host_token(buf);
}

SpoolQueue::SpoolQueue(RunProcessor& processor, SpoolOptions opts, Reconciler* reconciler)
    : processor_(processor),
      opts_(std::move(opts)),
      reconciler_(reconciler),
      inbox_(opts_.dir / "inbox"),
      processing_(opts_.dir / "processing"),
      host_(opts_.host.empty() ? local_host_id() : host_token(opts_.host)),
      limiter_(opts_.max_concurrent) {}

SpoolQueue::~SpoolQueue() {
    shutdown();
}

std::string SpoolQueue::open() {
    std::error_code ec;
    fs::create_directories(inbox_, ec);
    if (ec) return "create " + inbox_.string() + ": " + ec.message();
    fs::create_directories(processing_, ec);
    if (ec) return "create " + processing_.string() + ": " + ec.message();
    size_t n = recover_orphans();
    if (n > 0) std::cerr << "[spool] recovered " << n << " orphaned messages\n";
    return "";
}

size_t SpoolQueue::recover_orphans() {
    size_t recovered = 0;
    const long self = (long)::getpid();
    std::error_code ec;
    for (fs::directory_iterator it(processing_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string fn = it->path().filename().string();
        RunId run_id = 0;
        long owner = 0;
        std::string owner_host;
        if (!parse_spool_message_name(fn, &run_id, &owner, &owner_host) || owner == 0) continue;
        // another machine's pid: liveness cannot be checked from here
        if (!owner_host.empty() && owner_host != host_) continue;
        if (owner == self || process_alive(owner)) continue;

        const std::string base = fn.substr(0, fn.find(".json") + 5);
        auto run = processor_.store().get(run_id);
        std::error_code ec2;
        if (run && run->status == RunStatus::QUEUED) {
            fs::rename(it->path(), inbox_ / base, ec2);
            if (ec2) {
                std::cerr << "[spool] requeue " << fn << " failed: " << ec2.message() << "\n";
                continue;
            }
        } else {
            if (run && run->status == RunStatus::RUNNING) {
                (void)processor_.fail_run(run_id, "Run abandoned: worker exited during execution");
            }
            fs::remove(it->path(), ec2);
        }
        recovered++;
    }
    return recovered;
}

EnqueueResult SpoolQueue::submit(Job job) {
    EnqueueResult r;
    size_t depth = list_messages(inbox_).size();
    if (depth >= opts_.capacity) {
        rejected_++;
        std::cerr << "[spool] inbox full (" << depth << "), rejecting run " << job.run_id << "\n";
        r.message = "Execution queue overloaded";
        return r;
    }

    JsonDoc msg(json_object_new_object());
    json_object_object_add(msg.root, "run_id", json_object_new_int64(job.run_id));
    const int64_t ts = job.enqueued_ms > 0 ? job.enqueued_ms : now_ms();
    std::string err = write_atomic_file(inbox_ / spool_message_name(ts, job.run_id), json_dump(msg.root));
    if (!err.empty()) {
        rejected_++;
        std::cerr << "[spool] enqueue run " << job.run_id << " failed: " << err << "\n";
        r.message = "Execution queue unavailable: " + err;
        return r;
    }
    r.accepted = true;
    r.position = depth + 1;
    r.message = "Job enqueued (position: " + std::to_string(r.position) + ")";
    return r;
}

size_t SpoolQueue::position() const {
    return list_messages(inbox_).size();
}

std::optional<fs::path> SpoolQueue::claim_next() {
    const std::string suffix = "." + host_ + "." + std::to_string((long)::getpid()) + ".processing";
    for (const auto& p : list_messages(inbox_)) {
        fs::path dst = processing_ / (p.filename().string() + suffix);
        std::error_code ec;
        fs::rename(p, dst, ec);
        if (!ec) return dst;
        // lost the race to another worker; try the next message
    }
    return std::nullopt;
}

void SpoolQueue::handle_claimed(const fs::path& claimed, int wid) {
    RunId run_id = 0;
    JsonDoc msg = json_parse(slurp_file(claimed));
    if (!msg || !json_get_int64(msg.root, "run_id", &run_id)) {
        if (!parse_spool_message_name(claimed.filename().string(), &run_id, nullptr)) {
            std::cerr << "[spool] dropping unreadable message " << claimed.filename().string() << "\n";
            std::error_code ec;
            fs::remove(claimed, ec);
            return;
        }
    }

    try {
        RunStatus st = processor_.process_stored(run_id);
        std::cerr << "[worker " << wid << "] run " << run_id << " -> " << run_status_name(st) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[worker " << wid << "] run " << run_id << " failed: " << e.what() << "\n";
        (void)processor_.fail_run(run_id, std::string("Internal execution error: ") + e.what());
    }
    processed_++;

    std::error_code ec;
    fs::remove(claimed, ec);
    if (ec) std::cerr << "[spool] remove " << claimed.string() << ": " << ec.message() << "\n";
}

bool SpoolQueue::run_once() {
    Limiter::Slot slot(limiter_);
    auto claimed = claim_next();
    if (!claimed) return false;
    handle_claimed(*claimed, 0);
    return true;
}

void SpoolQueue::worker_loop(int wid) {
    while (true) {
        {
            std::lock_guard<std::mutex> lk(lifecycle_mu_);
            if (stopping_) break;
        }
        bool did = false;
        {
            // Hold a slot before claiming so a message this process cannot run
            // yet stays visible to other workers.
            Limiter::Slot slot(limiter_);
            if (auto claimed = claim_next()) {
                handle_claimed(*claimed, wid);
                did = true;
            }
        }
        if (did) continue;
        std::unique_lock<std::mutex> lk(lifecycle_mu_);
        stop_cv_.wait_for(lk, std::chrono::milliseconds(opts_.scan_ms), [&] { return stopping_; });
    }
}

void SpoolQueue::reconcile_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lk(lifecycle_mu_);
            if (stop_cv_.wait_for(lk, std::chrono::milliseconds(opts_.reconcile_interval_ms),
                                  [&] { return stopping_; })) {
                break;
            }
        }
        (void)recover_orphans();
        if (reconciler_) {
            ReconcileReport rep = reconciler_->sweep(now_ms());
            if (rep.queued_failed + rep.running_failed + rep.messages_removed > 0) {
                std::cerr << "[reconcile] failed " << rep.queued_failed << " queued, " << rep.running_failed
                          << " running; removed " << rep.messages_removed << " stale messages\n";
            }
        }
    }
}

void SpoolQueue::start(int workers) {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (started_) {
        std::cerr << "[spool] workers already running\n";
        return;
    }
    if (stopping_) {
        std::cerr << "[spool] cannot restart after shutdown\n";
        return;
    }
    started_ = true;
    if (workers < 1) workers = 1;
    workers_.reserve((size_t)workers);
    for (int i = 0; i < workers; i++) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
    if (opts_.reconcile_interval_ms > 0) {
        reconcile_thread_ = std::thread([this] { reconcile_loop(); });
    }
    std::cerr << "[spool] started " << workers << " workers on " << opts_.dir.string()
              << " (max_concurrent=" << limiter_.slots() << ")\n";
}

void SpoolQueue::shutdown() {
    std::vector<std::thread> workers;
    std::thread reconcile;
    {
        std::lock_guard<std::mutex> lk(lifecycle_mu_);
        if (stopping_) return;
        stopping_ = true;
        workers.swap(workers_);
        reconcile.swap(reconcile_thread_);
    }
    stop_cv_.notify_all();
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
    if (reconcile.joinable()) reconcile.join();
    // Inbox messages stay durable for the next worker to claim.
    std::cerr << "[spool] shut down (" << position() << " messages left in inbox)\n";
}

bool SpoolQueue::holds(RunId run_id) const {
    for (const auto& p : list_messages(inbox_)) {
        RunId id = 0;
        if (parse_spool_message_name(p.filename().string(), &id, nullptr) && id == run_id) return true;
    }
    return false;
}

BackendStats SpoolQueue::stats() const {
    BackendStats s;
    s.depth = position();
    s.in_flight = limiter_.in_use();
    s.processed = processed_.load();
    s.rejected = rejected_.load();
    return s;
}

} // namespace execq
