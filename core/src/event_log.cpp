#include "execq/event_log.h"
#include "execq/hash.h"
#include "execq/serialization.h"
#include "execq/util.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace execq {

namespace {

const std::string kGenesis(64, '0');

json_object* payload_object(const std::string& payload_json) {
    JsonDoc d = json_parse(payload_json);
    if (d && json_object_is_type(d.root, json_type_object)) return d.release();
    return json_new_string(payload_json);
}

// Builds the record without chain fields; the line adds them.
json_object* build_record(const std::string& name, RunId run_id, AttemptId attempt_id,
                          const std::string& payload_json, const std::string& ts) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_new_string(name));
    json_object_object_add(rec, "run_id", json_object_new_int64(run_id));
    json_object_object_add(rec, "attempt_id", json_object_new_int64(attempt_id));
    json_object_object_add(rec, "payload", payload_object(payload_json));
    json_object_object_add(rec, "pid", json_object_new_int((int)::getpid()));
    json_object_object_add(rec, "ts", json_new_string(ts));
    return rec;
}

} // namespace

RunEventLog::RunEventLog(std::filesystem::path path) : path_(std::move(path)) {}

RunEventLog::~RunEventLog() {
    if (fd_ >= 0) ::close(fd_);
}

std::string RunEventLog::open() {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) return "create " + path_.parent_path().string() + ": " + ec.message();
    }
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return "open " + path_.string() + ": " + std::strerror(errno);
    return "";
}

std::string RunEventLog::last_chain_hash() const {
    // Lines are small; the tail window always holds the last complete one.
    const off_t kWindow = 64 * 1024;
    int rfd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (rfd < 0) return kGenesis;
    struct stat st{};
    if (fstat(rfd, &st) != 0 || st.st_size == 0) {
        ::close(rfd);
        return kGenesis;
    }
    off_t start = st.st_size > kWindow ? st.st_size - kWindow : 0;
    std::string tail((size_t)(st.st_size - start), '\0');
    ssize_t n = pread(rfd, &tail[0], tail.size(), start);
    ::close(rfd);
    if (n <= 0) return kGenesis;
    tail.resize((size_t)n);

    while (!tail.empty() && tail.back() == '\n') tail.pop_back();
    size_t nl = tail.rfind('\n');
    std::string last = (nl == std::string::npos) ? tail : tail.substr(nl + 1);

    JsonDoc d = json_parse(last);
    std::string h;
    if (!d || !json_get_string(d.root, "chain_hash", &h) || h.size() != 64) return kGenesis;
    return h;
}

void RunEventLog::event(const std::string& name, RunId run_id, AttemptId attempt_id,
                        const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) return;

    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        std::cerr << "[events] flock failed: " << std::strerror(errno) << "\n";
        return;
    }

    const std::string ts = iso8601_utc(now_ms());
    const std::string prev = last_chain_hash();

    JsonDoc rec(build_record(name, run_id, attempt_id, payload_json, ts));
    const std::string chain_hash = sha256_hex(prev + json_canonical(rec.root));

    json_object_object_add(rec.root, "chain_prev", json_new_string(prev));
    json_object_object_add(rec.root, "chain_hash", json_new_string(chain_hash));
    std::string line = json_canonical(rec.root) + "\n";

    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, line.data() + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[events] write failed: " << std::strerror(errno) << "\n";
            break;
        }
        off += (size_t)w;
    }
    (void)::flock(fd_, LOCK_UN);
}

bool verify_event_chain(const std::filesystem::path& path, size_t* lines, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path.string();
        return false;
    }
    std::string prev = kGenesis;
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        n++;
        JsonDoc d = json_parse(line);
        std::string got_prev, got_hash;
        if (!d || !json_get_string(d.root, "chain_prev", &got_prev) ||
            !json_get_string(d.root, "chain_hash", &got_hash)) {
            if (err) *err = "line " + std::to_string(n) + ": malformed";
            return false;
        }
        if (got_prev != prev) {
            if (err) *err = "line " + std::to_string(n) + ": chain_prev mismatch";
            return false;
        }
        json_object_object_del(d.root, "chain_prev");
        json_object_object_del(d.root, "chain_hash");
        if (sha256_hex(prev + json_canonical(d.root)) != got_hash) {
            if (err) *err = "line " + std::to_string(n) + ": chain_hash mismatch";
            return false;
        }
        prev = got_hash;
    }
    if (lines) *lines = n;
    return true;
}

} // namespace execq
