#pragma once

#include "types.h"

#include <filesystem>
#include <mutex>
#include <string>

namespace execq {

// Append-only JSONL audit trail of Run lifecycle events (SUBMIT, REJECT, START,
// FINISH, RECONCILE). Each line carries chain_prev/chain_hash where
// chain_hash = SHA256(chain_prev || canonical record). Appends are serialized
// with flock so several processes sharing a data dir extend one chain.
class RunEventLog {
public:
    explicit RunEventLog(std::filesystem::path path);
    ~RunEventLog();

    RunEventLog(const RunEventLog&) = delete;
    RunEventLog& operator=(const RunEventLog&) = delete;

    std::string open();

    // payload_json must be a JSON object; anything else is stored as a string.
    void event(const std::string& name, RunId run_id, AttemptId attempt_id,
               const std::string& payload_json = "{}");

    const std::filesystem::path& path() const { return path_; }

private:
    std::string last_chain_hash() const;

    std::filesystem::path path_;
    int fd_{-1};
    std::mutex mu_;
};

// Recomputes every chain link. Returns false and sets *err at the first break.
bool verify_event_chain(const std::filesystem::path& path, size_t* lines, std::string* err);

} // namespace execq
