#pragma once

#include "types.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace execq {

// Persistence collaborator for Runs. Mutating calls return an error string
// (empty on success).
class IRunStore {
public:
    virtual ~IRunStore() = default;

    // Assigns run.id and persists the new Run.
    virtual std::string create(Run& run) = 0;
    virtual std::optional<Run> get(RunId id) = 0;
    // Rejects transitions the state machine forbids and any change to request_json.
    virtual std::string update(const Run& run) = 0;

    // A Run of the attempt in queued or running, if any.
    virtual std::optional<Run> find_active(AttemptId attempt) = 0;
    // The most recently created Run of the attempt.
    virtual std::optional<Run> latest_created(AttemptId attempt) = 0;
    virtual std::vector<Run> list_nonterminal() = 0;
};

// Validation shared by every store: empty string if `next` may replace `prev`.
std::string check_run_update(const Run& prev, const Run& next);

class MemoryRunStore : public IRunStore {
public:
    std::string create(Run& run) override;
    std::optional<Run> get(RunId id) override;
    std::string update(const Run& run) override;
    std::optional<Run> find_active(AttemptId attempt) override;
    std::optional<Run> latest_created(AttemptId attempt) override;
    std::vector<Run> list_nonterminal() override;

private:
    std::mutex mu_;
    std::map<RunId, Run> runs_;
    RunId next_id_{1};
};

// Directory layout under root:
//   runs/<id>.json            one Run document, replaced atomically
//   attempts/<attempt>/<id>   empty marker per Run of an attempt
//   next_id                   last allocated id
//   store.lock                flock target serializing writers across processes
class FileRunStore : public IRunStore {
public:
    explicit FileRunStore(std::filesystem::path root);

    // Creates the directory layout. Must succeed before any other call.
    std::string open();

    std::string create(Run& run) override;
    std::optional<Run> get(RunId id) override;
    std::string update(const Run& run) override;
    std::optional<Run> find_active(AttemptId attempt) override;
    std::optional<Run> latest_created(AttemptId attempt) override;
    std::vector<Run> list_nonterminal() override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path run_path(RunId id) const;
    std::vector<Run> runs_of_attempt(AttemptId attempt);

    std::filesystem::path root_;
};

} // namespace execq
