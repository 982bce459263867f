#include "test_common.h"

#include "execq/run_store.h"
#include "execq/serialization.h"

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace execq;
namespace fs = std::filesystem;

static Run new_run(AttemptId attempt, int64_t created_ms) {
    Run r;
    r.attempt_id = attempt;
    r.status = RunStatus::QUEUED;
    r.created_ms = created_ms;
    r.request_json = "{\"attempt_id\":" + std::to_string(attempt) + ",\"language\":\"c\",\"files\":[]}";
    r.snapshot_hash = "abc";
    return r;
}

static void exercise_store(IRunStore& s, const std::string& label) {
    Run a = new_run(7, 1000);
    expect_true(s.create(a).empty(), label + ": create a");
    Run b = new_run(7, 2000);
    expect_true(s.create(b).empty(), label + ": create b");
    Run other = new_run(8, 3000);
    expect_true(s.create(other).empty(), label + ": create other");
    expect_true(a.id > 0 && b.id > a.id && other.id > b.id, label + ": ids increase");

    auto got = s.get(a.id);
    expect_true(got.has_value(), label + ": get a");
    expect_true(got->request_json == a.request_json, label + ": request_json persisted");
    expect_true(!s.get(99999).has_value(), label + ": missing run");

    auto latest = s.latest_created(7);
    expect_true(latest && latest->id == b.id, label + ": latest_created picks newest");
    expect_true(!s.latest_created(12345).has_value(), label + ": no runs for unknown attempt");

    auto act = s.find_active(7);
    expect_true(act.has_value(), label + ": attempt 7 has an active run");

    // queued -> running -> success
    Run r = *s.get(a.id);
    r.status = RunStatus::RUNNING;
    r.started_ms = 1500;
    expect_true(s.update(r).empty(), label + ": queued -> running");
    r.status = RunStatus::SUCCESS;
    r.finished_ms = 1700;
    r.stdout_data = "ok\n";
    r.exit_code = 0;
    r.run_time_sec = 0.2;
    expect_true(s.update(r).empty(), label + ": running -> success");

    Run back = *s.get(a.id);
    expect_true(back.status == RunStatus::SUCCESS, label + ": status persisted");
    expect_true(back.stdout_data && *back.stdout_data == "ok\n", label + ": stdout persisted");
    expect_true(back.exit_code && *back.exit_code == 0, label + ": exit code persisted");

    // Forward-only and set-once
    Run bad = back;
    bad.status = RunStatus::RUNNING;
    expect_true(!s.update(bad).empty(), label + ": success -> running rejected");
    bad = back;
    bad.finished_ms = 9999;
    expect_true(!s.update(bad).empty(), label + ": finished_at is set once");
    bad = back;
    bad.request_json = "{}";
    expect_true(!s.update(bad).empty(), label + ": request_json immutable");
    bad = back;
    bad.attempt_id = 8;
    expect_true(!s.update(bad).empty(), label + ": attempt immutable");

    Run qb = *s.get(b.id);
    qb.status = RunStatus::SUCCESS;
    expect_true(!s.update(qb).empty(), label + ": queued -> success rejected");
    qb.status = RunStatus::ERROR;
    qb.finished_ms = 2100;
    expect_true(s.update(qb).empty(), label + ": queued -> error allowed");

    expect_true(!s.find_active(7).has_value(), label + ": attempt 7 no longer active");
    auto nonterm = s.list_nonterminal();
    expect_eq_ll((long long)nonterm.size(), 1, label + ": one nonterminal run left");
    expect_true(nonterm[0].id == other.id, label + ": the other attempt's run");

    Run ghost = new_run(9, 1);
    ghost.id = 424242;
    expect_true(!s.update(ghost).empty(), label + ": update of unknown run fails");
}

int main() {
    // State machine
    expect_true(run_status_can_transition(RunStatus::QUEUED, RunStatus::RUNNING), "queued->running");
    expect_true(run_status_can_transition(RunStatus::QUEUED, RunStatus::CANCELLED), "queued->cancelled reserved edge");
    expect_true(!run_status_can_transition(RunStatus::RUNNING, RunStatus::QUEUED), "no going back");
    expect_true(!run_status_can_transition(RunStatus::TIMEOUT, RunStatus::ERROR), "terminal has no exits");
    expect_true(run_status_terminal(RunStatus::COMPILATION_ERROR), "compilation_error terminal");
    expect_true(!run_status_terminal(RunStatus::RUNNING), "running not terminal");
    expect_true(run_status_from_name("compilation_error") == RunStatus::COMPILATION_ERROR, "name round trip");
    expect_true(!run_status_from_name("done").has_value(), "unknown name");

    MemoryRunStore mem;
    exercise_store(mem, "memory");

    fs::path dir = fs::temp_directory_path() / ("execq_test_store_" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(dir, ec);
    {
        FileRunStore fstore(dir);
        expect_true(fstore.open().empty(), "file store open");
        exercise_store(fstore, "file");

        // Documents are plain JSON and survive a reopen.
        expect_true(fs::exists(dir / "runs" / "1.json"), "run document on disk");
        expect_true(fs::exists(dir / "attempts" / "7" / "1"), "attempt marker on disk");

        // Stray temp files in the index are ignored.
        std::ofstream(dir / "attempts" / "7" / "2.tmp.1.2") << "";
        expect_true(!fstore.find_active(7).has_value(), "temp file ignored by index scan");
    }
    {
        FileRunStore reopened(dir);
        expect_true(reopened.open().empty(), "reopen");
        auto r = reopened.get(1);
        expect_true(r && r->status == RunStatus::SUCCESS, "state survives reopen");
        Run next = new_run(7, 5000);
        expect_true(reopened.create(next).empty(), "create after reopen");
        expect_eq_ll(next.id, 4, "id counter continues after reopen");
    }
    fs::remove_all(dir, ec);

    std::cout << "test_run_store: ALL PASSED\n";
    return 0;
}
