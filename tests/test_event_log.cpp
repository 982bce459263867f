#include "test_common.h"

#include "execq/event_log.h"
#include "execq/serialization.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace execq;
namespace fs = std::filesystem;

int main() {
    fs::path dir = fs::temp_directory_path() / ("execq_test_events_" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::path p = dir / "logs" / "events.jsonl";

    {
        RunEventLog log(p);
        std::string err = log.open();
        expect_true(err.empty(), "open should create parent dirs: " + err);
        log.event("SUBMIT", 1, 10);
        log.event("START", 1, 10);
        log.event("FINISH", 1, 10, "{\"status\":\"success\",\"exit_code\":0}");
        log.event("REJECT", 0, 10, "not-json");
    }

    size_t lines = 0;
    std::string err;
    expect_true(verify_event_chain(p, &lines, &err), "chain should verify: " + err);
    expect_eq_ll((long long)lines, 4, "four events");

    // First record links to the genesis hash and carries the fields.
    {
        std::ifstream in(p);
        std::string first;
        std::getline(in, first);
        JsonDoc d = json_parse(first);
        expect_true((bool)d, "first line is JSON");
        std::string v;
        expect_true(json_get_string(d.root, "event", &v) && v == "SUBMIT", "event name");
        expect_true(json_get_string(d.root, "chain_prev", &v) && v == std::string(64, '0'), "genesis prev");
        int64_t id = 0;
        expect_true(json_get_int64(d.root, "run_id", &id) && id == 1, "run id");
        expect_true(json_get_int64(d.root, "attempt_id", &id) && id == 10, "attempt id");
    }

    // A second writer on the same file (another process sharing the data dir)
    // continues the same chain.
    {
        RunEventLog a(p), b(p);
        expect_true(a.open().empty() && b.open().empty(), "open two writers");
        std::vector<std::thread> ths;
        for (int t = 0; t < 4; t++) {
            ths.emplace_back([&, t] {
                RunEventLog& w = (t % 2) ? a : b;
                for (int i = 0; i < 25; i++) w.event("START", 100 + t, 1);
            });
        }
        for (auto& th : ths) th.join();
    }
    expect_true(verify_event_chain(p, &lines, &err), "interleaved writers keep the chain: " + err);
    expect_eq_ll((long long)lines, 104, "all events appended");

    // Tampering with any record breaks verification.
    {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        std::string all = ss.str();
        size_t pos = all.find("\"run_id\":1,");
        expect_true(pos != std::string::npos, "find a record to tamper");
        all.replace(pos, 11, "\"run_id\":2,");
        std::ofstream out(p, std::ios::trunc);
        out << all;
    }
    expect_true(!verify_event_chain(p, &lines, &err), "tampered log should fail");
    expect_true(err.find("mismatch") != std::string::npos, "error names the mismatch: " + err);

    expect_true(!verify_event_chain(dir / "missing.jsonl", &lines, &err), "missing file fails");

    fs::remove_all(dir, ec);
    std::cout << "test_event_log: ALL PASSED\n";
    return 0;
}
