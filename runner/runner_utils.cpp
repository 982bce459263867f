#include "runner_utils.h"

#include "execq/util.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>

namespace execq {

namespace {
std::atomic<bool> g_stop{false};

void on_stop_signal(int) { g_stop.store(true); }
} // namespace

void install_stop_signals() {
    g_stop.store(false);
    std::signal(SIGTERM, on_stop_signal);
    std::signal(SIGINT, on_stop_signal);
}

bool stop_requested() { return g_stop.load(); }

void request_stop() { g_stop.store(true); }

bool read_input(const std::string& path, size_t max_bytes, std::string* out, std::string* err) {
    out->clear();
    if (path == "-") {
        char rbuf[8192];
        while (std::cin.read(rbuf, sizeof(rbuf)) || std::cin.gcount()) {
            out->append(rbuf, (size_t)std::cin.gcount());
            if (out->size() > max_bytes) {
                *err = "stdin exceeds " + std::to_string(max_bytes) + " bytes";
                return false;
            }
        }
        return true;
    }
    std::error_code ec;
    auto sz = std::filesystem::file_size(path, ec);
    if (ec) {
        *err = "cannot read " + path + ": " + ec.message();
        return false;
    }
    if (sz > max_bytes) {
        *err = path + " exceeds " + std::to_string(max_bytes) + " bytes";
        return false;
    }
    *out = slurp_file(path);
    return true;
}

std::string arg_value(int argc, char** argv, int from, const std::string& flag, const std::string& defv) {
    for (int i = from; i + 1 < argc; i++) {
        if (flag == argv[i]) return argv[i + 1];
    }
    return defv;
}

bool has_flag(int argc, char** argv, int from, const std::string& flag) {
    for (int i = from; i < argc; i++) {
        if (flag == argv[i]) return true;
    }
    return false;
}

} // namespace execq
