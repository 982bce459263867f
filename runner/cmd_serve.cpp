#include "cmd_serve.h"
#include "runner_utils.h"
#include "serve_http.h"
#include "services.h"

#include "execq/serialization.h"
#include "execq/util.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

#include <poll.h>

using namespace execq;

namespace {

const int kMaxHttpConns = 32;
const std::string kRunPrefix = "/api/execute/";

std::string detail_json(const std::string& detail) {
    JsonDoc d(json_object_new_object());
    json_object_object_add(d.root, "detail", json_new_string(detail));
    return json_dump(d.root);
}

std::string stats_json(const Services& svc) {
    BackendStats st = svc.backend->stats();
    JsonDoc d(json_object_new_object());
    json_object_object_add(d.root, "backend", json_new_string(svc.backend->name()));
    json_object_object_add(d.root, "depth", json_object_new_int64((int64_t)st.depth));
    json_object_object_add(d.root, "in_flight", json_object_new_int64((int64_t)st.in_flight));
    json_object_object_add(d.root, "processed", json_object_new_int64((int64_t)st.processed));
    json_object_object_add(d.root, "rejected", json_object_new_int64((int64_t)st.rejected));
    json_object_object_add(d.root, "max_concurrent", json_object_new_int64((int64_t)svc.cfg.max_concurrent));
    json_object_object_add(d.root, "queue_max", json_object_new_int64((int64_t)svc.cfg.queue_max));
    return json_dump(d.root);
}

void handle_submit(int cfd, Services& svc, const std::string& body) {
    ExecRequest req;
    std::string perr;
    if (!request_from_json(body, &req, &perr)) {
        send_json(cfd, 400, detail_json(perr));
        return;
    }

    SubmitResult sr = svc.admission->submit(req.attempt_id, req);
    JsonDoc d(json_object_new_object());
    switch (sr.kind) {
    case SubmitKind::ACCEPTED:
        json_object_object_add(d.root, "run_id", json_object_new_int64(sr.run_id));
        json_object_object_add(d.root, "status", json_object_new_string("queued"));
        json_object_object_add(d.root, "position", json_object_new_int64((int64_t)sr.queue_position));
        json_object_object_add(d.root, "message", json_new_string(sr.message));
        send_json(cfd, 202, json_dump(d.root));
        return;
    case SubmitKind::CONFLICT:
        json_object_object_add(d.root, "detail", json_new_string(sr.message));
        json_object_object_add(d.root, "run_id", json_object_new_int64(sr.run_id));
        send_json(cfd, 409, json_dump(d.root));
        return;
    case SubmitKind::RATE_LIMITED: {
        json_object_object_add(d.root, "detail", json_new_string(sr.message));
        json_object_object_add(d.root, "retry_after_ms", json_object_new_int64(sr.retry_after_ms));
        const int64_t secs = (sr.retry_after_ms + 999) / 1000;
        send_json(cfd, 429, json_dump(d.root), "Retry-After: " + std::to_string(secs) + "\r\n");
        return;
    }
    case SubmitKind::OVERLOADED:
        json_object_object_add(d.root, "detail", json_new_string(sr.message));
        if (sr.run_id > 0) {
            json_object_object_add(d.root, "run_id", json_object_new_int64(sr.run_id));
        } else {
            json_object_object_add(d.root, "run_id", nullptr);
        }
        send_json(cfd, 503, json_dump(d.root));
        return;
    case SubmitKind::INVALID:
        send_json(cfd, 400, detail_json(sr.message));
        return;
    }
    send_json(cfd, 500, detail_json("unexpected admission result"));
}

void handle_poll(int cfd, Services& svc, const std::string& head, const std::string& id_text) {
    RunId run_id = 0;
    if (!parse_id_strict(id_text, &run_id)) {
        send_json(cfd, 404, detail_json("Run not found"));
        return;
    }
    std::optional<AttemptId> viewer;
    std::string hdr = header_value_ci(head, "x-attempt-id");
    if (!hdr.empty()) {
        AttemptId a = 0;
        if (!parse_id_strict(hdr, &a)) {
            send_json(cfd, 400, detail_json("X-Attempt-Id must be a positive integer"));
            return;
        }
        viewer = a;
    }

    PollResult pr = svc.poller->get(run_id, viewer);
    switch (pr.kind) {
    case PollKind::FOUND:
        send_json(cfd, 200, pr.view_json);
        return;
    case PollKind::NOT_FOUND:
        send_json(cfd, 404, detail_json("Run not found"));
        return;
    case PollKind::UNAUTHORIZED:
        send_json(cfd, 403, detail_json("Not authorized to view this run"));
        return;
    }
}

struct ConnThread {
    std::thread t;
    std::shared_ptr<std::atomic<bool>> done;
};

} // namespace

int cmd_serve(int argc, char** argv) {
    // Writing to a disconnected client must not kill the server.
    ::signal(SIGPIPE, SIG_IGN);
    install_stop_signals();

    apply_profile_defaults(detect_profile());
    ExecConfig cfg = load_config_from_env();

    const std::string host = arg_value(argc, argv, 2, "--host", "127.0.0.1");
    const int port = std::atoi(arg_value(argc, argv, 2, "--port", "8080").c_str());
    const int requested = std::atoi(arg_value(argc, argv, 2, "--workers", std::to_string(cfg.workers)).c_str());
    const int workers = serve_worker_count(cfg, requested);
    if (requested <= 0 && workers == 1) {
        std::cerr << "[serve] the in-process backend needs at least one worker; using 1\n";
    }
    cfg.workers = workers;

    Services svc;
    std::string err = build_services(cfg, &svc);
    if (!err.empty()) {
        std::cerr << "[serve] startup failed: " << err << "\n";
        return 2;
    }

    // Create the socket before workers start so a bind failure leaves no threads behind.
    int sfd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sfd < 0) { std::cerr << "[serve] socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "[serve] bad host " << host << "\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "[serve] bind " << host << ":" << port << " failed\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "[serve] listen failed\n";
        ::close(sfd);
        return 2;
    }

    ReconcileReport rep = svc.reconciler->sweep(now_ms());
    if (rep.queued_failed + rep.running_failed + rep.messages_removed > 0) {
        std::cerr << "[reconcile] startup: queued_failed=" << rep.queued_failed
                  << " running_failed=" << rep.running_failed
                  << " messages_removed=" << rep.messages_removed << "\n";
    }
    if (workers > 0) svc.backend->start(workers);

    if (cfg.api_token.empty()) {
        std::cerr << "[serve] EXECQ_API_TOKEN not set: /api/* is unauthenticated and /shutdown is disabled\n";
    }
    std::cerr << "[serve] http://" << host << ":" << port << " workers=" << workers << "\n";

    const size_t max_body = cfg.max_request_bytes * 2 + 64 * 1024;
    std::atomic<int> active_conns{0};
    std::vector<ConnThread> conns;
    int64_t next_sweep = steady_ms() + cfg.reconcile_interval_ms;
    const bool periodic_sweep = cfg.queue_backend != "spool" && cfg.reconcile_interval_ms > 0;

    while (!stop_requested()) {
        for (auto it = conns.begin(); it != conns.end();) {
            if (it->done->load()) {
                it->t.join();
                it = conns.erase(it);
            } else {
                ++it;
            }
        }
        if (periodic_sweep && steady_ms() >= next_sweep) {
            svc.reconciler->sweep(now_ms());
            next_sweep = steady_ms() + cfg.reconcile_interval_ms;
        }

        pollfd pfd{sfd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 200);
        if (pr <= 0) continue;

        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept4(sfd, (sockaddr*)&caddr, &clen, SOCK_CLOEXEC);
        if (cfd < 0) continue;
        if (active_conns.load() >= kMaxHttpConns) {
            send_json(cfd, 503, detail_json("too many connections"));
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, 10);

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([&svc, &active_conns, &cfg, cfd, max_body, done]() {
            struct ConnGuard {
                int fd;
                std::atomic<int>& c;
                std::atomic<bool>& done;
                ~ConnGuard() {
                    ::close(fd);
                    c.fetch_sub(1);
                    done.store(true);
                }
            } cg{cfd, active_conns, *done};

            std::string head, body;
            HttpReadStatus rs = read_http_request(cfd, head, body, max_body);
            if (rs == HttpReadStatus::CLOSED) return;
            if (rs == HttpReadStatus::TOO_LARGE) {
                send_json(cfd, 413, detail_json("request body too large"));
                return;
            }
            if (rs == HttpReadStatus::BAD_REQUEST) {
                send_json(cfd, 400, detail_json("malformed HTTP request"));
                return;
            }

            std::istringstream iss(head);
            std::string method, path, ver;
            iss >> method >> path >> ver;
            auto q = path.find('?');
            if (q != std::string::npos) path.resize(q);

            try {
                if (path == "/health") {
                    if (method != "GET") { send_json(cfd, 405, detail_json("method not allowed")); return; }
                    send_json(cfd, 200, "{\"ok\":true,\"backend\":" + json_quote(svc.backend->name()) + "}");
                    return;
                }
                if (path == "/stats") {
                    if (method != "GET") { send_json(cfd, 405, detail_json("method not allowed")); return; }
                    send_json(cfd, 200, stats_json(svc));
                    return;
                }
                if (path == "/shutdown") {
                    if (method != "POST") { send_json(cfd, 405, detail_json("method not allowed")); return; }
                    // Fail closed: without a configured token nobody may stop the server remotely.
                    if (cfg.api_token.empty()) {
                        send_json(cfd, 403, detail_json("shutdown disabled: no auth configured"));
                        return;
                    }
                    if (!api_token_ok(head, cfg.api_token)) {
                        send_json(cfd, 401, detail_json("unauthorized"));
                        return;
                    }
                    send_json(cfd, 200, "{\"ok\":true,\"shutting_down\":true}");
                    request_stop();
                    return;
                }
                if (path == "/api/execute" || path.rfind(kRunPrefix, 0) == 0) {
                    if (!api_token_ok(head, cfg.api_token)) {
                        send_json(cfd, 401, detail_json("unauthorized"));
                        return;
                    }
                    if (path == "/api/execute") {
                        if (method != "POST") { send_json(cfd, 405, detail_json("method not allowed")); return; }
                        handle_submit(cfd, svc, body);
                        return;
                    }
                    if (method != "GET") { send_json(cfd, 405, detail_json("method not allowed")); return; }
                    handle_poll(cfd, svc, head, path.substr(kRunPrefix.size()));
                    return;
                }
                send_json(cfd, 404, detail_json("not found"));
            } catch (const std::exception& e) {
                std::cerr << "[serve] " << method << " " << path << " failed: " << e.what() << "\n";
                send_json(cfd, 500, detail_json("internal error"));
            }
        });
        conns.push_back(ConnThread{std::move(t), done});
    }

    std::cerr << "[serve] stopping: draining connections\n";
    ::close(sfd);
    for (auto& c : conns) {
        if (c.t.joinable()) c.t.join();
    }
    conns.clear();

    svc.backend->shutdown();
    BackendStats st = svc.backend->stats();
    std::cerr << "[serve] stopped processed=" << st.processed << " rejected=" << st.rejected << "\n";
    return 0;
}
