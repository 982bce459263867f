#pragma once

// Minimal HTTP/1.1 helpers for the serve command.

#include <cstdint>
#include <sstream>
#include <string>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include "execq/hash.h"

namespace execq {

// Bounds how long a slow client can hold a connection thread.
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

enum class HttpReadStatus { OK, CLOSED, BAD_REQUEST, TOO_LARGE };

// Reads one request. A Content-Length above max_body is refused before the
// body is read.
inline HttpReadStatus read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    std::string buf;
    buf.resize(8192);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, &buf[0], buf.size(), 0);
        if (n <= 0) return HttpReadStatus::CLOSED;
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024) return HttpReadStatus::BAD_REQUEST;
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    int cl_count = 0;
    std::istringstream iss(head);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string low = line;
        for (char& c : low) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        if (low.rfind("content-length:", 0) != 0) continue;
        if (++cl_count > 1) return HttpReadStatus::BAD_REQUEST;
        std::string v = line.substr(15);
        while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
        if (v.empty() || v.size() > 18) return HttpReadStatus::BAD_REQUEST;
        for (char c : v) {
            if (c < '0' || c > '9') return HttpReadStatus::BAD_REQUEST;
            cl = cl * 10 + (size_t)(c - '0');
        }
    }

    if (cl > max_body) return HttpReadStatus::TOO_LARGE;

    body = rest;
    while (body.size() < cl) {
        ssize_t n = ::recv(fd, &buf[0], buf.size(), 0);
        if (n <= 0) return HttpReadStatus::CLOSED;
        body.append(buf.data(), (size_t)n);
    }
    if (body.size() > cl) body.resize(cl);
    return HttpReadStatus::OK;
}

inline const char* http_reason(int code) {
    switch (code) {
    case 200: return "OK";
    case 202: return "Accepted";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    }
    return "Unknown";
}

inline void send_json(int fd, int code, const std::string& json, const std::string& extra_headers = "") {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << http_reason(code) << "\r\n";
    oss << "Content-Type: application/json\r\n";
    oss << "Content-Length: " << json.size() << "\r\n";
    oss << extra_headers;
    oss << "Connection: close\r\n\r\n";
    oss << json;
    auto s = oss.str();
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

inline std::string header_value_ci(const std::string& head, const std::string& key_lower) {
    std::istringstream iss(head);
    std::string line;
    std::getline(iss, line);
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c);
        for (char& ch : k) if (ch >= 'A' && ch <= 'Z') ch = (char)(ch - 'A' + 'a');
        if (k == key_lower) {
            std::string v = line.substr(c + 1);
            while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
            while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
            return v;
        }
    }
    return "";
}

// Empty expected token means auth is off.
inline bool api_token_ok(const std::string& head, const std::string& expected_token) {
    if (expected_token.empty()) return true;
    std::string x = header_value_ci(head, "x-api-token");
    if (!x.empty() && constant_time_eq(x, expected_token)) return true;
    std::string auth = header_value_ci(head, "authorization");
    const std::string pfx = "Bearer ";
    if (auth.rfind(pfx, 0) == 0) {
        return constant_time_eq(auth.substr(pfx.size()), expected_token);
    }
    return false;
}

// Digits-only positive int64. Rejects signs, spaces and overflow.
inline bool parse_id_strict(const std::string& s, int64_t* out) {
    if (s.empty() || s.size() > 18) return false;
    int64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    if (v <= 0) return false;
    *out = v;
    return true;
}

} // namespace execq
