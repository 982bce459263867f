#include "execq/serialization.h"
#include "execq/hash.h"

#include <algorithm>
#include <climits>
#include <sstream>

namespace execq {

namespace {

constexpr int kDumpFlags = JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE;

void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, kDumpFlags);
        break;
    }
}

void add_opt_string(json_object* o, const char* k, const std::optional<std::string>& v) {
    json_object_object_add(o, k, v ? json_new_string(*v) : nullptr);
}

void add_opt_int(json_object* o, const char* k, const std::optional<int>& v) {
    json_object_object_add(o, k, v ? json_object_new_int(*v) : nullptr);
}

void add_opt_i64(json_object* o, const char* k, const std::optional<int64_t>& v) {
    json_object_object_add(o, k, v ? json_object_new_int64(*v) : nullptr);
}

void add_opt_double(json_object* o, const char* k, const std::optional<double>& v) {
    json_object_object_add(o, k, v ? json_object_new_double(*v) : nullptr);
}

std::optional<std::string> opt_string(json_object* o, const char* k) {
    std::string s;
    if (json_get_string(o, k, &s)) return s;
    return std::nullopt;
}

std::optional<int64_t> opt_i64(json_object* o, const char* k) {
    int64_t v = 0;
    if (json_get_int64(o, k, &v)) return v;
    return std::nullopt;
}

std::optional<double> opt_double(json_object* o, const char* k) {
    double v = 0;
    if (json_get_double(o, k, &v)) return v;
    return std::nullopt;
}

json_object* files_to_json(const std::vector<SourceFile>& files, bool with_main) {
    json_object* arr = json_object_new_array();
    for (const auto& f : files) {
        json_object* fo = json_object_new_object();
        json_object_object_add(fo, "name", json_new_string(f.name));
        json_object_object_add(fo, "path", json_new_string(f.path));
        json_object_object_add(fo, "content", json_new_string(f.content));
        if (with_main) json_object_object_add(fo, "is_main", json_object_new_boolean(f.is_main));
        json_object_array_add(arr, fo);
    }
    return arr;
}

} // namespace

JsonDoc json_parse(const std::string& text) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return JsonDoc{};
    const int len = static_cast<int>(std::min(text.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return JsonDoc{};
    }
    for (size_t i = consumed; i < text.size(); i++) {
        char c = text[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            if (obj) json_object_put(obj);
            return JsonDoc{};
        }
    }
    return JsonDoc{obj};
}

std::string json_dump(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, kDumpFlags);
}

std::string json_quote(const std::string& s) {
    JsonDoc d(json_new_string(s));
    if (!d) return "\"\"";
    return json_dump(d.root);
}

std::string json_canonical(json_object* o) {
    std::ostringstream out;
    canonical_serialize(o, out);
    return out.str();
}

json_object* json_new_string(const std::string& s) {
    return json_object_new_string_len(s.data(), (int)std::min(s.size(), static_cast<size_t>(INT_MAX)));
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

bool json_get_int64(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_int)) return false;
    *out = (int64_t)json_object_get_int64(v);
    return true;
}

bool json_get_double(json_object* o, const char* k, double* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return false;
    *out = json_object_get_double(v);
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_boolean)) return false;
    *out = (json_object_get_boolean(v) != 0);
    return true;
}

// --- Request ---

std::string request_to_json(const ExecRequest& req) {
    JsonDoc d(json_object_new_object());
    json_object_object_add(d.root, "attempt_id", json_object_new_int64(req.attempt_id));
    json_object_object_add(d.root, "language", json_new_string(req.language));
    json_object_object_add(d.root, "files", files_to_json(req.files, true));
    json_object_object_add(d.root, "stdin", json_new_string(req.stdin_data));
    add_opt_string(d.root, "build_command", req.build_command);
    add_opt_string(d.root, "run_command", req.run_command);
    return json_dump(d.root);
}

bool request_from_json(const std::string& text, ExecRequest* out, std::string* err) {
    auto fail = [&](const std::string& m) {
        if (err) *err = m;
        return false;
    };
    if (!out) return fail("null output");

    JsonDoc d = json_parse(text);
    if (!d || !json_object_is_type(d.root, json_type_object)) return fail("request body is not a JSON object");

    ExecRequest req;
    if (!json_get_int64(d.root, "attempt_id", &req.attempt_id)) return fail("missing or non-integer attempt_id");
    if (!json_get_string(d.root, "language", &req.language)) return fail("missing language");

    json_object* files = nullptr;
    if (!json_object_object_get_ex(d.root, "files", &files) || !files ||
        !json_object_is_type(files, json_type_array)) {
        return fail("missing files array");
    }
    const size_t n = json_object_array_length(files);
    req.files.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* fo = json_object_array_get_idx(files, i);
        if (!fo || !json_object_is_type(fo, json_type_object)) return fail("files[" + std::to_string(i) + "] is not an object");
        SourceFile f;
        if (!json_get_string(fo, "name", &f.name)) return fail("files[" + std::to_string(i) + "] missing name");
        if (!json_get_string(fo, "content", &f.content)) return fail("files[" + std::to_string(i) + "] missing content");
        if (!json_get_string(fo, "path", &f.path)) f.path = f.name;
        (void)json_get_bool(fo, "is_main", &f.is_main);
        req.files.push_back(std::move(f));
    }

    (void)json_get_string(d.root, "stdin", &req.stdin_data);

    // Empty command strings mean "use the language default".
    std::string cmd;
    if (json_get_string(d.root, "build_command", &cmd) && !cmd.empty()) req.build_command = cmd;
    if (json_get_string(d.root, "run_command", &cmd) && !cmd.empty()) req.run_command = cmd;

    *out = std::move(req);
    return true;
}

std::string files_canonical_json(const std::vector<SourceFile>& files) {
    JsonDoc d(files_to_json(files, false));
    return json_canonical(d.root);
}

std::string snapshot_hash(const std::vector<SourceFile>& files) {
    return sha256_hex(files_canonical_json(files));
}

// --- Run documents ---

std::string run_to_json(const Run& run) {
    JsonDoc d(json_object_new_object());
    json_object* o = d.root;
    json_object_object_add(o, "id", json_object_new_int64(run.id));
    json_object_object_add(o, "attempt_id", json_object_new_int64(run.attempt_id));
    json_object_object_add(o, "status", json_object_new_string(run_status_name(run.status)));
    json_object_object_add(o, "created_ms", json_object_new_int64(run.created_ms));
    add_opt_i64(o, "started_ms", run.started_ms);
    add_opt_i64(o, "finished_ms", run.finished_ms);

    add_opt_string(o, "build_stdout", run.build_stdout);
    add_opt_string(o, "build_stderr", run.build_stderr);
    add_opt_int(o, "build_exit_code", run.build_exit_code);
    add_opt_double(o, "build_time", run.build_time_sec);

    add_opt_string(o, "stdout", run.stdout_data);
    add_opt_string(o, "stderr", run.stderr_data);
    add_opt_int(o, "exit_code", run.exit_code);
    add_opt_double(o, "run_time", run.run_time_sec);

    json_object_object_add(o, "request_json", json_new_string(run.request_json));
    add_opt_string(o, "code_snapshot", run.code_snapshot);
    json_object_object_add(o, "snapshot_hash", json_new_string(run.snapshot_hash));
    return json_dump(o);
}

bool run_from_json(const std::string& text, Run* out) {
    if (!out) return false;
    JsonDoc d = json_parse(text);
    if (!d || !json_object_is_type(d.root, json_type_object)) return false;
    json_object* o = d.root;

    Run r;
    std::string status;
    if (!json_get_int64(o, "id", &r.id)) return false;
    if (!json_get_int64(o, "attempt_id", &r.attempt_id)) return false;
    if (!json_get_string(o, "status", &status)) return false;
    auto st = run_status_from_name(status);
    if (!st) return false;
    r.status = *st;
    if (!json_get_int64(o, "created_ms", &r.created_ms)) return false;
    r.started_ms = opt_i64(o, "started_ms");
    r.finished_ms = opt_i64(o, "finished_ms");

    r.build_stdout = opt_string(o, "build_stdout");
    r.build_stderr = opt_string(o, "build_stderr");
    if (auto v = opt_i64(o, "build_exit_code")) r.build_exit_code = (int)*v;
    r.build_time_sec = opt_double(o, "build_time");

    r.stdout_data = opt_string(o, "stdout");
    r.stderr_data = opt_string(o, "stderr");
    if (auto v = opt_i64(o, "exit_code")) r.exit_code = (int)*v;
    r.run_time_sec = opt_double(o, "run_time");

    (void)json_get_string(o, "request_json", &r.request_json);
    r.code_snapshot = opt_string(o, "code_snapshot");
    (void)json_get_string(o, "snapshot_hash", &r.snapshot_hash);

    *out = std::move(r);
    return true;
}

} // namespace execq
