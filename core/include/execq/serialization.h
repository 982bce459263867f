#pragma once

#include "types.h"

#include <json-c/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace execq {

// Owns one json-c reference.
struct JsonDoc {
    json_object* root{nullptr};

    JsonDoc() = default;
    explicit JsonDoc(json_object* r) : root(r) {}
    JsonDoc(const JsonDoc&) = delete;
    JsonDoc& operator=(const JsonDoc&) = delete;
    JsonDoc(JsonDoc&& other) noexcept : root(other.root) { other.root = nullptr; }
    JsonDoc& operator=(JsonDoc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }
    ~JsonDoc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }

    // Transfers ownership to the caller (e.g. when adding to a parent object).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }
};

// Strict parse: trailing garbage or truncated input yields an empty doc.
JsonDoc json_parse(const std::string& text);

std::string json_dump(json_object* o);
std::string json_quote(const std::string& s);

// Recursively serializes with sorted object keys. Deterministic across runs,
// used for hash chains.
std::string json_canonical(json_object* o);

json_object* json_new_string(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_int64(json_object* o, const char* k, int64_t* out);
bool json_get_double(json_object* o, const char* k, double* out);
bool json_get_bool(json_object* o, const char* k, bool* out);

// --- Request ---

std::string request_to_json(const ExecRequest& req);
bool request_from_json(const std::string& text, ExecRequest* out, std::string* err);

// The canonical file list [{"name","path","content"}...] used for the snapshot
// and its hash. Key order is fixed so equal file sets serialize identically.
std::string files_canonical_json(const std::vector<SourceFile>& files);
std::string snapshot_hash(const std::vector<SourceFile>& files);

// --- Run documents ---

std::string run_to_json(const Run& run);
bool run_from_json(const std::string& text, Run* out);

} // namespace execq
