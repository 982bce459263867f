#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace execq {

// Time
int64_t now_ms();              // wall clock, epoch milliseconds
int64_t steady_ms();           // monotonic milliseconds
std::string iso8601_utc(int64_t epoch_ms);
void sleep_ms(int ms);

// Environment
int getenv_int(const char* k, int defv);
int64_t getenv_i64(const char* k, int64_t defv);
std::string getenv_str(const char* k, const std::string& defv);
bool getenv_bool(const char* k, bool defv);
void set_env_if_missing(const char* key, const std::string& value);

// Files
std::string slurp_file(const std::filesystem::path& p);

// Writes body to dst via a temp sibling + rename so readers never observe a
// partial document. Returns empty string on success.
std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body);

std::string lower_ascii(std::string s);

} // namespace execq
