#pragma once

#include <cstddef>
#include <string>

namespace execq {

// SIGINT/SIGTERM set a flag that long-running commands poll.
void install_stop_signals();
bool stop_requested();
void request_stop();

// Reads a whole file, or stdin when path is "-". Returns false when the input
// cannot be read or exceeds max_bytes.
bool read_input(const std::string& path, size_t max_bytes, std::string* out, std::string* err);

// "--flag value" lookup over argv[from..]. Returns defv when absent.
std::string arg_value(int argc, char** argv, int from, const std::string& flag, const std::string& defv);
bool has_flag(int argc, char** argv, int from, const std::string& flag);

} // namespace execq
