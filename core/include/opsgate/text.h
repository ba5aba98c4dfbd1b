#pragma once

#include <string>
#include <vector>

namespace opsgate {

std::string trim_ws(std::string s);
std::string lower_ascii(std::string s);
std::string upper_ascii(std::string s);

// Comma-separated list; entries are trimmed, empty entries dropped.
std::vector<std::string> split_csv(const std::string& s);

// Split on '\n', dropping a trailing '\r' per line. Empty lines are kept
// unless skip_empty is set.
std::vector<std::string> split_lines(const std::string& s, bool skip_empty = false);

std::vector<std::string> split_ws(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Keep the last max_bytes of s.
std::string tail_bytes(const std::string& s, size_t max_bytes);

// UTC wall clock, e.g. 2025-03-01T12:00:00Z
std::string iso_now();

int getenv_int(const char* name, int defv);

} // namespace opsgate
