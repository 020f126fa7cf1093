#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace toolhost {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char delim);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Case-insensitive substring test (ASCII)
bool contains_ci(const std::string& haystack, const std::string& needle);

bool ends_with(const std::string& s, const std::string& suffix);

// True when s is a non-empty run of decimal digits
bool is_all_digits(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Parse "<n>ms", "<n>s", "<n>m" or "<n>h" into milliseconds.
// Throws std::invalid_argument on anything else.
uint64_t parse_duration_ms(const std::string& text);

} // namespace toolhost
