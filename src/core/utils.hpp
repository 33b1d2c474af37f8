#pragma once

#include <string>
#include <optional>
#include <vector>

// Safe integer parse: returns nullopt unless the whole string is a number.
std::optional<long> parse_long(const std::string& s);

// Safe floating-point parse: returns nullopt unless the whole string is a number.
std::optional<double> parse_double(const std::string& s);

// Lowercase copy (ASCII only).
std::string to_lower(std::string s);

// Split on runs of whitespace; empty fields are dropped.
std::vector<std::string> split_whitespace(const std::string& s);

// Quote a single argument for a POSIX shell (remote exec channels).
std::string shell_quote(const std::string& arg);

// Join argv into one shell command line, quoting each argument as needed.
std::string join_command(const std::vector<std::string>& argv);

// Expand a leading "~/" against $HOME.
std::string expand_home(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
