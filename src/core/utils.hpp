#pragma once

#include <optional>
#include <string>
#include <vector>

// Strict integer parse: the whole string must be a number.
std::optional<int> parse_int(const std::string& s);

// Split on runs of whitespace; no empty tokens.
std::vector<std::string> split_whitespace(const std::string& s);

// Split on '\n', trimming '\r' and surrounding blanks; keeps empty lines.
std::vector<std::string> split_lines(const std::string& s);

// Wrap in single quotes for a POSIX shell, escaping embedded quotes.
std::string shell_quote(const std::string& s);

// Replace a leading "~" with the home directory.
std::string expand_user(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
