#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// True if s is non-empty and every character is a decimal digit.
bool is_all_digits(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Trim trailing whitespace in-place.
inline void rtrim(std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) { s.clear(); return; }
    s.erase(end + 1);
}
