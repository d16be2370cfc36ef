#pragma once

#include <ctime>
#include <string>
#include <vector>

// Format a time_t with strftime in local time. Returns "-" for 0.
std::string format_local_time(std::time_t t, const char* format);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Safe 64-bit parse for epoch seconds.
long long safe_stoll(const std::string& s, long long fallback = 0);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);

// Split on '\n', dropping a trailing '\r' from each line. Keeps empty lines.
std::vector<std::string> split_lines(const std::string& text);

// Split on runs of whitespace.
std::vector<std::string> split_fields(const std::string& line);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Trim trailing whitespace only (keeps porcelain status columns intact).
inline void rtrim(std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) { s.clear(); return; }
    s.erase(end + 1);
}
