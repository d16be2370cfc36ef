#pragma once

#include <string>

// Filesystem-safe token: lower-case, [a-z0-9-.] only, single hyphens,
// no leading/trailing hyphen. Empty results become "unnamed".
// Idempotent: sanitize_component(sanitize_component(x)) == sanitize_component(x).
std::string sanitize_component(const std::string& raw);

// Same rules for a whole generated directory name; empty becomes "worktree".
std::string sanitize_path(const std::string& raw);

// Shorten to at most max_len characters, preferring to cut at the last hyphen
// that fits. Without a usable hyphen the string is hard-cut, ending in "..."
// when max_len > 3. max_len <= 0 yields "".
std::string truncate_path(const std::string& path, int max_len);

// Hard cut to n characters, ending in "..." when n > 3 (no word boundary).
std::string truncate_string(const std::string& s, int n);

// Upper-case the first letter of every word. Word separators are characters
// other than letters, digits and '_'.
std::string title_case(const std::string& s);
