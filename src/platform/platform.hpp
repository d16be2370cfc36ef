#pragma once

#include <ctime>
#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Login name from USER / USERNAME. Empty if neither is set.
std::string current_user_name();

// Search PATH for an executable. Returns empty path if not found.
std::filesystem::path find_executable(const std::string& name);

// Last modification time of a path. Returns false if it cannot be stat'ed.
bool modified_time(const std::filesystem::path& p, std::time_t& out);

// True if a new file can be created in `dir`. Creates and deletes a file
// named <prefix>.<pid>.<n>, never touching an existing file.
bool can_create_file_in(const std::filesystem::path& dir, const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
