#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <string>
#include <sys/stat.h>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

std::string current_user_name() {
    for (const char* var : {"USER", "USERNAME"}) {
        const char* v = std::getenv(var);
        if (v && *v) return std::string(v);
    }
    return "";
}

fs::path find_executable(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};

#ifdef _WIN32
    const char sep = ';';
    const std::string exe = name + ".exe";
#else
    const char sep = ':';
    const std::string& exe = name;
#endif

    std::string paths(path_env);
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(sep, start);
        std::string dir = paths.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!dir.empty()) {
            fs::path candidate = fs::path(dir) / exe;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
#ifdef _WIN32
                return candidate;
#else
                if (access(candidate.c_str(), X_OK) == 0) return candidate;
#endif
            }
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return {};
}

bool modified_time(const fs::path& p, std::time_t& out) {
    struct stat st;
    if (::stat(p.string().c_str(), &st) != 0) return false;
    out = st.st_mtime;
    return true;
}

bool can_create_file_in(const fs::path& dir, const std::string& prefix) {
#ifdef _WIN32
    const unsigned long pid = GetCurrentProcessId();
#else
    const long pid = static_cast<long>(getpid());
#endif
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = dir / (prefix + "." + std::to_string(pid) + "." + std::to_string(attempt));
#ifdef _WIN32
        HANDLE h = CreateFileA(candidate.string().c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                               FILE_ATTRIBUTE_TEMPORARY | FILE_FLAG_DELETE_ON_CLOSE, nullptr);
        if (h != INVALID_HANDLE_VALUE) {
            CloseHandle(h);
            return true;
        }
        if (GetLastError() != ERROR_FILE_EXISTS) return false;
#else
        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
        if (fd >= 0) {
            ::close(fd);
            ::unlink(candidate.c_str());
            return true;
        }
        if (errno != EEXIST) return false;
#endif
    }
    return false;
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
