#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

inline std::string wtm_log_path() {
    static std::string path = (platform::temp_dir() / "wtm_debug.log").string();
    return path;
}

inline void wtm_log(const std::string& msg) {
    std::ofstream out(wtm_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

inline void wtm_log_git(const std::string& label, const std::filesystem::path& dir,
                        const std::vector<std::string>& args,
                        const platform::ProcessResult& r) {
    wtm_log(fmt::format("{} CMD: git {} (in {})", label, fmt::join(args, " "), dir.string()));
    wtm_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                        r.stdout_data.size(), r.stdout_data.substr(0, LOG_PREVIEW_LEN)));
    if (!r.stderr_data.empty())
        wtm_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_PREVIEW_LEN)));
    if (r.timed_out)
        wtm_log(fmt::format("{} timed out", label));
}
