#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace platform {

// Outcome of a finished (or abandoned) child process.
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool launched = false;     // false if pipe/fork failed
    bool timed_out = false;    // child was terminated after timeout_ms

    bool success() const { return launched && !timed_out && exit_code == 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Run `program` with `args` (argv[0] is added automatically, PATH is searched)
// and wait for it to exit, capturing stdout and stderr separately.
// cwd: working directory for the child; empty means inherit.
// timeout_ms = -1 means indefinite wait. On timeout the child gets SIGTERM,
// then SIGKILL after TERMINATE_GRACE_MS.
ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::filesystem::path& cwd = {},
                          int timeout_ms = -1);

} // namespace platform
