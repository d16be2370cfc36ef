#include "git_command.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

GitCommand::GitCommand(std::string binary, int timeout_secs)
    : binary_(std::move(binary)), timeout_secs_(timeout_secs) {}

Result<std::string> GitCommand::execute(const fs::path& dir,
                                        const std::vector<std::string>& args) {
    int timeout_ms = timeout_secs_ > 0 ? timeout_secs_ * 1000 : -1;
    auto r = platform::run_process(binary_, args, dir, timeout_ms);
    wtm_log_git("git", dir, args, r);

    if (!r.launched) {
        return Result<std::string>::Err(
            ErrorKind::Backend, fmt::format("failed to run {}: {}", binary_, r.stderr_data));
    }
    if (r.timed_out) {
        return Result<std::string>::Err(
            ErrorKind::Backend,
            fmt::format("git {} timed out after {}s", format_git_args(args), timeout_secs_));
    }
    if (r.exit_code != 0) {
        std::string err = r.stderr_data;
        trim(err);
        if (err.empty()) err = fmt::format("exit code {}", r.exit_code);
        return Result<std::string>::Err(
            ErrorKind::Backend, fmt::format("git {} failed: {}", format_git_args(args), err));
    }

    std::string out = r.stdout_data;
    rtrim(out);
    return Result<std::string>::Ok(out);
}

std::string format_git_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        if (a.empty() || a.find(' ') != std::string::npos) {
            out += "'" + a + "'";
        } else {
            out += a;
        }
    }
    return out;
}
