#include "session_controller.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

static constexpr int TMUX_TIMEOUT_MS = 10000;

TmuxSessionController::TmuxSessionController(std::string binary)
    : binary_(std::move(binary)) {}

bool TmuxSessionController::has_session(const std::string& name) {
    if (name.empty()) return false;
    auto r = platform::run_process(binary_, {"has-session", "-t", "=" + name}, {}, TMUX_TIMEOUT_MS);
    return r.success();
}

Result<void> TmuxSessionController::create_session(const std::string& name,
                                                   const std::filesystem::path& working_dir) {
    if (name.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "session name cannot be empty");
    }
    if (has_session(name)) {
        return Result<void>::Err(ErrorKind::Conflict, fmt::format("session '{}' already exists", name));
    }

    auto r = platform::run_process(binary_,
        {"new-session", "-d", "-s", name, "-c", working_dir.string()}, {}, TMUX_TIMEOUT_MS);
    wtm_log(fmt::format("tmux new-session {} in {}: exit={} {}", name, working_dir.string(),
                        r.exit_code, r.stderr_data.substr(0, LOG_PREVIEW_LEN)));
    if (!r.success()) {
        return Result<void>::Err(ErrorKind::Backend,
                                 fmt::format("failed to create session '{}': {}", name, r.get_output()));
    }
    return Result<void>::Ok();
}

Result<void> TmuxSessionController::remove_session(const std::string& name) {
    if (!has_session(name)) {
        return Result<void>::Err(ErrorKind::NotFound, fmt::format("session '{}' not found", name));
    }

    auto r = platform::run_process(binary_, {"kill-session", "-t", "=" + name}, {}, TMUX_TIMEOUT_MS);
    wtm_log(fmt::format("tmux kill-session {}: exit={}", name, r.exit_code));
    if (!r.success()) {
        return Result<void>::Err(ErrorKind::Backend,
                                 fmt::format("failed to remove session '{}': {}", name, r.get_output()));
    }
    return Result<void>::Ok();
}
