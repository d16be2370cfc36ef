#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Runs git subcommands. Implementations return stdout with trailing
// whitespace removed; failures carry ErrorKind::Backend and git's stderr.
class GitExecutor {
public:
    virtual ~GitExecutor() = default;

    // `dir` empty means the current working directory.
    virtual Result<std::string> execute(const fs::path& dir,
                                        const std::vector<std::string>& args) = 0;
};

// GitExecutor backed by a real git binary (platform::run_process).
class GitCommand : public GitExecutor {
public:
    explicit GitCommand(std::string binary = "git", int timeout_secs = GIT_CMD_TIMEOUT_SECS);

    Result<std::string> execute(const fs::path& dir,
                                const std::vector<std::string>& args) override;

    const std::string& binary() const { return binary_; }

private:
    std::string binary_;
    int timeout_secs_;
};

// "worktree add --force /tmp/x main" style rendering for logs and errors.
std::string format_git_args(const std::vector<std::string>& args);
