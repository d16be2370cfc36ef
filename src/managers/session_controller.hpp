#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// Named terminal sessions attached to worktrees.
class SessionController {
public:
    virtual ~SessionController() = default;

    virtual Result<void> create_session(const std::string& name,
                                        const std::filesystem::path& working_dir) = 0;
    virtual Result<void> remove_session(const std::string& name) = 0;
    virtual bool has_session(const std::string& name) = 0;
};

// Detached tmux sessions, one per worktree.
class TmuxSessionController : public SessionController {
public:
    explicit TmuxSessionController(std::string binary = "tmux");

    Result<void> create_session(const std::string& name,
                                const std::filesystem::path& working_dir) override;
    Result<void> remove_session(const std::string& name) override;
    bool has_session(const std::string& name) override;

private:
    std::string binary_;
};
