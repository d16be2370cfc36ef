#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <git/git_command.hpp>
#include <git/repository.hpp>
#include <managers/worktree_manager.hpp>
#include <managers/session_controller.hpp>
#include <managers/worktree_hooks.hpp>

// Prints lifecycle events to the terminal.
class ConsoleHooks : public WorktreeHooks {
public:
    Result<void> on_worktree_created(const HookContext& ctx) override;
    Result<void> on_worktree_activated(const HookContext& ctx) override;
};

class WtmCLI {
public:
    WtmCLI();

    // Returns the process exit code.
    int run(const std::string& command, const std::vector<std::string>& args);

private:
    // Config, repository and managers for the current directory.
    bool load();

    int cmd_create(const std::vector<std::string>& args);
    int cmd_list();
    int cmd_remove(const std::vector<std::string>& args);
    int cmd_move(const std::vector<std::string>& args);
    int cmd_prune();
    int cmd_cleanup(const std::vector<std::string>& args);
    int cmd_stats();
    int cmd_path(const std::vector<std::string>& args);
    int cmd_patterns(const std::vector<std::string>& args);
    int cmd_pr_url(const std::vector<std::string>& args);
    int cmd_init_config();

    Config config_;
    std::unique_ptr<GitCommand> git_;
    std::unique_ptr<RepositoryInspector> inspector_;
    Repository repo_;
    ConsoleHooks hooks_;
    std::unique_ptr<TmuxSessionController> sessions_;
    std::unique_ptr<WorktreeManager> manager_;
};

void print_usage();
