#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "git_types.hpp"
#include "git_command.hpp"

namespace fs = std::filesystem;

// Builds Repository snapshots by querying git. Nothing is cached: every call
// reflects the repository as it is now.
class RepositoryInspector {
public:
    explicit RepositoryInspector(GitExecutor& git, RemoteUrlPolicy policy = RemoteUrlPolicy::Keep);

    // Empty path means the current directory.
    Result<Repository> detect(const fs::path& path = {});

    // Re-check that `repo` still exists and refresh it in place.
    Result<void> validate_state(Repository* repo);

    bool is_git_repository(const fs::path& path);
    bool branch_exists(const fs::path& root, const std::string& branch);
    Result<bool> is_clean(const fs::path& dir);

    Result<std::vector<std::string>> list_branches(const fs::path& root);
    Result<std::vector<WorktreeInfo>> list_worktrees(const fs::path& root);
    Result<CommitInfo> commit_info(const fs::path& dir, const std::string& hash);
    Result<Remote> remote_info(const Repository& repo, const std::string& name) const;

    GitExecutor& git() { return git_; }

private:
    Result<void> populate(Repository& repo);
    std::string detect_current_branch(const fs::path& root);
    std::string detect_default_branch(const fs::path& root);
    Result<std::vector<Remote>> load_remotes(const fs::path& root);

    GitExecutor& git_;
    RemoteUrlPolicy policy_;
};
