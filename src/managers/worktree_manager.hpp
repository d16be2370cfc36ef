#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <git/git_command.hpp>
#include <git/repository.hpp>
#include <naming/pattern_manager.hpp>
#include "worktree_hooks.hpp"
#include "session_controller.hpp"

namespace fs = std::filesystem;

struct WorktreeOptions {
    fs::path path;               // empty: generate from the directory pattern
    bool create_branch = false;  // create `branch` first if it does not exist
    bool force = false;          // skip availability and branch-uniqueness checks
    bool checkout = true;
    std::string remote;          // start point remote when track_remote is set
    bool track_remote = false;
    bool auto_name = false;      // generate a path even if `path` is set
};

struct WorktreeStats {
    int total = 0;
    int clean = 0;
    int dirty = 0;
    int with_session = 0;
};

// Creates, lists and removes the worktrees of one repository.
//
// The Repository snapshot is re-validated before every mutating operation and
// refreshed afterwards, so it always reflects git's view rather than ours.
// Hooks and sessions are optional collaborators (may be null, not owned);
// their failures are reported through the status callback and never fail the
// operation itself.
class WorktreeManager {
public:
    WorktreeManager(Repository& repo, const Config& config, GitExecutor& git,
                    WorktreeHooks* hooks = nullptr, SessionController* sessions = nullptr);

    Result<WorktreeInfo> create(const std::string& branch, const WorktreeOptions& options,
                                StatusCallback cb = nullptr);

    // Enrichment failures for single entries are logged, not returned.
    Result<std::vector<WorktreeInfo>> list(StatusCallback cb = nullptr);

    Result<WorktreeInfo> info(const fs::path& path);

    // With force, a worktree whose directory is already gone is pruned.
    Result<void> remove(const fs::path& path, bool force, StatusCallback cb = nullptr);

    Result<void> prune();
    Result<void> move(const fs::path& old_path, const fs::path& new_path);

    // Remove clean, non-main worktrees not touched within max_age.
    // Returns how many were removed.
    Result<int> cleanup_old(std::chrono::seconds max_age, StatusCallback cb = nullptr);

    Result<WorktreeStats> stats();

    // Empty when session handles are disabled (no session prefix).
    std::string session_name_for(const WorktreeInfo& info) const;

    // origin's repository name, else the root directory name
    std::string project_name() const;

    PatternManager& patterns() { return patterns_; }
    const Repository& repository() const { return repo_; }

private:
    Result<void> validate_candidate(const fs::path& path) const;
    Result<void> ensure_branch(const std::string& branch, const WorktreeOptions& options,
                               StatusCallback cb);
    void enrich(WorktreeInfo& wt, StatusCallback cb);
    void start_session(WorktreeInfo& wt, HookContext& ctx, StatusCallback cb);
    void refresh(const char* after);

    Repository& repo_;
    const Config& config_;
    GitExecutor& git_;
    RepositoryInspector inspector_;
    PatternManager patterns_;
    WorktreeHooks* hooks_;
    SessionController* sessions_;
};
