#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "git_types.hpp"

// Parsers for git's machine-readable output. Unrecognised lines are skipped.

// `git worktree list --porcelain`: blank-line separated records.
std::vector<WorktreeInfo> parse_worktree_list(const std::string& output);

// `git remote -v`: "name url (fetch|push)". One entry per name, listing order.
// Only name and url are filled; see remote_url.hpp for the rest.
std::vector<Remote> parse_remote_list(const std::string& output);

// One entry of `git status --porcelain` (v1).
struct StatusEntry {
    char index = ' ';
    char worktree = ' ';
    std::string path;
    std::string orig_path;   // set for renames/copies

    bool untracked() const { return index == '?' && worktree == '?'; }
};

std::vector<StatusEntry> parse_status_porcelain(const std::string& output);

// `git show --name-only --pretty=format:%H%n%an%n%at%n%s`: four header lines,
// then the changed files.
Result<CommitInfo> parse_commit_info(const std::string& output);

// `git branch` or `git branch --format=%(refname:short)`. Strips the current
// (`*`) and other-worktree (`+`) markers, skips detached-HEAD pseudo entries.
std::vector<std::string> parse_branch_list(const std::string& output);
