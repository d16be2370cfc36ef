#pragma once

#include <ctime>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

struct CommitInfo {
    std::string hash;
    std::string author;
    std::time_t date = 0;
    std::string subject;
    std::vector<std::string> files;
};

// A configured remote. host/owner/repo are filled only when `parsed`.
struct Remote {
    std::string name;
    std::string url;
    std::string protocol;   // "ssh", "https", "http"
    std::string host;
    std::string owner;
    std::string repo;
    bool parsed = false;
};

// Snapshot of one entry of `git worktree list`, optionally enriched.
struct WorktreeInfo {
    fs::path path;
    std::string branch;         // empty when detached or bare
    std::string head;
    bool bare = false;
    bool detached = false;
    bool locked = false;
    bool prunable = false;
    bool is_clean = true;
    bool has_uncommitted = false;
    CommitInfo last_commit;
    std::time_t created_at = 0;
    std::time_t last_accessed = 0;
    std::string session_name;
};

struct Repository {
    fs::path path;              // as queried
    fs::path root;              // canonical top level
    std::string origin;         // origin URL, empty if none
    std::string default_branch;
    std::string current_branch;
    bool is_clean = true;
    std::vector<Remote> remotes;
    std::vector<WorktreeInfo> worktrees;
};
