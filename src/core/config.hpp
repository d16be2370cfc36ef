#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

namespace YAML { class Node; }

class Config {
public:
    // Load global config from ~/.wtm/config.yaml (defaults if absent)
    static Result<Config> load_global();

    // Overlay <dir>/.wtm.yaml on top of `base`
    static Result<Config> load_project(const fs::path& dir, const Config& base = Config());

    // Global, then project overrides
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse a single YAML file on top of defaults
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text on top of `base` (used by load_file and tests)
    static Result<Config> parse(const std::string& yaml_text, const Config& base = Config());

    // Accessors
    const WorktreeConfig& worktree() const { return worktree_; }
    const SessionConfig& session() const { return session_; }
    const GitConfig& git() const { return git_; }
    const fs::path& project_dir() const { return project_dir_; }

    void set_worktree(const WorktreeConfig& w) { worktree_ = w; }
    void set_session(const SessionConfig& s) { session_ = s; }
    void set_git(const GitConfig& g) { git_ = g; }

public:
    Config() = default;

private:
    static Result<Config> overlay(const YAML::Node& root, const Config& base);

    WorktreeConfig worktree_;
    SessionConfig session_;
    GitConfig git_;
    fs::path project_dir_;
};

// Checks that the worktree section can generate paths.
Result<void> validate_worktree_config(const WorktreeConfig& config);

// "keep" | "skip" | "reject"
Result<RemoteUrlPolicy> parse_remote_url_policy(const std::string& name);
const char* remote_url_policy_name(RemoteUrlPolicy policy);

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
