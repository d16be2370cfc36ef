#pragma once

#include <ctime>
#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <filesystem>
#include <core/types.hpp>
#include <git/git_command.hpp>
#include "template_engine.hpp"

namespace fs = std::filesystem;

// True when `path` equals `root` or lies below it, compared component-wise
// after canonicalisation (so /a/repo-sibling is not inside /a/repo).
bool path_within(const fs::path& path, const fs::path& root);

// PatternManager turns a branch + project into a safe worktree location.
//
// Directory names come from the configured directory pattern, resolved
// against a PatternContext. Locations live under the configured base
// directory, which must never be the repository itself or below it.
// Every method reports failures through Result; nothing throws.
class PatternManager {
public:
    PatternManager(const WorktreeConfig& config, GitExecutor& git);

    // Textual checks only: markers present, no '..', '~', '\' or leading '/',
    // parseable markup, whitelisted variables.
    Result<void> validate_pattern(const std::string& pattern) const;

    // Empty pattern means the configured directory_pattern.
    Result<std::string> apply_pattern(const std::string& pattern, const PatternContext& ctx) const;

    // Check a resolved directory name before it touches the filesystem.
    Result<void> validate_result(const std::string& candidate) const;

    PatternContext build_context(const std::string& branch, const std::string& project);

    // Absolute path for a new worktree. Creates the base directory.
    Result<fs::path> generate_worktree_path(const std::string& branch, const std::string& project);

    // Absolute base directory for a base-directory template (empty -> default).
    Result<fs::path> resolve_base_directory(const std::string& base_dir, const PatternContext& ctx) const;

    Result<void> validate_base_directory(const std::string& base_dir, const fs::path& repo_root) const;

    Result<void> check_path_available(const fs::path& path) const;
    Result<void> create_directory(const fs::path& path) const;

    // The pattern applied to three fixed sample contexts.
    Result<std::vector<std::string>> example_paths(const std::string& pattern) const;

    // (placeholder, description) tables for help output
    static std::vector<std::pair<std::string, std::string>> pattern_variables();
    static std::vector<std::pair<std::string, std::string>> pattern_functions();

    void set_clock(std::function<std::time_t()> clock) { clock_ = std::move(clock); }

    const WorktreeConfig& config() const { return config_; }

private:
    std::string user_name();

    WorktreeConfig config_;
    GitExecutor& git_;
    std::function<std::time_t()> clock_;
};
