#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

// ── Section parsing ───────────────────────────────────────────
// Each parser starts from `base` and only replaces the keys present in the
// node, so project files can override single values of the global config.

static void read_string(const YAML::Node& node, const char* key, std::string& out) {
    if (node[key] && node[key].IsScalar()) out = node[key].as<std::string>();
}

static void read_int(const YAML::Node& node, const char* key, int& out) {
    if (node[key] && node[key].IsScalar()) out = node[key].as<int>();
}

static void read_bool(const YAML::Node& node, const char* key, bool& out) {
    if (node[key] && node[key].IsScalar()) out = node[key].as<bool>();
}

static WorktreeConfig parse_worktree_config(const YAML::Node& node, WorktreeConfig base) {
    read_string(node, "base_directory", base.base_directory);
    read_string(node, "directory_pattern", base.directory_pattern);
    read_string(node, "default_branch", base.default_branch);
    read_bool(node, "auto_directory", base.auto_directory);
    read_bool(node, "auto_create_branch", base.auto_create_branch);
    read_bool(node, "sanitize_names", base.sanitize_names);
    read_int(node, "max_length", base.max_length);
    read_string(node, "prefix", base.prefix);
    read_string(node, "suffix", base.suffix);
    return base;
}

static SessionConfig parse_session_config(const YAML::Node& node, SessionConfig base) {
    read_string(node, "prefix", base.prefix);
    read_string(node, "naming_pattern", base.naming_pattern);
    read_int(node, "max_name_length", base.max_name_length);
    read_bool(node, "auto_cleanup", base.auto_cleanup);
    read_int(node, "cleanup_age_hours", base.cleanup_age_hours);
    return base;
}

static Result<GitConfig> parse_git_config(const YAML::Node& node, GitConfig base) {
    read_string(node, "command", base.command);
    read_int(node, "timeout_secs", base.timeout_secs);
    if (node["remote_url_policy"] && node["remote_url_policy"].IsScalar()) {
        auto policy = parse_remote_url_policy(node["remote_url_policy"].as<std::string>());
        if (policy.is_err()) return Result<GitConfig>::Wrap(policy, "git.remote_url_policy");
        base.remote_url_policy = policy.value;
    }
    if (base.command.empty()) {
        return Result<GitConfig>::Err(ErrorKind::Validation, "git.command cannot be empty");
    }
    if (base.timeout_secs < 0) {
        return Result<GitConfig>::Err(ErrorKind::Validation, "git.timeout_secs must be >= 0");
    }
    return Result<GitConfig>::Ok(base);
}

Result<Config> Config::overlay(const YAML::Node& root, const Config& base) {
    Config config = base;
    if (!root || root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err(ErrorKind::Validation, "config root must be a mapping");
    }

    if (root["worktree"] && root["worktree"].IsMap()) {
        config.worktree_ = parse_worktree_config(root["worktree"], config.worktree_);
    }
    if (root["session"] && root["session"].IsMap()) {
        config.session_ = parse_session_config(root["session"], config.session_);
    }
    if (root["git"] && root["git"].IsMap()) {
        auto git = parse_git_config(root["git"], config.git_);
        if (git.is_err()) return Result<Config>::Wrap(git, "");
        config.git_ = git.value;
    }

    auto valid = validate_worktree_config(config.worktree_);
    if (valid.is_err()) return Result<Config>::Wrap(valid, "worktree");

    if (config.session_.max_name_length < 0) {
        return Result<Config>::Err(ErrorKind::Validation, "session.max_name_length must be >= 0");
    }
    if (config.session_.cleanup_age_hours <= 0) {
        return Result<Config>::Err(ErrorKind::Validation, "session.cleanup_age_hours must be positive");
    }
    return Result<Config>::Ok(config);
}

Result<void> validate_worktree_config(const WorktreeConfig& config) {
    if (config.default_branch.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "default_branch cannot be empty");
    }
    if (config.max_length < 0) {
        return Result<void>::Err(ErrorKind::Validation, "max_length must be >= 0");
    }
    if (config.auto_directory) {
        if (config.directory_pattern.empty()) {
            return Result<void>::Err(ErrorKind::Validation,
                                     "directory_pattern is required when auto_directory is enabled");
        }
        if (config.directory_pattern.find("{{") == std::string::npos ||
            config.directory_pattern.find("}}") == std::string::npos) {
            return Result<void>::Err(ErrorKind::Validation,
                                     "directory_pattern must contain template variables");
        }
    }
    return Result<void>::Ok();
}

Result<RemoteUrlPolicy> parse_remote_url_policy(const std::string& name) {
    if (name == "keep") return Result<RemoteUrlPolicy>::Ok(RemoteUrlPolicy::Keep);
    if (name == "skip") return Result<RemoteUrlPolicy>::Ok(RemoteUrlPolicy::Skip);
    if (name == "reject") return Result<RemoteUrlPolicy>::Ok(RemoteUrlPolicy::Reject);
    return Result<RemoteUrlPolicy>::Err(ErrorKind::Validation,
                                        "unknown policy '" + name + "' (expected keep, skip or reject)");
}

const char* remote_url_policy_name(RemoteUrlPolicy policy) {
    switch (policy) {
        case RemoteUrlPolicy::Keep:   return "keep";
        case RemoteUrlPolicy::Skip:   return "skip";
        case RemoteUrlPolicy::Reject: return "reject";
    }
    return "keep";
}

// ── Paths ─────────────────────────────────────────────────────

bool global_config_exists() {
    std::error_code ec;
    return fs::exists(get_global_config_path(), ec);
}

bool project_config_exists(const fs::path& dir) {
    std::error_code ec;
    return fs::exists(get_project_config_path(dir), ec);
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".wtm";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / ".wtm.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (global_config_exists()) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::DirectoryCreation,
                                 "Failed to create " + config_path.parent_path().string() + ": " + ec.message());
    }

    const char* default_config = R"(# wtm configuration
# Project files (.wtm.yaml in the repository root) override these values.

worktree:
  # Where worktrees are placed. Relative paths resolve against the current
  # directory. Must not be inside the repository.
  base_directory: "../.worktrees/{{.Project}}"
  # Directory name for each worktree.
  # Variables: .Project .Branch .Worktree .Timestamp .UserName .Prefix .Suffix
  # Functions: lower upper title replace trim sanitize truncate
  directory_pattern: "{{.Project}}-{{.Branch}}"
  default_branch: "main"
  auto_directory: true
  auto_create_branch: false
  sanitize_names: true
  max_length: 100
  prefix: ""
  suffix: ""

session:
  prefix: ""                 # empty disables tmux sessions
  naming_pattern: "{{.Prefix}}-{{.Project}}-{{.Branch}}"
  max_name_length: 50
  auto_cleanup: false
  cleanup_age_hours: 168

git:
  command: "git"
  timeout_secs: 120
  remote_url_policy: "keep"  # keep | skip | reject
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Backend, "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err(ErrorKind::Backend, "Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

// ── Loading ───────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text, const Config& base) {
    try {
        return overlay(YAML::Load(yaml_text), base);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Validation, std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto result = overlay(root, Config());
        if (result.is_err()) return Result<Config>::Wrap(result, path.string());
        result.value.project_dir_ = path.parent_path();
        return result;
    } catch (const YAML::BadFile&) {
        return Result<Config>::Err(ErrorKind::NotFound, "Config not found at " + path.string());
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Validation,
                                   "Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        Config config;
        config.project_dir_ = fs::current_path();
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(get_global_config_path().string());
        auto result = overlay(root, Config());
        if (result.is_err()) return Result<Config>::Wrap(result, "global config");
        result.value.project_dir_ = fs::current_path();
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Validation,
                                   std::string("Failed to parse global config: ") + e.what());
    }
}

Result<Config> Config::load_project(const fs::path& dir, const Config& base) {
    Config config = base;
    config.project_dir_ = dir;
    if (!project_config_exists(dir)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(get_project_config_path(dir).string());
        auto result = overlay(root, config);
        if (result.is_err()) return Result<Config>::Wrap(result, "project config");
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Validation,
                                   std::string("Failed to parse project config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& project_dir) {
    auto global_result = load_global();
    if (global_result.is_err()) {
        return global_result;
    }
    return load_project(project_dir, global_result.value);
}
