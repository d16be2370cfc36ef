#include "worktree_manager.hpp"
#include <core/log.hpp>
#include <git/branch_name.hpp>
#include <core/utils.hpp>
#include <naming/sanitize.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <ctime>

namespace fs = std::filesystem;

static void report(const StatusCallback& cb, const std::string& msg) {
    if (cb) cb(msg);
}

static fs::path absolute_normal(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_relative_path()) abs = abs.parent_path();
    return abs;
}

static bool same_path(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    fs::path ca = fs::weakly_canonical(absolute_normal(a), ec);
    if (ec) ca = absolute_normal(a);
    fs::path cb = fs::weakly_canonical(absolute_normal(b), ec);
    if (ec) cb = absolute_normal(b);
    return absolute_normal(ca) == absolute_normal(cb);
}

WorktreeManager::WorktreeManager(Repository& repo, const Config& config, GitExecutor& git,
                                 WorktreeHooks* hooks, SessionController* sessions)
    : repo_(repo), config_(config), git_(git),
      inspector_(git, config.git().remote_url_policy),
      patterns_(config.worktree(), git),
      hooks_(hooks), sessions_(sessions) {}

std::string WorktreeManager::project_name() const {
    for (const auto& r : repo_.remotes) {
        if (r.name == DEFAULT_REMOTE && r.parsed && !r.repo.empty()) return r.repo;
    }
    return repo_.root.filename().string();
}

void WorktreeManager::refresh(const char* after) {
    auto r = inspector_.validate_state(&repo_);
    if (r.is_err()) {
        wtm_log(fmt::format("refresh after {} failed: {}", after, r.error));
    }
}

// ── Create ────────────────────────────────────────────────────

Result<void> WorktreeManager::validate_candidate(const fs::path& path) const {
    if (path.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "worktree path cannot be empty");
    }
    if (!path.is_absolute()) {
        return Result<void>::Err(ErrorKind::Validation, "worktree path must be absolute: " + path.string());
    }
    fs::path clean = path.lexically_normal();
    if (clean == clean.root_path()) {
        return Result<void>::Err(ErrorKind::Validation, "worktree path cannot be the filesystem root");
    }
    for (const auto& part : clean) {
        if (part == "..") {
            return Result<void>::Err(ErrorKind::Validation,
                                     "worktree path contains parent directory traversal: " + path.string());
        }
    }
    if (path_within(clean, repo_.root)) {
        return Result<void>::Err(ErrorKind::Validation,
                                 fmt::format("worktree path cannot be inside repository: {} (repository: {})",
                                             path.string(), repo_.root.string()));
    }
    return Result<void>::Ok();
}

Result<void> WorktreeManager::ensure_branch(const std::string& branch, const WorktreeOptions& options,
                                            StatusCallback cb) {
    if (inspector_.branch_exists(repo_.root, branch)) {
        return Result<void>::Ok();
    }

    std::vector<std::string> args = {"branch"};
    if (options.track_remote && !options.remote.empty()) {
        args.push_back("--track");
        args.push_back("--");
        args.push_back(branch);
        args.push_back(options.remote + "/" + branch);
    } else {
        args.push_back("--");
        args.push_back(branch);
        args.push_back(repo_.default_branch);
    }

    report(cb, fmt::format("Creating branch {} from {}", branch, args.back()));
    auto r = git_.execute(repo_.root, args);
    if (r.is_err()) {
        return Result<void>::Wrap(r, fmt::format("failed to create branch '{}'", branch));
    }
    return Result<void>::Ok();
}

void WorktreeManager::start_session(WorktreeInfo& wt, HookContext& ctx, StatusCallback cb) {
    std::string name = session_name_for(wt);
    if (name.empty()) return;

    auto r = sessions_->create_session(name, wt.path);
    if (r.is_err()) {
        wtm_log(fmt::format("session {} for {} failed: {}", name, wt.path.string(), r.error));
        report(cb, fmt::format("Warning: could not start session {}: {}", name, r.error));
        return;
    }

    wt.session_name = name;
    ctx.session_id = name;
    report(cb, fmt::format("Started session {}", name));

    if (hooks_) {
        auto activated = hooks_->on_worktree_activated(ctx);
        if (activated.is_err()) {
            wtm_log(fmt::format("worktree activated hook failed: {}", activated.error));
            report(cb, "Warning: worktree activated hook failed: " + activated.error);
        }
    }
}

Result<WorktreeInfo> WorktreeManager::create(const std::string& branch, const WorktreeOptions& options,
                                             StatusCallback cb) {
    auto named = validate_branch_name(branch);
    if (named.is_err()) return Result<WorktreeInfo>::Wrap(named, "");

    auto state = inspector_.validate_state(&repo_);
    if (state.is_err()) return Result<WorktreeInfo>::Wrap(state, "repository validation failed");

    const std::string& base_dir = config_.worktree().base_directory;
    auto base = patterns_.validate_base_directory(base_dir.empty() ? DEFAULT_BASE_DIRECTORY : base_dir,
                                                  repo_.root);
    if (base.is_err()) return Result<WorktreeInfo>::Wrap(base, "invalid base directory");

    if (options.path.empty() && !options.auto_name && !config_.worktree().auto_directory) {
        return Result<WorktreeInfo>::Err(ErrorKind::Validation,
                                         "a worktree path is required when auto_directory is disabled");
    }

    fs::path target;
    if (options.path.empty() || options.auto_name) {
        auto generated = patterns_.generate_worktree_path(branch, project_name());
        if (generated.is_err()) {
            return Result<WorktreeInfo>::Wrap(generated, "failed to generate worktree path");
        }
        target = generated.value;
    } else {
        target = absolute_normal(options.path);
    }

    auto valid = validate_candidate(target);
    if (valid.is_err()) return Result<WorktreeInfo>::Wrap(valid, "invalid worktree path");

    if (!options.force) {
        auto available = patterns_.check_path_available(target);
        if (available.is_err()) return Result<WorktreeInfo>::Wrap(available, "worktree path not available");

        for (const auto& wt : repo_.worktrees) {
            if (wt.branch == branch) {
                return Result<WorktreeInfo>::Err(
                    ErrorKind::Conflict,
                    fmt::format("branch '{}' is already checked out in worktree: {}", branch, wt.path.string()));
            }
        }
    }

    if (options.create_branch || config_.worktree().auto_create_branch) {
        auto created = ensure_branch(branch, options, cb);
        if (created.is_err()) return Result<WorktreeInfo>::Wrap(created, "");
    }

    std::vector<std::string> args = {"worktree", "add"};
    if (options.force) args.push_back("--force");
    if (!options.checkout) args.push_back("--no-checkout");
    args.push_back("--");
    args.push_back(target.string());
    args.push_back(branch);

    report(cb, fmt::format("Creating worktree for {} at {}", branch, target.string()));
    auto added = git_.execute(repo_.root, args);
    if (added.is_err()) return Result<WorktreeInfo>::Wrap(added, "failed to create worktree");

    refresh("create");

    WorktreeInfo created;
    auto fetched = info(target);
    if (fetched.is_ok()) {
        created = fetched.value;
    } else {
        wtm_log(fmt::format("create: could not inspect new worktree {}: {}", target.string(), fetched.error));
        created.path = target;
        created.branch = branch;
    }

    HookContext ctx;
    ctx.worktree_path = created.path;
    ctx.worktree_branch = branch;
    ctx.project_name = project_name();
    ctx.custom_vars["WTM_PARENT_PATH"] = repo_.root.string();
    ctx.custom_vars["WTM_WORKTREE_TYPE"] = "new";

    if (hooks_) {
        auto hook = hooks_->on_worktree_created(ctx);
        if (hook.is_err()) {
            wtm_log(fmt::format("worktree created hook failed: {}", hook.error));
            report(cb, "Warning: worktree created hook failed: " + hook.error);
        }
    }

    if (sessions_ && !config_.session().prefix.empty()) {
        start_session(created, ctx, cb);
    }

    return Result<WorktreeInfo>::Ok(created);
}

// ── Inspect ───────────────────────────────────────────────────

void WorktreeManager::enrich(WorktreeInfo& wt, StatusCallback cb) {
    std::error_code ec;
    if (!fs::exists(wt.path, ec)) {
        wtm_log("enrich: worktree directory missing: " + wt.path.string());
        report(cb, "Warning: worktree directory missing: " + wt.path.string());
        return;
    }

    if (!wt.bare) {
        auto clean = inspector_.is_clean(wt.path);
        if (clean.is_ok()) {
            wt.is_clean = clean.value;
            wt.has_uncommitted = !clean.value;
        } else {
            wtm_log(fmt::format("enrich {}: {}", wt.path.string(), clean.error));
            report(cb, fmt::format("Warning: could not read status of {}", wt.path.string()));
        }
    }

    if (!wt.head.empty()) {
        auto commit = inspector_.commit_info(wt.path, wt.head);
        if (commit.is_ok()) {
            wt.last_commit = commit.value;
        } else {
            wtm_log(fmt::format("enrich {}: {}", wt.path.string(), commit.error));
        }
    }

    std::time_t mtime = 0;
    if (platform::modified_time(wt.path, mtime)) {
        wt.last_accessed = mtime;
    }
    wt.created_at = wt.last_commit.date != 0 ? wt.last_commit.date : wt.last_accessed;

    if (sessions_) {
        std::string name = session_name_for(wt);
        if (!name.empty() && sessions_->has_session(name)) {
            wt.session_name = name;
        }
    }
}

Result<std::vector<WorktreeInfo>> WorktreeManager::list(StatusCallback cb) {
    auto state = inspector_.validate_state(&repo_);
    if (state.is_err()) return Result<std::vector<WorktreeInfo>>::Wrap(state, "repository validation failed");

    std::vector<WorktreeInfo> result;
    for (auto wt : repo_.worktrees) {
        enrich(wt, cb);
        result.push_back(wt);
    }
    return Result<std::vector<WorktreeInfo>>::Ok(result);
}

Result<WorktreeInfo> WorktreeManager::info(const fs::path& path) {
    if (path.empty()) {
        return Result<WorktreeInfo>::Err(ErrorKind::Validation, "worktree path cannot be empty");
    }
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<WorktreeInfo>::Err(ErrorKind::NotFound, "worktree does not exist: " + path.string());
    }
    if (!inspector_.is_git_repository(path)) {
        return Result<WorktreeInfo>::Err(ErrorKind::NotFound, "not a git worktree: " + path.string());
    }

    auto worktrees = inspector_.list_worktrees(repo_.root);
    if (worktrees.is_err()) return Result<WorktreeInfo>::Wrap(worktrees, "");

    for (auto wt : worktrees.value) {
        if (same_path(wt.path, path)) {
            enrich(wt, nullptr);
            return Result<WorktreeInfo>::Ok(wt);
        }
    }
    return Result<WorktreeInfo>::Err(
        ErrorKind::NotFound,
        fmt::format("{} is not a worktree of {}", path.string(), repo_.root.string()));
}

// ── Remove / move / prune ─────────────────────────────────────

Result<void> WorktreeManager::remove(const fs::path& path, bool force, StatusCallback cb) {
    if (path.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "worktree path cannot be empty");
    }
    fs::path target = absolute_normal(path);
    if (same_path(target, repo_.root)) {
        return Result<void>::Err(ErrorKind::Validation, "cannot remove the main worktree: " + target.string());
    }

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        if (!force) {
            return Result<void>::Err(ErrorKind::NotFound, "worktree does not exist: " + target.string());
        }
        // Directory already gone: drop the stale registration
        auto pruned = git_.execute(repo_.root, {"worktree", "prune"});
        if (pruned.is_err()) return Result<void>::Wrap(pruned, "failed to prune worktrees");
        report(cb, "Worktree directory already removed; pruned stale entry for " + target.string());
        refresh("remove");
        return Result<void>::Ok();
    }

    auto wt = info(target);
    if (wt.is_err() && !force) {
        return Result<void>::Wrap(wt, "cannot remove worktree");
    }
    if (wt.is_ok() && !wt.value.is_clean && !force) {
        return Result<void>::Err(ErrorKind::Validation,
                                 "worktree has uncommitted changes: " + target.string() +
                                 " (use force to remove anyway)");
    }

    if (sessions_ && wt.is_ok()) {
        std::string name = session_name_for(wt.value);
        if (!name.empty() && sessions_->has_session(name)) {
            auto killed = sessions_->remove_session(name);
            if (killed.is_err()) {
                wtm_log(fmt::format("remove session {}: {}", name, killed.error));
                report(cb, fmt::format("Warning: could not stop session {}: {}", name, killed.error));
            }
        }
    }

    std::vector<std::string> args = {"worktree", "remove"};
    if (force) args.push_back("--force");
    args.push_back(target.string());

    report(cb, "Removing worktree " + target.string());
    auto removed = git_.execute(repo_.root, args);
    if (removed.is_err()) return Result<void>::Wrap(removed, "failed to remove worktree");

    if (fs::exists(target, ec)) {
        fs::remove_all(target, ec);
        if (ec) {
            wtm_log(fmt::format("remove: leftover directory {}: {}", target.string(), ec.message()));
            report(cb, fmt::format("Warning: could not delete {}: {}", target.string(), ec.message()));
        }
    }

    refresh("remove");
    return Result<void>::Ok();
}

Result<void> WorktreeManager::prune() {
    auto r = git_.execute(repo_.root, {"worktree", "prune"});
    if (r.is_err()) return Result<void>::Wrap(r, "failed to prune worktrees");
    refresh("prune");
    return Result<void>::Ok();
}

Result<void> WorktreeManager::move(const fs::path& old_path, const fs::path& new_path) {
    if (old_path.empty() || new_path.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "both old and new paths are required");
    }
    fs::path from = absolute_normal(old_path);
    fs::path to = absolute_normal(new_path);

    std::error_code ec;
    if (!fs::exists(from, ec)) {
        return Result<void>::Err(ErrorKind::NotFound, "worktree does not exist: " + from.string());
    }

    auto valid = validate_candidate(to);
    if (valid.is_err()) return Result<void>::Wrap(valid, "invalid destination");

    auto available = patterns_.check_path_available(to);
    if (available.is_err()) return Result<void>::Wrap(available, "destination not available");

    auto r = git_.execute(repo_.root, {"worktree", "move", from.string(), to.string()});
    if (r.is_err()) return Result<void>::Wrap(r, "failed to move worktree");

    refresh("move");
    return Result<void>::Ok();
}

// ── Maintenance ───────────────────────────────────────────────

Result<int> WorktreeManager::cleanup_old(std::chrono::seconds max_age, StatusCallback cb) {
    auto listed = list(cb);
    if (listed.is_err()) return Result<int>::Wrap(listed, "");

    const std::time_t cutoff = std::time(nullptr) - static_cast<std::time_t>(max_age.count());
    int removed = 0;

    for (const auto& wt : listed.value) {
        if (wt.bare || same_path(wt.path, repo_.root)) continue;
        if (!wt.is_clean || wt.last_accessed == 0) continue;
        if (wt.last_accessed >= cutoff) continue;

        auto r = remove(wt.path, false, cb);
        if (r.is_err()) {
            wtm_log(fmt::format("cleanup: {}: {}", wt.path.string(), r.error));
            report(cb, fmt::format("Failed to remove {}: {}", wt.path.string(), r.error));
            continue;
        }
        removed++;
        report(cb, fmt::format("Removed old worktree {} (last used {})", wt.path.string(),
                               format_local_time(wt.last_accessed, "%Y-%m-%d %H:%M")));
    }
    return Result<int>::Ok(removed);
}

Result<WorktreeStats> WorktreeManager::stats() {
    auto listed = list(nullptr);
    if (listed.is_err()) return Result<WorktreeStats>::Wrap(listed, "");

    WorktreeStats s;
    for (const auto& wt : listed.value) {
        s.total++;
        if (wt.is_clean) s.clean++;
        else s.dirty++;
        if (!wt.session_name.empty()) s.with_session++;
    }
    return Result<WorktreeStats>::Ok(s);
}

std::string WorktreeManager::session_name_for(const WorktreeInfo& info) const {
    const auto& session = config_.session();
    if (session.prefix.empty()) return "";

    PatternContext ctx;
    ctx.prefix = session.prefix;
    ctx.project = sanitize_component(project_name());
    ctx.branch = sanitize_component(info.branch.empty() ? "detached" : info.branch);
    ctx.worktree = info.path.filename().string();

    const std::string& pattern = session.naming_pattern.empty()
        ? std::string(DEFAULT_SESSION_PATTERN) : session.naming_pattern;
    auto resolved = resolve_template(pattern, ctx);
    std::string raw;
    if (resolved.is_ok()) {
        raw = resolved.value;
    } else {
        wtm_log("session name pattern: " + resolved.error);
        raw = ctx.prefix + "-" + ctx.project + "-" + ctx.branch;
    }

    // tmux treats '.' and ':' as target separators
    for (auto& c : raw) {
        if (c == '.' || c == ':') c = '-';
    }
    std::string name = sanitize_component(raw);

    if (session.max_name_length > 0 && name.size() > static_cast<size_t>(session.max_name_length)) {
        name.resize(static_cast<size_t>(session.max_name_length));
        while (!name.empty() && name.back() == '-') name.pop_back();
    }
    return name;
}
