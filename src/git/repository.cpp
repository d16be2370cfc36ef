#include "repository.hpp"
#include "output_parser.hpp"
#include "remote_url.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static const std::string ORIGIN_HEAD_PREFIX = "refs/remotes/origin/";

RepositoryInspector::RepositoryInspector(GitExecutor& git, RemoteUrlPolicy policy)
    : git_(git), policy_(policy) {}

Result<Repository> RepositoryInspector::detect(const fs::path& path) {
    std::error_code ec;
    fs::path dir = path;
    if (dir.empty()) {
        dir = fs::current_path(ec);
        if (ec) {
            return Result<Repository>::Err(ErrorKind::Backend,
                                           "failed to get current directory: " + ec.message());
        }
    }
    if (!fs::exists(dir, ec)) {
        return Result<Repository>::Err(ErrorKind::NotFound, "path does not exist: " + dir.string());
    }

    auto top = git_.execute(dir, {"rev-parse", "--show-toplevel"});
    if (top.is_err() || top.value.empty()) {
        return Result<Repository>::Err(ErrorKind::NotFound, "not a git repository: " + dir.string());
    }

    Repository repo;
    repo.path = dir;
    repo.root = fs::weakly_canonical(fs::path(top.value), ec);
    if (ec) repo.root = fs::path(top.value);

    auto populated = populate(repo);
    if (populated.is_err()) {
        return Result<Repository>::Wrap(populated, "failed to populate repository info");
    }
    wtm_log(fmt::format("detect: {} root={} branch={} default={} remotes={} worktrees={}",
                        dir.string(), repo.root.string(), repo.current_branch,
                        repo.default_branch, repo.remotes.size(), repo.worktrees.size()));
    return Result<Repository>::Ok(repo);
}

Result<void> RepositoryInspector::validate_state(Repository* repo) {
    if (!repo) {
        return Result<void>::Err(ErrorKind::Validation, "repository is null");
    }
    std::error_code ec;
    if (!fs::exists(repo->root, ec)) {
        return Result<void>::Err(ErrorKind::NotFound,
                                 "repository root no longer exists: " + repo->root.string());
    }
    if (!is_git_repository(repo->root)) {
        return Result<void>::Err(ErrorKind::NotFound,
                                 "no longer a git repository: " + repo->root.string());
    }
    return populate(*repo);
}

bool RepositoryInspector::is_git_repository(const fs::path& path) {
    return git_.execute(path, {"rev-parse", "--git-dir"}).is_ok();
}

bool RepositoryInspector::branch_exists(const fs::path& root, const std::string& branch) {
    if (branch.empty()) return false;
    return git_.execute(root, {"rev-parse", "--verify", "--quiet", "refs/heads/" + branch}).is_ok();
}

Result<bool> RepositoryInspector::is_clean(const fs::path& dir) {
    auto status = git_.execute(dir, {"status", "--porcelain"});
    if (status.is_err()) return Result<bool>::Wrap(status, "failed to check status");
    return Result<bool>::Ok(parse_status_porcelain(status.value).empty());
}

Result<std::vector<std::string>> RepositoryInspector::list_branches(const fs::path& root) {
    auto out = git_.execute(root, {"branch", "--format=%(refname:short)"});
    if (out.is_err()) return Result<std::vector<std::string>>::Wrap(out, "failed to list branches");
    return Result<std::vector<std::string>>::Ok(parse_branch_list(out.value));
}

Result<std::vector<WorktreeInfo>> RepositoryInspector::list_worktrees(const fs::path& root) {
    auto out = git_.execute(root, {"worktree", "list", "--porcelain"});
    if (out.is_err()) return Result<std::vector<WorktreeInfo>>::Wrap(out, "failed to list worktrees");
    return Result<std::vector<WorktreeInfo>>::Ok(parse_worktree_list(out.value));
}

Result<CommitInfo> RepositoryInspector::commit_info(const fs::path& dir, const std::string& hash) {
    if (hash.empty()) {
        return Result<CommitInfo>::Err(ErrorKind::Validation, "commit hash is empty");
    }
    auto out = git_.execute(dir, {"show", "--name-only", "--pretty=format:%H%n%an%n%at%n%s", hash});
    if (out.is_err()) return Result<CommitInfo>::Wrap(out, "failed to get commit info");
    return parse_commit_info(out.value);
}

Result<Remote> RepositoryInspector::remote_info(const Repository& repo, const std::string& name) const {
    for (const auto& r : repo.remotes) {
        if (r.name == name) return Result<Remote>::Ok(r);
    }
    return Result<Remote>::Err(ErrorKind::NotFound, fmt::format("remote '{}' not found", name));
}

// ── Population ────────────────────────────────────────────────

std::string RepositoryInspector::detect_current_branch(const fs::path& root) {
    auto shown = git_.execute(root, {"branch", "--show-current"});
    if (shown.is_ok() && !shown.value.empty()) return shown.value;

    // Older git, or detached HEAD
    auto abbrev = git_.execute(root, {"rev-parse", "--abbrev-ref", "HEAD"});
    if (abbrev.is_ok()) return abbrev.value;
    return "";
}

std::string RepositoryInspector::detect_default_branch(const fs::path& root) {
    auto head = git_.execute(root, {"symbolic-ref", "refs/remotes/origin/HEAD"});
    if (head.is_ok() && starts_with(head.value, ORIGIN_HEAD_PREFIX) &&
        head.value.size() > ORIGIN_HEAD_PREFIX.size()) {
        return head.value.substr(ORIGIN_HEAD_PREFIX.size());
    }

    auto configured = git_.execute(root, {"config", "--get", "init.defaultBranch"});
    if (configured.is_ok()) {
        std::string name = configured.value;
        trim(name);
        if (!name.empty()) return name;
    }

    for (const char* candidate : {"main", "master", "develop"}) {
        if (branch_exists(root, candidate)) return candidate;
    }
    return DEFAULT_BRANCH;
}

Result<std::vector<Remote>> RepositoryInspector::load_remotes(const fs::path& root) {
    auto out = git_.execute(root, {"remote", "-v"});
    if (out.is_err()) return Result<std::vector<Remote>>::Wrap(out, "failed to list remotes");

    std::vector<Remote> remotes;
    for (auto& remote : parse_remote_list(out.value)) {
        if (apply_remote_url(remote)) {
            remotes.push_back(remote);
            continue;
        }

        switch (policy_) {
            case RemoteUrlPolicy::Keep:
                wtm_log(fmt::format("remote {}: unrecognised URL kept as-is: {}", remote.name, remote.url));
                remotes.push_back(remote);
                break;
            case RemoteUrlPolicy::Skip:
                wtm_log(fmt::format("remote {}: unrecognised URL skipped: {}", remote.name, remote.url));
                break;
            case RemoteUrlPolicy::Reject:
                return Result<std::vector<Remote>>::Err(
                    ErrorKind::Validation,
                    fmt::format("unsupported remote URL format for '{}': {}", remote.name, remote.url));
        }
    }
    return Result<std::vector<Remote>>::Ok(remotes);
}

Result<void> RepositoryInspector::populate(Repository& repo) {
    repo.current_branch = detect_current_branch(repo.root);
    repo.default_branch = detect_default_branch(repo.root);

    auto clean = is_clean(repo.root);
    if (clean.is_err()) return Result<void>::Wrap(clean, "");
    repo.is_clean = clean.value;

    auto remotes = load_remotes(repo.root);
    if (remotes.is_err()) return Result<void>::Wrap(remotes, "");
    repo.remotes = remotes.value;

    repo.origin.clear();
    for (const auto& r : repo.remotes) {
        if (r.name == DEFAULT_REMOTE) {
            repo.origin = r.url;
            break;
        }
    }

    auto worktrees = list_worktrees(repo.root);
    if (worktrees.is_err()) return Result<void>::Wrap(worktrees, "");
    repo.worktrees = worktrees.value;
    return Result<void>::Ok();
}
