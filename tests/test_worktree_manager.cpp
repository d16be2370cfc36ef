#include "git_fixture.hpp"
#include <managers/worktree_manager.hpp>
#include <chrono>
#include <set>

class RecordingHooks : public WorktreeHooks {
public:
    std::vector<HookContext> created;
    std::vector<HookContext> activated;
    bool fail = false;

    Result<void> on_worktree_created(const HookContext& ctx) override {
        created.push_back(ctx);
        if (fail) return Result<void>::Err(ErrorKind::Backend, "hook exploded");
        return Result<void>::Ok();
    }

    Result<void> on_worktree_activated(const HookContext& ctx) override {
        activated.push_back(ctx);
        return Result<void>::Ok();
    }
};

class FakeSessions : public SessionController {
public:
    std::set<std::string> live;
    std::vector<std::string> removed;

    Result<void> create_session(const std::string& name, const fs::path&) override {
        if (live.count(name)) return Result<void>::Err(ErrorKind::Conflict, "session exists: " + name);
        live.insert(name);
        return Result<void>::Ok();
    }

    Result<void> remove_session(const std::string& name) override {
        if (!live.erase(name)) return Result<void>::Err(ErrorKind::NotFound, "no session: " + name);
        removed.push_back(name);
        return Result<void>::Ok();
    }

    bool has_session(const std::string& name) override { return live.count(name) > 0; }
};

class WorktreeManagerTest : public GitRepoTest {
protected:
    GitCommand git_cmd;
    Config config;
    Repository repo;
    std::vector<std::string> messages;

    void SetUp() override {
        GitRepoTest::SetUp();
        if (IsSkipped()) return;

        WorktreeConfig wc;
        wc.base_directory = (tmp / "wts").string();
        config.set_worktree(wc);
        detect();
    }

    void detect() {
        RepositoryInspector inspector(git_cmd);
        auto r = inspector.detect(repo_dir);
        ASSERT_TRUE(r.is_ok()) << r.error;
        repo = r.value;
    }

    StatusCallback collect() {
        return [this](const std::string& msg) { messages.push_back(msg); };
    }

    bool any_message_contains(const std::string& needle) const {
        for (const auto& m : messages) {
            if (m.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    WorktreeInfo create_ok(WorktreeManager& mgr, const std::string& branch) {
        WorktreeOptions opts;
        opts.create_branch = true;
        auto r = mgr.create(branch, opts, collect());
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};

// ── Create ─────────────────────────────────────────────────────

TEST_F(WorktreeManagerTest, CreateGeneratesPathFromPattern) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/login");

    EXPECT_EQ(wt.path, tmp / "wts" / "repo-feature-login");
    EXPECT_EQ(wt.branch, "feature/login");
    EXPECT_TRUE(wt.is_clean);
    EXPECT_FALSE(wt.head.empty());
    EXPECT_EQ(wt.last_commit.subject, "initial commit");
    EXPECT_TRUE(fs::exists(wt.path / "README.md"));
    EXPECT_EQ(repo.worktrees.size(), 2u);
    EXPECT_TRUE(any_message_contains("Creating branch feature/login from main"));
}

TEST_F(WorktreeManagerTest, CreateAtExplicitRelativePath) {
    git({"branch", "topic"});
    WorktreeManager mgr(repo, config, git_cmd);

    WorktreeOptions opts;
    opts.path = "../custom/topic-tree";
    fs::create_directories(tmp / "custom");
    auto r = mgr.create("topic", opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.path, tmp / "custom" / "topic-tree");
    EXPECT_EQ(r.value.branch, "topic");
}

TEST_F(WorktreeManagerTest, CreateRejectsPathInsideRepository) {
    git({"branch", "topic"});
    WorktreeManager mgr(repo, config, git_cmd);

    WorktreeOptions opts;
    opts.path = repo_dir / "nested";
    auto r = mgr.create("topic", opts);
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_NE(r.error.find("inside repository"), std::string::npos);
}

TEST_F(WorktreeManagerTest, CreateRejectsBaseDirectoryInsideRepository) {
    WorktreeConfig wc = config.worktree();
    wc.base_directory = "worktrees";
    config.set_worktree(wc);
    WorktreeManager mgr(repo, config, git_cmd);

    auto r = mgr.create("topic", WorktreeOptions());
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_NE(r.error.find("invalid base directory"), std::string::npos);
}

TEST_F(WorktreeManagerTest, CreateRefusesBranchCheckedOutElsewhere) {
    WorktreeManager mgr(repo, config, git_cmd);
    auto r = mgr.create("main", WorktreeOptions());
    EXPECT_EQ(r.kind, ErrorKind::Conflict);
    EXPECT_NE(r.error.find("already checked out"), std::string::npos);
}

TEST_F(WorktreeManagerTest, CreateRefusesExistingPath) {
    git({"branch", "topic"});
    fs::create_directories(tmp / "taken");
    WorktreeManager mgr(repo, config, git_cmd);

    WorktreeOptions opts;
    opts.path = tmp / "taken";
    EXPECT_EQ(mgr.create("topic", opts).kind, ErrorKind::Conflict);
}

TEST_F(WorktreeManagerTest, CreateNeedsPathWithoutAutoDirectory) {
    git({"branch", "topic"});
    WorktreeConfig wc = config.worktree();
    wc.auto_directory = false;
    config.set_worktree(wc);
    WorktreeManager mgr(repo, config, git_cmd);

    EXPECT_EQ(mgr.create("topic", WorktreeOptions()).kind, ErrorKind::Validation);

    WorktreeOptions opts;
    opts.auto_name = true;
    auto r = mgr.create("topic", opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.path, tmp / "wts" / "repo-topic");
}

TEST_F(WorktreeManagerTest, CreateEmptyBranch) {
    WorktreeManager mgr(repo, config, git_cmd);
    EXPECT_EQ(mgr.create("", WorktreeOptions()).kind, ErrorKind::Validation);
}

TEST_F(WorktreeManagerTest, CreateRejectsOptionLikeBranch) {
    WorktreeManager mgr(repo, config, git_cmd);

    WorktreeOptions opts;
    opts.path = tmp / "injected";
    auto r = mgr.create("--detach", opts);
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_FALSE(fs::exists(tmp / "injected"));
    EXPECT_EQ(repo.worktrees.size(), 1u);

    for (const char* bad : {"-x", "a..b", "HEAD", "refs/heads/x"}) {
        opts.create_branch = true;
        auto rejected = mgr.create(bad, opts);
        EXPECT_EQ(rejected.kind, ErrorKind::Validation) << bad;
    }
    EXPECT_FALSE(fs::exists(tmp / "injected"));
    RepositoryInspector inspector(git_cmd);
    EXPECT_FALSE(inspector.branch_exists(repo_dir, "-x"));
}

TEST_F(WorktreeManagerTest, ForceCreatesOnBranchCheckedOutElsewhere) {
    WorktreeManager mgr(repo, config, git_cmd);

    WorktreeOptions opts;
    opts.force = true;
    opts.path = tmp / "forced";
    auto r = mgr.create("main", opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.branch, "main");
    EXPECT_EQ(r.value.path, tmp / "forced");
    EXPECT_TRUE(fs::exists(tmp / "forced" / "README.md"));
    EXPECT_EQ(repo.worktrees.size(), 2u);
}

TEST_F(WorktreeManagerTest, ForceReusesExistingEmptyDirectory) {
    git({"branch", "topic"});
    fs::create_directories(tmp / "taken");
    WorktreeManager mgr(repo, config, git_cmd);

    WorktreeOptions opts;
    opts.path = tmp / "taken";
    opts.force = true;
    auto r = mgr.create("topic", opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.path, tmp / "taken");
    EXPECT_TRUE(fs::exists(tmp / "taken" / "README.md"));
}

TEST_F(WorktreeManagerTest, CreateBranchTrackingRemote) {
    fs::path origin = tmp / "origin.git";
    git({"clone", "-q", "--bare", repo_dir.string(), origin.string()}, tmp);
    git({"branch", "feature/remote", "main"}, origin);
    git({"remote", "add", "origin", origin.string()});
    git({"fetch", "-q", "origin"});
    detect();
    WorktreeManager mgr(repo, config, git_cmd);

    WorktreeOptions opts;
    opts.create_branch = true;
    opts.track_remote = true;
    opts.remote = "origin";
    auto r = mgr.create("feature/remote", opts, collect());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.branch, "feature/remote");
    EXPECT_EQ(git({"config", "--get", "branch.feature/remote.remote"}), "origin\n");
    EXPECT_EQ(git({"config", "--get", "branch.feature/remote.merge"}), "refs/heads/feature/remote\n");
    EXPECT_TRUE(any_message_contains("Creating branch feature/remote from origin/feature/remote"));
}

TEST_F(WorktreeManagerTest, CreateUnknownBranchFailsInGit) {
    WorktreeManager mgr(repo, config, git_cmd);
    auto r = mgr.create("does-not-exist", WorktreeOptions());
    EXPECT_EQ(r.kind, ErrorKind::Backend);
    EXPECT_NE(r.error.find("failed to create worktree"), std::string::npos);
    EXPECT_EQ(repo.worktrees.size(), 1u);
}

TEST_F(WorktreeManagerTest, AutoCreateBranchFromConfig) {
    WorktreeConfig wc = config.worktree();
    wc.auto_create_branch = true;
    config.set_worktree(wc);
    WorktreeManager mgr(repo, config, git_cmd);

    auto r = mgr.create("feature/auto", WorktreeOptions());
    ASSERT_TRUE(r.is_ok()) << r.error;
    RepositoryInspector inspector(git_cmd);
    EXPECT_TRUE(inspector.branch_exists(repo_dir, "feature/auto"));
}

TEST_F(WorktreeManagerTest, CreateRunsHooks) {
    RecordingHooks hooks;
    WorktreeManager mgr(repo, config, git_cmd, &hooks);
    WorktreeInfo wt = create_ok(mgr, "feature/hooked");

    ASSERT_EQ(hooks.created.size(), 1u);
    const HookContext& ctx = hooks.created[0];
    EXPECT_EQ(ctx.worktree_path, wt.path);
    EXPECT_EQ(ctx.worktree_branch, "feature/hooked");
    EXPECT_EQ(ctx.project_name, "repo");
    EXPECT_TRUE(ctx.session_id.empty());
    EXPECT_EQ(ctx.custom_vars.at("WTM_PARENT_PATH"), repo_dir.string());
    EXPECT_EQ(ctx.custom_vars.at("WTM_WORKTREE_TYPE"), "new");
    EXPECT_TRUE(hooks.activated.empty());
}

TEST_F(WorktreeManagerTest, HookFailureIsOnlyAWarning) {
    RecordingHooks hooks;
    hooks.fail = true;
    WorktreeManager mgr(repo, config, git_cmd, &hooks);

    WorktreeOptions opts;
    opts.create_branch = true;
    auto r = mgr.create("feature/failing-hook", opts, collect());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(any_message_contains("hook exploded"));
}

TEST_F(WorktreeManagerTest, CreateStartsSession) {
    SessionConfig sc;
    sc.prefix = "dev";
    config.set_session(sc);
    RecordingHooks hooks;
    FakeSessions sessions;
    WorktreeManager mgr(repo, config, git_cmd, &hooks, &sessions);

    WorktreeInfo wt = create_ok(mgr, "feature/x");
    EXPECT_EQ(wt.session_name, "dev-repo-feature-x");
    EXPECT_EQ(sessions.live.count("dev-repo-feature-x"), 1u);
    ASSERT_EQ(hooks.activated.size(), 1u);
    EXPECT_EQ(hooks.activated[0].session_id, "dev-repo-feature-x");

    auto listed = mgr.list();
    ASSERT_TRUE(listed.is_ok()) << listed.error;
    int with_session = 0;
    for (const auto& w : listed.value) {
        if (!w.session_name.empty()) with_session++;
    }
    EXPECT_EQ(with_session, 1);

    ASSERT_TRUE(mgr.remove(wt.path, false).is_ok());
    std::vector<std::string> removed = {"dev-repo-feature-x"};
    EXPECT_EQ(sessions.removed, removed);
}

TEST_F(WorktreeManagerTest, NoSessionWithoutPrefix) {
    FakeSessions sessions;
    WorktreeManager mgr(repo, config, git_cmd, nullptr, &sessions);
    WorktreeInfo wt = create_ok(mgr, "feature/quiet");
    EXPECT_TRUE(wt.session_name.empty());
    EXPECT_TRUE(sessions.live.empty());
}

// ── Inspect ────────────────────────────────────────────────────

TEST_F(WorktreeManagerTest, ListReportsDirtyWorktrees) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/dirty");
    write_file(wt.path / "scratch.txt", "wip");

    auto listed = mgr.list();
    ASSERT_TRUE(listed.is_ok()) << listed.error;
    ASSERT_EQ(listed.value.size(), 2u);
    EXPECT_EQ(listed.value[0].path, repo_dir);
    EXPECT_TRUE(listed.value[0].is_clean);
    EXPECT_FALSE(listed.value[1].is_clean);
    EXPECT_TRUE(listed.value[1].has_uncommitted);
    EXPECT_GT(listed.value[1].last_accessed, 0);
    EXPECT_GT(listed.value[1].created_at, 0);
}

TEST_F(WorktreeManagerTest, ListWarnsAboutMissingDirectories) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/vanished");
    fs::remove_all(wt.path);

    messages.clear();
    auto listed = mgr.list(collect());
    ASSERT_TRUE(listed.is_ok()) << listed.error;
    EXPECT_EQ(listed.value.size(), 2u);
    EXPECT_TRUE(any_message_contains("missing"));
}

TEST_F(WorktreeManagerTest, InfoErrors) {
    WorktreeManager mgr(repo, config, git_cmd);
    EXPECT_EQ(mgr.info("").kind, ErrorKind::Validation);
    EXPECT_EQ(mgr.info(tmp / "missing").kind, ErrorKind::NotFound);

    fs::create_directories(tmp / "plain");
    setenv("GIT_CEILING_DIRECTORIES", tmp.c_str(), 1);
    auto r = mgr.info(tmp / "plain");
    unsetenv("GIT_CEILING_DIRECTORIES");
    EXPECT_EQ(r.kind, ErrorKind::NotFound);

    auto main_info = mgr.info(repo_dir);
    ASSERT_TRUE(main_info.is_ok()) << main_info.error;
    EXPECT_EQ(main_info.value.branch, "main");
}

// ── Remove ─────────────────────────────────────────────────────

TEST_F(WorktreeManagerTest, RemoveCleanWorktree) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/done");

    ASSERT_TRUE(mgr.remove(wt.path, false).is_ok());
    EXPECT_FALSE(fs::exists(wt.path));
    EXPECT_EQ(repo.worktrees.size(), 1u);

    EXPECT_EQ(mgr.remove(wt.path, false).kind, ErrorKind::NotFound);
}

TEST_F(WorktreeManagerTest, RemoveDirtyNeedsForce) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/wip");
    write_file(wt.path / "wip.txt", "unsaved");

    auto refused = mgr.remove(wt.path, false);
    EXPECT_EQ(refused.kind, ErrorKind::Validation);
    EXPECT_NE(refused.error.find("uncommitted changes"), std::string::npos);
    EXPECT_TRUE(fs::exists(wt.path));

    ASSERT_TRUE(mgr.remove(wt.path, true).is_ok());
    EXPECT_FALSE(fs::exists(wt.path));
}

TEST_F(WorktreeManagerTest, ForceRemovePrunesVanishedDirectory) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/gone");
    fs::remove_all(wt.path);

    ASSERT_TRUE(mgr.remove(wt.path, true).is_ok());
    EXPECT_EQ(repo.worktrees.size(), 1u);
}

TEST_F(WorktreeManagerTest, RemoveRefusesMainWorktree) {
    WorktreeManager mgr(repo, config, git_cmd);
    EXPECT_EQ(mgr.remove(repo_dir, true).kind, ErrorKind::Validation);
    EXPECT_EQ(mgr.remove("", false).kind, ErrorKind::Validation);
    EXPECT_TRUE(fs::exists(repo_dir / "README.md"));
}

// ── Move / prune ───────────────────────────────────────────────

TEST_F(WorktreeManagerTest, MoveWorktree) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/mover");
    fs::path dest = tmp / "moved";

    ASSERT_TRUE(mgr.move(wt.path, dest).is_ok());
    EXPECT_FALSE(fs::exists(wt.path));
    EXPECT_TRUE(fs::exists(dest / "README.md"));

    auto moved = mgr.info(dest);
    ASSERT_TRUE(moved.is_ok()) << moved.error;
    EXPECT_EQ(moved.value.branch, "feature/mover");
}

TEST_F(WorktreeManagerTest, MoveValidatesDestination) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/stay");
    fs::create_directories(tmp / "occupied");

    EXPECT_EQ(mgr.move(tmp / "nowhere", tmp / "dest").kind, ErrorKind::NotFound);
    EXPECT_EQ(mgr.move(wt.path, repo_dir / "inside").kind, ErrorKind::Validation);
    EXPECT_EQ(mgr.move(wt.path, tmp / "occupied").kind, ErrorKind::Conflict);
    EXPECT_EQ(mgr.move(wt.path, "").kind, ErrorKind::Validation);
    EXPECT_TRUE(fs::exists(wt.path));
}

TEST_F(WorktreeManagerTest, PruneDropsStaleEntries) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo wt = create_ok(mgr, "feature/stale");
    fs::remove_all(wt.path);

    ASSERT_TRUE(mgr.prune().is_ok());
    EXPECT_EQ(repo.worktrees.size(), 1u);
}

// ── Maintenance ────────────────────────────────────────────────

TEST_F(WorktreeManagerTest, CleanupRemovesOnlyOldCleanWorktrees) {
    WorktreeManager mgr(repo, config, git_cmd);
    WorktreeInfo fresh = create_ok(mgr, "feature/fresh");
    WorktreeInfo old_clean = create_ok(mgr, "feature/old");
    WorktreeInfo old_dirty = create_ok(mgr, "feature/old-dirty");
    write_file(old_dirty.path / "wip.txt", "keep me");

    auto month_ago = fs::file_time_type::clock::now() - std::chrono::hours(24 * 30);
    fs::last_write_time(old_clean.path, month_ago);
    fs::last_write_time(old_dirty.path, month_ago);

    auto r = mgr.cleanup_old(std::chrono::hours(DEFAULT_CLEANUP_AGE_HOURS), collect());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 1);
    EXPECT_FALSE(fs::exists(old_clean.path));
    EXPECT_TRUE(fs::exists(old_dirty.path));
    EXPECT_TRUE(fs::exists(fresh.path));
    EXPECT_TRUE(fs::exists(repo_dir));
    EXPECT_TRUE(any_message_contains("Removed old worktree"));
}

TEST_F(WorktreeManagerTest, Stats) {
    WorktreeManager mgr(repo, config, git_cmd);
    create_ok(mgr, "feature/a");
    WorktreeInfo b = create_ok(mgr, "feature/b");
    write_file(b.path / "change.txt", "x");

    auto s = mgr.stats();
    ASSERT_TRUE(s.is_ok()) << s.error;
    EXPECT_EQ(s.value.total, 3);
    EXPECT_EQ(s.value.clean, 2);
    EXPECT_EQ(s.value.dirty, 1);
    EXPECT_EQ(s.value.with_session, 0);
}

// ── Naming ─────────────────────────────────────────────────────

TEST_F(WorktreeManagerTest, SessionNames) {
    WorktreeInfo wt;
    wt.path = tmp / "wts" / "repo-release-v1.2";
    wt.branch = "release/v1.2";

    {
        WorktreeManager mgr(repo, config, git_cmd);
        EXPECT_EQ(mgr.session_name_for(wt), "");
    }

    SessionConfig sc;
    sc.prefix = "dev";
    config.set_session(sc);
    {
        WorktreeManager mgr(repo, config, git_cmd);
        EXPECT_EQ(mgr.session_name_for(wt), "dev-repo-release-v1-2");
    }

    sc.max_name_length = 9;
    config.set_session(sc);
    {
        WorktreeManager mgr(repo, config, git_cmd);
        EXPECT_EQ(mgr.session_name_for(wt), "dev-repo");
    }

    sc.max_name_length = 50;
    sc.naming_pattern = "{{.Prefix}}:{{.Worktree}}";
    config.set_session(sc);
    {
        WorktreeManager mgr(repo, config, git_cmd);
        EXPECT_EQ(mgr.session_name_for(wt), "dev-repo-release-v1-2");
    }
}

TEST_F(WorktreeManagerTest, ProjectNameFromOrigin) {
    git({"remote", "add", "origin", "git@github.com:acme/widget.git"});
    detect();
    WorktreeManager mgr(repo, config, git_cmd);
    EXPECT_EQ(mgr.project_name(), "widget");

    WorktreeInfo wt = create_ok(mgr, "feature/named");
    EXPECT_EQ(wt.path, tmp / "wts" / "widget-feature-named");
}
