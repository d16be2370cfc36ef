#include "wtm_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <git/hosting.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <iostream>

static void print_status(const std::string& msg) {
    std::cout << theme::step(msg);
}

// "--name value" lookup; returns false if the flag is absent.
static bool take_option(std::vector<std::string>& args, const std::string& name, std::string& value) {
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == name && i + 1 < args.size()) {
            value = args[i + 1];
            args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i) + 2);
            return true;
        }
    }
    return false;
}

static bool take_flag(std::vector<std::string>& args, const std::string& name,
                      const std::string& short_name = "") {
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == name || (!short_name.empty() && args[i] == short_name)) {
            args.erase(args.begin() + static_cast<long>(i));
            return true;
        }
    }
    return false;
}

template <typename T>
static int report_error(const std::string& what, const Result<T>& r) {
    std::cout << theme::fail(fmt::format("{} ({}): {}", what, error_kind_name(r.kind), r.error));
    return 1;
}

Result<void> ConsoleHooks::on_worktree_created(const HookContext& ctx) {
    std::cout << theme::info(fmt::format("worktree created: {} ({})",
                                         ctx.worktree_path.string(), ctx.worktree_branch));
    return Result<void>::Ok();
}

Result<void> ConsoleHooks::on_worktree_activated(const HookContext& ctx) {
    std::cout << theme::info(fmt::format("session {} attached to {}",
                                         ctx.session_id, ctx.worktree_path.string()));
    return Result<void>::Ok();
}

WtmCLI::WtmCLI() = default;

bool WtmCLI::load() {
    auto cwd = fs::current_path();

    auto detected_config = Config::load(cwd);
    if (detected_config.is_err()) {
        std::cout << theme::fail(detected_config.error);
        return false;
    }
    config_ = detected_config.value;

    git_ = std::make_unique<GitCommand>(config_.git().command, config_.git().timeout_secs);
    inspector_ = std::make_unique<RepositoryInspector>(*git_, config_.git().remote_url_policy);

    auto repo = inspector_->detect(cwd);
    if (repo.is_err()) {
        std::cout << theme::fail(repo.error);
        return false;
    }
    repo_ = repo.value;

    // Project config lives at the repository root, not necessarily cwd
    if (repo_.root != cwd) {
        auto rooted = Config::load(repo_.root);
        if (rooted.is_err()) {
            std::cout << theme::fail(rooted.error);
            return false;
        }
        config_ = rooted.value;
    }

    if (!config_.session().prefix.empty() && !platform::find_executable("tmux").empty()) {
        sessions_ = std::make_unique<TmuxSessionController>();
    }
    manager_ = std::make_unique<WorktreeManager>(repo_, config_, *git_, &hooks_, sessions_.get());
    wtm_log(fmt::format("loaded repository {} (project {})", repo_.root.string(), manager_->project_name()));
    return true;
}

int WtmCLI::run(const std::string& command, const std::vector<std::string>& args) {
    if (command == "init-config") return cmd_init_config();
    if (command == "patterns") return cmd_patterns(args);

    static const std::vector<std::string> repo_commands = {
        "create", "list", "remove", "move", "prune", "cleanup", "stats", "path", "pr-url",
    };
    bool known = false;
    for (const auto& c : repo_commands) {
        if (c == command) { known = true; break; }
    }
    if (!known) {
        std::cout << theme::fail("Unknown command: " + command);
        print_usage();
        return 1;
    }

    if (!load()) return 1;

    if (command == "create")  return cmd_create(args);
    if (command == "list")    return cmd_list();
    if (command == "remove")  return cmd_remove(args);
    if (command == "move")    return cmd_move(args);
    if (command == "prune")   return cmd_prune();
    if (command == "cleanup") return cmd_cleanup(args);
    if (command == "stats")   return cmd_stats();
    if (command == "path")    return cmd_path(args);
    return cmd_pr_url(args);
}

// ── Commands ──────────────────────────────────────────────

int WtmCLI::cmd_create(const std::vector<std::string>& raw) {
    auto args = raw;
    WorktreeOptions opts;
    std::string path;
    if (take_option(args, "--path", path)) opts.path = path;
    opts.track_remote = take_option(args, "--track", opts.remote);
    opts.create_branch = take_flag(args, "--new-branch", "-b");
    opts.force = take_flag(args, "--force", "-f");
    opts.checkout = !take_flag(args, "--no-checkout");
    opts.auto_name = take_flag(args, "--auto-name");

    if (args.size() != 1) {
        std::cout << theme::fail("Usage: wtm create <branch> [--path P] [-b] [--track REMOTE] [--force]");
        return 1;
    }

    auto r = manager_->create(args[0], opts, print_status);
    if (r.is_err()) return report_error("Create failed", r);

    std::cout << theme::ok(fmt::format("Worktree ready at {}", r.value.path.string()));
    if (!r.value.session_name.empty()) {
        std::cout << theme::kv("session", r.value.session_name);
    }

    if (config_.session().auto_cleanup) {
        auto cleaned = manager_->cleanup_old(std::chrono::hours(config_.session().cleanup_age_hours),
                                             print_status);
        if (cleaned.is_err()) {
            std::cout << theme::warn("Auto cleanup failed: " + cleaned.error);
        } else if (cleaned.value > 0) {
            std::cout << theme::info(fmt::format("Auto cleanup removed {} old worktree(s)", cleaned.value));
        }
    }
    return 0;
}

int WtmCLI::cmd_list() {
    auto r = manager_->list([](const std::string& msg) { std::cout << theme::warn(msg); });
    if (r.is_err()) return report_error("List failed", r);

    std::cout << theme::section(fmt::format("Worktrees of {}", manager_->project_name()));
    for (const auto& wt : r.value) {
        std::string branch = wt.branch.empty() ? (wt.bare ? "(bare)" : "(detached)") : wt.branch;
        std::string state = wt.is_clean ? theme::green("clean") : theme::yellow("dirty");
        std::cout << "    " << theme::bold(branch) << "  " << state << "\n";
        std::cout << theme::kv("path", wt.path.string());
        if (!wt.last_commit.hash.empty()) {
            std::cout << theme::kv("commit", fmt::format("{} {}", wt.last_commit.hash.substr(0, 8),
                                                         wt.last_commit.subject));
        }
        std::cout << theme::kv("accessed", format_local_time(wt.last_accessed, "%Y-%m-%d %H:%M"));
        if (!wt.session_name.empty()) std::cout << theme::kv("session", wt.session_name);
        if (wt.locked) std::cout << theme::kv("locked", "yes");
        if (wt.prunable) std::cout << theme::kv("prunable", "yes");
        std::cout << "\n";
    }
    return 0;
}

int WtmCLI::cmd_remove(const std::vector<std::string>& raw) {
    auto args = raw;
    bool force = take_flag(args, "--force", "-f");
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: wtm remove <path> [--force]");
        return 1;
    }

    auto r = manager_->remove(args[0], force, print_status);
    if (r.is_err()) return report_error("Remove failed", r);
    std::cout << theme::ok("Removed " + args[0]);
    return 0;
}

int WtmCLI::cmd_move(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cout << theme::fail("Usage: wtm move <old-path> <new-path>");
        return 1;
    }
    auto r = manager_->move(args[0], args[1]);
    if (r.is_err()) return report_error("Move failed", r);
    std::cout << theme::ok(fmt::format("Moved {} -> {}", args[0], args[1]));
    return 0;
}

int WtmCLI::cmd_prune() {
    auto r = manager_->prune();
    if (r.is_err()) return report_error("Prune failed", r);
    std::cout << theme::ok("Pruned stale worktree entries");
    return 0;
}

int WtmCLI::cmd_cleanup(const std::vector<std::string>& raw) {
    auto args = raw;
    int hours = config_.session().cleanup_age_hours;
    std::string value;
    if (take_option(args, "--hours", value)) {
        hours = safe_stoi(value, -1);
        if (hours <= 0) {
            std::cout << theme::fail("--hours must be a positive number");
            return 1;
        }
    }

    auto r = manager_->cleanup_old(std::chrono::hours(hours), print_status);
    if (r.is_err()) return report_error("Cleanup failed", r);
    std::cout << theme::ok(fmt::format("Removed {} worktree(s) older than {}h", r.value, hours));
    return 0;
}

int WtmCLI::cmd_stats() {
    auto r = manager_->stats();
    if (r.is_err()) return report_error("Stats failed", r);
    std::cout << theme::section("Worktree stats");
    std::cout << theme::kv("total", std::to_string(r.value.total));
    std::cout << theme::kv("clean", std::to_string(r.value.clean));
    std::cout << theme::kv("dirty", std::to_string(r.value.dirty));
    std::cout << theme::kv("sessions", std::to_string(r.value.with_session));
    return 0;
}

int WtmCLI::cmd_path(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: wtm path <branch>");
        return 1;
    }
    auto r = manager_->patterns().generate_worktree_path(args[0], manager_->project_name());
    if (r.is_err()) return report_error("Cannot generate path", r);
    std::cout << r.value.string() << "\n";
    return 0;
}

int WtmCLI::cmd_patterns(const std::vector<std::string>& args) {
    auto loaded = Config::load(fs::current_path());
    if (loaded.is_err()) return report_error("Config", loaded);
    config_ = loaded.value;

    std::string pattern = args.empty() ? config_.worktree().directory_pattern : args[0];
    GitCommand git(config_.git().command, config_.git().timeout_secs);
    PatternManager patterns(config_.worktree(), git);

    std::cout << theme::section("Variables");
    for (const auto& [name, desc] : PatternManager::pattern_variables()) {
        std::cout << theme::kv(name, desc);
    }
    std::cout << theme::section("Functions");
    for (const auto& [name, desc] : PatternManager::pattern_functions()) {
        std::cout << theme::kv(name, desc);
    }

    std::cout << theme::section("Examples for " + pattern);
    auto examples = patterns.example_paths(pattern);
    if (examples.is_err()) return report_error("Invalid pattern", examples);
    for (const auto& e : examples.value) {
        std::cout << theme::step(e);
    }
    return 0;
}

int WtmCLI::cmd_pr_url(const std::vector<std::string>& raw) {
    auto args = raw;
    std::string remote_name = DEFAULT_REMOTE;
    std::string target = repo_.default_branch;
    take_option(args, "--remote", remote_name);
    take_option(args, "--target", target);

    std::string source = args.empty() ? repo_.current_branch : args[0];
    if (args.size() > 1 || source.empty()) {
        std::cout << theme::fail("Usage: wtm pr-url [branch] [--target BRANCH] [--remote NAME]");
        return 1;
    }

    auto remote = inspector_->remote_info(repo_, remote_name);
    if (remote.is_err()) return report_error("Remote", remote);

    auto client = make_hosting_client(detect_hosting_service(remote.value.url));
    if (!client->supports_pull_requests()) {
        std::cout << theme::fail(fmt::format("{} remote '{}' does not support pull requests",
                                             client->name(), remote_name));
        return 1;
    }
    auto url = client->pull_request_url(remote.value, source, target);
    if (url.is_err()) return report_error("Cannot build pull request URL", url);
    std::cout << url.value << "\n";
    return 0;
}

int WtmCLI::cmd_init_config() {
    bool existed = global_config_exists();
    auto r = create_default_global_config();
    if (r.is_err()) return report_error("Cannot write config", r);
    if (existed) {
        std::cout << theme::info("Config already exists at " + get_global_config_path().string());
    } else {
        std::cout << theme::ok("Wrote " + get_global_config_path().string());
    }
    return 0;
}

void print_usage() {
    std::cout << theme::section("wtm: git worktree manager");
    std::cout << theme::usage("create", "<branch> [--path P] [-b]", "Create a worktree");
    std::cout << theme::usage("", "[--track REMOTE] [--force]", "");
    std::cout << theme::usage("", "[--no-checkout] [--auto-name]", "");
    std::cout << theme::usage("list", "", "List worktrees");
    std::cout << theme::usage("remove", "<path> [--force]", "Remove a worktree");
    std::cout << theme::usage("move", "<old> <new>", "Move a worktree");
    std::cout << theme::usage("prune", "", "Drop stale worktree entries");
    std::cout << theme::usage("cleanup", "[--hours N]", "Remove clean, unused worktrees");
    std::cout << theme::usage("stats", "", "Count worktrees by state");
    std::cout << theme::usage("path", "<branch>", "Print the generated path");
    std::cout << theme::usage("patterns", "[pattern]", "Pattern help and examples");
    std::cout << theme::usage("pr-url", "[branch] [--target B]", "Pull request URL");
    std::cout << theme::usage("init-config", "", "Write ~/.wtm/config.yaml");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    wtm --version        Show version\n"
              << "    wtm --help           Show this help"
              << theme::color::RESET << "\n\n";
}
