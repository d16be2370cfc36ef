#include "pattern_manager.hpp"
#include "sanitize.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

static const char* const RESERVED_NAMES[] = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

// Absolute, symlink-resolved where the path exists, split into components.
static std::vector<std::string> path_components(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    fs::path canon = fs::weakly_canonical(abs, ec);
    if (ec) canon = abs.lexically_normal();

    std::vector<std::string> parts;
    for (const auto& part : canon) {
        std::string s = part.string();
        if (!s.empty()) parts.push_back(s);
    }
    return parts;
}

bool path_within(const fs::path& path, const fs::path& root) {
    auto p = path_components(path);
    auto r = path_components(root);
    if (r.empty() || p.size() < r.size()) return false;
    for (size_t i = 0; i < r.size(); i++) {
        if (p[i] != r[i]) return false;
    }
    return true;
}

PatternManager::PatternManager(const WorktreeConfig& config, GitExecutor& git)
    : config_(config), git_(git), clock_([] { return std::time(nullptr); }) {}

// ── Validation ────────────────────────────────────────────────

Result<void> PatternManager::validate_pattern(const std::string& pattern) const {
    if (pattern.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "pattern cannot be empty");
    }
    if (pattern.find("{{") == std::string::npos || pattern.find("}}") == std::string::npos) {
        return Result<void>::Err(ErrorKind::Validation, "pattern must contain template variables");
    }
    if (pattern.find("..") != std::string::npos) {
        return Result<void>::Err(ErrorKind::Validation,
                                 "pattern cannot contain '..' (directory traversal)");
    }
    if (pattern.find('~') != std::string::npos) {
        return Result<void>::Err(ErrorKind::Validation, "pattern cannot contain '~'");
    }
    if (pattern.find('\\') != std::string::npos) {
        return Result<void>::Err(ErrorKind::Validation, "pattern cannot contain backslashes");
    }
    if (pattern[0] == '/') {
        return Result<void>::Err(ErrorKind::Validation, "pattern cannot start with '/'");
    }

    auto parsed = parse_template(pattern);
    if (parsed.is_err()) return Result<void>::Wrap(parsed, "invalid pattern syntax");

    const auto& allowed = pattern_variable_names();
    for (const auto& name : parsed.value.variables()) {
        bool known = false;
        for (const auto& a : allowed) {
            if (a == name) { known = true; break; }
        }
        if (!known) {
            return Result<void>::Err(ErrorKind::UnknownVariable,
                                     fmt::format("unknown variable .{} in pattern", name));
        }
    }
    return Result<void>::Ok();
}

Result<std::string> PatternManager::apply_pattern(const std::string& pattern,
                                                  const PatternContext& ctx) const {
    const std::string& effective = pattern.empty() ? config_.directory_pattern : pattern;

    auto valid = validate_pattern(effective);
    if (valid.is_err()) return Result<std::string>::Wrap(valid, "invalid pattern");

    auto resolved = resolve_template(effective, ctx);
    if (resolved.is_err()) return Result<std::string>::Wrap(resolved, "failed to execute pattern");

    std::string result = resolved.value;
    if (config_.sanitize_names) {
        result = sanitize_path(result);
    }
    if (config_.max_length > 0) {
        result = truncate_path(result, config_.max_length);
    }
    return Result<std::string>::Ok(result);
}

Result<void> PatternManager::validate_result(const std::string& candidate) const {
    if (candidate.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "pattern result cannot be empty");
    }
    if (candidate[0] == '/' || fs::path(candidate).is_absolute()) {
        return Result<void>::Err(ErrorKind::Validation,
                                 "pattern result cannot be an absolute path: " + candidate);
    }
    std::string clean = fs::path(candidate).lexically_normal().string();
    if (clean.find("..") != std::string::npos) {
        return Result<void>::Err(ErrorKind::Validation,
                                 "pattern result contains parent directory traversal: " + candidate);
    }

    std::string upper = to_upper(candidate);
    for (const char* reserved : RESERVED_NAMES) {
        std::string r(reserved);
        if (upper == r || starts_with(upper, r + ".")) {
            return Result<void>::Err(ErrorKind::Validation,
                                     "pattern result uses reserved name: " + candidate);
        }
    }

    if (candidate.size() > MAX_PATTERN_RESULT_LEN) {
        return Result<void>::Err(ErrorKind::Validation,
                                 fmt::format("pattern result too long ({} chars, max {}): {}",
                                             candidate.size(), MAX_PATTERN_RESULT_LEN, candidate));
    }
    return Result<void>::Ok();
}

// ── Context ───────────────────────────────────────────────────

std::string PatternManager::user_name() {
    auto r = git_.execute({}, {"config", "--get", "user.name"});
    if (r.is_ok()) {
        std::string name = r.value;
        trim(name);
        if (!name.empty()) return sanitize_component(name);
    }

    std::string name = platform::current_user_name();
    if (!name.empty()) return sanitize_component(name);
    return "user";
}

PatternContext PatternManager::build_context(const std::string& branch, const std::string& project) {
    std::time_t now = clock_();

    PatternContext ctx;
    ctx.project = sanitize_component(project);
    ctx.branch = sanitize_component(branch);
    ctx.worktree = ctx.branch + "-" + format_local_time(now, WORKTREE_ID_FORMAT);
    ctx.timestamp = format_local_time(now, TIMESTAMP_FORMAT);
    ctx.user_name = user_name();
    ctx.prefix = config_.prefix.empty() ? config_.default_branch : config_.prefix;
    ctx.suffix = config_.suffix;
    return ctx;
}

// ── Placement ─────────────────────────────────────────────────

Result<fs::path> PatternManager::resolve_base_directory(const std::string& base_dir,
                                                        const PatternContext& ctx) const {
    const std::string tmpl = base_dir.empty() ? std::string(DEFAULT_BASE_DIRECTORY) : base_dir;

    auto resolved = resolve_template(tmpl, ctx);
    if (resolved.is_err()) {
        return Result<fs::path>::Err(ErrorKind::BaseDirectoryResolution,
                                     "failed to resolve base directory pattern: " + resolved.error);
    }

    std::string text = resolved.value;
    if (text.empty()) {
        return Result<fs::path>::Err(ErrorKind::BaseDirectoryResolution,
                                     "base directory pattern resolved to an empty path");
    }
    if (text == "~" || starts_with(text, "~/")) {
        text = (platform::home_dir() / text.substr(text.size() > 1 ? 2 : 1)).string();
    }

    fs::path p(text);
    if (p.is_relative()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (ec) {
            return Result<fs::path>::Err(ErrorKind::BaseDirectoryResolution,
                                         "failed to get current directory: " + ec.message());
        }
        p = cwd / p;
    }
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return Result<fs::path>::Ok(p);
}

Result<void> PatternManager::validate_base_directory(const std::string& base_dir,
                                                     const fs::path& repo_root) const {
    if (base_dir.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "base directory cannot be empty");
    }

    PatternContext ctx;
    ctx.project = sanitize_component(repo_root.filename().string());
    ctx.prefix = config_.prefix.empty() ? config_.default_branch : config_.prefix;
    ctx.suffix = config_.suffix;

    auto resolved = resolve_base_directory(base_dir, ctx);
    if (resolved.is_err()) return Result<void>::Wrap(resolved, "");

    if (path_within(resolved.value, repo_root)) {
        return Result<void>::Err(ErrorKind::Validation,
                                 fmt::format("base directory cannot be inside repository: {} (repository: {})",
                                             resolved.value.string(), repo_root.string()));
    }
    return Result<void>::Ok();
}

Result<fs::path> PatternManager::generate_worktree_path(const std::string& branch,
                                                        const std::string& project) {
    PatternContext ctx = build_context(branch, project);

    auto base = resolve_base_directory(config_.base_directory, ctx);
    if (base.is_err()) return base;

    auto name = apply_pattern(config_.directory_pattern, ctx);
    if (name.is_err()) return Result<fs::path>::Wrap(name, "failed to apply pattern");

    auto valid = validate_result(name.value);
    if (valid.is_err()) return Result<fs::path>::Wrap(valid, "invalid worktree directory name");

    std::error_code ec;
    fs::create_directories(base.value, ec);
    if (ec || !fs::is_directory(base.value)) {
        std::string why = ec ? ec.message() : "exists and is not a directory";
        return Result<fs::path>::Err(ErrorKind::DirectoryCreation,
                                     fmt::format("failed to create base directory {}: {}",
                                                 base.value.string(), why));
    }

    fs::path full = (base.value / name.value).lexically_normal();
    wtm_log(fmt::format("generate_worktree_path: branch={} project={} -> {}",
                        branch, project, full.string()));
    return Result<fs::path>::Ok(full);
}

Result<void> PatternManager::check_path_available(const fs::path& path) const {
    if (path.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "path cannot be empty");
    }

    std::error_code ec;
    if (fs::exists(fs::symlink_status(path, ec))) {
        return Result<void>::Err(ErrorKind::Conflict, "path already exists: " + path.string());
    }

    fs::path parent = path.parent_path();
    if (parent.empty()) return Result<void>::Ok();

    auto st = fs::status(parent, ec);
    if (!fs::exists(st)) {
        return Result<void>::Err(ErrorKind::NotFound,
                                 "parent directory does not exist: " + parent.string());
    }
    if (!fs::is_directory(st)) {
        return Result<void>::Err(ErrorKind::Validation,
                                 "parent path is not a directory: " + parent.string());
    }

    if (!platform::can_create_file_in(parent, WRITE_TEST_PREFIX)) {
        return Result<void>::Err(ErrorKind::Validation,
                                 "parent directory is not writable: " + parent.string());
    }
    return Result<void>::Ok();
}

Result<void> PatternManager::create_directory(const fs::path& path) const {
    auto available = check_path_available(path);
    if (available.is_err()) return available;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::DirectoryCreation,
                                 fmt::format("failed to create directory {}: {}", path.string(), ec.message()));
    }
    return Result<void>::Ok();
}

// ── Documentation ─────────────────────────────────────────────

Result<std::vector<std::string>> PatternManager::example_paths(const std::string& pattern) const {
    static const PatternContext samples[] = {
        {"my-project", "feature/user-auth", "feature-user-auth-0102-143045",
         "20240102-143045", "john-doe", "main", "dev"},
        {"api-server", "bugfix/memory-leak", "bugfix-memory-leak-0103-091530",
         "20240103-091530", "jane-smith", "master", "fix"},
        {"frontend-app", "main", "main-0103-102015",
         "20240103-102015", "dev-user", "main", ""},
    };

    std::vector<std::string> results;
    for (const auto& ctx : samples) {
        auto r = apply_pattern(pattern, ctx);
        if (r.is_err()) {
            return Result<std::vector<std::string>>::Wrap(
                r, fmt::format("failed to apply pattern for {}/{}", ctx.project, ctx.branch));
        }
        results.push_back(r.value);
    }
    return Result<std::vector<std::string>>::Ok(results);
}

std::vector<std::pair<std::string, std::string>> PatternManager::pattern_variables() {
    return {
        {"{{.Project}}",   "Project/repository name (sanitized)"},
        {"{{.Branch}}",    "Git branch name (sanitized)"},
        {"{{.Worktree}}",  "Unique worktree identifier (branch-MMDD-HHMMSS)"},
        {"{{.Timestamp}}", "Current timestamp (YYYYMMDD-HHMMSS)"},
        {"{{.UserName}}",  "Git user name or system user (sanitized)"},
        {"{{.Prefix}}",    "Configured prefix, or the default branch"},
        {"{{.Suffix}}",    "Configured suffix"},
    };
}

std::vector<std::pair<std::string, std::string>> PatternManager::pattern_functions() {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& f : template_functions()) {
        out.emplace_back(f.name, f.description);
    }
    return out;
}
