#include "output_parser.hpp"
#include <core/utils.hpp>

static const std::string BRANCH_REF_PREFIX = "refs/heads/";

// Value after "key " on a porcelain line, or the whole remainder if the key
// stands alone.
static bool take_field(const std::string& line, const std::string& key, std::string& value) {
    if (line == key) {
        value.clear();
        return true;
    }
    if (line.size() > key.size() && starts_with(line, key) && line[key.size()] == ' ') {
        value = line.substr(key.size() + 1);
        return true;
    }
    return false;
}

std::vector<WorktreeInfo> parse_worktree_list(const std::string& output) {
    std::vector<WorktreeInfo> worktrees;
    WorktreeInfo current;
    bool in_record = false;

    auto flush = [&]() {
        if (in_record && !current.path.empty()) {
            worktrees.push_back(current);
        }
        current = WorktreeInfo();
        in_record = false;
    };

    for (const auto& line : split_lines(output)) {
        if (line.empty()) {
            flush();
            continue;
        }

        std::string value;
        if (take_field(line, "worktree", value)) {
            flush();
            current.path = value;
            in_record = true;
        } else if (!in_record) {
            continue;
        } else if (take_field(line, "HEAD", value)) {
            current.head = value;
        } else if (take_field(line, "branch", value)) {
            current.branch = starts_with(value, BRANCH_REF_PREFIX)
                ? value.substr(BRANCH_REF_PREFIX.size()) : value;
        } else if (line == "bare") {
            current.bare = true;
        } else if (line == "detached") {
            current.detached = true;
        } else if (take_field(line, "locked", value)) {
            current.locked = true;
        } else if (take_field(line, "prunable", value)) {
            current.prunable = true;
        }
    }
    flush();
    return worktrees;
}

std::vector<Remote> parse_remote_list(const std::string& output) {
    std::vector<Remote> remotes;
    for (const auto& line : split_lines(output)) {
        auto fields = split_fields(line);
        if (fields.size() < 2) continue;

        bool seen = false;
        for (const auto& r : remotes) {
            if (r.name == fields[0]) { seen = true; break; }
        }
        if (seen) continue;

        Remote remote;
        remote.name = fields[0];
        remote.url = fields[1];
        remotes.push_back(remote);
    }
    return remotes;
}

std::vector<StatusEntry> parse_status_porcelain(const std::string& output) {
    std::vector<StatusEntry> entries;
    for (const auto& line : split_lines(output)) {
        // "XY path", at least one character of path
        if (line.size() < 4 || line[2] != ' ') continue;

        StatusEntry e;
        e.index = line[0];
        e.worktree = line[1];
        std::string rest = line.substr(3);

        auto arrow = rest.find(" -> ");
        if (arrow != std::string::npos && (e.index == 'R' || e.index == 'C')) {
            e.orig_path = rest.substr(0, arrow);
            e.path = rest.substr(arrow + 4);
        } else {
            e.path = rest;
        }
        entries.push_back(e);
    }
    return entries;
}

Result<CommitInfo> parse_commit_info(const std::string& output) {
    auto lines = split_lines(output);
    if (lines.size() < 3 || lines[0].empty()) {
        return Result<CommitInfo>::Err(ErrorKind::Backend, "unexpected commit info output");
    }

    CommitInfo info;
    info.hash = lines[0];
    info.author = lines[1];
    info.date = static_cast<std::time_t>(safe_stoll(lines[2], 0));
    if (lines.size() > 3) info.subject = lines[3];

    for (size_t i = 4; i < lines.size(); i++) {
        std::string file = lines[i];
        trim(file);
        if (!file.empty()) info.files.push_back(file);
    }
    return Result<CommitInfo>::Ok(info);
}

std::vector<std::string> parse_branch_list(const std::string& output) {
    std::vector<std::string> branches;
    for (auto line : split_lines(output)) {
        if (line.size() >= 2 && (line[0] == '*' || line[0] == '+') && line[1] == ' ') {
            line.erase(0, 2);
        }
        trim(line);
        if (line.empty() || line[0] == '(') continue;
        branches.push_back(line);
    }
    return branches;
}
