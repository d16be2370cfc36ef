#pragma once

#include <map>
#include <string>
#include <filesystem>
#include <core/types.hpp>

// Values handed to lifecycle hooks.
struct HookContext {
    std::filesystem::path worktree_path;
    std::string worktree_branch;
    std::string project_name;
    std::string session_id;                          // empty when no session
    std::map<std::string, std::string> custom_vars;  // WTM_PARENT_PATH, WTM_WORKTREE_TYPE, ...
};

// Observer for worktree lifecycle events. Failures are reported to the
// caller's status callback and logged; they never fail the operation.
class WorktreeHooks {
public:
    virtual ~WorktreeHooks() = default;

    virtual Result<void> on_worktree_created(const HookContext& ctx) = 0;
    virtual Result<void> on_worktree_activated(const HookContext& ctx) = 0;
};
