#pragma once

#include <cstddef>

// ── Naming ──────────────────────────────────────────────────
constexpr const char* FALLBACK_COMPONENT_NAME = "unnamed";    // sanitized branch/project
constexpr const char* FALLBACK_PATH_NAME      = "worktree";   // sanitized directory name
constexpr const char* TRUNCATION_MARKER       = "...";
constexpr std::size_t MAX_PATTERN_RESULT_LEN  = 255;
constexpr const char* WRITE_TEST_PREFIX       = ".wtm-write-test";

// strftime formats for PatternContext
constexpr const char* TIMESTAMP_FORMAT   = "%Y%m%d-%H%M%S";   // {{.Timestamp}}
constexpr const char* WORKTREE_ID_FORMAT = "%m%d-%H%M%S";     // suffix of {{.Worktree}}

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_BASE_DIRECTORY    = "../.worktrees/{{.Project}}";
constexpr const char* DEFAULT_DIRECTORY_PATTERN = "{{.Project}}-{{.Branch}}";
constexpr const char* DEFAULT_BRANCH            = "main";
constexpr const char* DEFAULT_REMOTE            = "origin";
constexpr const char* DEFAULT_SESSION_PATTERN   = "{{.Prefix}}-{{.Project}}-{{.Branch}}";
constexpr int DEFAULT_MAX_NAME_LENGTH           = 100;
constexpr int DEFAULT_SESSION_NAME_MAX          = 50;
constexpr int DEFAULT_CLEANUP_AGE_HOURS         = 168;   // one week

// ── Timeouts ────────────────────────────────────────────────
constexpr int GIT_CMD_TIMEOUT_SECS   = 120;   // Max time for a single git invocation
constexpr int TERMINATE_GRACE_MS     = 2000;  // SIGTERM -> SIGKILL window

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PROCESS_READ_BUF_SIZE  = 4096;
constexpr std::size_t LOG_PREVIEW_LEN = 500;
