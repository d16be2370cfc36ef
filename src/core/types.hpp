#pragma once

#include <string>
#include <functional>

#include "constants.hpp"

// What went wrong, so callers can react without parsing messages.
// UnknownVariable, TemplateSyntax and BaseDirectoryResolution are the
// template error family.
enum class ErrorKind {
    None,
    Validation,
    Conflict,
    NotFound,
    Backend,
    DirectoryCreation,
    UnknownVariable,
    TemplateSyntax,
    BaseDirectoryResolution,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                    return "none";
        case ErrorKind::Validation:              return "validation failed";
        case ErrorKind::Conflict:                return "conflict";
        case ErrorKind::NotFound:                return "not found";
        case ErrorKind::Backend:                 return "backend failure";
        case ErrorKind::DirectoryCreation:       return "directory creation error";
        case ErrorKind::UnknownVariable:         return "unknown variable";
        case ErrorKind::TemplateSyntax:          return "template syntax error";
        case ErrorKind::BaseDirectoryResolution: return "base directory resolution error";
    }
    return "unknown";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Carry another result's failure, prefixed with what was being attempted.
    template <typename U>
    static Result<T> Wrap(const Result<U>& other, const std::string& context) {
        return {false, T{}, context.empty() ? other.error : context + ": " + other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool is_template_error() const {
        return kind == ErrorKind::UnknownVariable || kind == ErrorKind::TemplateSyntax ||
               kind == ErrorKind::BaseDirectoryResolution;
    }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Wrap(const Result<U>& other, const std::string& context) {
        return {false, context.empty() ? other.error : context + ": " + other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool is_template_error() const {
        return kind == ErrorKind::UnknownVariable || kind == ErrorKind::TemplateSyntax ||
               kind == ErrorKind::BaseDirectoryResolution;
    }
};

// What to do with a remote whose URL matches none of the known shapes
enum class RemoteUrlPolicy {
    Keep,    // keep the raw URL, leave host/owner/repo empty
    Skip,    // drop the remote from the snapshot
    Reject,  // fail repository detection
};

// Configuration structures
struct WorktreeConfig {
    std::string base_directory = DEFAULT_BASE_DIRECTORY;
    std::string directory_pattern = DEFAULT_DIRECTORY_PATTERN;
    std::string default_branch = DEFAULT_BRANCH;
    bool auto_directory = true;
    bool auto_create_branch = false;
    bool sanitize_names = true;
    int max_length = DEFAULT_MAX_NAME_LENGTH;    // 0 disables truncation
    std::string prefix;                          // empty -> default_branch
    std::string suffix;
};

struct SessionConfig {
    std::string prefix;                          // empty disables session handles
    std::string naming_pattern = DEFAULT_SESSION_PATTERN;
    int max_name_length = DEFAULT_SESSION_NAME_MAX;
    bool auto_cleanup = false;
    int cleanup_age_hours = DEFAULT_CLEANUP_AGE_HOURS;
};

struct GitConfig {
    std::string command = "git";
    int timeout_secs = GIT_CMD_TIMEOUT_SECS;
    RemoteUrlPolicy remote_url_policy = RemoteUrlPolicy::Keep;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
