#pragma once

#include <string>
#include <optional>
#include "git_types.hpp"

struct RemoteUrlParts {
    std::string protocol;   // "ssh", "https", "http"
    std::string host;
    std::string owner;
    std::string repo;       // without a trailing ".git"
};

// Recognises user@host:owner/repo[.git], https://host/owner/repo[.git] and
// http://host/owner/repo[.git]. Anything else yields nullopt.
std::optional<RemoteUrlParts> parse_remote_url(const std::string& url);

// Fill remote's structured fields from its url. Returns remote.parsed.
bool apply_remote_url(Remote& remote);

// Host part of any remote URL shape (scp-like, ssh://, http(s)://).
// Empty if none can be found.
std::string remote_url_host(const std::string& url);
