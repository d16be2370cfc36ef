#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "git_types.hpp"

enum class HostingService {
    GitHub,
    GitLab,
    Bitbucket,
    Generic,
};

const char* hosting_service_name(HostingService service);

// Chosen by the remote's host; unknown hosts are Generic.
HostingService detect_hosting_service(const std::string& remote_url);

// Capabilities of a code hosting service. Only URL construction lives here;
// no requests are made.
class HostingClient {
public:
    virtual ~HostingClient() = default;

    virtual HostingService service() const = 0;
    const char* name() const { return hosting_service_name(service()); }

    virtual bool supports_pull_requests() const { return true; }

    // Browser URL that opens a pull request from `source` into `target`.
    virtual Result<std::string> pull_request_url(const Remote& remote,
                                                 const std::string& source,
                                                 const std::string& target) const = 0;
};

class GitHubClient : public HostingClient {
public:
    HostingService service() const override { return HostingService::GitHub; }
    Result<std::string> pull_request_url(const Remote& remote, const std::string& source,
                                         const std::string& target) const override;
};

class GitLabClient : public HostingClient {
public:
    HostingService service() const override { return HostingService::GitLab; }
    Result<std::string> pull_request_url(const Remote& remote, const std::string& source,
                                         const std::string& target) const override;
};

class BitbucketClient : public HostingClient {
public:
    HostingService service() const override { return HostingService::Bitbucket; }
    Result<std::string> pull_request_url(const Remote& remote, const std::string& source,
                                         const std::string& target) const override;
};

class GenericClient : public HostingClient {
public:
    HostingService service() const override { return HostingService::Generic; }
    bool supports_pull_requests() const override { return false; }
    Result<std::string> pull_request_url(const Remote& remote, const std::string& source,
                                         const std::string& target) const override;
};

std::unique_ptr<HostingClient> make_hosting_client(HostingService service);

// Percent-encode everything outside RFC 3986 unreserved characters.
// keep_slash leaves '/' alone for use inside a path.
std::string url_encode(const std::string& s, bool keep_slash = false);
