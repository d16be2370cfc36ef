#include "hosting.hpp"
#include "remote_url.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

const char* hosting_service_name(HostingService service) {
    switch (service) {
        case HostingService::GitHub:    return "github";
        case HostingService::GitLab:    return "gitlab";
        case HostingService::Bitbucket: return "bitbucket";
        case HostingService::Generic:   return "generic";
    }
    return "generic";
}

HostingService detect_hosting_service(const std::string& remote_url) {
    std::string host = to_lower(remote_url_host(remote_url));
    if (host.find("github.com") != std::string::npos) return HostingService::GitHub;
    if (host.find("gitlab.com") != std::string::npos) return HostingService::GitLab;
    if (host.find("bitbucket.org") != std::string::npos) return HostingService::Bitbucket;
    return HostingService::Generic;
}

std::string url_encode(const std::string& s, bool keep_slash) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            out += static_cast<char>(c);
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

// Shared argument checks; returns the repository's web root on success.
static Result<std::string> web_root(const Remote& remote, const std::string& source,
                                    const std::string& target) {
    if (!remote.parsed) {
        return Result<std::string>::Err(ErrorKind::Validation,
                                        "remote URL not recognised: " + remote.url);
    }
    if (source.empty() || target.empty()) {
        return Result<std::string>::Err(ErrorKind::Validation,
                                        "source and target branches are required");
    }
    if (source == target) {
        return Result<std::string>::Err(ErrorKind::Validation,
                                        "source and target branches are the same");
    }
    return Result<std::string>::Ok(
        fmt::format("https://{}/{}/{}", remote.host, remote.owner, remote.repo));
}

Result<std::string> GitHubClient::pull_request_url(const Remote& remote, const std::string& source,
                                                   const std::string& target) const {
    auto root = web_root(remote, source, target);
    if (root.is_err()) return root;
    return Result<std::string>::Ok(fmt::format("{}/compare/{}...{}?expand=1", root.value,
                                               url_encode(target, true), url_encode(source, true)));
}

Result<std::string> GitLabClient::pull_request_url(const Remote& remote, const std::string& source,
                                                   const std::string& target) const {
    auto root = web_root(remote, source, target);
    if (root.is_err()) return root;
    return Result<std::string>::Ok(fmt::format(
        "{}/-/merge_requests/new?merge_request%5Bsource_branch%5D={}&merge_request%5Btarget_branch%5D={}",
        root.value, url_encode(source), url_encode(target)));
}

Result<std::string> BitbucketClient::pull_request_url(const Remote& remote, const std::string& source,
                                                      const std::string& target) const {
    auto root = web_root(remote, source, target);
    if (root.is_err()) return root;
    return Result<std::string>::Ok(fmt::format("{}/pull-requests/new?source={}&dest={}", root.value,
                                               url_encode(source), url_encode(target)));
}

Result<std::string> GenericClient::pull_request_url(const Remote& remote, const std::string&,
                                                    const std::string&) const {
    return Result<std::string>::Err(
        ErrorKind::Validation,
        fmt::format("pull requests are not supported for remote '{}' ({})", remote.name, remote.url));
}

std::unique_ptr<HostingClient> make_hosting_client(HostingService service) {
    switch (service) {
        case HostingService::GitHub:    return std::make_unique<GitHubClient>();
        case HostingService::GitLab:    return std::make_unique<GitLabClient>();
        case HostingService::Bitbucket: return std::make_unique<BitbucketClient>();
        case HostingService::Generic:   break;
    }
    return std::make_unique<GenericClient>();
}
