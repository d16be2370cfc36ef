#include "remote_url.hpp"
#include <regex>

std::optional<RemoteUrlParts> parse_remote_url(const std::string& url) {
    static const std::regex ssh_re(R"(^([A-Za-z0-9._-]+)@([^:/]+):([^/]+)/(.+?)(?:\.git)?$)");
    static const std::regex http_re(R"(^(https?)://([^/]+)/([^/]+)/(.+?)(?:\.git)?$)");

    std::smatch m;
    if (std::regex_match(url, m, ssh_re)) {
        return RemoteUrlParts{"ssh", m[2].str(), m[3].str(), m[4].str()};
    }
    if (std::regex_match(url, m, http_re)) {
        return RemoteUrlParts{m[1].str(), m[2].str(), m[3].str(), m[4].str()};
    }
    return std::nullopt;
}

bool apply_remote_url(Remote& remote) {
    auto parts = parse_remote_url(remote.url);
    if (!parts) {
        remote.protocol.clear();
        remote.host.clear();
        remote.owner.clear();
        remote.repo.clear();
        remote.parsed = false;
        return false;
    }
    remote.protocol = parts->protocol;
    remote.host = parts->host;
    remote.owner = parts->owner;
    remote.repo = parts->repo;
    remote.parsed = true;
    return true;
}

std::string remote_url_host(const std::string& url) {
    if (url.empty()) return "";

    auto scheme = url.find("://");
    if (scheme != std::string::npos) {
        std::string rest = url.substr(scheme + 3);
        rest = rest.substr(0, rest.find('/'));
        auto at = rest.rfind('@');
        if (at != std::string::npos) rest = rest.substr(at + 1);
        return rest.substr(0, rest.find(':'));
    }

    // scp-like: [user@]host:path
    auto colon = url.find(':');
    if (colon == std::string::npos) return "";
    std::string host = url.substr(0, colon);
    auto at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);
    if (host.find('/') != std::string::npos) return "";
    return host;
}
