#include "branch_name.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static Result<void> invalid(const std::string& name, const std::string& why) {
    return Result<void>::Err(ErrorKind::Validation, fmt::format("invalid branch name '{}': {}", name, why));
}

Result<void> validate_branch_name(const std::string& name) {
    if (name.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "branch name cannot be empty");
    }

    if (starts_with(name, "-")) return invalid(name, "cannot start with '-'");
    if (starts_with(name, ".")) return invalid(name, "cannot start with '.'");
    if (ends_with(name, ".lock")) return invalid(name, "cannot end with '.lock'");
    if (ends_with(name, ".")) return invalid(name, "cannot end with '.'");
    if (name.find("..") != std::string::npos) return invalid(name, "cannot contain '..'");
    if (name == "@" || name.find("@{") != std::string::npos) {
        return invalid(name, "cannot be '@' or contain '@{'");
    }
    if (starts_with(name, "refs/")) return invalid(name, "cannot start with 'refs/'");
    if (to_upper(name) == "HEAD") return invalid(name, "cannot be 'HEAD'");

    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) return invalid(name, "cannot contain control characters");
        if (c == ' ') return invalid(name, "cannot contain spaces");
        if (std::string("~^:?*[\\").find(c) != std::string::npos) {
            return invalid(name, fmt::format("cannot contain '{}'", c));
        }
    }
    return Result<void>::Ok();
}
