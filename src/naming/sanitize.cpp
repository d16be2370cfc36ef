#include "sanitize.hpp"
#include <core/constants.hpp>
#include <cctype>

static std::string sanitize_with_fallback(const std::string& raw, const char* fallback) {
    std::string out;
    out.reserve(raw.size());

    for (unsigned char c : raw) {
        char mapped;
        if (c == '/' || c == '\\' || c == '_' || std::isspace(c)) {
            mapped = '-';
        } else if (c < 0x80 && (std::isalnum(c) || c == '-' || c == '.')) {
            mapped = static_cast<char>(std::tolower(c));
        } else {
            continue;
        }
        // Collapse runs of hyphens as we go
        if (mapped == '-' && !out.empty() && out.back() == '-') continue;
        out += mapped;
    }

    size_t start = out.find_first_not_of('-');
    if (start == std::string::npos) return fallback;
    size_t end = out.find_last_not_of('-');
    return out.substr(start, end - start + 1);
}

std::string sanitize_component(const std::string& raw) {
    return sanitize_with_fallback(raw, FALLBACK_COMPONENT_NAME);
}

std::string sanitize_path(const std::string& raw) {
    return sanitize_with_fallback(raw, FALLBACK_PATH_NAME);
}

std::string truncate_path(const std::string& path, int max_len) {
    if (max_len <= 0) return "";
    const size_t limit = static_cast<size_t>(max_len);
    if (path.size() <= limit) return path;

    size_t cut = path.rfind('-', limit);
    if (cut != std::string::npos && cut > 0) {
        std::string head = path.substr(0, cut);
        size_t last = head.find_last_not_of('-');
        if (last != std::string::npos) return head.substr(0, last + 1);
    }
    return truncate_string(path, max_len);
}

std::string truncate_string(const std::string& s, int n) {
    if (n <= 0) return "";
    const size_t limit = static_cast<size_t>(n);
    if (s.size() <= limit) return s;

    const std::string marker = TRUNCATION_MARKER;
    if (limit > marker.size()) {
        return s.substr(0, limit - marker.size()) + marker;
    }
    return s.substr(0, limit);
}

std::string title_case(const std::string& s) {
    std::string out = s;
    bool at_word_start = true;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        bool word_char = std::isalnum(c) || c == '_';
        if (word_char && at_word_start) {
            ch = static_cast<char>(std::toupper(c));
        }
        at_word_start = !word_char;
    }
    return out;
}
