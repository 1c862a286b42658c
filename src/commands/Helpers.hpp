#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "../vfs/IVfs.hpp"

// Split on '\n' keeping a trailing empty piece ("a\n" -> {"a", ""}).
inline std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (true) {
        size_t nl = s.find('\n', pos);
        if (nl == std::string::npos) { out.push_back(s.substr(pos)); break; }
        out.push_back(s.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return out;
}

// Lines of a text file: a final newline does not start another line.
inline std::vector<std::string> text_lines(const std::string& s) {
    if (s.empty()) return {};
    auto lines = split_lines(s);
    if (!lines.empty() && lines.back().empty()) lines.pop_back();
    return lines;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

inline std::string truncate_line(const std::string& line, size_t max_len) {
    if (line.size() <= max_len) return line;
    return line.substr(0, max_len) + "...";
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Whole-string integer parse; nullopt on anything else.
inline std::optional<long> parse_long(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0') return std::nullopt;
    return v;
}

inline std::string pad_end(const std::string& s, size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

inline std::string pad_start(const std::string& s, size_t width, char fill = ' ') {
    if (s.size() >= width) return s;
    return std::string(width - s.size(), fill) + s;
}

// Arguments containing '*' are expanded through the workspace glob;
// everything else passes through unchanged.
inline std::vector<std::string> expand_paths(const IVfs& vfs, const std::string& arg) {
    if (arg.find('*') == std::string::npos) return {arg};
    return vfs.glob(arg);
}

inline std::string basename_of(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}
