#include "ShellConfig.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

bool parse_number(const std::string& text, unsigned long long& out) {
    if (text.empty()) return false;
    unsigned long long v = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + static_cast<unsigned long long>(c - '0');
    }
    out = v;
    return true;
}

std::string unescape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\\' && i + 1 < in.size()) {
            char n = in[i + 1];
            if (n == 'n') { out += '\n'; ++i; continue; }
            if (n == 't') { out += '\t'; ++i; continue; }
            if (n == '\\') { out += '\\'; ++i; continue; }
        }
        out += in[i];
    }
    return out;
}

}

bool ShellConfig::load(const std::filesystem::path& path) {
    error_.clear();
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        error_ = "config file not found: " + path.string();
        return false;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return parse(ss.str());
}

bool ShellConfig::parse(const std::string& text) {
    error_.clear();
    std::istringstream is(text);
    std::string line;
    std::string section;
    size_t lineno = 0;

    while (std::getline(is, line)) {
        ++lineno;
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;
        if (trimmed.front() == '[' && trimmed.back() == ']') {
            section = trim(trimmed.substr(1, trimmed.size() - 2));
            if (section != "shell" && section != "headers" && section != "limits" && section != "files") {
                error_ = "unknown section [" + section + "] at line " + std::to_string(lineno);
                return false;
            }
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos || section.empty()) {
            error_ = "invalid line " + std::to_string(lineno) + ": " + trimmed;
            return false;
        }
        auto key = trim(trimmed.substr(0, eq));
        auto value = trim(trimmed.substr(eq + 1));
        if (key.empty()) {
            error_ = "missing key at line " + std::to_string(lineno);
            return false;
        }

        if (section == "shell") {
            if (key == "base_url") base_url = value;
            else if (key == "timeout_ms") {
                unsigned long long n = 0;
                if (!parse_number(value, n)) {
                    error_ = "timeout_ms must be a non-negative integer";
                    return false;
                }
                timeout_ms = static_cast<long>(n);
            } else {
                error_ = "unknown [shell] key: " + key;
                return false;
            }
        } else if (section == "headers") {
            bool replaced = false;
            for (auto& h : default_headers) {
                if (h.first == key) { h.second = value; replaced = true; }
            }
            if (!replaced) default_headers.emplace_back(key, value);
        } else if (section == "limits") {
            unsigned long long n = 0;
            if (!parse_number(value, n) || n == 0) {
                error_ = "limit '" + key + "' must be a positive integer";
                return false;
            }
            auto v = static_cast<std::size_t>(n);
            if (key == "max_line_length") limits.max_line_length = v;
            else if (key == "default_line_limit") limits.default_line_limit = v;
            else if (key == "max_file_size") limits.max_file_size = v;
            else if (key == "max_grep_output") limits.max_grep_output = v;
            else if (key == "max_browse_output") limits.max_browse_output = v;
            else {
                error_ = "unknown [limits] key: " + key;
                return false;
            }
        } else {
            initial_files[key] = unescape(value);
        }
    }
    return true;
}
