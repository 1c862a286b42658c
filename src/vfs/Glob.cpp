#include "Glob.hpp"

#include <cstring>

namespace Glob {

bool has_wildcard(const std::string& s) {
    return s.find('*') != std::string::npos || s.find('?') != std::string::npos;
}

std::string to_regex_source(const std::string& pattern) {
    static const char* meta = ".+^$(){}|[]\\";
    std::string re = "^";
    const size_t n = pattern.size();
    for (size_t i = 0; i < n; ++i) {
        char c = pattern[i];
        if (c == '*' && i + 1 < n && pattern[i + 1] == '*') {
            bool at_segment_start = (i == 0 || pattern[i - 1] == '/');
            bool slash_follows = (i + 2 < n && pattern[i + 2] == '/');
            bool at_end = (i + 2 == n);
            if (at_segment_start && slash_follows) {
                re += "(?:.*/)?";
                i += 2;
            } else if (at_segment_start && at_end && i > 0) {
                // "dir/**" also matches "dir" itself
                re.pop_back();
                re += "(?:/.*)?";
                i += 1;
            } else {
                re += ".*";
                i += 1;
            }
            continue;
        }
        if (c == '*') { re += "[^/]*"; continue; }
        if (c == '?') { re += "[^/]"; continue; }
        if (std::strchr(meta, c)) re += '\\';
        re += c;
    }
    re += "$";
    return re;
}

std::regex compile(const std::string& pattern) {
    return std::regex(to_regex_source(pattern), std::regex::ECMAScript);
}

bool match(const std::string& path, const std::string& pattern) {
    return std::regex_match(path, compile(pattern));
}

}
