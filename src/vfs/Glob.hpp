#pragma once
#include <regex>
#include <string>

// Shell-style wildcard matching over '/'-separated paths.
//   **   any number of path segments (including none)
//   *    any run of characters inside one segment
//   ?    exactly one character inside one segment
namespace Glob {
    bool has_wildcard(const std::string& s);
    std::string to_regex_source(const std::string& pattern);
    std::regex compile(const std::string& pattern);
    bool match(const std::string& path, const std::string& pattern);
}
