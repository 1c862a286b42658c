#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

struct Limits {
    std::size_t max_line_length = 2000;
    std::size_t default_line_limit = 2000;
    std::size_t max_file_size = 256 * 1024;
    std::size_t max_grep_output = 30000;
    std::size_t max_browse_output = 50000;
};

// Host configuration for a Shell instance.
//
// File format (INI):
//   [shell]    base_url, timeout_ms
//   [headers]  Name = value          (sent with every curl request)
//   [limits]   max_line_length, default_line_limit, max_file_size,
//              max_grep_output, max_browse_output
//   [files]    path = content        (\n and \t escapes are expanded)
class ShellConfig {
public:
    std::string base_url;
    std::vector<std::pair<std::string, std::string>> default_headers;
    long timeout_ms = 0;
    Limits limits;
    std::map<std::string, std::string> initial_files;

    bool load(const std::filesystem::path& path);
    bool parse(const std::string& text);
    const std::string& error() const { return error_; }

private:
    std::string error_;
};
