#pragma once
#include <optional>
#include <string>
#include <vector>

// One pipeline stage after tokenizing and redirection extraction.
struct ParsedCommand {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> input_file;    // < file
    std::optional<std::string> output_file;   // > file
    std::optional<std::string> append_file;   // >> file
    std::optional<std::string> stdin_content; // heredoc body
    bool heredoc_quoted = false;              // <<'EOF': body is not expanded
};

// a | b | c, executed left to right.
struct Pipeline {
    std::vector<ParsedCommand> stages;
};
